#include "Note.h"

#include "util/Bytes.h"

#include <spdlog/fmt/ranges.h>

using JSON = nlohmann::json;

SEGMAP_NOTE_BEGIN

namespace {

enum GnuNoteType : uint32_t { GnuAbiTag = 1, GnuHwcap = 2, GnuBuildId = 3, GnuGoldVersion = 4, GnuProperty0 = 5 };

enum CoreNoteType : uint32_t {
    CorePrStatus = 1,
    CoreFpRegSet = 2,
    CorePrPsInfo = 3,
    CoreTaskStruct = 4,
    CoreAuxv = 6,
    CoreSigInfo = 0x53494749,
    CoreFile = 0x46494c45,
};

} // namespace

std::string Note::typeName() const {
    if (mName == "GNU") {
        switch (mType) {
        case GnuAbiTag:
            return "NT_GNU_ABI_TAG";
        case GnuHwcap:
            return "NT_GNU_HWCAP";
        case GnuBuildId:
            return "NT_GNU_BUILD_ID";
        case GnuGoldVersion:
            return "NT_GNU_GOLD_VERSION";
        case GnuProperty0:
            return "NT_GNU_PROPERTY_TYPE_0";
        default:
            break;
        }
    } else if (mName == "CORE" || mName == "LINUX") {
        switch (mType) {
        case CorePrStatus:
            return "NT_PRSTATUS";
        case CoreFpRegSet:
            return "NT_FPREGSET";
        case CorePrPsInfo:
            return "NT_PRPSINFO";
        case CoreTaskStruct:
            return "NT_TASKSTRUCT";
        case CoreAuxv:
            return "NT_AUXV";
        case CoreSigInfo:
            return "NT_SIGINFO";
        case CoreFile:
            return "NT_FILE";
        default:
            break;
        }
    }
    return fmt::format("{:#x}", mType);
}

JSON Note::toJson() const {
    JSON desc;
    if (mName == "GNU" && mType == GnuAbiTag && mDesc.size() >= 16) {
        desc = JSON{
            {"abi_os",    util::FromBytes<uint32_t>(mDesc.data(), mLittleEndian)     },
            {"abi_major", util::FromBytes<uint32_t>(mDesc.data() + 4, mLittleEndian) },
            {"abi_minor", util::FromBytes<uint32_t>(mDesc.data() + 8, mLittleEndian) },
            {"abi_tiny",  util::FromBytes<uint32_t>(mDesc.data() + 12, mLittleEndian)}
        };
    } else if (mName == "GNU" && mType == GnuGoldVersion) {
        std::string version(mDesc.begin(), mDesc.end());
        desc = version.substr(0, version.find('\0'));
    } else {
        // NT_GNU_BUILD_ID and anything we do not interpret.
        desc = fmt::format("{:02x}", fmt::join(mDesc, ""));
    }
    return JSON{
        {"n_offset",  mOffset    },
        {"n_size",    mSize      },
        {"n_namesz",  mNameSize  },
        {"n_descsz",  mDescSize  },
        {"n_name",    mName      },
        {"n_type",    mType      },
        {"type_name", typeName() },
        {"n_desc",    desc       }
    };
}

SEGMAP_NOTE_END
