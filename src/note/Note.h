#pragma once

#include "base/Base.h"
#include "base/ByteSource.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

SEGMAP_NOTE_BEGIN

// One Elf_Nhdr record and its payload.
struct Note {
    uint32_t    mNameSize{}; // n_namesz
    uint32_t    mDescSize{}; // n_descsz
    uint32_t    mType{};     // n_type
    std::string mName;       // n_name, up to the first NUL
    Bytes       mDesc;       // n_desc, unpadded
    uint64_t    mOffset{};   // file offset of the record
    uint64_t    mSize{};     // header plus padded name and descriptor
    bool        mLittleEndian{true};

    [[nodiscard]] std::string    typeName() const;
    [[nodiscard]] nlohmann::json toJson() const;

    bool operator==(const Note&) const = default;
};

SEGMAP_NOTE_END
