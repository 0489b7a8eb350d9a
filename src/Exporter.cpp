#include "Exporter.h"

#include "segment/NoteSegment.h"

#include <magic_enum.hpp>

using JSON = nlohmann::json;

SEGMAP_BEGIN

JSON exportSegment(const Segment& pSegment) {
    auto& header = pSegment.header();
    return JSON{
        {"type",     segtype2str(header.mType)                  },
        {"kind",     std::string(magic_enum::enum_name(pSegment.kind()))},
        {"p_type",   header.mRawType                            },
        {"p_flags",  header.mFlags                              },
        {"p_offset", header.mOffset                             },
        {"p_vaddr",  header.mVirtualAddress                     },
        {"p_paddr",  header.mPhysicalAddress                    },
        {"p_filesz", header.mFileSize                           },
        {"p_memsz",  header.mMemorySize                         },
        {"p_align",  header.mAlign                              }
    };
}

JSON exportImage(const format::ElfFile& pFile, ExportArguments pArgs) {
    auto segments = JSON::array();
    auto notes    = JSON::array();
    for (auto& segment : pFile.getSegments()) {
        segments.emplace_back(exportSegment(*segment));
        if (!pArgs.mNotes) continue;
        if (auto noteSegment = dynamic_cast<const NoteSegment*>(segment.get())) {
            for (auto& note : noteSegment->iterNotes()) {
                notes.emplace_back(note.toJson());
            }
        }
    }

    auto mapping = JSON::array();
    for (auto& entry : pFile.getSectionMapping()) {
        mapping.emplace_back(JSON{
            {"segment",  entry.mSegmentIndex},
            {"sections", entry.mSections    }
        });
    }

    auto interpreter = pFile.getInterpreter();

    JSON result{
        {"segments",    segments                                            },
        {"mapping",     mapping                                             },
        {"interpreter", interpreter.has_value() ? JSON(*interpreter) : JSON{}}
    };
    if (pArgs.mNotes) result["notes"] = notes;
    return result;
}

SEGMAP_END
