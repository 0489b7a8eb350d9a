#pragma once

#include "base/Base.h"
#include "format/ElfFile.h"

#include <nlohmann/json.hpp>

SEGMAP_BEGIN

struct ExportArguments {
    bool mNotes{true};
};

[[nodiscard]] nlohmann::json exportSegment(const Segment& pSegment);
[[nodiscard]] nlohmann::json exportImage(const format::ElfFile& pFile, ExportArguments pArgs);

SEGMAP_END
