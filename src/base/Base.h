#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define MAGIC_ENUM_RANGE_MIN 0
#define MAGIC_ENUM_RANGE_MAX 1024

// clang-format off

#define SEGMAP_BEGIN namespace segmap {
#define SEGMAP_END   }

// base

#define SEGMAP_FORMAT_BEGIN SEGMAP_BEGIN namespace format {
#define SEGMAP_FORMAT_END   SEGMAP_END   }

#define SEGMAP_NOTE_BEGIN   SEGMAP_BEGIN namespace note {
#define SEGMAP_NOTE_END     SEGMAP_END   }

#define SEGMAP_UTIL_BEGIN   SEGMAP_BEGIN namespace util {
#define SEGMAP_UTIL_END     SEGMAP_END }

// clang-format on
