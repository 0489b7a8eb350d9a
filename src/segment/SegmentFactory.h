#pragma once

#include "Segment.h"

#include "base/Image.h"

SEGMAP_BEGIN

// Picks the segment class for a decoded header once, from p_type.
[[nodiscard]] std::unique_ptr<Segment>
makeSegment(const ProgramHeader& pHeader, std::shared_ptr<ByteSource> pSource, const Image& pImage);

SEGMAP_END
