#pragma once

#include "Segment.h"

#include <string>

SEGMAP_BEGIN

// PT_INTERP: holds the path of the program interpreter.
class InterpSegment : public Segment {
public:
    using Segment::Segment;

    [[nodiscard]] SegmentKind kind() const override { return SegmentKind::Interp; }

    [[nodiscard]] std::string getInterpName() const;
};

SEGMAP_END
