#include "SegmentFactory.h"

#include "InterpSegment.h"
#include "NoteSegment.h"

SEGMAP_BEGIN

std::unique_ptr<Segment>
makeSegment(const ProgramHeader& pHeader, std::shared_ptr<ByteSource> pSource, const Image& pImage) {
    switch (pHeader.mType) {
    case SegmentType::Interp:
        return std::make_unique<InterpSegment>(pHeader, std::move(pSource));
    case SegmentType::Note:
        return std::make_unique<NoteSegment>(pHeader, std::move(pSource), pImage);
    default:
        return std::make_unique<Segment>(pHeader, std::move(pSource));
    }
}

SEGMAP_END
