#pragma once

#include "Segment.h"

#include "base/Image.h"
#include "note/NoteReader.h"

SEGMAP_BEGIN

class NoteSegment : public Segment {
public:
    NoteSegment(ProgramHeader pHeader, std::shared_ptr<ByteSource> pSource, const Image& pImage)
    : Segment(pHeader, std::move(pSource)),
      mImage(pImage) {}

    [[nodiscard]] SegmentKind kind() const override { return SegmentKind::Note; }

    // A fresh sequence over [p_offset, p_offset + p_filesz) on every call.
    [[nodiscard]] note::NoteSequence iterNotes() const { return {mImage, mHeader.mOffset, mHeader.mFileSize}; }

private:
    const Image& mImage;
};

SEGMAP_END
