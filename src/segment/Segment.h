#pragma once

#include "base/Base.h"
#include "base/ByteSource.h"
#include "base/Header.h"

#include <memory>
#include <string_view>

SEGMAP_BEGIN

enum class SegmentKind { Plain, Interp, Note };

class Segment {
public:
    Segment(ProgramHeader pHeader, std::shared_ptr<ByteSource> pSource);
    virtual ~Segment() = default;

    [[nodiscard]] virtual SegmentKind kind() const { return SegmentKind::Plain; }

    [[nodiscard]] const ProgramHeader& header() const { return mHeader; }
    [[nodiscard]] SegmentType          type() const { return mHeader.mType; }

    // Throws UnknownFieldError for names a program header does not have.
    [[nodiscard]] uint64_t field(std::string_view pName) const { return mHeader.field(pName); }

    // The p_filesz bytes at p_offset. Moves the shared source position.
    [[nodiscard]] Bytes data() const;

    // Strict section-in-segment test, as binutils' ELF_SECTION_IN_SEGMENT_STRICT
    // (check_vma on).
    [[nodiscard]] bool sectionInSegment(const SectionHeader& pSection) const;

protected:
    ProgramHeader               mHeader;
    std::shared_ptr<ByteSource> mSource;
};

SEGMAP_END
