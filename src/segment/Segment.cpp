#include "Segment.h"

#include <elfio/elfio.hpp>

using namespace ELFIO;

SEGMAP_BEGIN

Segment::Segment(ProgramHeader pHeader, std::shared_ptr<ByteSource> pSource)
: mHeader(pHeader),
  mSource(std::move(pSource)) {}

Bytes Segment::data() const { return mSource->readAt(mHeader.mOffset, mHeader.mFileSize); }

bool Segment::sectionInSegment(const SectionHeader& pSection) const {
    const auto segType  = mHeader.mType;
    const auto secFlags = pSection.mFlags;

    // Only PT_LOAD, PT_GNU_RELRO and PT_TLS segments can contain SHF_TLS sections.
    const bool isTls = (secFlags & SHF_TLS) != 0;
    if (isTls && (segType == SegmentType::Tls || segType == SegmentType::GnuRelro || segType == SegmentType::Load)) {
        // ok
    } else if (isTls || segType == SegmentType::Tls || segType == SegmentType::Phdr) {
        return false;
    }

    // PT_LOAD and similar segments only have SHF_ALLOC sections.
    const bool isAlloc = (secFlags & SHF_ALLOC) != 0;
    if (!isAlloc
        && (segType == SegmentType::Load || segType == SegmentType::Dynamic || segType == SegmentType::GnuEhFrame
            || segType == SegmentType::GnuRelro || segType == SegmentType::GnuStack)) {
        return false;
    }

    // VMA bounds. An empty section does not match at the very end of the
    // segment, and a zero-sized segment holds no alloc section at all.
    if (isAlloc) {
        const auto secAddr = pSection.mAddress;
        const auto vaddr   = mHeader.mVirtualAddress;
        const auto memSize = mHeader.mMemorySize;
        if (secAddr < vaddr) return false;
        const auto delta = secAddr - vaddr;
        if (delta >= memSize || pSection.mSize > memSize - delta) return false;
    }

    if (pSection.mType == SectionType::Nobits) return true;

    // Same rules on file offsets.
    const auto secOffset = pSection.mOffset;
    const auto offset    = mHeader.mOffset;
    const auto fileSize  = mHeader.mFileSize;
    if (secOffset < offset) return false;
    const auto delta = secOffset - offset;
    return delta < fileSize && pSection.mSize <= fileSize - delta;
}

SEGMAP_END
