#pragma once

#include "Note.h"

#include "base/Image.h"

#include <iterator>
#include <vector>

SEGMAP_NOTE_BEGIN

// Decodes Elf_Nhdr records one at a time over [offset, end). Single pass.
class NoteIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = Note;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const Note*;
    using reference         = const Note&;

    NoteIterator() = default;
    NoteIterator(const Image& pImage, uint64_t pOffset, uint64_t pEnd);

    reference operator*() const { return mCurrent; }
    pointer   operator->() const { return &mCurrent; }

    NoteIterator& operator++();
    void          operator++(int) { ++*this; }

    bool operator==(const NoteIterator& pOther) const {
        return mImage == pOther.mImage && mCurrent.mOffset == pOther.mCurrent.mOffset;
    }

private:
    void _decode(uint64_t pOffset);

    const Image* mImage{};
    uint64_t     mEnd{};
    Note         mCurrent;
};

// The notes of one byte range. Every begin() starts a fresh decode.
class NoteSequence {
public:
    NoteSequence(const Image& pImage, uint64_t pOffset, uint64_t pSize)
    : mImage(pImage),
      mOffset(pOffset),
      mSize(pSize) {}

    [[nodiscard]] NoteIterator begin() const { return {mImage, mOffset, mOffset + mSize}; }
    [[nodiscard]] NoteIterator end() const { return {}; }

    [[nodiscard]] std::vector<Note> collect() const { return {begin(), end()}; }

private:
    const Image& mImage;
    uint64_t     mOffset;
    uint64_t     mSize;
};

SEGMAP_NOTE_END
