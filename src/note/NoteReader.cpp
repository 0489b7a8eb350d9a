#include "NoteReader.h"

#include "util/Bytes.h"

#include <algorithm>

SEGMAP_NOTE_BEGIN

namespace {

constexpr uint64_t NoteHeaderSize = 12; // n_namesz, n_descsz, n_type

} // namespace

NoteIterator::NoteIterator(const Image& pImage, uint64_t pOffset, uint64_t pEnd) : mImage(&pImage), mEnd(pEnd) {
    if (pOffset >= mEnd) {
        mImage = nullptr;
        return;
    }
    _decode(pOffset);
}

NoteIterator& NoteIterator::operator++() {
    auto next = mCurrent.mOffset + mCurrent.mSize;
    if (next >= mEnd) {
        mImage   = nullptr;
        mCurrent = {};
        return *this;
    }
    _decode(next);
    return *this;
}

void NoteIterator::_decode(uint64_t pOffset) {
    auto source       = mImage->getSource();
    auto littleEndian = mImage->isLittleEndian();

    Note note;
    note.mOffset       = pOffset;
    note.mLittleEndian = littleEndian;

    auto header    = source->readAt(pOffset, NoteHeaderSize);
    note.mNameSize = util::FromBytes<uint32_t>(header.data(), littleEndian);
    note.mDescSize = util::FromBytes<uint32_t>(header.data() + 4, littleEndian);
    note.mType     = util::FromBytes<uint32_t>(header.data() + 8, littleEndian);

    // Name is padded to 4 bytes on disk, the descriptor is read unpadded.
    auto diskNameSize = util::RoundUp4(note.mNameSize);
    auto payload      = source->readAt(pOffset + NoteHeaderSize, diskNameSize + note.mDescSize);

    auto nameEnd = payload.begin() + (ptrdiff_t)diskNameSize;
    note.mName.assign(payload.begin(), std::find(payload.begin(), nameEnd, 0));
    note.mDesc.assign(nameEnd, payload.end());
    note.mSize = NoteHeaderSize + diskNameSize + util::RoundUp4(note.mDescSize);

    spdlog::debug("Note at {:#x}: {} {}", pOffset, note.mName, note.typeName());
    mCurrent = std::move(note);
}

SEGMAP_NOTE_END
