#include "ByteSource.h"
#include "Error.h"

#include <fstream>

SEGMAP_BEGIN

ByteSource::ByteSource(const std::string& pPath) {
    std::ifstream file;
    file.open(pPath, std::ios::binary);
    if (!file.is_open()) {
        spdlog::error("Failed to open {}.", pPath);
        mIsValid = false;
        return;
    }
    file.seekg(0, std::ios::beg);
    mStream << file.rdbuf();
    file.close();
    mSize = mStream.str().size();
}

std::shared_ptr<ByteSource> ByteSource::fromBuffer(std::string pBuffer) {
    std::shared_ptr<ByteSource> source(new ByteSource());
    source->mSize = pBuffer.size();
    source->mStream.str(std::move(pBuffer));
    return source;
}

bool ByteSource::isValid() const { return mIsValid; }

void ByteSource::seek(uint64_t pPos) {
    std::lock_guard lock(mMutex);
    _seek(pPos);
}

Bytes ByteSource::read(size_t pLength) {
    std::lock_guard lock(mMutex);
    return _read(pLength);
}

uint64_t ByteSource::cur() {
    std::lock_guard lock(mMutex);
    return mStream.tellg();
}

Bytes ByteSource::readAt(uint64_t pPos, size_t pLength) {
    std::lock_guard lock(mMutex);
    _seek(pPos);
    return _read(pLength);
}

std::string ByteSource::readCStringAt(uint64_t pPos) {
    std::lock_guard lock(mMutex);
    _seek(pPos);
    return _readCString();
}

void ByteSource::_seek(uint64_t pPos) {
    if (pPos > mSize) {
        throw IoError(fmt::format("Seek to {:#x} is beyond the end of source ({:#x}).", pPos, mSize));
    }
    mStream.clear();
    mStream.seekg((std::streamoff)pPos, std::ios::beg);
    if (!mStream.good()) throw IoError("ByteSource is broken.");
}

Bytes ByteSource::_read(size_t pLength) {
    if (!pLength) return {};
    std::streamoff pos = mStream.tellg();
    if (pos < 0) throw IoError("ByteSource is broken.");
    auto remaining = mSize - (uint64_t)pos;
    if (pLength > remaining) {
        throw IoError(fmt::format("Short read: wanted {} byte(s), {} left.", pLength, remaining));
    }
    Bytes result(pLength);
    mStream.read(reinterpret_cast<char*>(result.data()), (std::streamsize)pLength);
    auto got = (size_t)mStream.gcount();
    if (got != pLength) {
        throw IoError(fmt::format("Short read: wanted {} byte(s), got {}.", pLength, got));
    }
    return result;
}

std::string ByteSource::_readCString() {
    std::string result;
    char        chr;
    while (mStream.get(chr)) {
        if (chr == '\0') return result;
        result += chr;
    }
    throw IoError("Reached end of source before string terminator.");
}

SEGMAP_END
