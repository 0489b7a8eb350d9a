#pragma once

#include "Base.h"

#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

SEGMAP_BEGIN

using Bytes = std::vector<uint8_t>;

// Seekable view over the bytes of one file. A single instance is shared by
// every segment of that file, so the read position is shared too; readAt() and
// readCStringAt() hold the source lock across the seek and the read.
class ByteSource {
public:
    explicit ByteSource(const std::string& pPath);

    static std::shared_ptr<ByteSource> fromBuffer(std::string pBuffer);

    [[nodiscard]] bool     isValid() const;
    [[nodiscard]] uint64_t size() const { return mSize; }

    void                  seek(uint64_t pPos);
    [[nodiscard]] Bytes   read(size_t pLength);
    [[nodiscard]] uint64_t cur();

    [[nodiscard]] Bytes       readAt(uint64_t pPos, size_t pLength);
    [[nodiscard]] std::string readCStringAt(uint64_t pPos);

private:
    ByteSource() = default;

    void        _seek(uint64_t pPos);
    Bytes       _read(size_t pLength);
    std::string _readCString();

    std::stringstream mStream;
    std::mutex        mMutex;

    uint64_t mSize{};
    bool     mIsValid{true};
};

SEGMAP_END
