#pragma once

#include "base/Base.h"
#include "base/ByteSource.h"

#include <memory>

SEGMAP_BEGIN

// The file a segment was decoded from, as far as segment-level decoders need
// to know it.
class Image {
public:
    virtual ~Image() = default;

    [[nodiscard]] virtual std::shared_ptr<ByteSource> getSource() const = 0;

    [[nodiscard]] virtual bool isLittleEndian() const = 0;
    [[nodiscard]] virtual bool is64Bit() const        = 0;
};

SEGMAP_END
