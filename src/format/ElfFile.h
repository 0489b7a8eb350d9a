#pragma once

#include "base/Base.h"
#include "base/Header.h"
#include "base/Image.h"

#include "segment/Segment.h"

#include <elfio/elfio.hpp>

#include <optional>
#include <string>
#include <vector>

SEGMAP_FORMAT_BEGIN

struct SegmentMapping {
    size_t                   mSegmentIndex{};
    std::vector<std::string> mSections;
};

class ElfFile : public Image {
public:
    explicit ElfFile(const std::string& pPath);

    ElfFile(const ElfFile&)            = delete;
    ElfFile& operator=(const ElfFile&) = delete;

    [[nodiscard]] bool isValid() const { return mIsValid; }

    [[nodiscard]] std::shared_ptr<ByteSource> getSource() const override { return mSource; }

    [[nodiscard]] bool isLittleEndian() const override;
    [[nodiscard]] bool is64Bit() const override;

    [[nodiscard]] const std::vector<std::unique_ptr<Segment>>& getSegments() const { return mSegments; }
    [[nodiscard]] const std::vector<SectionHeader>&            getSections() const { return mSections; }

    // Path from the first PT_INTERP segment, if any.
    [[nodiscard]] std::optional<std::string> getInterpreter() const;

    // Section names per segment, like readelf's "Section to Segment mapping".
    [[nodiscard]] std::vector<SegmentMapping> getSectionMapping() const;

private:
    void _decodeSections();
    void _decodeSegments();

    ELFIO::elfio mImage;

    std::shared_ptr<ByteSource>           mSource;
    std::vector<std::unique_ptr<Segment>> mSegments;
    std::vector<SectionHeader>            mSections;

    bool mIsValid{true};
};

SEGMAP_FORMAT_END
