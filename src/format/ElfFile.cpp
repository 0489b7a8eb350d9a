#include "ElfFile.h"

#include "segment/InterpSegment.h"
#include "segment/SegmentFactory.h"

#include <magic_enum.hpp>

using namespace ELFIO;

SEGMAP_FORMAT_BEGIN

ElfFile::ElfFile(const std::string& pPath) : mSource(std::make_shared<ByteSource>(pPath)) {
    if (!mSource->isValid()) {
        mIsValid = false;
        return;
    }
    if (!mImage.load(pPath)) {
        spdlog::error("Failed to load elf image.");
        mIsValid = false;
        return;
    }
    spdlog::info(
        "{:<12}{} {}",
        "Format:",
        is64Bit() ? "ELF64" : "ELF32",
        isLittleEndian() ? "little endian" : "big endian"
    );
    _decodeSections();
    _decodeSegments();
}

bool ElfFile::isLittleEndian() const { return mImage.get_encoding() == ELFDATA2LSB; }

bool ElfFile::is64Bit() const { return mImage.get_class() == ELFCLASS64; }

std::optional<std::string> ElfFile::getInterpreter() const {
    for (auto& segment : mSegments) {
        if (auto interp = dynamic_cast<const InterpSegment*>(segment.get())) {
            return interp->getInterpName();
        }
    }
    return std::nullopt;
}

std::vector<SegmentMapping> ElfFile::getSectionMapping() const {
    std::vector<SegmentMapping> result;
    for (size_t idx = 0; idx < mSegments.size(); ++idx) {
        auto&          segment = *mSegments[idx];
        SegmentMapping mapping{idx, {}};
        for (auto& section : mSections) {
            if (section.mType == SectionType::Null) continue;
            // .tbss occupies no space outside PT_TLS.
            if ((section.mFlags & SHF_TLS) && section.mType == SectionType::Nobits
                && segment.type() != SegmentType::Tls) {
                continue;
            }
            if (segment.sectionInSegment(section)) {
                mapping.mSections.emplace_back(section.mName);
            }
        }
        result.emplace_back(std::move(mapping));
    }
    return result;
}

void ElfFile::_decodeSections() {
    for (auto& sec : mImage.sections) {
        SectionHeader header;
        header.mName       = sec->get_name();
        header.mRawType    = sec->get_type();
        header.mType       = toSectionType(header.mRawType);
        header.mNameOffset = sec->get_name_string_offset();
        header.mFlags      = sec->get_flags();
        header.mAddress    = sec->get_address();
        header.mOffset     = sec->get_offset();
        header.mSize       = sec->get_size();
        header.mLink       = sec->get_link();
        header.mInfo       = sec->get_info();
        header.mAddrAlign  = sec->get_addr_align();
        header.mEntrySize  = sec->get_entry_size();
        if (header.mType == SectionType::Unknown) {
            spdlog::warn("Section {} has unrecognized type {:#x}.", header.mName, header.mRawType);
        }
        mSections.emplace_back(std::move(header));
    }
}

void ElfFile::_decodeSegments() {
    for (auto& seg : mImage.segments) {
        ProgramHeader header;
        header.mRawType         = seg->get_type();
        header.mType            = toSegmentType(header.mRawType);
        header.mFlags           = seg->get_flags();
        header.mOffset          = seg->get_offset();
        header.mVirtualAddress  = seg->get_virtual_address();
        header.mPhysicalAddress = seg->get_physical_address();
        header.mFileSize        = seg->get_file_size();
        header.mMemorySize      = seg->get_memory_size();
        header.mAlign           = seg->get_align();
        if (header.mType == SegmentType::Unknown) {
            spdlog::warn("Segment #{} has unrecognized type {:#x}.", mSegments.size(), header.mRawType);
        }
        auto segment = makeSegment(header, mSource, *this);
        spdlog::debug(
            "Segment #{} {} ({}) offset {:#x} filesz {:#x}",
            mSegments.size(),
            segtype2str(segment->type()),
            magic_enum::enum_name(segment->kind()),
            header.mOffset,
            header.mFileSize
        );
        mSegments.emplace_back(std::move(segment));
    }
}

SEGMAP_FORMAT_END
