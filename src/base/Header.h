#pragma once

#include "Base.h"

#include <cstdint>
#include <string>
#include <string_view>

SEGMAP_BEGIN

enum class SegmentType {
    Null,
    Load,
    Dynamic,
    Interp,
    Note,
    Shlib,
    Phdr,
    Tls,
    GnuEhFrame,
    GnuStack,
    GnuRelro,
    GnuProperty,
    Unknown
};

enum class SectionType {
    Null,
    Progbits,
    Symtab,
    Strtab,
    Rela,
    Hash,
    Dynamic,
    Note,
    Nobits,
    Rel,
    Shlib,
    Dynsym,
    InitArray,
    FiniArray,
    PreinitArray,
    Group,
    SymtabShndx,
    Unknown
};

// Resolve raw p_type / sh_type values to the symbolic identifiers the
// containment rules are written against.
[[nodiscard]] SegmentType toSegmentType(uint32_t pRawType);
[[nodiscard]] SectionType toSectionType(uint32_t pRawType);

[[nodiscard]] std::string segtype2str(SegmentType pType);
[[nodiscard]] std::string sectype2str(SectionType pType);

struct ProgramHeader {
    SegmentType mType{SegmentType::Null};
    uint32_t    mRawType{};
    uint32_t    mFlags{};
    uint64_t    mOffset{};
    uint64_t    mVirtualAddress{};
    uint64_t    mPhysicalAddress{};
    uint64_t    mFileSize{};
    uint64_t    mMemorySize{};
    uint64_t    mAlign{};

    // Lookup by ELF field name (p_type, p_offset, ...).
    [[nodiscard]] uint64_t field(std::string_view pName) const;
};

struct SectionHeader {
    std::string mName;
    SectionType mType{SectionType::Null};
    uint32_t    mRawType{};
    uint32_t    mNameOffset{};
    uint64_t    mFlags{};
    uint64_t    mAddress{};
    uint64_t    mOffset{};
    uint64_t    mSize{};
    uint32_t    mLink{};
    uint32_t    mInfo{};
    uint64_t    mAddrAlign{};
    uint64_t    mEntrySize{};

    // Lookup by ELF field name (sh_type, sh_flags, ...).
    [[nodiscard]] uint64_t field(std::string_view pName) const;
};

SEGMAP_END
