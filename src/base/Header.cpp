#include "Header.h"
#include "Error.h"

#include <elfio/elfio.hpp>

using namespace ELFIO;

SEGMAP_BEGIN

namespace {

// GNU extensions in the PT_LOOS range.
constexpr uint32_t GnuEhFrameType  = 0x6474e550;
constexpr uint32_t GnuStackType    = 0x6474e551;
constexpr uint32_t GnuRelroType    = 0x6474e552;
constexpr uint32_t GnuPropertyType = 0x6474e553;

} // namespace

SegmentType toSegmentType(uint32_t pRawType) {
    switch (pRawType) {
    case PT_NULL:
        return SegmentType::Null;
    case PT_LOAD:
        return SegmentType::Load;
    case PT_DYNAMIC:
        return SegmentType::Dynamic;
    case PT_INTERP:
        return SegmentType::Interp;
    case PT_NOTE:
        return SegmentType::Note;
    case PT_SHLIB:
        return SegmentType::Shlib;
    case PT_PHDR:
        return SegmentType::Phdr;
    case PT_TLS:
        return SegmentType::Tls;
    case GnuEhFrameType:
        return SegmentType::GnuEhFrame;
    case GnuStackType:
        return SegmentType::GnuStack;
    case GnuRelroType:
        return SegmentType::GnuRelro;
    case GnuPropertyType:
        return SegmentType::GnuProperty;
    default:
        return SegmentType::Unknown;
    }
}

SectionType toSectionType(uint32_t pRawType) {
    switch (pRawType) {
    case SHT_NULL:
        return SectionType::Null;
    case SHT_PROGBITS:
        return SectionType::Progbits;
    case SHT_SYMTAB:
        return SectionType::Symtab;
    case SHT_STRTAB:
        return SectionType::Strtab;
    case SHT_RELA:
        return SectionType::Rela;
    case SHT_HASH:
        return SectionType::Hash;
    case SHT_DYNAMIC:
        return SectionType::Dynamic;
    case SHT_NOTE:
        return SectionType::Note;
    case SHT_NOBITS:
        return SectionType::Nobits;
    case SHT_REL:
        return SectionType::Rel;
    case SHT_SHLIB:
        return SectionType::Shlib;
    case SHT_DYNSYM:
        return SectionType::Dynsym;
    case SHT_INIT_ARRAY:
        return SectionType::InitArray;
    case SHT_FINI_ARRAY:
        return SectionType::FiniArray;
    case SHT_PREINIT_ARRAY:
        return SectionType::PreinitArray;
    case SHT_GROUP:
        return SectionType::Group;
    case SHT_SYMTAB_SHNDX:
        return SectionType::SymtabShndx;
    default:
        return SectionType::Unknown;
    }
}

std::string segtype2str(SegmentType pType) {
    switch (pType) {
    case SegmentType::Null:
        return "PT_NULL";
    case SegmentType::Load:
        return "PT_LOAD";
    case SegmentType::Dynamic:
        return "PT_DYNAMIC";
    case SegmentType::Interp:
        return "PT_INTERP";
    case SegmentType::Note:
        return "PT_NOTE";
    case SegmentType::Shlib:
        return "PT_SHLIB";
    case SegmentType::Phdr:
        return "PT_PHDR";
    case SegmentType::Tls:
        return "PT_TLS";
    case SegmentType::GnuEhFrame:
        return "PT_GNU_EH_FRAME";
    case SegmentType::GnuStack:
        return "PT_GNU_STACK";
    case SegmentType::GnuRelro:
        return "PT_GNU_RELRO";
    case SegmentType::GnuProperty:
        return "PT_GNU_PROPERTY";
    case SegmentType::Unknown:
    default:
        return "unknown";
    }
}

std::string sectype2str(SectionType pType) {
    switch (pType) {
    case SectionType::Null:
        return "SHT_NULL";
    case SectionType::Progbits:
        return "SHT_PROGBITS";
    case SectionType::Symtab:
        return "SHT_SYMTAB";
    case SectionType::Strtab:
        return "SHT_STRTAB";
    case SectionType::Rela:
        return "SHT_RELA";
    case SectionType::Hash:
        return "SHT_HASH";
    case SectionType::Dynamic:
        return "SHT_DYNAMIC";
    case SectionType::Note:
        return "SHT_NOTE";
    case SectionType::Nobits:
        return "SHT_NOBITS";
    case SectionType::Rel:
        return "SHT_REL";
    case SectionType::Shlib:
        return "SHT_SHLIB";
    case SectionType::Dynsym:
        return "SHT_DYNSYM";
    case SectionType::InitArray:
        return "SHT_INIT_ARRAY";
    case SectionType::FiniArray:
        return "SHT_FINI_ARRAY";
    case SectionType::PreinitArray:
        return "SHT_PREINIT_ARRAY";
    case SectionType::Group:
        return "SHT_GROUP";
    case SectionType::SymtabShndx:
        return "SHT_SYMTAB_SHNDX";
    case SectionType::Unknown:
    default:
        return "unknown";
    }
}

uint64_t ProgramHeader::field(std::string_view pName) const {
    if (pName == "p_type") return mRawType;
    if (pName == "p_flags") return mFlags;
    if (pName == "p_offset") return mOffset;
    if (pName == "p_vaddr") return mVirtualAddress;
    if (pName == "p_paddr") return mPhysicalAddress;
    if (pName == "p_filesz") return mFileSize;
    if (pName == "p_memsz") return mMemorySize;
    if (pName == "p_align") return mAlign;
    throw UnknownFieldError(std::string(pName));
}

uint64_t SectionHeader::field(std::string_view pName) const {
    if (pName == "sh_name") return mNameOffset;
    if (pName == "sh_type") return mRawType;
    if (pName == "sh_flags") return mFlags;
    if (pName == "sh_addr") return mAddress;
    if (pName == "sh_offset") return mOffset;
    if (pName == "sh_size") return mSize;
    if (pName == "sh_link") return mLink;
    if (pName == "sh_info") return mInfo;
    if (pName == "sh_addralign") return mAddrAlign;
    if (pName == "sh_entsize") return mEntrySize;
    throw UnknownFieldError(std::string(pName));
}

SEGMAP_END
