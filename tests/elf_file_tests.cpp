/**
 * @file elf_file_tests.cpp
 * @brief End-to-end tests over a small ELF64 image loaded with ELFIO
 */

#include "test_helpers.hpp"
#include "Exporter.h"
#include "format/ElfFile.h"
#include "segment/NoteSegment.h"
#include <gtest/gtest.h>

using namespace segmap;

class ElfFileTest : public ::testing::Test {
protected:
    TempFile file{"segmap_minimal.elf", buildMinimalElf()};
    format::ElfFile image{file.path()};
};

// ============================================================================
// Decoding
// ============================================================================

TEST_F(ElfFileTest, LoadsImage) {
    ASSERT_TRUE(image.isValid());
    EXPECT_TRUE(image.is64Bit());
    EXPECT_TRUE(image.isLittleEndian());
}

TEST_F(ElfFileTest, DecodesProgramHeaders) {
    ASSERT_TRUE(image.isValid());
    auto& segments = image.getSegments();
    ASSERT_EQ(segments.size(), 3u);

    EXPECT_EQ(segments[0]->type(), SegmentType::Interp);
    EXPECT_EQ(segments[0]->kind(), SegmentKind::Interp);
    EXPECT_EQ(segments[0]->field("p_offset"), 0xe8u);
    EXPECT_EQ(segments[0]->field("p_filesz"), 28u);

    EXPECT_EQ(segments[1]->type(), SegmentType::Note);
    EXPECT_EQ(segments[1]->kind(), SegmentKind::Note);

    EXPECT_EQ(segments[2]->type(), SegmentType::Load);
    EXPECT_EQ(segments[2]->kind(), SegmentKind::Plain);
    EXPECT_EQ(segments[2]->header().mVirtualAddress, 0x400000u);
    EXPECT_EQ(segments[2]->header().mMemorySize, 0x200u);
}

TEST_F(ElfFileTest, DecodesSectionHeaders) {
    ASSERT_TRUE(image.isValid());
    auto& sections = image.getSections();
    ASSERT_EQ(sections.size(), 5u);
    EXPECT_EQ(sections[0].mType, SectionType::Null);
    EXPECT_EQ(sections[1].mName, ".interp");
    EXPECT_EQ(sections[2].mType, SectionType::Note);
    EXPECT_EQ(sections[3].mName, ".shstrtab");
    EXPECT_EQ(sections[4].mType, SectionType::Nobits);
    EXPECT_EQ(sections[4].field("sh_size"), 0x40u);
}

TEST_F(ElfFileTest, ReadsInterpreter) {
    ASSERT_TRUE(image.isValid());
    auto interp = image.getInterpreter();
    ASSERT_TRUE(interp.has_value());
    EXPECT_EQ(*interp, kInterpPath);
}

TEST_F(ElfFileTest, IteratesNotes) {
    ASSERT_TRUE(image.isValid());
    auto noteSegment = dynamic_cast<const NoteSegment*>(image.getSegments()[1].get());
    ASSERT_NE(noteSegment, nullptr);
    auto notes = noteSegment->iterNotes().collect();
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_EQ(notes[0].mName, "GNU");
    EXPECT_EQ(notes[0].typeName(), "NT_GNU_BUILD_ID");
    EXPECT_EQ(notes[0].toJson()["n_desc"], "deadbeef");
}

// ============================================================================
// Section to segment mapping
// ============================================================================

TEST_F(ElfFileTest, MapsSectionsToSegments) {
    ASSERT_TRUE(image.isValid());
    auto mapping = image.getSectionMapping();
    ASSERT_EQ(mapping.size(), 3u);
    EXPECT_EQ(mapping[0].mSections, (std::vector<std::string>{".interp"}));
    EXPECT_EQ(mapping[1].mSections, (std::vector<std::string>{".note.gnu.build-id"}));
    EXPECT_EQ(mapping[2].mSections, (std::vector<std::string>{".interp", ".note.gnu.build-id", ".bss"}));
}

// ============================================================================
// Export
// ============================================================================

TEST_F(ElfFileTest, ExportsJson) {
    ASSERT_TRUE(image.isValid());
    auto json = exportImage(image, ExportArguments{});
    ASSERT_EQ(json["segments"].size(), 3u);
    EXPECT_EQ(json["segments"][0]["type"], "PT_INTERP");
    EXPECT_EQ(json["segments"][0]["kind"], "Interp");
    EXPECT_EQ(json["segments"][2]["p_memsz"], 0x200);
    EXPECT_EQ(json["interpreter"], kInterpPath);
    ASSERT_EQ(json["notes"].size(), 1u);
    EXPECT_EQ(json["notes"][0]["type_name"], "NT_GNU_BUILD_ID");
    EXPECT_EQ(json["mapping"][2]["sections"].size(), 3u);
}

TEST_F(ElfFileTest, ExportWithoutNotes) {
    ASSERT_TRUE(image.isValid());
    auto json = exportImage(image, ExportArguments{false});
    EXPECT_FALSE(json.contains("notes"));
    EXPECT_EQ(json["segments"].size(), 3u);
}

TEST(ElfFileLoadTest, RejectsNonElfInput) {
    TempFile file("segmap_not_elf.bin", "this is not an ELF file at all");
    format::ElfFile image(file.path());
    EXPECT_FALSE(image.isValid());
}

TEST(ElfFileLoadTest, RejectsMissingFile) {
    format::ElfFile image("/nonexistent/segmap/input.elf");
    EXPECT_FALSE(image.isValid());
}
