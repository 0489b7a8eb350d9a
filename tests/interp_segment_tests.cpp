/**
 * @file interp_segment_tests.cpp
 * @brief Tests for interpreter path extraction
 */

#include "test_helpers.hpp"
#include "base/Error.h"
#include "segment/InterpSegment.h"
#include <gtest/gtest.h>

using namespace segmap;

TEST(InterpSegmentTest, ReadsPathWithoutTerminator) {
    std::string bytes(8, 'x');
    bytes += std::string("/lib64/ld-linux.so.2\0", 21);
    bytes += "garbage";
    FakeImage image(bytes);
    InterpSegment segment(makeSegmentHeader(SegmentType::Interp, 8, 0, 21, 21), image.getSource());
    EXPECT_EQ(segment.getInterpName(), "/lib64/ld-linux.so.2");
}

TEST(InterpSegmentTest, IgnoresFileszBound) {
    // Only the terminator ends the path, not p_filesz.
    FakeImage image(std::string("/lib/ld-musl-x86_64.so.1\0", 25));
    InterpSegment segment(makeSegmentHeader(SegmentType::Interp, 0, 0, 4, 4), image.getSource());
    EXPECT_EQ(segment.getInterpName(), "/lib/ld-musl-x86_64.so.1");
}

TEST(InterpSegmentTest, KeepsUtf8Bytes) {
    FakeImage image(std::string("/opt/\xc3\xa9t\xc3\xa9/ld.so\0", 17));
    InterpSegment segment(makeSegmentHeader(SegmentType::Interp, 0, 0, 17, 17), image.getSource());
    EXPECT_EQ(segment.getInterpName(), "/opt/\xc3\xa9t\xc3\xa9/ld.so");
}

TEST(InterpSegmentTest, MissingTerminatorThrows) {
    FakeImage image("/lib64/ld-linux.so.2");
    InterpSegment segment(makeSegmentHeader(SegmentType::Interp, 0, 0, 20, 20), image.getSource());
    EXPECT_THROW((void)segment.getInterpName(), IoError);
}
