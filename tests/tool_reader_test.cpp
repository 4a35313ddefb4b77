/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_tool_reader.h"
#include "tpl_test_util.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace ps::tpl {
namespace {

TEST(ToolReaderTest, DisplayNameIsTextAfterLastEquals) {
    EXPECT_EQ(tool_display_name("Default=MyBrush"), "MyBrush");
    EXPECT_EQ(tool_display_name("a=b=c"), "c");
    EXPECT_EQ(tool_display_name("Plain"), "Plain");
    EXPECT_EQ(tool_display_name("Trailing="), "");
}

TEST(ToolReaderTest, GroupsRecordsByTypeInFirstSeenOrder) {
    std::vector<std::uint8_t> buf;
    test::append_tool_head("1754$/Brush=Soft", "Brsh", 1, &buf);
    test::append_long_property("Sz  ", 10, &buf);
    test::append_tool_head("Eraser One", " Ersr ", 0, &buf);
    test::append_tool_head("Hard", "Brsh", 2, &buf);
    test::append_long_property("Sz  ", 20, &buf);
    test::append_property_head("Anti", "bool", &buf);
    test::append_u8(1, &buf);

    ByteReader r(buf);
    const Document doc = read_tools(r);
    ASSERT_EQ(doc.groups.size(), 2U);
    EXPECT_EQ(doc.groups[0].type, "Brsh");
    EXPECT_EQ(doc.groups[1].type, "Ersr");
    EXPECT_EQ(doc.tool_count(), 3U);

    const ToolGroup* brushes = doc.find("Brsh");
    ASSERT_NE(brushes, nullptr);
    ASSERT_EQ(brushes->tools.size(), 2U);
    EXPECT_EQ(brushes->tools[0].name, "Soft");
    EXPECT_EQ(brushes->tools[1].name, "Hard");
    ASSERT_EQ(brushes->tools[1].properties.size(), 2U);
    EXPECT_EQ(*brushes->tools[1].properties[1].entry->value.get_if<bool>(), true);

    const ToolGroup* erasers = doc.find("Ersr");
    ASSERT_NE(erasers, nullptr);
    EXPECT_EQ(erasers->tools[0].name, "Eraser One");
    EXPECT_TRUE(erasers->tools[0].properties.empty());
}

TEST(ToolReaderTest, StopsWhenFewerThanFourBytesRemain) {
    std::vector<std::uint8_t> buf;
    test::append_tool_head("One", "Brsh", 0, &buf);
    test::append_u8(0, &buf);
    test::append_u8(0, &buf);
    test::append_u8(0, &buf);

    ByteReader r(buf);
    const Document doc = read_tools(r);
    EXPECT_EQ(doc.tool_count(), 1U);
    EXPECT_EQ(r.remaining(), 3U);
}

TEST(ToolReaderTest, EmptySectionYieldsEmptyDocument) {
    const std::vector<std::uint8_t> buf = {0x00, 0x00};
    ByteReader r(buf);
    EXPECT_TRUE(read_tools(r).empty());
}

TEST(ToolReaderTest, TruncatedRecordAbortsDecode) {
    std::vector<std::uint8_t> buf;
    test::append_tool_head("One", "Brsh", 2, &buf);
    test::append_long_property("Sz  ", 10, &buf);

    ByteReader r(buf);
    try {
        (void)read_tools(r);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.kind(), DecodeErrorKind::UnexpectedEndOfBuffer);
    }
}

}  // namespace
}  // namespace ps::tpl
