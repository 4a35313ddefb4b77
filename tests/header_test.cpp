/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "tpl/tpl_header.h"
#include "tpl_test_util.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <vector>

namespace ps::tpl {
namespace {

TEST(HeaderTest, AcceptsSignaturesInAnyCase) {
    std::vector<std::uint8_t> upper;
    test::append_file_header(&upper);
    const HeaderCheck a = validate_header(upper);
    EXPECT_TRUE(a.valid);
    EXPECT_EQ(a.offset, 16U);

    std::vector<std::uint8_t> mixed;
    test::append_ascii("8bTp", &mixed);
    test::append_ascii("\xff\xff\xff\xff\xff\xff\xff\xff", &mixed);
    test::append_ascii("8bIm", &mixed);
    EXPECT_TRUE(validate_header(mixed).valid);
}

TEST(HeaderTest, SignatureCompareClearsHighBit) {
    std::vector<std::uint8_t> buf;
    for (const char c : std::string_view("8BTP")) {
        test::append_u8(static_cast<std::uint8_t>(c | 0x80), &buf);
    }
    test::append_u64be(0, &buf);
    test::append_ascii("8BIM", &buf);
    EXPECT_TRUE(validate_header(buf).valid);
}

TEST(HeaderTest, RejectsWrongOrShortSignatures) {
    std::vector<std::uint8_t> psd;
    test::append_ascii("8BPS", &psd);
    test::append_u64be(0, &psd);
    test::append_ascii("8BIM", &psd);
    EXPECT_FALSE(validate_header(psd).valid);

    std::vector<std::uint8_t> bad_second;
    test::append_ascii("8BTP", &bad_second);
    test::append_u64be(0, &bad_second);
    test::append_ascii("8BIX", &bad_second);
    EXPECT_FALSE(validate_header(bad_second).valid);

    std::vector<std::uint8_t> short_buf;
    test::append_ascii("8BTP", &short_buf);
    test::append_u32be(0, &short_buf);
    EXPECT_FALSE(validate_header(short_buf).valid);
    EXPECT_FALSE(validate_header({}).valid);
}

TEST(HeaderTest, LocatesLastToolSectionMarker) {
    std::vector<std::uint8_t> buf(300, 0);
    const std::string_view marker = "8BIMtptp";
    std::copy(marker.begin(), marker.end(), buf.begin() + 10);
    std::copy(marker.begin(), marker.end(), buf.begin() + 200);

    const SectionLocation loc = locate_tool_section(buf);
    ASSERT_TRUE(loc.found);
    EXPECT_EQ(loc.offset, 216U);
}

TEST(HeaderTest, MissingMarkerIsNotFound) {
    std::vector<std::uint8_t> buf;
    test::append_file_header(&buf);
    test::append_ascii("8BIMtpt", &buf);
    EXPECT_FALSE(locate_tool_section(buf).found);
    EXPECT_FALSE(locate_tool_section({}).found);
}

}  // namespace
}  // namespace ps::tpl
