#include "licenseheaders/core/comment_style.hpp"
#include "licenseheaders/core/header_detector.hpp"
#include <gtest/gtest.h>

namespace licenseheaders {

class HeaderDetectorTest : public ::testing::Test {
protected:
    const CommentStyle& c_ = CommentStyleRegistry::builtin().require("c");
    const CommentStyle& python_ = CommentStyleRegistry::builtin().require("python");
    const CommentStyle& xml_ = CommentStyleRegistry::builtin().require("xml");
};

TEST_F(HeaderDetectorTest, BlockHeaderAtTop)
{
    std::vector<std::string> lines = {"/*", " * Copyright 2020 Acme", " */", "", "int main() {}"};

    auto span = find_header(lines, c_);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->start_line, 0);
    EXPECT_EQ(span->end_line, 3);
}

TEST_F(HeaderDetectorTest, SingleLineBlock)
{
    std::vector<std::string> lines = {"/* Copyright 2020 Acme */", "int x;"};

    auto span = find_header(lines, c_);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(*span, (HeaderSpan{.start_line = 0, .end_line = 1}));
}

TEST_F(HeaderDetectorTest, OpenerDoesNotCloseItself)
{
    std::vector<std::string> lines = {"/*/", " text", " */", "int x;"};

    auto span = find_header(lines, c_);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->end_line, 3);
}

TEST_F(HeaderDetectorTest, LeadingBlankLinesWithinTolerance)
{
    std::vector<std::string> lines = {"", "  ", "/*", " * text", " */", "code"};

    auto span = find_header(lines, c_);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->start_line, 2);
    EXPECT_EQ(span->end_line, 5);
}

TEST_F(HeaderDetectorTest, TooManyLeadingBlankLines)
{
    std::vector<std::string> lines = {"", "", "", "/*", " * text", " */"};

    EXPECT_FALSE(find_header(lines, c_).has_value());
    EXPECT_TRUE(find_header(lines, c_, 3).has_value());
}

TEST_F(HeaderDetectorTest, CodeBeforeCommentMeansNoHeader)
{
    std::vector<std::string> lines = {"#include <stdio.h>", "/* not a header */"};

    EXPECT_FALSE(find_header(lines, c_).has_value());
}

TEST_F(HeaderDetectorTest, UnterminatedBlockIsAbsent)
{
    std::vector<std::string> lines = {"/*", " * Copyright 2020 Acme", "int main() {}"};

    EXPECT_FALSE(find_header(lines, c_).has_value());
}

TEST_F(HeaderDetectorTest, EmptyRemainderIsAbsent)
{
    std::vector<std::string> lines;

    EXPECT_FALSE(find_header(lines, c_).has_value());
    EXPECT_FALSE(find_header(lines, python_).has_value());
}

TEST_F(HeaderDetectorTest, LineHeaderRunStopsAtBlankLine)
{
    std::vector<std::string> lines = {"# Copyright 2021 Acme", "#", "# MIT License", "", "# comment",
                                      "import os"};

    auto span = find_header(lines, python_);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->start_line, 0);
    EXPECT_EQ(span->end_line, 3);
}

TEST_F(HeaderDetectorTest, LineHeaderRunStopsAtCode)
{
    std::vector<std::string> lines = {"# Copyright 2021 Acme", "import os"};

    auto span = find_header(lines, python_);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->size(), 1);
}

TEST_F(HeaderDetectorTest, IndentedLineCommentsCount)
{
    std::vector<std::string> lines = {"  # indented", "\t# tabbed", "x = 1"};

    auto span = find_header(lines, python_);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->end_line, 2);
}

TEST_F(HeaderDetectorTest, LineStyleWithoutCommentIsAbsent)
{
    std::vector<std::string> lines = {"import os", "# later comment"};

    EXPECT_FALSE(find_header(lines, python_).has_value());
}

TEST_F(HeaderDetectorTest, XmlBlock)
{
    std::vector<std::string> lines = {"<!--", "  Copyright 2022 Acme", "-->", "<root/>"};

    auto span = find_header(lines, xml_);

    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(span->end_line, 3);
}

TEST_F(HeaderDetectorTest, SpanText)
{
    std::vector<std::string> lines = {"/*", " * a", " */", "x"};

    EXPECT_EQ(span_text(lines, HeaderSpan{.start_line = 0, .end_line = 3}), "/*\n * a\n */");
}

TEST(YearsTest, ExtractSingleYear)
{
    EXPECT_EQ(extract_years("Copyright (c) 2019 Acme"), "2019");
}

TEST(YearsTest, ExtractRangeWithSpaces)
{
    EXPECT_EQ(extract_years("Copyright 2019 - 2021 Acme"), "2019 - 2021");
    EXPECT_EQ(extract_years("Copyright 2019-2021, 2023 Acme"), "2019-2021");
}

TEST(YearsTest, IgnoresNumbersThatAreNotYears)
{
    EXPECT_FALSE(extract_years("Version 3.14, build 12345").has_value());
    EXPECT_FALSE(extract_years("port 8080").has_value());
    EXPECT_EQ(extract_years("id 120199 then 1999"), "1999");
}

TEST(YearsTest, ReplaceYears)
{
    EXPECT_EQ(replace_years(" * Copyright 2019-2021 Acme", "2024"), " * Copyright 2024 Acme");
    EXPECT_FALSE(replace_years(" * no year here", "2024").has_value());
}

TEST(YearsTest, ParseYearRange)
{
    EXPECT_EQ(parse_year_range("2019"), (YearRange{.first = 2019, .last = 2019}));
    EXPECT_EQ(parse_year_range("2019-2021"), (YearRange{.first = 2019, .last = 2021}));
    EXPECT_EQ(parse_year_range("2019 - 2021"), (YearRange{.first = 2019, .last = 2021}));
    EXPECT_FALSE(parse_year_range("twenty").has_value());
}

TEST(YearsTest, ExtendNeverShrinks)
{
    EXPECT_EQ(extend_year_range({.first = 2019, .last = 2021}, 2024), (YearRange{.first = 2019, .last = 2024}));
    EXPECT_EQ(extend_year_range({.first = 2019, .last = 2030}, 2024), (YearRange{.first = 2019, .last = 2030}));
}

TEST(YearsTest, FormatYearRange)
{
    EXPECT_EQ(format_year_range({.first = 2024, .last = 2024}), "2024");
    EXPECT_EQ(format_year_range({.first = 2019, .last = 2024}), "2019-2024");
}

TEST(YearsTest, CopyrightYearsSkipsEarlierLines)
{
    EXPECT_EQ(copyright_years("/*\n * Stable since 2015\n * COPYRIGHT (c) 2019-2021 Acme\n */"), "2019-2021");
    EXPECT_FALSE(copyright_years("Released 2015, MIT License").has_value());
}

TEST(YearsTest, ReplaceCopyrightYearsKeepsEarlierYear)
{
    EXPECT_EQ(replace_copyright_years("2019 fork, Copyright 2020 Acme", "2024"), "2019 fork, Copyright 2024 Acme");
    EXPECT_FALSE(replace_copyright_years(" * since 2019", "2024").has_value());
    EXPECT_FALSE(replace_copyright_years(" * Copyright Acme", "2024").has_value());
}

TEST(LicenseTextTest, LicenseWordsOrDatedCopyright)
{
    EXPECT_TRUE(is_license_text("# Licensed under the Apache License"));
    EXPECT_TRUE(is_license_text("// SPDX-License-Identifier: MIT"));
    EXPECT_TRUE(is_license_text("/* Released under the MIT licence */"));
    EXPECT_TRUE(is_license_text("/* (C) Copyright 1999 Someone */"));
}

TEST(LicenseTextTest, OrdinaryCommentsAreNotLicenses)
{
    EXPECT_FALSE(is_license_text("# helper: parse args quickly"));
    EXPECT_FALSE(is_license_text("/* Fast ring buffer used by the scheduler */"));
    EXPECT_FALSE(is_license_text("/* Ring buffer, rewritten 2019 */"));
    EXPECT_FALSE(is_license_text("// copyright notice goes here"));
}

} // namespace licenseheaders
