/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "Format.hpp"
#include "IPAddress.hpp"
#include "StringUtil.hpp"
#include "Time.hpp"

TEST(TableFormatTest, LongCellsAreCut)
{
	EXPECT_EQ(LTableFormat::FitCell("abc", 5), "abc  ");
	EXPECT_EQ(LTableFormat::FitCell("abcdefgh", 5), "abc..");
	EXPECT_EQ(LTableFormat::FitCell("abcdefgh", 2), "..");
}

TEST(TableFormatTest, RowsAreAlignedWithoutTrailingPadding)
{
	LTableFormat const Format({ { "Proto", 6 }, { "Port", 6 } });
	auto const         Lines = Format.Format({ { "TCP", "4840" } });

	ASSERT_EQ(Lines.size(), 3u);
	EXPECT_EQ(Lines[0], "Proto   Port");
	EXPECT_EQ(Lines[1], std::string(14, '-'));
	EXPECT_EQ(Lines[2], "TCP     4840");
}

TEST(StringUtilTest, ShortenCollapsesAndCuts)
{
	EXPECT_EQ(LStringUtil::Shorten("  BadTimeout \n  while   reading ", 220), "BadTimeout while reading");
	EXPECT_EQ(LStringUtil::Shorten("abcdefghij", 8), "abcde...");
}

TEST(StringUtilTest, SplitLastColon)
{
	EXPECT_EQ(LStringUtil::SplitLastColon("[::1]:4840"), (std::pair<std::string, std::string>{ "[::1]", "4840" }));
	EXPECT_EQ(LStringUtil::SplitLastColon("host"), (std::pair<std::string, std::string>{ "host", "" }));
	EXPECT_EQ(LStringUtil::StripBrackets("[fe80::1]"), "fe80::1");
}

TEST(TimeTest, Iso8601AndFileStamp)
{
	// 2026-01-31T17:04:05.123Z
	LMsec const Stamp = 1769879045123;
	EXPECT_EQ(LTime::FormatIso8601(Stamp), "2026-01-31T17:04:05.123Z");
	EXPECT_EQ(LTime::FormatFileStamp(Stamp), "2026-01-31T17-04-05-123Z");
}

TEST(IPAddressTest, ParsesAndUnmaps)
{
	auto const Mapped = LIPAddress::FromString("::ffff:10.0.0.5");
	ASSERT_TRUE(Mapped.has_value());
	EXPECT_TRUE(Mapped->IsV4Mapped());
	EXPECT_EQ(Mapped->UnmapV4().ToString(), "10.0.0.5");

	auto const Bracketed = LIPAddress::FromString("[fe80::1]");
	ASSERT_TRUE(Bracketed.has_value());
	EXPECT_EQ(Bracketed->Family, EIPFamily::IPv6);
	EXPECT_EQ(Bracketed->ToString(), "fe80::1");

	EXPECT_FALSE(LIPAddress::FromString("plc.local").has_value());
}
