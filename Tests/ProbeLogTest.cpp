/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <algorithm>
#include <fstream>
#include <sstream>
#include <unistd.h>
#include <gtest/gtest.h>

#include "ProbeLog.hpp"
#include "StringUtil.hpp"
#include "Time.hpp"

struct LSample
{
	int Port = 4840;

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Port));
	}
};

class ProbeLogTest : public ::testing::Test
{
protected:
	stdfs::path              Directory{};
	std::vector<std::string> Headlines{};

	void SetUp() override
	{
		Directory = stdfs::temp_directory_path() / fmt::format("lauscher-log-{}", getpid());
		stdfs::remove_all(Directory);
	}

	void TearDown() override { stdfs::remove_all(Directory); }

	std::unique_ptr<LProbeLog> MakeLog()
	{
		return std::make_unique<LProbeLog>(
			Directory, LTime::GetEpochMs(), [this](std::string const& Line) { Headlines.push_back(Line); });
	}

	static std::vector<std::string> ReadLines(stdfs::path const& Path)
	{
		std::ifstream      File(Path);
		std::ostringstream Content;
		Content << File.rdbuf();
		return LStringUtil::SplitLines(Content.str());
	}

	// Line text without the "[timestamp] " prefix
	static std::vector<std::string> StripTimestamps(std::vector<std::string> const& Lines)
	{
		std::vector<std::string> Result{};
		for (auto const& Line : Lines)
		{
			auto const Pos = Line.find("] ");
			Result.push_back(Pos == std::string::npos ? Line : Line.substr(Pos + 2));
		}
		return Result;
	}
};

TEST_F(ProbeLogTest, FileNameCarriesTheStartTime)
{
	EXPECT_EQ(LProbeLog::MakeFileName(1769879045123), "lauscher-probe_2026-01-31T17-04-05-123Z.log");

	auto const Log = MakeLog();
	ASSERT_FALSE(Log->GetFilePath().empty());
	EXPECT_TRUE(stdfs::exists(Log->GetFilePath()));
	EXPECT_EQ(Log->GetFilePath().parent_path(), Directory);
	EXPECT_TRUE(Log->GetFilePath().filename().string().starts_with(LProbeLog::kFilePrefix));
}

TEST_F(ProbeLogTest, HeadlinesReachObserversDetailsDoNot)
{
	auto Log = MakeLog();
	Log->Headline("Querying endpoints");
	Log->Detail("detail only");
	Log->Headline("first\nsecond");
	auto const Path = Log->GetFilePath();
	Log.reset();

	EXPECT_EQ(Headlines, (std::vector<std::string>{ "Querying endpoints", "first", "second" }));

	auto const Lines = ReadLines(Path);
	ASSERT_EQ(Lines.size(), 4u);
	for (auto const& Line : Lines)
	{
		EXPECT_TRUE(Line.starts_with("[20")) << Line;
		EXPECT_EQ(Line[24], 'Z') << Line;
	}
	EXPECT_EQ(StripTimestamps(Lines),
		(std::vector<std::string>{ "Querying endpoints", "detail only", "first", "second" }));
}

TEST_F(ProbeLogTest, SectionsAndTables)
{
	auto Log = MakeLog();
	Log->Section("Probe Configuration", { "Summary: test" });
	Log->Table("Listening Sockets", LTableFormat({ { "Proto", 6 }, { "Local Address", 8 } }),
		{ { "TCP", "fe80::1234:5678" } });
	Log->Table("Connection Attempts", LTableFormat({ { "Proto", 6 } }), {});
	auto const Path = Log->GetFilePath();
	Log.reset();

	EXPECT_EQ(StripTimestamps(ReadLines(Path)),
		(std::vector<std::string>{
			"===== Probe Configuration =====",
			"Summary: test",
			"===== End Probe Configuration =====",
			"===== Listening Sockets =====",
			"Proto   Local ..",
			"----------------",
			"TCP     fe80::..",
			"===== End Listening Sockets =====",
			"===== Connection Attempts =====",
			"Proto",
			"------",
			"(none)",
			"===== End Connection Attempts =====",
		}));
}

TEST_F(ProbeLogTest, DetailedDataIsSingleLineJson)
{
	auto const Json = LProbeLog::ToJson("sample", LSample{});
	EXPECT_EQ(Json.find('\n'), std::string::npos);
	EXPECT_NE(Json.find("\"sample\""), std::string::npos);
	EXPECT_NE(Json.find("\"Port\":"), std::string::npos);
}

TEST_F(ProbeLogTest, IssuesAreCollectedAndSummarized)
{
	auto Log = MakeLog();
	Log->WriteIssueSummary();
	Log->Warning("Baseline Port Capture", "netstat not found");
	Log->Error("Subscription Creation", "BadNodeIdUnknown", "SubscriptionError");
	Log->WriteIssueSummary();

	ASSERT_EQ(Log->GetWarnings().size(), 1u);
	EXPECT_EQ(Log->GetWarnings()[0].Context, "Baseline Port Capture");
	EXPECT_TRUE(Log->GetWarnings()[0].Kind.empty());
	ASSERT_EQ(Log->GetErrors().size(), 1u);
	EXPECT_EQ(Log->GetErrors()[0].Kind, "SubscriptionError");

	auto const Path = Log->GetFilePath();
	Log.reset();
	auto const Lines = StripTimestamps(ReadLines(Path));

	EXPECT_EQ(Lines.front(), "[WARNING] Baseline Port Capture: netstat not found");
	EXPECT_EQ(std::count(Lines.begin(), Lines.end(), std::string("===== Error Detected =====")), 1);
	EXPECT_EQ(std::count(Lines.begin(), Lines.end(), std::string("===== Error And Warning Summary =====")), 1);
	EXPECT_EQ(std::count(Lines.begin(), Lines.end(), std::string("Total Errors: 1")), 1);
	EXPECT_EQ(std::count(Lines.begin(), Lines.end(), std::string("Total Warnings: 1")), 1);
	EXPECT_EQ(std::count(Lines.begin(), Lines.end(), std::string("  Type: SubscriptionError")), 1);
	EXPECT_EQ(Lines.back(), "===== End Error And Warning Summary =====");
	EXPECT_TRUE(Headlines.empty());
}

TEST_F(ProbeLogTest, UnwritableDirectoryFallsBackToNoFile)
{
	// a regular file where the directory should be
	stdfs::create_directories(Directory);
	auto const Blocker = Directory / "blocked";
	std::ofstream(Blocker) << "x";

	LProbeLog Log(Blocker, LTime::GetEpochMs(), [this](std::string const& Line) { Headlines.push_back(Line); });
	EXPECT_TRUE(Log.GetFilePath().empty());

	Log.Headline("still forwarded");
	EXPECT_EQ(Headlines, std::vector<std::string>{ "still forwarded" });
}
