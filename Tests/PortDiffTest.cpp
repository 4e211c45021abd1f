/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <gtest/gtest.h>

#include "Net/PortDiff.hpp"

static LSocketRecord Listener(std::string const& Address, std::string const& Port)
{
	return LSocketRecord{ .Protocol = "TCP", .LocalAddress = Address, .LocalPort = Port, .ProcessId = "4" };
}

TEST(PortDiffTest, NewCallbackPortIsDetected)
{
	auto const Diff = LPortDiffEngine::Diff(
		{ Listener("0.0.0.0", "135") }, { Listener("0.0.0.0", "135"), Listener("0.0.0.0", "52000") });

	EXPECT_EQ(Diff.NewPorts, std::vector<std::string>{ "0.0.0.0:52000" });
	EXPECT_TRUE(Diff.RemovedPorts.empty());
	EXPECT_EQ(Diff.NetChange, 1);
}

TEST(PortDiffTest, RemovedPortsAndNegativeChange)
{
	auto const Diff = LPortDiffEngine::Diff(
		{ Listener("0.0.0.0", "135"), Listener("127.0.0.1", "9000"), Listener("[::]", "135") },
		{ Listener("0.0.0.0", "135") });

	EXPECT_TRUE(Diff.NewPorts.empty());
	EXPECT_EQ(Diff.RemovedPorts, (std::vector<std::string>{ "127.0.0.1:9000", "[::]:135" }));
	EXPECT_EQ(Diff.NetChange, -2);
}

TEST(PortDiffTest, SameAddressDifferentPortIsADifferentKey)
{
	auto const Diff = LPortDiffEngine::Diff({ Listener("0.0.0.0", "135") }, { Listener("0.0.0.0", "136") });

	EXPECT_EQ(Diff.NewPorts, std::vector<std::string>{ "0.0.0.0:136" });
	EXPECT_EQ(Diff.RemovedPorts, std::vector<std::string>{ "0.0.0.0:135" });
	EXPECT_EQ(Diff.NetChange, 0);
}

TEST(PortDiffTest, DuplicateRecordsAreReportedOnceButCounted)
{
	auto const Diff = LPortDiffEngine::Diff(
		{}, { Listener("0.0.0.0", "52000"), Listener("0.0.0.0", "52000") });

	EXPECT_EQ(Diff.NewPorts, std::vector<std::string>{ "0.0.0.0:52000" });
	EXPECT_EQ(Diff.NetChange, 2);
}

TEST(PortDiffTest, EmptySnapshots)
{
	auto const Diff = LPortDiffEngine::Diff({}, {});

	EXPECT_TRUE(Diff.NewPorts.empty());
	EXPECT_TRUE(Diff.RemovedPorts.empty());
	EXPECT_EQ(Diff.NetChange, 0);
}
