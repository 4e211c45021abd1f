/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "PortDiff.hpp"

#include <string>
#include <unordered_set>

static std::unordered_set<std::string> CollectKeys(std::vector<LSocketRecord> const& Records)
{
	std::unordered_set<std::string> Keys{};
	for (auto const& Record : Records)
	{
		Keys.insert(Record.Key());
	}
	return Keys;
}

// Keys of Records missing from Other, each key once
static std::vector<std::string> Missing(
	std::vector<LSocketRecord> const& Records, std::unordered_set<std::string> const& Other)
{
	std::vector<std::string>        Result{};
	std::unordered_set<std::string> Seen{};
	for (auto const& Record : Records)
	{
		auto Key = Record.Key();
		if (!Other.contains(Key) && Seen.insert(Key).second)
		{
			Result.push_back(std::move(Key));
		}
	}
	return Result;
}

LPortDiff LPortDiffEngine::Diff(std::vector<LSocketRecord> const& Before, std::vector<LSocketRecord> const& After)
{
	auto const BeforeKeys = CollectKeys(Before);
	auto const AfterKeys = CollectKeys(After);

	LPortDiff Result{};
	Result.NewPorts = Missing(After, BeforeKeys);
	Result.RemovedPorts = Missing(Before, AfterKeys);
	Result.NetChange = static_cast<int64_t>(After.size()) - static_cast<int64_t>(Before.size());
	return Result;
}
