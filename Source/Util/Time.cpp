/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "Time.hpp"

#include <algorithm>
#include <ctime>
#include <spdlog/fmt/fmt.h>

LMsec LTime::GetEpochMs()
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
		.count();
}

std::string LTime::FormatIso8601(LMsec EpochMs)
{
	auto const Seconds = static_cast<time_t>(EpochMs / 1000);
	auto const Millis = static_cast<int>(EpochMs % 1000);

	tm Utc{};
	if (gmtime_r(&Seconds, &Utc) == nullptr)
	{
		return {};
	}

	return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z", Utc.tm_year + 1900, Utc.tm_mon + 1, Utc.tm_mday,
		Utc.tm_hour, Utc.tm_min, Utc.tm_sec, Millis);
}

std::string LTime::FormatFileStamp(LMsec EpochMs)
{
	std::string Stamp = FormatIso8601(EpochMs);
	std::ranges::replace(Stamp, ':', '-');
	std::ranges::replace(Stamp, '.', '-');
	return Stamp;
}
