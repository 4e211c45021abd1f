/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <chrono>
#include <string>

#include "Types.hpp"

namespace LTime
{
	LMsec GetEpochMs();

	// 2026-01-31T17:04:05.123Z
	std::string FormatIso8601(LMsec EpochMs);

	inline std::string NowIso8601() { return FormatIso8601(GetEpochMs()); }

	// ISO-8601 with ':' and '.' replaced by '-', safe to use in file names
	std::string FormatFileStamp(LMsec EpochMs);
} // namespace LTime
