/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <functional>
#include <string>
#include <vector>

#include "Data/ProbeTypes.hpp"
#include "SocketTableSource.hpp"
#include "Time.hpp"
#include "Types.hpp"

// Polls the connection table for a fixed window and collects every row coming from the target address
class LConnectionWatcher
{
	ISocketTableSource& Source;
	LSleepFunction      Sleep;
	LClockFunction      Clock;

public:
	// Called after every tick with the 1-based tick number
	std::function<void(size_t Tick, size_t Polls)> OnTick{};

	// Called when a tick's capture failed, polling continues
	std::function<void(size_t Tick, std::string const& Message)> OnTickFailed{};

	LConnectionWatcher(ISocketTableSource& Source_, LSleepFunction Sleep_, LClockFunction Clock_ = LTime::GetEpochMs)
		: Source(Source_)
		, Sleep(std::move(Sleep_))
		, Clock(std::move(Clock_))
	{
	}

	// Throws LProbeError(Monitor) for non-positive parameters or if no tick succeeded,
	// LProbeCancelled if the sleep was interrupted
	std::vector<LConnectionAttempt> Watch(std::string const& TargetAddress, LDuration Duration, LDuration PollInterval);

	// ceil(Duration / PollInterval)
	static size_t GetPollCount(LDuration Duration, LDuration PollInterval);

	// Exact address comparison, "10.0.0.5" doesn't match "10.0.0.50:4840"
	static bool IsFromTarget(std::string const& RemoteEndpoint, std::string const& TargetAddress);
};
