/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ConnectionWatcher.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

#include "ProbeError.hpp"
#include "SocketTable.hpp"
#include "StringUtil.hpp"

size_t LConnectionWatcher::GetPollCount(LDuration Duration, LDuration PollInterval)
{
	if (Duration.count() <= 0 || PollInterval.count() <= 0)
	{
		return 0;
	}
	return static_cast<size_t>((Duration.count() + PollInterval.count() - 1) / PollInterval.count());
}

bool LConnectionWatcher::IsFromTarget(std::string const& RemoteEndpoint, std::string const& TargetAddress)
{
	auto const [Address, Port] = LStringUtil::SplitLastColon(RemoteEndpoint);
	return LStringUtil::StripBrackets(Address) == LStringUtil::StripBrackets(TargetAddress);
}

std::vector<LConnectionAttempt> LConnectionWatcher::Watch(
	std::string const& TargetAddress, LDuration Duration, LDuration PollInterval)
{
	size_t const Polls = GetPollCount(Duration, PollInterval);
	if (Polls == 0)
	{
		throw LProbeError(EProbeError::Monitor,
			fmt::format("invalid monitoring window {}ms / {}ms", Duration.count(), PollInterval.count()));
	}
	if (TargetAddress.empty())
	{
		throw LProbeError(EProbeError::Monitor, "no target address to monitor");
	}

	std::vector<LConnectionAttempt> Attempts{};
	size_t                          FailedTicks = 0;
	LMsec                           LastTimestamp = 0;

	for (size_t Tick = 1; Tick <= Polls; ++Tick)
	{
		if (!Sleep(PollInterval))
		{
			throw LProbeCancelled();
		}

		std::string Table;
		try
		{
			Table = Source.Capture();
		}
		catch (LProbeCancelled const&)
		{
			throw;
		}
		catch (std::exception const& e)
		{
			++FailedTicks;
			spdlog::debug("Monitor tick {}/{} failed: {}", Tick, Polls, e.what());
			if (OnTickFailed)
			{
				OnTickFailed(Tick, e.what());
			}
			if (OnTick)
			{
				OnTick(Tick, Polls);
			}
			continue;
		}

		// wall clock may step back, attempts stay ordered
		LMsec const Timestamp = std::max(Clock(), LastTimestamp);
		LastTimestamp = Timestamp;

		for (auto const& Row : LSocketTable::ParseRows(Table, Source.GetHeaderLines()))
		{
			if (!IsFromTarget(Row.RemoteEndpoint, TargetAddress))
			{
				continue;
			}

			auto [LocalAddress, LocalPort] = LStringUtil::SplitLastColon(Row.LocalEndpoint);
			auto [RemoteAddress, RemotePort] = LStringUtil::SplitLastColon(Row.RemoteEndpoint);
			Attempts.push_back(LConnectionAttempt{
				.TimestampMs = Timestamp,
				.Protocol = Row.Protocol,
				.LocalAddress = std::move(LocalAddress),
				.LocalPort = std::move(LocalPort),
				.RemoteAddress = std::move(RemoteAddress),
				.RemotePort = std::move(RemotePort),
				.State = Row.State,
				.ProcessId = Row.ProcessId,
			});
		}

		if (OnTick)
		{
			OnTick(Tick, Polls);
		}
	}

	if (FailedTicks == Polls)
	{
		throw LProbeError(
			EProbeError::Monitor, fmt::format("all {} connection table captures failed ({})", Polls, Source.GetDescription()));
	}
	return Attempts;
}
