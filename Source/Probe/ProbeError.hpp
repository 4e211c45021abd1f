/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace EProbeError
{
	enum Type : uint8_t
	{
		Config,       // missing/invalid host or port, fatal before the pipeline starts
		Connect,      // endpoint discovery failed, fatal
		Capture,      // socket table snapshot failed, degrades to an empty snapshot
		Subscription, // recorded as a failed subscription outcome
		Monitor       // connection watcher failed, degrades to an empty attempt list
	};

	inline char const* ToString(Type Error)
	{
		switch (Error)
		{
			case Config:
				return "ConfigError";
			case Connect:
				return "ConnectError";
			case Capture:
				return "CaptureError";
			case Subscription:
				return "SubscriptionError";
			case Monitor:
				return "MonitorError";
			default:
				return "Error";
		}
	}
} // namespace EProbeError

class LProbeError : public std::runtime_error
{
	EProbeError::Type Kind;

public:
	LProbeError(EProbeError::Type Kind_, std::string const& Message)
		: std::runtime_error(Message)
		, Kind(Kind_)
	{
	}

	[[nodiscard]] EProbeError::Type GetKind() const { return Kind; }
};

// Thrown at suspension points once the run was cancelled, never recorded as an error
class LProbeCancelled : public std::exception
{
public:
	[[nodiscard]] char const* what() const noexcept override { return "probe cancelled"; }
};
