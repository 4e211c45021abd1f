/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>
#include <vector>

#include "Data/ProbeEvents.hpp"
#include "Data/ProbeTypes.hpp"

namespace EFindingSeverity
{
	enum Type : uint8_t
	{
		Info,
		Success,
		Warn,
		Error
	};

	inline char const* ToString(Type Severity)
	{
		switch (Severity)
		{
			case Info:
				return "info";
			case Success:
				return "success";
			case Warn:
				return "warn";
			case Error:
				return "error";
			default:
				return "unknown";
		}
	}
} // namespace EFindingSeverity

struct LProbeFinding
{
	std::string            Title{};
	EFindingSeverity::Type Severity{ EFindingSeverity::Info };
	std::string            Text{};
};

// Human readable interpretation of the stage results of one run
class LProbeReport
{
	std::optional<std::vector<LSocketRecord>> Baseline{};
	std::vector<LProbeFinding>                Findings{};

public:
	static constexpr size_t kMaxListedPorts = 5;
	static constexpr size_t kMaxErrorLength = 220;

	// Interprets a partial result, remembers the baseline for the post capture comparison
	LProbeFinding const& Add(LPartialResult const& Result);

	[[nodiscard]] std::vector<LProbeFinding> const& GetFindings() const { return Findings; }

	static LProbeFinding SummarizeEndpoints(std::vector<LEndpointDescriptor> const& Endpoints);
	static LProbeFinding SummarizeBaseline(std::vector<LSocketRecord> const& Listeners);
	static LProbeFinding SummarizeSubscription(LSubscriptionOutcome const& Outcome);
	static LProbeFinding SummarizePostCapture(
		std::vector<LSocketRecord> const& Listeners, std::vector<LSocketRecord> const* Baseline);
	static LProbeFinding SummarizeConnections(std::vector<LConnectionAttempt> const& Connections);

	// Distinct non-empty ports in table order
	static std::vector<std::string> GetUniquePorts(std::vector<LSocketRecord> const& Listeners);
};
