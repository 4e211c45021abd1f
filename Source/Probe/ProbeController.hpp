/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <string>
#include <vector>

#include "CancellationToken.hpp"
#include "Client/EndpointClient.hpp"
#include "Data/ProbeEvents.hpp"
#include "Data/ProbeTypes.hpp"
#include "Net/SocketTableSource.hpp"
#include "ProbeConfig.hpp"
#include "ProbeError.hpp"
#include "ProbeLog.hpp"

// Runs the probe stages in order and applies the failure policy of each stage:
//   QueryEndpoints  fatal, the run ends in Failed
//   BaselineCapture warning, empty listener list
//   Subscribe       failed outcome
//   PostCapture     warning, empty listener list
//   Monitor         warning, empty attempt list
class LProbeController
{
	LProbeConfig        Config;
	LProbeSettings      Settings;
	IEndpointClient&    Client;
	ISocketTableSource& Source;
	LProbeEventStream&  Stream;
	LProbeLog&          Log;
	LCancellationToken& Token;
	LSleepFunction      Sleep;
	LProgressEmitter    Progress;

	std::atomic<EProbeStage::Type> Stage{ EProbeStage::Init };
	std::vector<EProbeStage::Type> CompletedStages{};
	std::string                    EndpointUrl{};

	void EnterStage(EProbeStage::Type NewStage, std::string const& Task, LPercent Percent);
	void CompleteStage(LPartialResult const& Result);

	std::vector<LEndpointDescriptor> QueryEndpoints();
	std::vector<LSocketRecord>       CaptureListeners(std::vector<LSocketRecord> const* Baseline);
	LSubscriptionOutcome             CreateSubscription();
	std::vector<LConnectionAttempt>  MonitorConnections();

	// Resolved address of the server, the host itself if it can't be resolved
	std::string ResolveTarget();

	void LogListeners(std::vector<LSocketRecord> const& Listeners, std::vector<LSocketRecord> const* Baseline);
	void LogConnections(std::string const& Target, std::vector<LConnectionAttempt> const& Connections);
	void LogCompletion(LProbeResult const& Result);
	void LogFailure(std::string const& Message, std::string const& Kind);

public:
	static constexpr LPercent kQueryPercent = 10;
	static constexpr LPercent kBaselinePercent = 25;
	static constexpr LPercent kSubscribePercent = 45;
	static constexpr LPercent kPostCapturePercent = 65;
	static constexpr LPercent kMonitorPercent = 75;
	static constexpr LPercent kMonitorEndPercent = 90;
	static constexpr LPercent kCompletedPercent = 100;

	LProbeController(LProbeConfig Config_, LProbeSettings Settings_, IEndpointClient& Client_,
		ISocketTableSource& Source_, LProbeEventStream& Stream_, LProbeLog& Log_, LCancellationToken& Token_,
		LSleepFunction Sleep_);

	// Throws LProbeError for fatal failures (after logging them and emitting the error event),
	// LProbeCancelled once the token got cancelled
	LProbeResult Run();

	[[nodiscard]] EProbeStage::Type GetStage() const { return Stage; }

	[[nodiscard]] std::vector<EProbeStage::Type> const& GetCompletedStages() const { return CompletedStages; }

	[[nodiscard]] std::string const& GetEndpointUrl() const { return EndpointUrl; }
};
