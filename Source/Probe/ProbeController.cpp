/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProbeController.hpp"

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "Data/ProbeSummary.hpp"
#include "Format.hpp"
#include "Net/AddressResolver.hpp"
#include "Net/ConnectionWatcher.hpp"
#include "Net/PortDiff.hpp"
#include "Net/SocketTable.hpp"
#include "StringUtil.hpp"
#include "Time.hpp"

static LTableFormat const ListenerTable({
	{ "Proto", 6 },
	{ "Local Address", 40 },
	{ "Port", 6 },
	{ "PID", 8 },
});

static LTableFormat const EndpointTable({
	{ "Endpoint URL", 40 },
	{ "Security Policy", 56 },
	{ "Mode", 14 },
	{ "User Tokens", 40 },
});

static LTableFormat const ConnectionTable({
	{ "Time", 24 },
	{ "Proto", 6 },
	{ "Local Address", 24 },
	{ "Port", 6 },
	{ "Remote Address", 24 },
	{ "Port", 6 },
	{ "State", 13 },
	{ "PID", 8 },
});

LProbeController::LProbeController(LProbeConfig Config_, LProbeSettings Settings_, IEndpointClient& Client_,
	ISocketTableSource& Source_, LProbeEventStream& Stream_, LProbeLog& Log_, LCancellationToken& Token_,
	LSleepFunction Sleep_)
	: Config(std::move(Config_))
	, Settings(std::move(Settings_))
	, Client(Client_)
	, Source(Source_)
	, Stream(Stream_)
	, Log(Log_)
	, Token(Token_)
	, Sleep(std::move(Sleep_))
	, Progress(Stream_)
{
}

void LProbeController::EnterStage(EProbeStage::Type NewStage, std::string const& Task, LPercent Percent)
{
	Token.ThrowIfCancelled();
	Stage = NewStage;
	Progress.Report(Task, Percent);
	Log.Headline(Task);
}

void LProbeController::CompleteStage(LPartialResult const& Result)
{
	Token.ThrowIfCancelled();
	CompletedStages.push_back(Result.Stage);
	Stream.PartialResult(Result);
}

LProbeResult LProbeController::Run()
{
	LProbeResult Result{};

	Log.Headline("Probe started");
	Log.DetailedData("Probe Configuration", "Initial probe configuration parameters", "config", Config);

	try
	{
		// fatal before the first stage starts
		Config.Validate();
		EndpointUrl = LEndpointUrl::Normalize(Config.Server, Config.Port);

		Result.Endpoints = QueryEndpoints();
		CompleteStage(LPartialResult{ .Stage = EProbeStage::QueryEndpoints, .Payload = Result.Endpoints });

		EnterStage(EProbeStage::BaselineCapture, "Recording listening ports (before)", kBaselinePercent);
		Result.BeforeListeners = CaptureListeners(nullptr);
		CompleteStage(LPartialResult{ .Stage = EProbeStage::BaselineCapture, .Payload = Result.BeforeListeners });

		EnterStage(EProbeStage::Subscribe, "Creating subscription and monitored item", kSubscribePercent);
		Result.Subscription = CreateSubscription();
		CompleteStage(LPartialResult{ .Stage = EProbeStage::Subscribe, .Payload = Result.Subscription });

		EnterStage(EProbeStage::PostCapture, "Recording listening ports (after)", kPostCapturePercent);
		Result.AfterListeners = CaptureListeners(&Result.BeforeListeners);
		Result.Diff = LPortDiffEngine::Diff(Result.BeforeListeners, Result.AfterListeners);
		CompleteStage(LPartialResult{ .Stage = EProbeStage::PostCapture, .Payload = Result.AfterListeners });

		EnterStage(EProbeStage::Monitor,
			fmt::format("Monitoring incoming connection attempts ({}s)", Settings.MonitorDuration.count() / 1000),
			kMonitorPercent);
		Result.Connections = MonitorConnections();
		CompleteStage(LPartialResult{ .Stage = EProbeStage::Monitor, .Payload = Result.Connections });
	}
	catch (LProbeCancelled const&)
	{
		throw;
	}
	catch (LProbeError const& e)
	{
		LogFailure(e.what(), EProbeError::ToString(e.GetKind()));
		throw;
	}
	catch (std::exception const& e)
	{
		LogFailure(e.what(), "Error");
		throw;
	}

	Token.ThrowIfCancelled();
	Stage = EProbeStage::Completed;
	LogCompletion(Result);
	Stream.FinalResult(Result);
	Progress.Report("Completed", kCompletedPercent);
	Log.Headline("Probe finished successfully");
	Log.Flush();
	return Result;
}

std::vector<LEndpointDescriptor> LProbeController::QueryEndpoints()
{
	EnterStage(EProbeStage::QueryEndpoints, "Querying endpoints", kQueryPercent);
	Log.Headline(fmt::format("Connecting to endpoint: {}", EndpointUrl));

	auto Endpoints = Client.Discover(EndpointUrl);
	Token.ThrowIfCancelled();
	Log.Headline(fmt::format("Successfully retrieved {} endpoint(s)", Endpoints.size()));

	if (Endpoints.empty())
	{
		Log.Warning(EProbeStage::ToString(EProbeStage::QueryEndpoints), "No endpoints returned from server");
		Log.Section("Endpoint Query Results",
			{
				"Summary: No endpoints found - server may be unreachable or endpoint URL incorrect",
				fmt::format("Endpoint URL: {}", EndpointUrl),
			});
		return Endpoints;
	}

	Log.DetailedData("Endpoint Query Results",
		fmt::format("Found {} endpoint(s) from {}", Endpoints.size(), EndpointUrl), "summary",
		LEndpointSummary::Build(Endpoints));

	std::vector<std::vector<std::string>> Rows{};
	for (auto const& Endpoint : Endpoints)
	{
		Rows.push_back({ Endpoint.EndpointUrl, Endpoint.SecurityPolicyUri, Endpoint.SecurityMode,
			fmt::format("{}", fmt::join(Endpoint.UserIdentityTokens, ",")) });
	}
	Log.Table("Endpoints", EndpointTable, Rows);
	return Endpoints;
}

std::vector<LSocketRecord> LProbeController::CaptureListeners(std::vector<LSocketRecord> const* Baseline)
{
	std::string const Context = EProbeStage::ToString(Stage);
	Log.Headline(Baseline ? "Capturing listening ports after subscription" : "Capturing baseline listening ports");

	std::vector<LSocketRecord> Listeners{};
	try
	{
		Listeners = LSocketTable::ParseListening(Source.Capture(), Source.GetHeaderLines());
	}
	catch (LProbeCancelled const&)
	{
		throw;
	}
	catch (std::exception const& e)
	{
		Log.Warning(Context, fmt::format("{}, continuing with an empty listener list", e.what()));
		return {};
	}
	Token.ThrowIfCancelled();

	Log.Headline(fmt::format("Captured {} listening socket(s) {} subscription", Listeners.size(),
		Baseline ? "after" : "before"));
	LogListeners(Listeners, Baseline);
	return Listeners;
}

LSubscriptionOutcome LProbeController::CreateSubscription()
{
	Log.Headline(fmt::format("Target node: {}", Config.NodeId));
	Log.Headline(fmt::format("Publishing interval: {}ms", Config.PublishingIntervalMs));

	LSubscriptionOutcome Outcome{};
	try
	{
		Outcome = Client.Subscribe(EndpointUrl, Config.NodeId, Config.PublishingIntervalMs);
	}
	catch (LProbeCancelled const&)
	{
		throw;
	}
	catch (std::exception const& e)
	{
		Outcome = LSubscriptionOutcome{ .bSuccess = false, .NodeMonitored = {}, .Error = e.what() };
	}
	Token.ThrowIfCancelled();

	if (Outcome.bSuccess)
	{
		Log.Headline(fmt::format("Subscription created successfully, monitored node: {}", Outcome.NodeMonitored));
		Log.DetailedData(
			"Subscription Result", "Subscription and monitored item created successfully", "subscription", Outcome);
	}
	else
	{
		if (Outcome.Error.empty())
		{
			Outcome.Error = "Subscription failed";
		}
		Log.Headline(fmt::format("Subscription failed: {}", Outcome.Error));
		Log.Error(EProbeStage::ToString(EProbeStage::Subscribe), Outcome.Error,
			EProbeError::ToString(EProbeError::Subscription));
		Log.DetailedData("Subscription Result", "Subscription creation failed", "subscription", Outcome);
	}
	return Outcome;
}

std::string LProbeController::ResolveTarget()
{
	auto const  Host = LEndpointUrl::ExtractHost(EndpointUrl);
	std::string Error{};
	if (auto const Address = LAddressResolver::ResolveNumeric(Host, Error))
	{
		return Address.value();
	}

	Log.Warning(EProbeStage::ToString(EProbeStage::Monitor),
		fmt::format("Can't resolve {} ({}), matching the host name as is", Host, Error));
	return Host;
}

std::vector<LConnectionAttempt> LProbeController::MonitorConnections()
{
	std::string const Context = EProbeStage::ToString(EProbeStage::Monitor);
	std::string const Target = ResolveTarget();

	Log.Headline("Monitoring incoming connections from server");
	Log.Headline(fmt::format("Monitoring for connections from server IP: {} (port: {})", Target,
		Config.Port ? std::to_string(Config.Port.value()) : LStringUtil::SplitLastColon(EndpointUrl).second));
	Log.Headline(fmt::format("Monitoring duration: {} seconds", Settings.MonitorDuration.count() / 1000));

	LConnectionWatcher Watcher(Source, Sleep);
	Watcher.OnTick = [this](size_t Tick, size_t Polls) {
		Progress.ReportStep(fmt::format("Monitoring incoming connections ({}/{})", Tick, Polls), kMonitorPercent,
			kMonitorEndPercent, Tick, Polls);
	};
	Watcher.OnTickFailed = [this, &Context](size_t Tick, std::string const& Message) {
		Log.Warning(Context, fmt::format("Connection table capture {} failed: {}", Tick, Message));
	};

	std::vector<LConnectionAttempt> Connections{};
	try
	{
		Connections = Watcher.Watch(Target, Settings.MonitorDuration, Settings.PollInterval);
	}
	catch (LProbeCancelled const&)
	{
		throw;
	}
	catch (std::exception const& e)
	{
		Log.Warning(Context, fmt::format("{}, continuing with an empty attempt list", e.what()));
		return {};
	}

	Log.Headline(fmt::format("Monitoring complete: {} connection attempt(s) detected", Connections.size()));
	LogConnections(Target, Connections);
	return Connections;
}

void LProbeController::LogListeners(
	std::vector<LSocketRecord> const& Listeners, std::vector<LSocketRecord> const* Baseline)
{
	auto const Summary = LListenerSummary::Build(Listeners);
	if (Baseline)
	{
		auto const Diff = LPortDiffEngine::Diff(*Baseline, Listeners);
		Log.DetailedData("Post-Subscription Listening Ports",
			fmt::format("After subscription: {} listening socket(s), {} new port(s) detected", Listeners.size(),
				Diff.NewPorts.size()),
			"summary", Summary);
		Log.DetailedData("Baseline Comparison",
			fmt::format("{} before, {} after, {} new, {} removed", Baseline->size(), Listeners.size(),
				Diff.NewPorts.size(), Diff.RemovedPorts.size()),
			"comparison", Diff);
	}
	else
	{
		Log.DetailedData("Baseline Listening Ports",
			fmt::format("Baseline: {} listening socket(s) on {} unique port(s)", Listeners.size(),
				Summary.UniquePorts.size()),
			"summary", Summary);
	}

	std::vector<std::vector<std::string>> Rows{};
	for (auto const& Listener : Listeners)
	{
		Rows.push_back({ Listener.Protocol, Listener.LocalAddress, Listener.LocalPort, Listener.ProcessId });
	}
	Log.Table(Baseline ? "Listening Sockets After Subscription" : "Listening Sockets Before Subscription",
		ListenerTable, Rows);
}

void LProbeController::LogConnections(std::string const& Target, std::vector<LConnectionAttempt> const& Connections)
{
	if (Connections.empty())
	{
		Log.Section("Incoming Connection Monitoring Results",
			{ fmt::format("Summary: No incoming connections detected from server IP {} - server may not be attempting "
						  "callbacks or firewall may be blocking",
				Target) });
		return;
	}

	Log.DetailedData("Incoming Connection Monitoring Results",
		fmt::format("Detected {} incoming connection attempt(s) from server IP {}", Connections.size(), Target),
		"summary", LConnectionSummary::Build(Connections));

	std::vector<std::vector<std::string>> Rows{};
	for (auto const& Connection : Connections)
	{
		Rows.push_back({ LTime::FormatIso8601(Connection.TimestampMs), Connection.Protocol, Connection.LocalAddress,
			Connection.LocalPort, Connection.RemoteAddress, Connection.RemotePort, Connection.State,
			Connection.ProcessId });
	}
	Log.Table("Connection Attempts", ConnectionTable, Rows);
}

void LProbeController::LogCompletion(LProbeResult const& Result)
{
	Log.Section("Probe Completion Summary",
		{
			fmt::format("Probe completed at: {}", LTime::NowIso8601()),
			fmt::format("Configuration: {}", LProbeLog::ToJson("config", Config)),
			fmt::format("Endpoints found: {}", Result.Endpoints.size()),
			fmt::format("Baseline listeners: {}", Result.BeforeListeners.size()),
			fmt::format("Post-subscription listeners: {}", Result.AfterListeners.size()),
			fmt::format("Subscription success: {}", Result.Subscription.bSuccess ? "Yes" : "No"),
			fmt::format("Incoming connections detected: {}", Result.Connections.size()),
		});
	Log.WriteIssueSummary();
	Log.DetailedData(
		"Complete Probe Results", "Complete aggregated results from all probe steps", "result", Result);
}

void LProbeController::LogFailure(std::string const& Message, std::string const& Kind)
{
	std::string const Context = EProbeStage::ToString(Stage);
	Stage = EProbeStage::Failed;

	spdlog::debug("Probe failed in {}: {}", Context, Message);
	Log.Error(Context, Message, Kind);
	Log.Section("Probe Failed",
		{
			fmt::format("Probe failed at: {}", LTime::NowIso8601()),
			fmt::format("Configuration: {}", LProbeLog::ToJson("config", Config)),
		});
	Log.WriteIssueSummary();
	Log.Headline(fmt::format("Probe failed: {}", Message));
	Log.Flush();
	Stream.Error(Message);
}
