/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

#include "ProbeConfig.hpp"
#include "ProbeError.hpp"
#include "ProbeReport.hpp"
#include "ProbeSession.hpp"
#include "SignalHandler.hpp"
#include "StringUtil.hpp"

constexpr int       kExitInterrupted = 130;
constexpr LDuration kInterruptDrain{ 2000 };

static void PrintUsage(char const* Program)
{
	fmt::print(stderr, "usage: {} [-c file.ini] <server> [port] [nodeId] [publishingIntervalMs]\n", Program);
	fmt::print(stderr, "  server   host, host:port or opc.tcp://host:port\n");
	fmt::print(stderr, "  port     1-65535, default {}\n", LProbeConfig::kDefaultPort);
	fmt::print(stderr, "  nodeId   monitored node, default {}\n", LProbeConfig::kDefaultNodeId);
	fmt::print(stderr, "  interval publishing interval in ms, default {}\n", LProbeConfig::kDefaultPublishingIntervalMs);
}

// Fills Config from the positional arguments, throws LProbeError(Config)
static void ParseArguments(std::vector<std::string> const& Arguments, LProbeConfig& Config)
{
	if (!Arguments.empty())
	{
		Config.Server = Arguments[0];
	}

	if (Arguments.size() > 1)
	{
		Config.Port = LProbeConfig::ParsePort(Arguments[1]);
	}
	else if (LStringUtil::IContains(LStringUtil::Trim(Config.Server), ":"))
	{
		// an inline "host:port" wins over the configured port
		try
		{
			auto const Url = LEndpointUrl::Normalize(Config.Server, std::nullopt);
			Config.Port.reset();
			spdlog::debug("Using the inline port of {}", Url);
		}
		catch (LProbeError const&)
		{
			spdlog::debug("'{}' has no inline port, using {}", Config.Server, Config.Port.value_or(0));
		}
	}

	if (Arguments.size() > 2)
	{
		Config.NodeId = Arguments[2];
	}

	if (Arguments.size() > 3)
	{
		auto const& Interval = Arguments[3];
		if (!LStringUtil::IsDigits(Interval) || Interval.size() > 9)
		{
			throw LProbeError(EProbeError::Config, fmt::format("invalid publishing interval '{}'", Interval));
		}
		Config.PublishingIntervalMs = std::stoi(Interval);
	}

	Config.Validate();
	spdlog::info("Probing {}", LEndpointUrl::Normalize(Config.Server, Config.Port));
}

int main(int argc, char** argv)
{
	if (std::getenv("INVOCATION_ID") != nullptr)
	{
		// Running under systemd so we don't need the timestamp from spdlog
		spdlog::set_pattern("[%^%l%$] %v");
	}

	std::string              ConfigPath{};
	std::vector<std::string> Arguments{};
	for (int i = 1; i < argc; ++i)
	{
		if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0)
		{
			PrintUsage(argv[0]);
			return 0;
		}
		if (std::strcmp(argv[i], "-c") == 0)
		{
			if (i + 1 >= argc)
			{
				PrintUsage(argv[0]);
				return 1;
			}
			ConfigPath = argv[++i];
			continue;
		}
		Arguments.emplace_back(argv[i]);
	}

	if (Arguments.size() > 4)
	{
		PrintUsage(argv[0]);
		return 1;
	}

	auto& ProberConfig = LProberConfig::GetInstance();
	if (!ConfigPath.empty() && !ProberConfig.Load(ConfigPath))
	{
		return 1;
	}
	ProberConfig.LogConfig();

	LProbeConfig Config = ProberConfig.Defaults;
	try
	{
		ParseArguments(Arguments, Config);
	}
	catch (LProbeError const& e)
	{
		spdlog::error("{}", e.what());
		PrintUsage(argv[0]);
		return 1;
	}

	auto& SignalHandler = LSignalHandler::GetInstance();

	LProbeSession     Session(ProberConfig.Settings);
	LProbeReport      Report{};
	std::atomic<int>  ExitCode{ 1 };
	std::atomic<bool> bFinished{ false };
	std::mutex        OutputMutex;

	auto& Events = Session.GetEvents();
	Events.OnProgress.connect([&](LProgressEvent const& Event) {
		std::lock_guard Lock(OutputMutex);
		fmt::print("[{:>3}%] {}\n", Event.Percent, Event.Task);
	});
	Events.OnLogLine.connect([&](std::string const& Line) {
		std::lock_guard Lock(OutputMutex);
		fmt::print("        {}\n", Line);
	});
	Events.OnPartialResult.connect([&](LPartialResult const& Result) {
		std::lock_guard Lock(OutputMutex);
		auto const&     Finding = Report.Add(Result);
		fmt::print("  {:<8} {}: {}\n", fmt::format("[{}]", EFindingSeverity::ToString(Finding.Severity)),
			Finding.Title, Finding.Text);
	});
	Events.OnFinalResult.connect([&](LProbeResult const& Result) {
		std::lock_guard Lock(OutputMutex);
		fmt::print("Probe complete: {} endpoint(s), {} new listening port(s), {} callback connection(s)\n",
			Result.Endpoints.size(), Result.Diff.NewPorts.size(), Result.Connections.size());
	});
	Events.OnError.connect([&](std::string const& Message) {
		std::lock_guard Lock(OutputMutex);
		fmt::print(stderr, "Probe failed: {}\n", Message);
	});
	Events.OnFinished.connect([&](int Code) {
		ExitCode = Code;
		bFinished = true;
	});

	Session.Start(Config);

	while (!bFinished)
	{
		if (SignalHandler.bStop)
		{
			spdlog::info("Received signal {}, cancelling the probe", SignalHandler.LastSignal.load());
			if (!Session.CancelAndDrain(kInterruptDrain))
			{
				spdlog::warn("The cancelled probe did not stop within {} ms", kInterruptDrain.count());
			}
			// skip static destruction, a thread that did not stop may still log
			spdlog::default_logger()->flush();
			std::_Exit(kExitInterrupted);
		}
		std::this_thread::sleep_for(std::chrono::milliseconds(100));
	}

	return ExitCode == 0 ? 0 : 1;
}
