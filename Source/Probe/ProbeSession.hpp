/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>

#include "Client/EndpointClient.hpp"
#include "Data/ProbeEvents.hpp"
#include "Net/SocketTableSource.hpp"
#include "ProbeConfig.hpp"

using LEndpointClientFactory =
	std::function<std::unique_ptr<IEndpointClient>(LProbeSettings const& Settings, LSleepFunction Sleep)>;
using LSocketTableSourceFactory = std::function<std::unique_ptr<ISocketTableSource>(LProbeSettings const& Settings)>;

// Runs one probe at a time on a background thread. Starting a new probe or cancelling abandons the
// active one on the spot: its thread is left to run out and none of its events reach observers anymore
class LProbeSession
{
	struct LRun
	{
		std::shared_ptr<LCancellationToken> Token{};
		std::shared_ptr<LProbeEventStream>  Stream{};

		std::mutex              Mutex;
		std::condition_variable Condition;
		bool                    bDone{ false };
	};

	std::shared_ptr<LProbeEvents> Events{ std::make_shared<LProbeEvents>() };
	LProbeSettings                Settings;
	LEndpointClientFactory        ClientFactory;
	LSocketTableSourceFactory     SourceFactory;

	std::mutex            Mutex;
	std::shared_ptr<LRun> Active{};

	void Terminate(std::shared_ptr<LRun> const& Run);

	static bool WaitDone(std::shared_ptr<LRun> const& Run, LDuration Timeout);

	static void Execute(std::shared_ptr<LRun> Run, LProbeConfig Config, LProbeSettings Settings,
		LEndpointClientFactory ClientFactory, LSocketTableSourceFactory SourceFactory);

public:
	explicit LProbeSession(LProbeSettings Settings_, LEndpointClientFactory ClientFactory_ = MakeOpcUaClient,
		LSocketTableSourceFactory SourceFactory_ = MakeSocketTableSource);

	~LProbeSession();

	LProbeSession(LProbeSession const&) = delete;
	LProbeSession& operator=(LProbeSession const&) = delete;

	[[nodiscard]] LProbeEvents& GetEvents() { return *Events; }

	// Terminates the active probe (finished -1) and starts a new one
	void Start(LProbeConfig Config);

	// Terminates the active probe, no-op if there is none
	void Cancel();

	// Cancel, then blocks until the abandoned thread ran out. False on timeout, the thread is still alive then
	bool CancelAndDrain(LDuration Timeout);

	[[nodiscard]] bool IsRunning();

	// Blocks until the active probe ended by itself, false on timeout
	bool WaitForCompletion(LDuration Timeout);

	static std::unique_ptr<IEndpointClient> MakeOpcUaClient(LProbeSettings const& Settings, LSleepFunction Sleep);
};
