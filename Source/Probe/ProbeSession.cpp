/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProbeSession.hpp"

#include <thread>
#include <spdlog/spdlog.h>

#include "Client/OpcUaEndpointClient.hpp"
#include "ProbeController.hpp"
#include "ProbeLog.hpp"
#include "Time.hpp"

LProbeSession::LProbeSession(
	LProbeSettings Settings_, LEndpointClientFactory ClientFactory_, LSocketTableSourceFactory SourceFactory_)
	: Settings(std::move(Settings_))
	, ClientFactory(std::move(ClientFactory_))
	, SourceFactory(std::move(SourceFactory_))
{
}

LProbeSession::~LProbeSession()
{
	Cancel();
}

std::unique_ptr<IEndpointClient> LProbeSession::MakeOpcUaClient(LProbeSettings const& Settings, LSleepFunction Sleep)
{
	return std::make_unique<LOpcUaEndpointClient>(Settings.SubscriptionSettle, Settings.SessionTimeout, std::move(Sleep));
}

void LProbeSession::Start(LProbeConfig Config)
{
	auto Run = std::make_shared<LRun>();
	Run->Token = std::make_shared<LCancellationToken>();
	Run->Stream = std::make_shared<LProbeEventStream>(Events, Run->Token);

	std::shared_ptr<LRun> Previous{};
	{
		std::lock_guard Lock(Mutex);
		Previous = std::exchange(Active, Run);
	}
	if (Previous)
	{
		spdlog::info("Terminating the running probe");
		Terminate(Previous);
	}

	// the thread only holds shared state, the session may go away before it ends
	std::thread(&LProbeSession::Execute, Run, std::move(Config), Settings, ClientFactory, SourceFactory).detach();
}

void LProbeSession::Cancel()
{
	std::shared_ptr<LRun> Run{};
	{
		std::lock_guard Lock(Mutex);
		Run = std::move(Active);
	}
	if (Run)
	{
		Terminate(Run);
	}
}

bool LProbeSession::CancelAndDrain(LDuration Timeout)
{
	std::shared_ptr<LRun> Run{};
	{
		std::lock_guard Lock(Mutex);
		Run = std::move(Active);
	}
	if (!Run)
	{
		return true;
	}
	Terminate(Run);
	return WaitDone(Run, Timeout);
}

void LProbeSession::Terminate(std::shared_ptr<LRun> const& Run)
{
	if (Run->Stream->Close())
	{
		Events->OnFinished(-1);
	}
}

bool LProbeSession::IsRunning()
{
	std::shared_ptr<LRun> Run{};
	{
		std::lock_guard Lock(Mutex);
		Run = Active;
	}
	if (!Run)
	{
		return false;
	}
	std::lock_guard Lock(Run->Mutex);
	return !Run->bDone;
}

bool LProbeSession::WaitForCompletion(LDuration Timeout)
{
	std::shared_ptr<LRun> Run{};
	{
		std::lock_guard Lock(Mutex);
		Run = Active;
	}
	if (!Run)
	{
		return true;
	}
	return WaitDone(Run, Timeout);
}

bool LProbeSession::WaitDone(std::shared_ptr<LRun> const& Run, LDuration Timeout)
{
	std::unique_lock Lock(Run->Mutex);
	return Run->Condition.wait_for(Lock, Timeout, [&Run] { return Run->bDone; });
}

void LProbeSession::Execute(std::shared_ptr<LRun> Run, LProbeConfig Config, LProbeSettings Settings,
	LEndpointClientFactory ClientFactory, LSocketTableSourceFactory SourceFactory)
{
	auto const Stream = Run->Stream;
	auto const Token = Run->Token;
	int        ExitCode = 0;

	try
	{
		LProbeLog Log(Settings.LogDirectory, LTime::GetEpochMs(),
			[Stream](std::string const& Line) { Stream->LogLine(Line); });
		spdlog::info("Probe log: {}", Log.GetFilePath().empty() ? "(none)" : Log.GetFilePath().string());

		auto Source = SourceFactory(Settings);
		auto Client = ClientFactory(Settings, Token->MakeSleep());

		LProbeController Controller(Config, Settings, *Client, *Source, *Stream, Log, *Token, Token->MakeSleep());
		try
		{
			Controller.Run();
		}
		catch (LProbeError const&)
		{
			// already logged and reported by the controller
			ExitCode = 1;
		}
		catch (LProbeCancelled const&)
		{
			throw;
		}
		catch (std::exception const&)
		{
			ExitCode = 1;
		}
		Client->Close();
	}
	catch (LProbeCancelled const&)
	{
		spdlog::debug("Abandoned probe run ended");
	}
	catch (std::exception const& e)
	{
		spdlog::error("Probe run failed: {}", e.what());
		Stream->Error(e.what());
		ExitCode = 1;
	}

	if (!Stream->FinishAndClose(ExitCode))
	{
		spdlog::debug("Probe run was terminated before it finished");
	}

	{
		std::lock_guard Lock(Run->Mutex);
		Run->bDone = true;
	}
	Run->Condition.notify_all();
}
