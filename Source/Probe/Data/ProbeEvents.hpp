/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <vector>
#include <sigslot/signal.hpp>

#include "CancellationToken.hpp"
#include "Data/ProbeTypes.hpp"

struct LProgressEvent
{
	std::string Task{};
	LPercent    Percent{};
};

// Data produced by a single stage, only what that stage added
struct LPartialResult
{
	using LPayload = std::variant<std::vector<LEndpointDescriptor>, std::vector<LSocketRecord>, LSubscriptionOutcome,
		std::vector<LConnectionAttempt>>;

	EProbeStage::Type Stage{ EProbeStage::Init };
	LPayload          Payload{};
};

// Outbound event stream of a probe session
class LProbeEvents
{
public:
	sigslot::signal<LProgressEvent const&> OnProgress;
	sigslot::signal<LPartialResult const&> OnPartialResult;
	sigslot::signal<LProbeResult const&>   OnFinalResult;
	sigslot::signal<std::string const&>    OnLogLine;
	sigslot::signal<std::string const&>    OnError;
	sigslot::signal<int>                   OnFinished; // 0 success, 1 fatal failure, -1 terminated
};

// The view of LProbeEvents a single run gets. Once closed nothing passes anymore,
// Close() waits for an emission in progress on another thread to finish
class LProbeEventStream
{
	std::shared_ptr<LProbeEvents>       Events;
	std::shared_ptr<LCancellationToken> Token;
	std::recursive_mutex                Mutex;

	template <typename TFunction>
	void Emit(TFunction&& Function)
	{
		std::lock_guard Lock(Mutex);
		if (Token->IsCancelled())
		{
			return;
		}
		Function(*Events);
	}

public:
	LProbeEventStream(std::shared_ptr<LProbeEvents> Events_, std::shared_ptr<LCancellationToken> Token_)
		: Events(std::move(Events_))
		, Token(std::move(Token_))
	{
	}

	// Cancels the run's token, false if the stream was closed already
	bool Close();

	// Emits the finished event and closes the stream in one step, false if it was closed already
	bool FinishAndClose(int ExitCode);

	[[nodiscard]] bool IsClosed() const { return Token->IsCancelled(); }

	void Progress(LProgressEvent const& Event);
	void PartialResult(LPartialResult const& Result);
	void FinalResult(LProbeResult const& Result);
	void LogLine(std::string const& Line);
	void Error(std::string const& Message);
};

// Progress of one run, never goes backwards and stays within 0-100
class LProgressEmitter
{
	LProbeEventStream& Stream;
	LPercent           Current{ 0 };

public:
	explicit LProgressEmitter(LProbeEventStream& Stream_)
		: Stream(Stream_)
	{
	}

	void Report(std::string const& Task, LPercent Percent);

	// Linear between From and To
	void ReportStep(std::string const& Task, LPercent From, LPercent To, size_t Step, size_t Steps);

	[[nodiscard]] LPercent GetCurrent() const { return Current; }
};
