/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProbeEvents.hpp"

#include <algorithm>
#include <cmath>

bool LProbeEventStream::Close()
{
	std::lock_guard Lock(Mutex);
	if (Token->IsCancelled())
	{
		return false;
	}
	Token->Cancel();
	return true;
}

bool LProbeEventStream::FinishAndClose(int ExitCode)
{
	std::lock_guard Lock(Mutex);
	if (Token->IsCancelled())
	{
		return false;
	}
	Events->OnFinished(ExitCode);
	Token->Cancel();
	return true;
}

void LProbeEventStream::Progress(LProgressEvent const& Event)
{
	Emit([&](LProbeEvents& E) { E.OnProgress(Event); });
}

void LProbeEventStream::PartialResult(LPartialResult const& Result)
{
	Emit([&](LProbeEvents& E) { E.OnPartialResult(Result); });
}

void LProbeEventStream::FinalResult(LProbeResult const& Result)
{
	Emit([&](LProbeEvents& E) { E.OnFinalResult(Result); });
}

void LProbeEventStream::LogLine(std::string const& Line)
{
	Emit([&](LProbeEvents& E) { E.OnLogLine(Line); });
}

void LProbeEventStream::Error(std::string const& Message)
{
	Emit([&](LProbeEvents& E) { E.OnError(Message); });
}

void LProgressEmitter::Report(std::string const& Task, LPercent Percent)
{
	Current = std::max(Current, std::clamp(Percent, 0, 100));
	Stream.Progress(LProgressEvent{ .Task = Task, .Percent = Current });
}

void LProgressEmitter::ReportStep(std::string const& Task, LPercent From, LPercent To, size_t Step, size_t Steps)
{
	if (Steps == 0)
	{
		Report(Task, To);
		return;
	}
	double const Fraction = static_cast<double>(std::min(Step, Steps)) / static_cast<double>(Steps);
	Report(Task, From + static_cast<LPercent>(std::lround(Fraction * (To - From))));
}
