/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "CancellationToken.hpp"

#include "ProbeError.hpp"

void LCancellationToken::Cancel()
{
	{
		std::lock_guard Lock(Mutex);
		bCancelled = true;
	}
	Condition.notify_all();
}

void LCancellationToken::ThrowIfCancelled() const
{
	if (bCancelled)
	{
		throw LProbeCancelled();
	}
}

bool LCancellationToken::WaitFor(LDuration Duration)
{
	std::unique_lock Lock(Mutex);
	return !Condition.wait_for(Lock, Duration, [this] { return bCancelled.load(); });
}

LSleepFunction LCancellationToken::MakeSleep()
{
	return [this](LDuration Duration) { return WaitFor(Duration); };
}
