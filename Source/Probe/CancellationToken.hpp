/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>

#include "Types.hpp"

// Shared between a probe run and whoever may cancel it, cancellation is one-way
class LCancellationToken
{
	std::mutex              Mutex;
	std::condition_variable Condition;
	std::atomic<bool>       bCancelled{ false };

public:
	void Cancel();

	[[nodiscard]] bool IsCancelled() const { return bCancelled; }

	// Throws LProbeCancelled
	void ThrowIfCancelled() const;

	// Sleeps for Duration, returns false as soon as the token gets cancelled
	bool WaitFor(LDuration Duration);

	// Sleep function bound to this token
	LSleepFunction MakeSleep();
};
