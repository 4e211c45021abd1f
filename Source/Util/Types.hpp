/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <sys/types.h>
#include <cstdint>
#include <chrono>
#include <functional>

using LProcessId = pid_t;
using LSocketInode = uint64_t;
using LMsec = int64_t;
using LPercent = int32_t;
using LDuration = std::chrono::milliseconds;

// Blocks for the given duration, returns false if the wait was interrupted
using LSleepFunction = std::function<bool(LDuration)>;

// Wall clock in epoch milliseconds
using LClockFunction = std::function<LMsec()>;
