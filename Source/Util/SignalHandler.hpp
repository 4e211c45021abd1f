/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include <atomic>

#include "Singleton.hpp"

class LSignalHandler : public TSingleton<LSignalHandler>
{
public:
	LSignalHandler();

	std::atomic<bool> bStop{ false };
	std::atomic<int>  LastSignal{ 0 };
};
