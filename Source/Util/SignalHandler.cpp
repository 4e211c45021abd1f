/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SignalHandler.hpp"

#include <csignal>

static void OnStopSignal(int Signal)
{
	LSignalHandler::GetInstance().LastSignal = Signal;
	LSignalHandler::GetInstance().bStop = true;
}

LSignalHandler::LSignalHandler()
{
	signal(SIGINT, OnStopSignal);
	signal(SIGTERM, OnStopSignal);
}
