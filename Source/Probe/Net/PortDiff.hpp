/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <vector>

#include "Data/ProbeTypes.hpp"

class LPortDiffEngine
{
public:
	// Set difference of the "address:port" keys, keys are reported in the order they were first seen
	static LPortDiff Diff(std::vector<LSocketRecord> const& Before, std::vector<LSocketRecord> const& After);
};
