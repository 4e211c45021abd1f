/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>

#include "Data/ProbeTypes.hpp"

// One row of a `netstat -ano` style connection table:
//   Proto  Local Address  Foreign Address  State  PID
struct LSocketTableRow
{
	std::string Protocol{};
	std::string LocalEndpoint{};  // address:port
	std::string RemoteEndpoint{}; // address:port
	std::string State{};
	std::string ProcessId{};
};

// Parses the text output of the OS connection table, rows that don't look like a socket are skipped
class LSocketTable
{
public:
	static constexpr size_t kDefaultHeaderLines = 4;
	static constexpr size_t kMinColumns = 5;

	// Every row with at least 5 columns, in table order
	static std::vector<LSocketTableRow> ParseRows(std::string const& Text, size_t HeaderLines = kDefaultHeaderLines);

	// Rows in the listening state converted to socket records
	static std::vector<LSocketRecord> ParseListening(
		std::string const& Text, size_t HeaderLines = kDefaultHeaderLines);

	// "LISTEN" or "LISTENING", any case
	static bool IsListeningState(std::string const& State);

	static LSocketRecord ToSocketRecord(LSocketTableRow const& Row);
};
