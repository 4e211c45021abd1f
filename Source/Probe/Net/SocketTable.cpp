/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SocketTable.hpp"

#include "StringUtil.hpp"

std::vector<LSocketTableRow> LSocketTable::ParseRows(std::string const& Text, size_t HeaderLines)
{
	std::vector<LSocketTableRow> Rows{};
	auto const                   Lines = LStringUtil::SplitLines(Text);

	for (size_t i = HeaderLines; i < Lines.size(); ++i)
	{
		auto const Columns = LStringUtil::SplitWhitespace(Lines[i]);
		if (Columns.size() < kMinColumns)
		{
			// blank lines and UDP rows, which have no state column
			continue;
		}

		Rows.push_back(LSocketTableRow{
			.Protocol = Columns[0],
			.LocalEndpoint = Columns[1],
			.RemoteEndpoint = Columns[2],
			.State = Columns[3],
			.ProcessId = Columns[4],
		});
	}
	return Rows;
}

std::vector<LSocketRecord> LSocketTable::ParseListening(std::string const& Text, size_t HeaderLines)
{
	std::vector<LSocketRecord> Records{};
	for (auto const& Row : ParseRows(Text, HeaderLines))
	{
		if (IsListeningState(Row.State))
		{
			Records.push_back(ToSocketRecord(Row));
		}
	}
	return Records;
}

bool LSocketTable::IsListeningState(std::string const& State)
{
	return LStringUtil::IEquals(State, "LISTENING") || LStringUtil::IEquals(State, "LISTEN");
}

LSocketRecord LSocketTable::ToSocketRecord(LSocketTableRow const& Row)
{
	// IPv6 addresses contain colons as well, only the last one separates the port
	auto [Address, Port] = LStringUtil::SplitLastColon(Row.LocalEndpoint);
	return LSocketRecord{
		.Protocol = Row.Protocol,
		.LocalAddress = std::move(Address),
		.LocalPort = std::move(Port),
		.ProcessId = Row.ProcessId,
	};
}
