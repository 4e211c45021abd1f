/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProbeSummary.hpp"

#include <algorithm>

#include "Time.hpp"

// Appends Value unless it's empty or already present
static void AddUnique(std::vector<std::string>& Values, std::string const& Value)
{
	if (!Value.empty() && std::ranges::find(Values, Value) == Values.end())
	{
		Values.push_back(Value);
	}
}

LEndpointSummary LEndpointSummary::Build(std::vector<LEndpointDescriptor> const& Endpoints)
{
	LEndpointSummary Summary{ .Total = Endpoints.size() };
	for (auto const& Endpoint : Endpoints)
	{
		++Summary.SecurityPolicies[Endpoint.SecurityPolicyUri.empty() ? "Unknown" : Endpoint.SecurityPolicyUri];
		++Summary.SecurityModes[Endpoint.SecurityMode.empty() ? "Unknown" : Endpoint.SecurityMode];
		for (auto const& Token : Endpoint.UserIdentityTokens)
		{
			AddUnique(Summary.UserTokenTypes, Token);
		}
	}
	return Summary;
}

LListenerSummary LListenerSummary::Build(std::vector<LSocketRecord> const& Listeners)
{
	LListenerSummary Summary{ .Total = Listeners.size() };
	for (auto const& Listener : Listeners)
	{
		AddUnique(Summary.UniquePorts, Listener.LocalPort);
		AddUnique(Summary.UniqueAddresses, Listener.LocalAddress);
		AddUnique(Summary.Protocols, Listener.Protocol);
		AddUnique(Summary.ProcessIds, Listener.ProcessId);
	}
	return Summary;
}

LConnectionSummary LConnectionSummary::Build(std::vector<LConnectionAttempt> const& Connections)
{
	LConnectionSummary Summary{ .Total = Connections.size() };
	for (auto const& Connection : Connections)
	{
		AddUnique(Summary.UniqueRemoteAddresses, Connection.RemoteAddress);
		AddUnique(Summary.UniqueLocalPorts, Connection.LocalPort);
		AddUnique(Summary.UniqueStates, Connection.State);
		AddUnique(Summary.UniqueProcessIds, Connection.ProcessId);
	}
	if (!Connections.empty())
	{
		Summary.First = LTime::FormatIso8601(Connections.front().TimestampMs);
		Summary.Last = LTime::FormatIso8601(Connections.back().TimestampMs);
	}
	return Summary;
}
