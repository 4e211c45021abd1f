/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProbeReport.hpp"

#include <algorithm>
#include <iterator>
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include "StringUtil.hpp"

static std::string DescribePorts(std::vector<std::string> const& Ports)
{
	if (Ports.empty())
	{
		return "no specific ports could be parsed.";
	}
	if (Ports.size() <= LProbeReport::kMaxListedPorts)
	{
		return fmt::format("ports {}.", fmt::join(Ports, ", "));
	}
	return fmt::format("ports {} and additional ports.",
		fmt::join(Ports.begin(), Ports.begin() + LProbeReport::kMaxListedPorts, ", "));
}

static std::string JoinEndpoint(std::string const& Address, std::string const& Port)
{
	return Port.empty() ? Address : Address + ":" + Port;
}

LProbeFinding const& LProbeReport::Add(LPartialResult const& Result)
{
	LProbeFinding Finding{};
	switch (Result.Stage)
	{
		case EProbeStage::QueryEndpoints:
			Finding = SummarizeEndpoints(std::get<std::vector<LEndpointDescriptor>>(Result.Payload));
			break;
		case EProbeStage::BaselineCapture:
			Baseline = std::get<std::vector<LSocketRecord>>(Result.Payload);
			Finding = SummarizeBaseline(*Baseline);
			break;
		case EProbeStage::Subscribe:
			Finding = SummarizeSubscription(std::get<LSubscriptionOutcome>(Result.Payload));
			break;
		case EProbeStage::PostCapture:
			Finding = SummarizePostCapture(
				std::get<std::vector<LSocketRecord>>(Result.Payload), Baseline ? &Baseline.value() : nullptr);
			break;
		case EProbeStage::Monitor:
			Finding = SummarizeConnections(std::get<std::vector<LConnectionAttempt>>(Result.Payload));
			break;
		default:
			Finding = LProbeFinding{ .Title = EProbeStage::ToString(Result.Stage),
				.Severity = EFindingSeverity::Info,
				.Text = "No interpretation for this stage." };
			break;
	}
	Findings.push_back(std::move(Finding));
	return Findings.back();
}

std::vector<std::string> LProbeReport::GetUniquePorts(std::vector<LSocketRecord> const& Listeners)
{
	std::vector<std::string> Ports{};
	for (auto const& Listener : Listeners)
	{
		if (!Listener.LocalPort.empty() && std::ranges::find(Ports, Listener.LocalPort) == Ports.end())
		{
			Ports.push_back(Listener.LocalPort);
		}
	}
	return Ports;
}

LProbeFinding LProbeReport::SummarizeEndpoints(std::vector<LEndpointDescriptor> const& Endpoints)
{
	LProbeFinding Finding{ .Title = "Endpoint Security" };
	if (Endpoints.empty())
	{
		Finding.Severity = EFindingSeverity::Error;
		Finding.Text = "The server did not return any OPC UA endpoints. This usually means the endpoint URL or port "
					   "is wrong, or the server refused the connection.";
		return Finding;
	}

	size_t                   NoneCount = 0;
	size_t                   ModernCount = 0;
	size_t                   LegacyCount = 0;
	std::vector<std::string> Policies{};
	for (auto const& Endpoint : Endpoints)
	{
		auto const& Uri = Endpoint.SecurityPolicyUri;
		if (Uri.empty())
		{
			continue;
		}
		if (std::ranges::find(Policies, Uri) == Policies.end())
		{
			Policies.push_back(Uri);
		}

		if (LStringUtil::IContains(Uri, "none"))
		{
			++NoneCount;
		}
		else if (LStringUtil::IContains(Uri, "aes"))
		{
			++ModernCount;
		}
		else if (LStringUtil::IContains(Uri, "basic128") || LStringUtil::IContains(Uri, "basic256"))
		{
			++LegacyCount;
		}
	}

	std::vector<std::string> Parts{};
	Parts.push_back(fmt::format("The server advertised {} OPC UA endpoint(s).", Endpoints.size()));
	if (NoneCount > 0)
	{
		Parts.push_back(fmt::format("{} endpoint(s) use no encryption (SecurityPolicy.None).", NoneCount));
	}
	if (LegacyCount > 0)
	{
		Parts.push_back(
			fmt::format("{} endpoint(s) use legacy RSA-based security policies (Basic128/256).", LegacyCount));
	}
	if (ModernCount > 0)
	{
		Parts.push_back(fmt::format("{} endpoint(s) use modern AES-based security policies.", ModernCount));
	}
	if (!Policies.empty())
	{
		Parts.push_back(fmt::format("Security policies seen: {}.", fmt::join(Policies, ", ")));
	}

	bool const bOnlyUnsecured = ModernCount == 0 && LegacyCount == 0 && NoneCount > 0;
	Finding.Severity = bOnlyUnsecured ? EFindingSeverity::Warn : EFindingSeverity::Success;
	Finding.Text = fmt::format("{}", fmt::join(Parts, " "));
	return Finding;
}

LProbeFinding LProbeReport::SummarizeBaseline(std::vector<LSocketRecord> const& Listeners)
{
	LProbeFinding Finding{ .Title = "Baseline Listeners", .Severity = EFindingSeverity::Info };
	if (Listeners.empty())
	{
		Finding.Text = "Before creating a subscription, no listening TCP sockets were captured. This is the baseline "
					   "used for comparison.";
		return Finding;
	}

	Finding.Text = fmt::format("Before the subscription, the tool saw {} listening TCP socket(s) on {}",
		Listeners.size(), DescribePorts(GetUniquePorts(Listeners)));
	return Finding;
}

LProbeFinding LProbeReport::SummarizeSubscription(LSubscriptionOutcome const& Outcome)
{
	LProbeFinding Finding{ .Title = "Subscription" };
	if (Outcome.bSuccess)
	{
		Finding.Severity = EFindingSeverity::Success;
		Finding.Text = fmt::format("The tool successfully created a subscription and monitored {}. This confirms the "
								   "server accepted the subscription on the selected endpoint.",
			Outcome.NodeMonitored.empty() ? "the default status node" : Outcome.NodeMonitored);
		return Finding;
	}

	auto const Details = Outcome.Error.empty() ? std::string("an unspecified error occurred.")
											   : LStringUtil::Shorten(Outcome.Error, kMaxErrorLength);
	Finding.Severity = EFindingSeverity::Error;
	Finding.Text = fmt::format("The tool could not maintain a subscription. The server likely rejected the monitored "
							   "item or closed the session early. Details: {}",
		Details);
	return Finding;
}

LProbeFinding LProbeReport::SummarizePostCapture(
	std::vector<LSocketRecord> const& Listeners, std::vector<LSocketRecord> const* Baseline)
{
	LProbeFinding Finding{ .Title = "Post-Subscription Listeners", .Severity = EFindingSeverity::Info };
	auto const    PortsAfter = GetUniquePorts(Listeners);

	if (!Baseline)
	{
		Finding.Text = Listeners.empty()
			? "After the subscription step, no listening TCP sockets were captured."
			: fmt::format("After the subscription, the tool saw {} listening TCP socket(s) on {}", Listeners.size(),
				  DescribePorts(PortsAfter));
		return Finding;
	}

	if (Listeners.empty())
	{
		Finding.Severity = EFindingSeverity::Warn;
		Finding.Text = "After the subscription, no listening TCP sockets were captured. This suggests the client did "
					   "not keep a separate callback listener open.";
		return Finding;
	}

	auto const               PortsBefore = GetUniquePorts(*Baseline);
	std::vector<std::string> NewPorts{};
	std::ranges::copy_if(PortsAfter, std::back_inserter(NewPorts),
		[&](std::string const& Port) { return std::ranges::find(PortsBefore, Port) == PortsBefore.end(); });

	if (NewPorts.empty())
	{
		Finding.Text = "The set of listening ports did not change after creating the subscription. The OPC UA client "
					   "likely reused existing ports for callbacks.";
		return Finding;
	}

	std::string const Detail = NewPorts.size() <= kMaxListedPorts
		? fmt::format("New listening port(s) appeared after the subscription: {}.", fmt::join(NewPorts, ", "))
		: fmt::format("Several new listening ports appeared after the subscription, including {}.",
			  fmt::join(NewPorts.begin(), NewPorts.begin() + kMaxListedPorts, ", "));
	Finding.Text = fmt::format(
		"After creating the subscription, the tool saw {} listening TCP socket(s). {}", Listeners.size(), Detail);
	return Finding;
}

LProbeFinding LProbeReport::SummarizeConnections(std::vector<LConnectionAttempt> const& Connections)
{
	LProbeFinding Finding{ .Title = "Server Callbacks" };
	if (Connections.empty())
	{
		Finding.Severity = EFindingSeverity::Warn;
		Finding.Text = "No incoming TCP connections from the server's IP were observed during the monitoring window. "
					   "This may mean the server is not attempting callbacks, cannot reach this machine, or a firewall "
					   "is blocking the traffic.";
		return Finding;
	}

	auto const& Last = Connections.back();
	auto const  Source = JoinEndpoint(Last.RemoteAddress.empty() ? "server" : Last.RemoteAddress, Last.RemotePort);
	auto const  Target = JoinEndpoint(Last.LocalAddress.empty() ? "this machine" : Last.LocalAddress, Last.LocalPort);

	Finding.Severity = EFindingSeverity::Success;
	Finding.Text = fmt::format("The tool observed {} incoming TCP connection attempt(s) from the server's IP during the "
							   "monitoring window. One example connection was from {} to {} with state \"{}\".",
		Connections.size(), Source, Target, Last.State.empty() ? "unknown" : Last.State);
	return Finding;
}
