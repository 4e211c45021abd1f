/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include "Types.hpp"

namespace EProbeStage
{
	enum Type : uint8_t
	{
		Init = 0,
		QueryEndpoints,
		BaselineCapture,
		Subscribe,
		PostCapture,
		Monitor,
		Completed,
		Failed
	};

	inline char const* ToString(Type Stage)
	{
		switch (Stage)
		{
			case Init:
				return "Init";
			case QueryEndpoints:
				return "Endpoint Query";
			case BaselineCapture:
				return "Baseline Port Capture";
			case Subscribe:
				return "Subscription Creation";
			case PostCapture:
				return "Post-Subscription Port Capture";
			case Monitor:
				return "Connection Monitoring";
			case Completed:
				return "Completed";
			case Failed:
				return "Failed";
			default:
				return "Unknown";
		}
	}
} // namespace EProbeStage

struct LEndpointDescriptor
{
	std::string              EndpointUrl{};
	std::string              SecurityPolicyUri{};
	std::string              SecurityMode{};
	std::vector<std::string> UserIdentityTokens{}; // token kinds, i.e. "Anonymous", "UserName"

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(EndpointUrl), CEREAL_NVP(SecurityPolicyUri), CEREAL_NVP(SecurityMode),
			CEREAL_NVP(UserIdentityTokens));
	}
};

// A listening socket, all fields are raw text from the socket table and never absent (empty instead)
struct LSocketRecord
{
	std::string Protocol{};
	std::string LocalAddress{};
	std::string LocalPort{};
	std::string ProcessId{};

	[[nodiscard]] std::string Key() const { return LocalAddress + ":" + LocalPort; }

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Protocol), CEREAL_NVP(LocalAddress), CEREAL_NVP(LocalPort), CEREAL_NVP(ProcessId));
	}
};

struct LConnectionAttempt
{
	LMsec       TimestampMs{};
	std::string Protocol{};
	std::string LocalAddress{};
	std::string LocalPort{};
	std::string RemoteAddress{};
	std::string RemotePort{};
	std::string State{};
	std::string ProcessId{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(TimestampMs), CEREAL_NVP(Protocol), CEREAL_NVP(LocalAddress), CEREAL_NVP(LocalPort),
			CEREAL_NVP(RemoteAddress), CEREAL_NVP(RemotePort), CEREAL_NVP(State), CEREAL_NVP(ProcessId));
	}
};

struct LSubscriptionOutcome
{
	bool        bSuccess{ false };
	std::string NodeMonitored{}; // set on success
	std::string Error{};         // set on failure

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(bSuccess), CEREAL_NVP(NodeMonitored), CEREAL_NVP(Error));
	}
};

struct LPortDiff
{
	std::vector<std::string> NewPorts{};
	std::vector<std::string> RemovedPorts{};
	int64_t                  NetChange{ 0 };

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(NewPorts), CEREAL_NVP(RemovedPorts), CEREAL_NVP(NetChange));
	}
};

struct LProbeResult
{
	std::vector<LEndpointDescriptor> Endpoints{};
	std::vector<LSocketRecord>       BeforeListeners{};
	LSubscriptionOutcome             Subscription{};
	std::vector<LSocketRecord>       AfterListeners{};
	LPortDiff                        Diff{};
	std::vector<LConnectionAttempt>  Connections{};

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Endpoints), CEREAL_NVP(BeforeListeners), CEREAL_NVP(Subscription),
			CEREAL_NVP(AfterListeners), CEREAL_NVP(Diff), CEREAL_NVP(Connections));
	}
};
