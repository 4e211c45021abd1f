/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <map>
#include <string>
#include <vector>
#include <cereal/cereal.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/string.hpp>
#include <cereal/types/vector.hpp>

#include "Data/ProbeTypes.hpp"

// Aggregates written next to the raw stage data in the probe log

struct LEndpointSummary
{
	size_t                        Total{};
	std::map<std::string, size_t> SecurityPolicies{};
	std::map<std::string, size_t> SecurityModes{};
	std::vector<std::string>      UserTokenTypes{};

	static LEndpointSummary Build(std::vector<LEndpointDescriptor> const& Endpoints);

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Total), CEREAL_NVP(SecurityPolicies), CEREAL_NVP(SecurityModes), CEREAL_NVP(UserTokenTypes));
	}
};

struct LListenerSummary
{
	size_t                   Total{};
	std::vector<std::string> UniquePorts{};
	std::vector<std::string> UniqueAddresses{};
	std::vector<std::string> Protocols{};
	std::vector<std::string> ProcessIds{};

	static LListenerSummary Build(std::vector<LSocketRecord> const& Listeners);

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Total), CEREAL_NVP(UniquePorts), CEREAL_NVP(UniqueAddresses), CEREAL_NVP(Protocols),
			CEREAL_NVP(ProcessIds));
	}
};

struct LConnectionSummary
{
	size_t                   Total{};
	std::vector<std::string> UniqueRemoteAddresses{};
	std::vector<std::string> UniqueLocalPorts{};
	std::vector<std::string> UniqueStates{};
	std::vector<std::string> UniqueProcessIds{};
	std::string              First{}; // ISO-8601, empty without attempts
	std::string              Last{};

	static LConnectionSummary Build(std::vector<LConnectionAttempt> const& Connections);

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Total), CEREAL_NVP(UniqueRemoteAddresses), CEREAL_NVP(UniqueLocalPorts),
			CEREAL_NVP(UniqueStates), CEREAL_NVP(UniqueProcessIds), CEREAL_NVP(First), CEREAL_NVP(Last));
	}
};
