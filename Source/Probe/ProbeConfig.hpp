/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <cereal/cereal.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/string.hpp>

#include "Filesystem.hpp"
#include "Singleton.hpp"
#include "Types.hpp"

// Parameters of one probe run, immutable once the run started
struct LProbeConfig
{
	static constexpr uint16_t    kDefaultPort = 4840;
	static constexpr char const* kDefaultNodeId = "ns=0;i=2258"; // Server_ServerStatus_CurrentTime
	static constexpr int32_t     kDefaultPublishingIntervalMs = 250;

	std::string             Server{};
	std::optional<uint16_t> Port{ kDefaultPort }; // unset: taken from an inline "host:port" server
	std::string             NodeId{ kDefaultNodeId };
	int32_t                 PublishingIntervalMs{ kDefaultPublishingIntervalMs };

	// Throws LProbeError(Config)
	void Validate() const;

	// Throws LProbeError(Config) for anything outside 1-65535
	static uint16_t ParsePort(std::string const& Text);

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Server), CEREAL_NVP(Port), CEREAL_NVP(NodeId), CEREAL_NVP(PublishingIntervalMs));
	}
};

class LEndpointUrl
{
public:
	static constexpr char const* kScheme = "opc.tcp://";

	// "host", "host:port" or "opc.tcp://host:port" -> "opc.tcp://host:port"
	// An inline port is only used if Port is unset, throws LProbeError(Config) if host or port are missing
	static std::string Normalize(std::string const& Server, std::optional<uint16_t> Port);

	// "opc.tcp://10.0.0.5:4840/path" -> "10.0.0.5", "opc.tcp://[fe80::1]:4840" -> "fe80::1"
	static std::string ExtractHost(std::string const& EndpointUrl);
};

namespace ESocketTableSource
{
	enum Type : uint8_t
	{
		Proc,   // /proc/net/tcp{,6}
		Command // output of an external command, i.e. netstat -ano
	};
} // namespace ESocketTableSource

// Installation wide settings, copied into every run
struct LProbeSettings
{
	stdfs::path              LogDirectory{ "./logs" };
	ESocketTableSource::Type TableSource{ ESocketTableSource::Proc };
	std::string              TableCommand{ "netstat -ano" };
	size_t                   TableHeaderLines{ 4 };
	LDuration                MonitorDuration{ 30000 };
	LDuration                PollInterval{ 2000 };
	LDuration                SubscriptionSettle{ 1500 };
	LDuration                SessionTimeout{ 5000 };
};

struct LProberConfig final : TSingleton<LProberConfig>
{
	LProbeSettings Settings{};
	LProbeConfig   Defaults{};

	LProberConfig();

	bool Load(std::string const& Path);

	void LogConfig() const;

	static stdfs::path GetDefaultLogFolder();
};
