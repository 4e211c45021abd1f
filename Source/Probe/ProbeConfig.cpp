/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProbeConfig.hpp"

#include <regex>
#include <INIReader.h>
#include <spdlog/spdlog.h>

#include "ProbeError.hpp"
#include "StringUtil.hpp"

void LProbeConfig::Validate() const
{
	if (LStringUtil::Trim(Server).empty())
	{
		throw LProbeError(EProbeError::Config, "server missing");
	}

	if (Port.has_value() && Port.value() == 0)
	{
		throw LProbeError(EProbeError::Config, "port must be between 1 and 65535");
	}

	if (PublishingIntervalMs <= 0)
	{
		throw LProbeError(
			EProbeError::Config, fmt::format("publishing interval must be positive, got {}", PublishingIntervalMs));
	}

	if (NodeId.empty())
	{
		throw LProbeError(EProbeError::Config, "node id missing");
	}
}

uint16_t LProbeConfig::ParsePort(std::string const& Text)
{
	auto const Trimmed = LStringUtil::Trim(Text);
	// at most 5 digits, keeps stoul in range
	if (!LStringUtil::IsDigits(Trimmed) || Trimmed.size() > 5)
	{
		throw LProbeError(EProbeError::Config, fmt::format("invalid port '{}'", Text));
	}

	auto const Value = std::stoul(Trimmed);
	if (Value < 1 || Value > 65535)
	{
		throw LProbeError(EProbeError::Config, fmt::format("port {} out of range 1-65535", Value));
	}
	return static_cast<uint16_t>(Value);
}

std::string LEndpointUrl::Normalize(std::string const& Server, std::optional<uint16_t> Port)
{
	std::string Host = LStringUtil::Trim(Server);

	if (LStringUtil::IStartsWith(Host, kScheme))
	{
		Host = Host.substr(std::char_traits<char>::length(kScheme));
	}

	static std::regex const HostPortPattern(R"(^(.+?):(\d+)$)");
	std::smatch             Match;
	if (std::regex_match(Host, Match, HostPortPattern))
	{
		std::string const InlinePort = Match[2].str();
		Host = Match[1].str();
		if (!Port.has_value())
		{
			Port = LProbeConfig::ParsePort(InlinePort);
		}
	}

	if (Host.empty())
	{
		throw LProbeError(EProbeError::Config, "server missing");
	}

	if (!Port.has_value())
	{
		throw LProbeError(EProbeError::Config, "port missing");
	}

	return fmt::format("{}{}:{}", kScheme, Host, Port.value());
}

std::string LEndpointUrl::ExtractHost(std::string const& EndpointUrl)
{
	std::string Rest = LStringUtil::Trim(EndpointUrl);
	if (LStringUtil::IStartsWith(Rest, kScheme))
	{
		Rest = Rest.substr(std::char_traits<char>::length(kScheme));
	}

	if (auto const Slash = Rest.find('/'); Slash != std::string::npos)
	{
		Rest.resize(Slash);
	}

	auto [Host, Port] = LStringUtil::SplitLastColon(Rest);
	if (!LStringUtil::IsDigits(Port))
	{
		// no port suffix, the colon belongs to the address
		Host = Rest;
	}
	return LStringUtil::StripBrackets(Host);
}

LProberConfig::LProberConfig()
{
	Settings.LogDirectory = GetDefaultLogFolder();

	stdfs::path Path{};
	if (LFilesystem::Exists("./lauscher.ini"))
	{
		Path = "./lauscher.ini";
	}
	else if (LFilesystem::Exists("/etc/lauscher/lauscher.ini"))
	{
		Path = "/etc/lauscher/lauscher.ini";
	}

	if (Path.empty())
	{
		spdlog::info("no configuration file found, using defaults");
	}
	else if (!Load(Path.string()))
	{
		spdlog::warn("using defaults");
	}
}

bool LProberConfig::Load(std::string const& Path)
{
	INIReader Reader(Path);

	if (Reader.ParseError() < 0)
	{
		spdlog::error("can't load '{}': {}", Path, Reader.ParseErrorMessage());
		return false;
	}

	auto SafeGet = [&](std::string const& Section, std::string const& Name, std::string& OutVal) {
		if (Reader.HasValue(Section, Name))
		{
			OutVal = Reader.Get(Section, Name, OutVal);
		}
	};

	auto SafeGetDuration = [&](std::string const& Section, std::string const& Name, LDuration& OutVal) {
		auto const Value = Reader.GetInteger(Section, Name, OutVal.count());
		if (Value <= 0)
		{
			spdlog::warn("ignoring non-positive {}.{}={} in '{}'", Section, Name, Value, Path);
			return;
		}
		OutVal = LDuration(Value);
	};

	SafeGet("probe", "server", Defaults.Server);
	SafeGet("probe", "node_id", Defaults.NodeId);
	if (Reader.HasValue("probe", "port"))
	{
		auto const Port = Reader.GetInteger("probe", "port", LProbeConfig::kDefaultPort);
		if (Port >= 1 && Port <= 65535)
		{
			Defaults.Port = static_cast<uint16_t>(Port);
		}
		else
		{
			spdlog::warn("ignoring invalid probe.port={} in '{}'", Port, Path);
		}
	}
	Defaults.PublishingIntervalMs = static_cast<int32_t>(
		Reader.GetInteger("probe", "publishing_interval", Defaults.PublishingIntervalMs));

	std::string SourceName = Settings.TableSource == ESocketTableSource::Proc ? "proc" : "command";
	SafeGet("capture", "source", SourceName);
	if (LStringUtil::IEquals(SourceName, "command"))
	{
		Settings.TableSource = ESocketTableSource::Command;
	}
	else if (LStringUtil::IEquals(SourceName, "proc"))
	{
		Settings.TableSource = ESocketTableSource::Proc;
	}
	else
	{
		spdlog::warn("unknown capture.source '{}', keeping the default", SourceName);
	}
	SafeGet("capture", "command", Settings.TableCommand);
	auto const HeaderLines =
		Reader.GetInteger("capture", "header_lines", static_cast<long>(Settings.TableHeaderLines));
	if (HeaderLines >= 0)
	{
		Settings.TableHeaderLines = static_cast<size_t>(HeaderLines);
	}

	SafeGetDuration("monitor", "duration_ms", Settings.MonitorDuration);
	SafeGetDuration("monitor", "poll_interval_ms", Settings.PollInterval);
	SafeGetDuration("subscription", "settle_ms", Settings.SubscriptionSettle);
	SafeGetDuration("subscription", "timeout_ms", Settings.SessionTimeout);

	std::string LogDirectory = Settings.LogDirectory.string();
	SafeGet("log", "directory", LogDirectory);
	Settings.LogDirectory = LogDirectory;

	spdlog::info("loaded configuration from '{}'", Path);
	return true;
}

void LProberConfig::LogConfig() const
{
	spdlog::info("log directory={}", Settings.LogDirectory.string());
	if (Settings.TableSource == ESocketTableSource::Command)
	{
		spdlog::info("socket table source=command '{}' (skipping {} header lines)", Settings.TableCommand,
			Settings.TableHeaderLines);
	}
	else
	{
		spdlog::info("socket table source=/proc/net");
	}
	spdlog::info("monitor window={}ms, poll interval={}ms", Settings.MonitorDuration.count(),
		Settings.PollInterval.count());
}

stdfs::path LProberConfig::GetDefaultLogFolder()
{
	char const* Xdg = std::getenv("XDG_STATE_HOME");
	stdfs::path Base;
	if (Xdg && Xdg[0] != '\0')
	{
		Base = stdfs::path(Xdg);
	}
	else
	{
		char const* Home = std::getenv("HOME");
		if (!Home || Home[0] == '\0')
		{
			spdlog::warn("Neither XDG_STATE_HOME nor HOME are set; writing logs to ./logs");
			return { "./logs" };
		}
		Base = stdfs::path(Home) / ".local" / "state";
	}

	return Base / "lauscher" / "logs";
}
