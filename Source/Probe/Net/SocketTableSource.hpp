/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Filesystem.hpp"
#include "IPAddress.hpp"
#include "Types.hpp"

struct LProbeSettings;

// Produces the raw connection table text consumed by LSocketTable, throws LProbeError(Capture)
class ISocketTableSource
{
public:
	virtual ~ISocketTableSource() = default;

	virtual std::string Capture() = 0;

	// Number of preamble lines before the first socket row
	[[nodiscard]] virtual size_t GetHeaderLines() const = 0;

	[[nodiscard]] virtual std::string GetDescription() const = 0;
};

// Runs an external command (i.e. `netstat -ano`) and returns its stdout
class LCommandSocketTableSource : public ISocketTableSource
{
	std::string Command{};
	size_t      HeaderLines{};

public:
	LCommandSocketTableSource(std::string Command_, size_t HeaderLines_)
		: Command(std::move(Command_))
		, HeaderLines(HeaderLines_)
	{
	}

	std::string Capture() override;

	[[nodiscard]] size_t GetHeaderLines() const override { return HeaderLines; }

	[[nodiscard]] std::string GetDescription() const override { return "command '" + Command + "'"; }
};

struct LProcNetEntry
{
	LIPAddress   LocalAddress{};
	uint16_t     LocalPort{};
	LIPAddress   RemoteAddress{};
	uint16_t     RemotePort{};
	uint32_t     State{};
	LSocketInode Inode{};
};

// Reads /proc/net/tcp and /proc/net/tcp6 and renders them in the `netstat -ano` layout,
// PIDs are found by matching socket inodes against /proc/<pid>/fd
class LProcNetSocketTableSource : public ISocketTableSource
{
	stdfs::path ProcRoot{ "/proc" };

public:
	static constexpr size_t kHeaderLines = 4;

	explicit LProcNetSocketTableSource(stdfs::path ProcRoot_ = "/proc")
		: ProcRoot(std::move(ProcRoot_))
	{
	}

	std::string Capture() override;

	[[nodiscard]] size_t GetHeaderLines() const override { return kHeaderLines; }

	[[nodiscard]] std::string GetDescription() const override { return ProcRoot.string() + "/net/tcp{,6}"; }

	// Parse line from /proc/net/tcp or /proc/net/tcp6
	static std::optional<LProcNetEntry> ParseLine(std::string const& Line, bool bIsIPv6);

	// parse hex address:port format
	static bool ParseAddressPort(std::string const& AddrPortStr, LIPAddress& OutAddr, uint16_t& OutPort, bool bIsIPv6);

	// Kernel TCP state number to the netstat spelling, i.e. 0x0A -> LISTENING
	static std::string StateName(uint32_t State);

	static std::string FormatEndpoint(LIPAddress const& Address, uint16_t Port);

	static std::string Render(
		std::vector<LProcNetEntry> const& Entries, std::unordered_map<LSocketInode, LProcessId> const& Owners);

	[[nodiscard]] std::unordered_map<LSocketInode, LProcessId> MapInodesToProcesses(
		std::vector<LProcNetEntry> const& Entries) const;
};

std::unique_ptr<ISocketTableSource> MakeSocketTableSource(LProbeSettings const& Settings);
