/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "SocketTableSource.hpp"

#include <array>
#include <charconv>
#include <cstdio>
#include <sstream>
#include <unordered_set>
#include <sys/wait.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include "ErrnoUtil.hpp"
#include "ProbeConfig.hpp"
#include "ProbeError.hpp"
#include "StringUtil.hpp"

// TCP states from Linux kernel (include/net/tcp_states.h)
constexpr uint32_t TCP_LISTEN = 0x0A;

std::string LCommandSocketTableSource::Capture()
{
	FILE* Pipe = popen(Command.c_str(), "r");
	if (!Pipe)
	{
		throw LProbeError(
			EProbeError::Capture, fmt::format("failed to run '{}': {}", Command, LErrnoUtil::StrError()));
	}

	std::string            Output{};
	std::array<char, 4096> Buffer{};
	size_t                 Read = 0;
	while ((Read = fread(Buffer.data(), 1, Buffer.size(), Pipe)) > 0)
	{
		Output.append(Buffer.data(), Read);
	}

	int const Status = pclose(Pipe);
	if (Status == -1)
	{
		throw LProbeError(
			EProbeError::Capture, fmt::format("failed to wait for '{}': {}", Command, LErrnoUtil::StrError()));
	}
	if (!WIFEXITED(Status) || WEXITSTATUS(Status) != 0)
	{
		int const Code = WIFEXITED(Status) ? WEXITSTATUS(Status) : -1;
		throw LProbeError(EProbeError::Capture, fmt::format("'{}' exited with status {}", Command, Code));
	}
	return Output;
}

std::string LProcNetSocketTableSource::Capture()
{
	std::vector<LProcNetEntry> Entries{};
	bool                       bAnyRead = false;

	for (auto const& [Name, bIsIPv6] : { std::pair{ "tcp", false }, std::pair{ "tcp6", true } })
	{
		auto const Content = LFilesystem::ReadFile(ProcRoot / "net" / Name);
		if (!Content.has_value())
		{
			spdlog::debug("can't read {}/net/{}", ProcRoot.string(), Name);
			continue;
		}
		bAnyRead = true;

		auto const Lines = LStringUtil::SplitLines(Content.value());
		// first line is the column header
		for (size_t i = 1; i < Lines.size(); ++i)
		{
			if (auto Entry = ParseLine(Lines[i], bIsIPv6))
			{
				Entries.push_back(Entry.value());
			}
		}
	}

	if (!bAnyRead)
	{
		throw LProbeError(EProbeError::Capture,
			fmt::format("can't read {0}/net/tcp or {0}/net/tcp6: {1}", ProcRoot.string(), LErrnoUtil::StrError()));
	}

	return Render(Entries, MapInodesToProcesses(Entries));
}

static bool IsHex(std::string const& Str)
{
	return !Str.empty() && Str.find_first_not_of("0123456789abcdefABCDEF") == std::string::npos;
}

// Whole string as a number of type T, std::nullopt on garbage or overflow
template <typename T>
static std::optional<T> ParseNumber(std::string const& Str, int Base = 10)
{
	T          Value{};
	auto const End = Str.data() + Str.size();
	auto const [Ptr, Ec] = std::from_chars(Str.data(), End, Value, Base);
	if (Str.empty() || Ec != std::errc{} || Ptr != End)
	{
		return std::nullopt;
	}
	return Value;
}

std::optional<LProcNetEntry> LProcNetSocketTableSource::ParseLine(std::string const& Line, bool bIsIPv6)
{
	//  sl  local_address rem_address   st tx_queue:rx_queue tr:tm->when retrnsmt   uid  timeout inode
	auto const Columns = LStringUtil::SplitWhitespace(Line);
	if (Columns.size() < 10)
	{
		return std::nullopt;
	}

	LProcNetEntry Entry{};
	if (!ParseAddressPort(Columns[1], Entry.LocalAddress, Entry.LocalPort, bIsIPv6)
		|| !ParseAddressPort(Columns[2], Entry.RemoteAddress, Entry.RemotePort, bIsIPv6))
	{
		return std::nullopt;
	}

	auto const State = ParseNumber<uint32_t>(Columns[3], 16);
	auto const Inode = ParseNumber<LSocketInode>(Columns[9]);
	if (!State || !Inode || State.value() > 0xFF)
	{
		return std::nullopt;
	}
	Entry.State = State.value();
	Entry.Inode = Inode.value();
	return Entry;
}

bool LProcNetSocketTableSource::ParseAddressPort(
	std::string const& AddrPortStr, LIPAddress& OutAddr, uint16_t& OutPort, bool bIsIPv6)
{
	size_t const ColonPos = AddrPortStr.find(':');
	if (ColonPos == std::string::npos)
		return false;

	std::string const AddrStr = AddrPortStr.substr(0, ColonPos);
	std::string const PortStr = AddrPortStr.substr(ColonPos + 1);

	// Parse port (always in hex)
	auto const Port = ParseNumber<uint16_t>(PortStr, 16);
	if (!IsHex(AddrStr) || !Port)
		return false;
	OutPort = Port.value();

	if (bIsIPv6)
	{
		// IPv6 address is 32 hex chars (128 bits)
		if (AddrStr.length() != 32)
		{
			return false;
		}

		// Parse as 4 uint32_t values in little-endian byte order
		uint32_t Addr6[4];
		for (size_t i = 0; i < 4; ++i)
		{
			auto const Quad = ParseNumber<uint32_t>(AddrStr.substr(i * 8, 8), 16);
			if (!Quad)
			{
				return false;
			}
			Addr6[i] = Quad.value();
		}

		// Convert from little-endian to bytes
		for (size_t i = 0; i < 4; ++i)
		{
			OutAddr.Bytes[i * 4 + 0] = static_cast<uint8_t>(Addr6[i] & 0xFF);
			OutAddr.Bytes[i * 4 + 1] = static_cast<uint8_t>(Addr6[i] >> 8 & 0xFF);
			OutAddr.Bytes[i * 4 + 2] = static_cast<uint8_t>(Addr6[i] >> 16 & 0xFF);
			OutAddr.Bytes[i * 4 + 3] = static_cast<uint8_t>(Addr6[i] >> 24 & 0xFF);
		}

		OutAddr.Family = EIPFamily::IPv6;
	}
	else
	{
		// IPv4 address is 8 hex chars (32 bits) in little-endian
		if (AddrStr.length() != 8)
		{
			return false;
		}

		auto const Parsed = ParseNumber<uint32_t>(AddrStr, 16);
		if (!Parsed)
		{
			return false;
		}
		uint32_t const Addr4 = Parsed.value();

		OutAddr.Bytes[0] = static_cast<uint8_t>(Addr4 & 0xFF);
		OutAddr.Bytes[1] = static_cast<uint8_t>(Addr4 >> 8 & 0xFF);
		OutAddr.Bytes[2] = static_cast<uint8_t>(Addr4 >> 16 & 0xFF);
		OutAddr.Bytes[3] = static_cast<uint8_t>(Addr4 >> 24 & 0xFF);

		OutAddr.Family = EIPFamily::IPv4;
	}

	return true;
}

std::string LProcNetSocketTableSource::StateName(uint32_t State)
{
	switch (State)
	{
		case 0x01:
			return "ESTABLISHED";
		case 0x02:
			return "SYN_SENT";
		case 0x03:
		case 0x0C: // TCP_NEW_SYN_RECV
			return "SYN_RECEIVED";
		case 0x04:
			return "FIN_WAIT_1";
		case 0x05:
			return "FIN_WAIT_2";
		case 0x06:
			return "TIME_WAIT";
		case 0x07:
			return "CLOSED";
		case 0x08:
			return "CLOSE_WAIT";
		case 0x09:
			return "LAST_ACK";
		case TCP_LISTEN:
			return "LISTENING";
		case 0x0B:
			return "CLOSING";
		default:
			return fmt::format("UNKNOWN_{:02X}", State);
	}
}

std::string LProcNetSocketTableSource::FormatEndpoint(LIPAddress const& Address, uint16_t Port)
{
	auto const Plain = Address.UnmapV4();
	if (Plain.Family == EIPFamily::IPv6)
	{
		return fmt::format("[{}]:{}", Plain.ToString(), Port);
	}
	return fmt::format("{}:{}", Plain.ToString(), Port);
}

std::string LProcNetSocketTableSource::Render(
	std::vector<LProcNetEntry> const& Entries, std::unordered_map<LSocketInode, LProcessId> const& Owners)
{
	std::ostringstream Os;
	// same preamble as `netstat -ano` so both sources share one parser
	Os << "\nActive Connections\n\n";
	Os << fmt::format("  {:<6} {:<46} {:<46} {:<15} {}\n", "Proto", "Local Address", "Foreign Address", "State", "PID");

	for (auto const& Entry : Entries)
	{
		LProcessId Pid = 0;
		if (auto It = Owners.find(Entry.Inode); It != Owners.end())
		{
			Pid = It->second;
		}

		Os << fmt::format("  {:<6} {:<46} {:<46} {:<15} {}\n", "TCP",
			FormatEndpoint(Entry.LocalAddress, Entry.LocalPort), FormatEndpoint(Entry.RemoteAddress, Entry.RemotePort),
			StateName(Entry.State), Pid);
	}
	return Os.str();
}

std::unordered_map<LSocketInode, LProcessId> LProcNetSocketTableSource::MapInodesToProcesses(
	std::vector<LProcNetEntry> const& Entries) const
{
	std::unordered_map<LSocketInode, LProcessId> Owners{};
	std::unordered_set<LSocketInode>             Wanted{};
	for (auto const& Entry : Entries)
	{
		// inode 0 is a socket in TIME_WAIT without an owner
		if (Entry.Inode != 0)
		{
			Wanted.insert(Entry.Inode);
		}
	}

	if (Wanted.empty())
	{
		return Owners;
	}

	for (auto const Pid : LFilesystem::ListProcessIds(ProcRoot))
	{
		// the process may exit while its fds are walked, errors end the walk of that process
		std::error_code Ec;
		auto const      FdDir = ProcRoot / std::to_string(Pid) / "fd";
		for (stdfs::directory_iterator It(FdDir, Ec), End; !Ec && It != End; It.increment(Ec))
		{
			// "socket:[12345]"
			auto const Target = LFilesystem::ReadLink(It->path().string());
			if (!Target.starts_with("socket:[") || Target.back() != ']')
			{
				continue;
			}

			auto const Inode = ParseNumber<LSocketInode>(Target.substr(8, Target.size() - 9));
			if (Inode && Wanted.contains(Inode.value()))
			{
				Owners.emplace(Inode.value(), Pid);
			}
		}
	}
	return Owners;
}

std::unique_ptr<ISocketTableSource> MakeSocketTableSource(LProbeSettings const& Settings)
{
	if (Settings.TableSource == ESocketTableSource::Command)
	{
		return std::make_unique<LCommandSocketTableSource>(Settings.TableCommand, Settings.TableHeaderLines);
	}
	return std::make_unique<LProcNetSocketTableSource>();
}
