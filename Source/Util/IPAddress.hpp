/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <arpa/inet.h>
#include <netinet/in.h>

namespace EIPFamily
{
	enum Type : uint8_t
	{
		Unknown = 0,
		IPv4 = 4,
		IPv6 = 6
	};
} // namespace EIPFamily

struct LIPAddress
{
	// IPv4: first 4 bytes used; IPv6: all 16 bytes used.
	std::array<uint8_t, 16> Bytes{};
	EIPFamily::Type         Family{};

	// ::ffff:a.b.c.d
	[[nodiscard]] bool IsV4Mapped() const
	{
		if (Family != EIPFamily::IPv6)
		{
			return false;
		}
		for (size_t i = 0; i < 10; ++i)
		{
			if (Bytes[i] != 0)
				return false;
		}
		return Bytes[10] == 0xFF && Bytes[11] == 0xFF;
	}

	[[nodiscard]] LIPAddress UnmapV4() const
	{
		if (!IsV4Mapped())
		{
			return *this;
		}
		LIPAddress V4{};
		V4.Family = EIPFamily::IPv4;
		V4.Bytes[0] = Bytes[12];
		V4.Bytes[1] = Bytes[13];
		V4.Bytes[2] = Bytes[14];
		V4.Bytes[3] = Bytes[15];
		return V4;
	}

	[[nodiscard]] std::string ToString() const
	{
		if (Family == EIPFamily::IPv4)
		{
			in_addr Addr4{};
			Addr4.s_addr = htonl((Bytes[0] << 24) | (Bytes[1] << 16) | (Bytes[2] << 8) | Bytes[3]);
			char        Buffer[INET_ADDRSTRLEN];
			char const* Result = inet_ntop(AF_INET, &Addr4, Buffer, INET_ADDRSTRLEN);
			if (Result)
			{
				return { Buffer };
			}
			return {};
		}

		in6_addr Addr6{};
		for (unsigned long i = 0; i < 16; ++i)
		{
			Addr6.s6_addr[i] = Bytes[i];
		}
		char        Buffer[INET6_ADDRSTRLEN];
		char const* Result = inet_ntop(AF_INET6, &Addr6, Buffer, INET6_ADDRSTRLEN);
		if (Result)
		{
			return { Buffer };
		}
		return {};
	}

	// Numeric text form, brackets around IPv6 are accepted
	static std::optional<LIPAddress> FromString(std::string const& Text)
	{
		std::string Address = Text;
		if (Address.size() >= 2 && Address.front() == '[' && Address.back() == ']')
		{
			Address = Address.substr(1, Address.size() - 2);
		}

		LIPAddress Result{};
		in_addr    Addr4{};
		if (inet_pton(AF_INET, Address.c_str(), &Addr4) == 1)
		{
			Result.FromIPv4Uint32(Addr4.s_addr);
			return Result;
		}

		in6_addr Addr6{};
		if (inet_pton(AF_INET6, Address.c_str(), &Addr6) == 1)
		{
			for (size_t i = 0; i < 16; ++i)
			{
				Result.Bytes[i] = Addr6.s6_addr[i];
			}
			Result.Family = EIPFamily::IPv6;
			return Result;
		}
		return std::nullopt;
	}

	void FromIPv4Uint32(uint32_t IPv4Addr_NetworkByteOrder)
	{
		auto IPv4Addr_HostByteOrder = ntohl(IPv4Addr_NetworkByteOrder);
		Bytes[0] = static_cast<uint8_t>((IPv4Addr_HostByteOrder >> 24) & 0xFF);
		Bytes[1] = static_cast<uint8_t>((IPv4Addr_HostByteOrder >> 16) & 0xFF);
		Bytes[2] = static_cast<uint8_t>((IPv4Addr_HostByteOrder >> 8) & 0xFF);
		Bytes[3] = static_cast<uint8_t>(IPv4Addr_HostByteOrder & 0xFF);
		Family = EIPFamily::IPv4;
	}
};
