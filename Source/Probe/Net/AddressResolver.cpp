/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "AddressResolver.hpp"

#include <memory>
#include <netdb.h>
#include <spdlog/spdlog.h>

#include "IPAddress.hpp"
#include "StringUtil.hpp"

std::optional<std::string> LAddressResolver::ResolveNumeric(std::string const& Host, std::string& Error)
{
	if (auto const Numeric = LIPAddress::FromString(Host))
	{
		return Numeric->UnmapV4().ToString();
	}

	addrinfo Hints{};
	Hints.ai_family = AF_UNSPEC;
	Hints.ai_socktype = SOCK_STREAM;

	addrinfo* RawResult = nullptr;
	int const Result = getaddrinfo(LStringUtil::StripBrackets(Host).c_str(), nullptr, &Hints, &RawResult);
	if (Result != 0)
	{
		// getaddrinfo returns GAI error codes, not errno
		Error = fmt::format("{} ({})", gai_strerror(Result), Result);
		return std::nullopt;
	}
	std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> Info(RawResult, &freeaddrinfo);

	for (addrinfo const* It = Info.get(); It; It = It->ai_next)
	{
		char Buffer[NI_MAXHOST]{};
		if (getnameinfo(It->ai_addr, It->ai_addrlen, Buffer, sizeof(Buffer), nullptr, 0, NI_NUMERICHOST) == 0)
		{
			spdlog::debug("Resolved {} to {}", Host, Buffer);
			if (auto const Address = LIPAddress::FromString(Buffer))
			{
				return Address->UnmapV4().ToString();
			}
			// scoped link-local addresses ("fe80::1%eth0") don't parse, keep the text
			return std::string(Buffer);
		}
	}

	Error = "no numeric address";
	return std::nullopt;
}
