/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <optional>
#include <string>

class LAddressResolver
{
public:
	// Numeric hosts are returned unchanged (without brackets), host names are resolved with getaddrinfo
	// to their first address. std::nullopt if the lookup failed, Error holds the reason
	static std::optional<std::string> ResolveNumeric(std::string const& Host, std::string& Error);
};
