/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <cerrno>
#include <cstring>
#include <string>

class LErrnoUtil
{
public:
	static std::string StrError() { return StrError(errno); }

	static std::string StrError(int Error) { return std::string(strerror(Error)); }
};
