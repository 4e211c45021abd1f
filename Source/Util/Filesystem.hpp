/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once

#include "ErrnoUtil.hpp"
#include "Types.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>
#include <spdlog/spdlog.h>

namespace stdfs = std::filesystem;

class LFilesystem
{
public:
	static bool Exists(stdfs::path const& p)
	{
		std::error_code Ec;
		return stdfs::exists(p, Ec);
	}

	// Reads a whole (proc) file, std::nullopt if it can't be opened
	static std::optional<std::string> ReadFile(stdfs::path const& Path)
	{
		std::ifstream FileStream(Path, std::ios::in | std::ios::binary);
		if (!FileStream)
			return std::nullopt;

		std::ostringstream ss;
		ss << FileStream.rdbuf();
		return ss.str();
	}

	// Readlink helper that returns the symlink target as string; returns empty on failure.
	static std::string ReadLink(std::string const& Path)
	{
		std::vector<char> Buf(256);
		while (true)
		{
			ssize_t N = ::readlink(Path.c_str(), Buf.data(), Buf.size());
			if (N < 0)
			{
				return {};
			}
			if (static_cast<size_t>(N) < Buf.size())
			{
				return { Buf.data(), static_cast<size_t>(N) };
			}
			// Buffer too small, grow and retry
			Buf.resize(Buf.size() * 2);
		}
	}

	static bool EnsureDirectory(stdfs::path const& Path)
	{
		std::error_code Ec;
		if (stdfs::is_directory(Path, Ec))
		{
			return true;
		}

		if (!stdfs::create_directories(Path, Ec) && Ec)
		{
			spdlog::error("Failed to create directory {}: {}", Path.string(), Ec.message());
			return false;
		}
		return true;
	}

	// All numeric entries of /proc
	static std::vector<LProcessId> ListProcessIds(stdfs::path const& ProcRoot = "/proc")
	{
		std::vector<LProcessId> Pids{};
		std::error_code         Ec;
		for (stdfs::directory_iterator It(ProcRoot, Ec), End; !Ec && It != End; It.increment(Ec))
		{
			auto const Name = It->path().filename().string();
			LProcessId Pid{};
			auto const NameEnd = Name.data() + Name.size();
			auto const [Ptr, ParseEc] = std::from_chars(Name.data(), NameEnd, Pid);
			if (Name.empty() || ParseEc != std::errc{} || Ptr != NameEnd || Pid <= 0)
			{
				continue;
			}
			Pids.push_back(Pid);
		}
		if (Ec)
		{
			spdlog::debug("Listing {} stopped early: {}", ProcRoot.string(), Ec.message());
		}
		return Pids;
	}
};
