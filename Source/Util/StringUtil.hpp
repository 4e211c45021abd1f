/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

class LStringUtil
{
public:
	static std::string Trim(std::string_view Str)
	{
		auto const IsSpace = [](unsigned char C) { return std::isspace(C) != 0; };
		auto       Begin = std::find_if_not(Str.begin(), Str.end(), IsSpace);
		auto       End = std::find_if_not(Str.rbegin(), Str.rend(), IsSpace).base();
		if (Begin >= End)
		{
			return {};
		}
		return { Begin, End };
	}

	static std::string ToLower(std::string_view Str)
	{
		std::string Result(Str);
		std::ranges::transform(Result, Result.begin(), [](unsigned char C) { return std::tolower(C); });
		return Result;
	}

	static bool IEquals(std::string_view Lhs, std::string_view Rhs)
	{
		return Lhs.size() == Rhs.size()
			&& std::equal(Lhs.begin(), Lhs.end(), Rhs.begin(),
				[](unsigned char A, unsigned char B) { return std::tolower(A) == std::tolower(B); });
	}

	static bool IStartsWith(std::string_view Str, std::string_view Prefix)
	{
		return Str.size() >= Prefix.size() && IEquals(Str.substr(0, Prefix.size()), Prefix);
	}

	static bool IContains(std::string_view Str, std::string_view Needle)
	{
		return ToLower(Str).find(ToLower(Needle)) != std::string::npos;
	}

	static std::vector<std::string> SplitWhitespace(std::string const& Line)
	{
		std::istringstream       Iss(Line);
		std::vector<std::string> Parts{};
		std::string              Part;
		while (Iss >> Part)
		{
			Parts.push_back(Part);
		}
		return Parts;
	}

	static std::vector<std::string> SplitLines(std::string const& Text)
	{
		std::vector<std::string> Lines{};
		std::istringstream       Iss(Text);
		std::string              Line;
		while (std::getline(Iss, Line))
		{
			if (!Line.empty() && Line.back() == '\r')
			{
				Line.pop_back();
			}
			Lines.push_back(std::move(Line));
		}
		return Lines;
	}

	// Splits "address:port" at the last colon; no colon yields { Text, "" }
	static std::pair<std::string, std::string> SplitLastColon(std::string const& Text)
	{
		auto const Pos = Text.rfind(':');
		if (Pos == std::string::npos)
		{
			return { Text, {} };
		}
		return { Text.substr(0, Pos), Text.substr(Pos + 1) };
	}

	// "[::1]" -> "::1"
	static std::string StripBrackets(std::string const& Address)
	{
		if (Address.size() >= 2 && Address.front() == '[' && Address.back() == ']')
		{
			return Address.substr(1, Address.size() - 2);
		}
		return Address;
	}

	static bool IsDigits(std::string_view Str)
	{
		return !Str.empty() && std::ranges::all_of(Str, [](unsigned char C) { return std::isdigit(C) != 0; });
	}

	// Collapses whitespace runs and cuts the text at MaxLength characters
	static std::string Shorten(std::string_view Text, size_t MaxLength)
	{
		std::string Collapsed{};
		bool        bInSpace = false;
		for (unsigned char C : Trim(Text))
		{
			if (std::isspace(C))
			{
				bInSpace = true;
				continue;
			}
			if (bInSpace)
			{
				Collapsed.push_back(' ');
				bInSpace = false;
			}
			Collapsed.push_back(static_cast<char>(C));
		}

		if (Collapsed.size() > MaxLength && MaxLength > 3)
		{
			Collapsed.resize(MaxLength - 3);
			Collapsed += "...";
		}
		return Collapsed;
	}
};
