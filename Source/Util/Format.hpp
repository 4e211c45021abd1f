/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <spdlog/fmt/fmt.h>
#include <string>
#include <vector>

struct LTableColumn
{
	std::string Title{};
	size_t      Width{};
};

// Fixed width text tables for the probe log
class LTableFormat
{
	std::vector<LTableColumn> Columns{};

public:
	explicit LTableFormat(std::vector<LTableColumn> Columns_)
		: Columns(std::move(Columns_))
	{
	}

	// Cells wider than the column keep Width - 2 characters followed by ".."
	static std::string FitCell(std::string const& Cell, size_t Width)
	{
		if (Cell.size() <= Width)
		{
			return fmt::format("{:<{}}", Cell, Width);
		}
		if (Width <= 2)
		{
			return std::string(Width, '.');
		}
		return Cell.substr(0, Width - 2) + "..";
	}

	[[nodiscard]] std::string FormatRow(std::vector<std::string> const& Cells) const
	{
		std::string Line{};
		for (size_t i = 0; i < Columns.size(); ++i)
		{
			if (i > 0)
			{
				Line += "  ";
			}
			Line += FitCell(i < Cells.size() ? Cells[i] : std::string{}, Columns[i].Width);
		}
		// no trailing padding after the last column
		while (!Line.empty() && Line.back() == ' ')
		{
			Line.pop_back();
		}
		return Line;
	}

	[[nodiscard]] std::string FormatHeader() const
	{
		std::vector<std::string> Titles{};
		Titles.reserve(Columns.size());
		for (auto const& Column : Columns)
		{
			Titles.push_back(Column.Title);
		}
		return FormatRow(Titles);
	}

	[[nodiscard]] std::string FormatRule() const
	{
		size_t Total = 0;
		for (auto const& Column : Columns)
		{
			Total += Column.Width;
		}
		Total += Columns.empty() ? 0 : (Columns.size() - 1) * 2;
		return std::string(Total, '-');
	}

	[[nodiscard]] std::vector<std::string> Format(std::vector<std::vector<std::string>> const& Rows) const
	{
		std::vector<std::string> Lines{};
		Lines.reserve(Rows.size() + 2);
		Lines.push_back(FormatHeader());
		Lines.push_back(FormatRule());
		for (auto const& Row : Rows)
		{
			Lines.push_back(FormatRow(Row));
		}
		return Lines;
	}
};
