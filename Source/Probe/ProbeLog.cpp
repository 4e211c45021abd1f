/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "ProbeLog.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/pattern_formatter.h>

#include "StringUtil.hpp"
#include "Time.hpp"

// [2026-01-31T17:04:05.123Z] text
constexpr char const* kFilePattern = "[%Y-%m-%dT%H:%M:%S.%eZ] %v";

void LProbeEventSink::sink_it_(spdlog::details::log_msg const& Message)
{
	spdlog::memory_buf_t Formatted;
	formatter_->format(Message, Formatted);
	std::string Line(Formatted.data(), Formatted.size());
	while (!Line.empty() && (Line.back() == '\n' || Line.back() == '\r'))
	{
		Line.pop_back();
	}
	if (Forward)
	{
		Forward(Line);
	}
}

LProbeLog::LProbeLog(
	stdfs::path const& Directory, LMsec StartMs, std::function<void(std::string const&)> OnHeadline)
{
	spdlog::sink_ptr FileSink{};
	if (LFilesystem::EnsureDirectory(Directory))
	{
		FilePath = Directory / MakeFileName(StartMs);
		try
		{
			FileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(FilePath.string(), false);
		}
		catch (spdlog::spdlog_ex const& e)
		{
			spdlog::error("Failed to open probe log {}: {}", FilePath.string(), e.what());
			FilePath.clear();
		}
	}
	if (!FileSink)
	{
		FileSink = std::make_shared<spdlog::sinks::null_sink_mt>();
	}
	FileSink->set_formatter(std::make_unique<spdlog::pattern_formatter>(kFilePattern, spdlog::pattern_time_type::utc));

	auto EventSink = std::make_shared<LProbeEventSink>(std::move(OnHeadline));
	EventSink->set_pattern("%v");

	// not registered with spdlog, every run owns its loggers
	DetailLogger = std::make_shared<spdlog::logger>("probe-detail", FileSink);
	HeadlineLogger = std::make_shared<spdlog::logger>("probe", spdlog::sinks_init_list{ FileSink, EventSink });
	for (auto const& Logger : { DetailLogger, HeadlineLogger })
	{
		Logger->set_level(spdlog::level::trace);
		Logger->flush_on(spdlog::level::warn);
	}
}

LProbeLog::~LProbeLog()
{
	Flush();
}

std::string LProbeLog::MakeFileName(LMsec StartMs)
{
	return fmt::format("{}{}.log", kFilePrefix, LTime::FormatFileStamp(StartMs));
}

void LProbeLog::WriteLines(spdlog::logger& Logger, std::string const& Text)
{
	if (Text.empty())
	{
		Logger.info("");
		return;
	}
	for (auto const& Line : LStringUtil::SplitLines(Text))
	{
		Logger.info(Line);
	}
}

void LProbeLog::Headline(std::string const& Text)
{
	WriteLines(*HeadlineLogger, Text);
}

void LProbeLog::Detail(std::string const& Text)
{
	WriteLines(*DetailLogger, Text);
}

void LProbeLog::Section(std::string const& Title, std::vector<std::string> const& Lines)
{
	Detail(fmt::format("===== {} =====", Title));
	for (auto const& Line : Lines)
	{
		Detail(Line);
	}
	Detail(fmt::format("===== End {} =====", Title));
}

void LProbeLog::Table(
	std::string const& Title, LTableFormat const& Format, std::vector<std::vector<std::string>> const& Rows)
{
	auto Lines = Format.Format(Rows);
	if (Rows.empty())
	{
		Lines.emplace_back("(none)");
	}
	Section(Title, Lines);
}

void LProbeLog::Warning(std::string const& Context, std::string const& Message)
{
	{
		std::lock_guard Lock(IssueMutex);
		Warnings.push_back(
			LProbeIssue{ .Timestamp = LTime::NowIso8601(), .Context = Context, .Message = Message, .Kind = {} });
	}
	DetailLogger->warn("[WARNING] {}: {}", Context, Message);
}

void LProbeLog::Error(std::string const& Context, std::string const& Message, std::string const& Kind)
{
	{
		std::lock_guard Lock(IssueMutex);
		Errors.push_back(
			LProbeIssue{ .Timestamp = LTime::NowIso8601(), .Context = Context, .Message = Message, .Kind = Kind });
	}
	Section("Error Detected",
		{
			fmt::format("Context: {}", Context),
			fmt::format("Error Kind: {}", Kind),
			fmt::format("Error Message: {}", Message),
		});
	DetailLogger->flush();
}

void LProbeLog::WriteIssues(std::string const& Label, std::vector<LProbeIssue> const& Issues)
{
	if (Issues.empty())
	{
		return;
	}

	Detail(fmt::format("Total {}s: {}", Label, Issues.size()));
	for (size_t i = 0; i < Issues.size(); ++i)
	{
		auto const& Issue = Issues[i];
		Detail(fmt::format("--- {} {} ---", Label, i + 1));
		Detail(fmt::format("  Time: {}", Issue.Timestamp));
		Detail(fmt::format("  Context: {}", Issue.Context.empty() ? "Unknown" : Issue.Context));
		if (!Issue.Kind.empty())
		{
			Detail(fmt::format("  Type: {}", Issue.Kind));
		}
		Detail(fmt::format("  Message: {}", Issue.Message));
	}
}

void LProbeLog::WriteIssueSummary()
{
	auto const CurrentErrors = GetErrors();
	auto const CurrentWarnings = GetWarnings();
	if (CurrentErrors.empty() && CurrentWarnings.empty())
	{
		return;
	}

	Detail("===== Error And Warning Summary =====");
	WriteIssues("Error", CurrentErrors);
	WriteIssues("Warning", CurrentWarnings);
	Detail("===== End Error And Warning Summary =====");
}

void LProbeLog::Flush()
{
	DetailLogger->flush();
	HeadlineLogger->flush();
}

std::vector<LProbeIssue> LProbeLog::GetErrors()
{
	std::lock_guard Lock(IssueMutex);
	return Errors;
}

std::vector<LProbeIssue> LProbeLog::GetWarnings()
{
	std::lock_guard Lock(IssueMutex);
	return Warnings;
}
