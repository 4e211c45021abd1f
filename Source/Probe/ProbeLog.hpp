/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>
#include <cereal/archives/json.hpp>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/spdlog.h>

#include "Filesystem.hpp"
#include "Format.hpp"
#include "Types.hpp"

// Warning or error collected during a run, replayed at the end of the log
struct LProbeIssue
{
	std::string Timestamp{};
	std::string Context{}; // stage the issue was raised in
	std::string Message{};
	std::string Kind{}; // error kind, empty for warnings

	template <class Archive>
	void serialize(Archive& archive)
	{
		archive(CEREAL_NVP(Timestamp), CEREAL_NVP(Context), CEREAL_NVP(Message), CEREAL_NVP(Kind));
	}
};

// Forwards every formatted record to a callback, used for the live log lines of a run
class LProbeEventSink : public spdlog::sinks::base_sink<std::mutex>
{
	std::function<void(std::string const&)> Forward{};

public:
	explicit LProbeEventSink(std::function<void(std::string const&)> InForward)
		: Forward(std::move(InForward))
	{
	}

protected:
	void sink_it_(spdlog::details::log_msg const& Message) override;
	void flush_() override {}
};

// Append-only log of one probe run. Headline records go to the file and to live observers,
// detail records only to the file
class LProbeLog
{
	stdfs::path                     FilePath{};
	std::shared_ptr<spdlog::logger> DetailLogger{};
	std::shared_ptr<spdlog::logger> HeadlineLogger{};

	std::mutex               IssueMutex;
	std::vector<LProbeIssue> Errors{};
	std::vector<LProbeIssue> Warnings{};

	static void WriteLines(spdlog::logger& Logger, std::string const& Text);

	void WriteIssues(std::string const& Label, std::vector<LProbeIssue> const& Issues);

public:
	static constexpr char const* kFilePrefix = "lauscher-probe_";

	// The file is created in Directory and named after StartMs, if it can't be opened the run
	// continues without a file
	LProbeLog(stdfs::path const& Directory, LMsec StartMs, std::function<void(std::string const&)> OnHeadline);

	~LProbeLog();

	LProbeLog(LProbeLog const&) = delete;
	LProbeLog& operator=(LProbeLog const&) = delete;

	// lauscher-probe_2026-01-31T17-04-05-123Z.log
	static std::string MakeFileName(LMsec StartMs);

	void Headline(std::string const& Text);
	void Detail(std::string const& Text);

	// ===== Title ===== ... ===== End Title =====
	void Section(std::string const& Title, std::vector<std::string> const& Lines);

	void Table(std::string const& Title, LTableFormat const& Format, std::vector<std::vector<std::string>> const& Rows);

	// Section with a one line summary and the data serialized as single line JSON
	template <typename T>
	void DetailedData(std::string const& Title, std::string const& Summary, char const* Name, T const& Data)
	{
		std::vector<std::string> Lines{};
		if (!Summary.empty())
		{
			Lines.push_back("Summary: " + Summary);
		}
		Lines.push_back("Detailed Data: " + ToJson(Name, Data));
		Section(Title, Lines);
	}

	template <typename T>
	static std::string ToJson(char const* Name, T const& Data)
	{
		std::ostringstream Os;
		{
			cereal::JSONOutputArchive Archive(Os, cereal::JSONOutputArchive::Options::NoIndent());
			Archive(cereal::make_nvp(Name, Data));
		}
		return Os.str();
	}

	void Warning(std::string const& Context, std::string const& Message);
	void Error(std::string const& Context, std::string const& Message, std::string const& Kind);

	// Every warning and error of the run, nothing is written if there are none
	void WriteIssueSummary();

	void Flush();

	[[nodiscard]] stdfs::path const& GetFilePath() const { return FilePath; }

	[[nodiscard]] std::vector<LProbeIssue> GetErrors();
	[[nodiscard]] std::vector<LProbeIssue> GetWarnings();
};
