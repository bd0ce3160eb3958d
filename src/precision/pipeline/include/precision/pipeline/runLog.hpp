#pragma once

#include "precision/core/stageReporter.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace cutprec::precision::pipeline {

//! Random identifier of one pipeline run, 12 lowercase hex characters.
std::string buildRunId();

//! Logging of one pipeline run.
//! Human readable lines go to stderr and to a rotating "run.log" in the output directory.
//! Structured events go to a rotating "run.jsonl", one JSON object per line.
class RunLog {
public:
	//! \param [in] outDir Directory receiving run.log and run.jsonl. Created if missing.
	//! \param [in] runId  Identifier attached to every structured event.
	//! \param [in] debug  Print debug messages on stderr.
	RunLog(const std::filesystem::path& outDir, std::string runId, bool debug);
	~RunLog();

	RunLog(const RunLog&)            = delete;
	RunLog& operator=(const RunLog&) = delete;

	const std::string& runId() const {
		return m_runId;
	}

	//! Log a message and write a structured event with the given fields.
	void event(spdlog::level::level_enum level, std::string_view message, const nlohmann::json& fields);

	//! Event for a file written into the run directory.
	void artifactWritten(std::string_view stage, std::string_view artifact, const std::filesystem::path& path,
	                     spdlog::level::level_enum level = spdlog::level::info);

	//! Adapter forwarding stage events of the measurement to this log.
	core::StageReporter stageReporter();

	spdlog::logger& text() {
		return *m_text;
	}

private:
	std::string m_runId;
	std::shared_ptr<spdlog::logger> m_text;   //!< stderr and run.log
	std::shared_ptr<spdlog::logger> m_events; //!< run.jsonl
};

} // namespace cutprec::precision::pipeline
