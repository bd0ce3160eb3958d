#include "precision/pipeline/runLog.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/format.h>

#include <cstdint>
#include <random>

namespace cutprec::precision::pipeline {

namespace {

static constexpr std::size_t MAX_LOG_BYTES = 10 * 1024 * 1024;
static constexpr std::size_t MAX_LOG_FILES = 3;

static std::string formatFields(const nlohmann::json& fields) {
	std::string out;
	for (const auto& [key, value]: fields.items()) {
		out += fmt::format(" {}={}", key, value.is_string() ? value.get<std::string>() : value.dump());
	}
	return out;
}

} // namespace

std::string buildRunId() {
	std::random_device device;
	std::mt19937_64 engine(device());
	std::uniform_int_distribution<std::uint64_t> dist(0, 0xFFFFFFFFFFFFull);
	return fmt::format("{:012x}", dist(engine));
}

RunLog::RunLog(const std::filesystem::path& outDir, std::string runId, bool debug) : m_runId(std::move(runId)) {
	std::filesystem::create_directories(outDir);

	auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
	console->set_level(debug ? spdlog::level::debug : spdlog::level::info);

	auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>((outDir / "run.log").string(), MAX_LOG_BYTES, MAX_LOG_FILES);
	file->set_level(spdlog::level::debug);

	m_text = std::make_shared<spdlog::logger>("cut_precision", spdlog::sinks_init_list{console, file});
	m_text->set_level(spdlog::level::debug);
	m_text->set_pattern("%Y-%m-%d %H:%M:%S.%e | %^%-8l%$ | %v");

	auto jsonl = std::make_shared<spdlog::sinks::rotating_file_sink_mt>((outDir / "run.jsonl").string(), MAX_LOG_BYTES, MAX_LOG_FILES);
	m_events   = std::make_shared<spdlog::logger>("cut_precision.events", jsonl);
	m_events->set_level(spdlog::level::info);
	m_events->set_pattern(R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","level":"%l","record":%v})");
	m_events->flush_on(spdlog::level::info);
}

RunLog::~RunLog() {
	m_text->flush();
	m_events->flush();
}

void RunLog::event(spdlog::level::level_enum level, std::string_view message, const nlohmann::json& fields) {
	m_text->log(level, "{}{}", message, formatFields(fields));

	nlohmann::json record = fields;
	record["message"]     = std::string(message);
	record["run_id"]      = m_runId;
	m_events->log(level, "{}", record.dump());
}

void RunLog::artifactWritten(std::string_view stage, std::string_view artifact, const std::filesystem::path& path, spdlog::level::level_enum level) {
	event(level, "artifact_written",
	      {{"event", "artifact.write"}, {"stage", std::string(stage)}, {"status", "ok"}, {"artifact", std::string(artifact)}, {"path", std::filesystem::absolute(path).string()}});
}

core::StageReporter RunLog::stageReporter() {
	return [this](const core::StageEvent& e) {
		switch (e.status) {
		case core::StageStatus::Started:
			event(spdlog::level::info, "stage_start", {{"event", e.stage + ".start"}, {"stage", e.stage}, {"status", "started"}});
			break;
		case core::StageStatus::Ok:
			event(spdlog::level::info, "stage_end", {{"event", e.stage + ".end"}, {"stage", e.stage}, {"status", "ok"}, {"duration_ms", e.durationMs}});
			break;
		case core::StageStatus::Failed:
			event(spdlog::level::warn, "stage_failed",
			      {{"event", e.stage + ".error"}, {"stage", e.stage}, {"status", "failed"}, {"duration_ms", e.durationMs}, {"detail", e.detail}});
			break;
		}
	};
}

} // namespace cutprec::precision::pipeline
