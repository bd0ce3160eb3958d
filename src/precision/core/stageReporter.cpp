#include "precision/core/stageReporter.hpp"

#include <exception>

namespace cutprec::precision::core {

const char* toString(StageStatus status) {
	switch (status) {
	case StageStatus::Started:
		return "started";
	case StageStatus::Ok:
		return "ok";
	case StageStatus::Failed:
		return "failed";
	}
	return "unknown";
}

ScopedStage::ScopedStage(const StageReporter& reporter, std::string stage)
    : m_reporter(reporter), m_stage(std::move(stage)), m_uncaught(std::uncaught_exceptions()), m_start(std::chrono::steady_clock::now()) {
	if (m_reporter) {
		m_reporter(StageEvent{m_stage, StageStatus::Started});
	}
}

ScopedStage::~ScopedStage() {
	if (!m_reporter) {
		return;
	}

	const auto elapsed     = std::chrono::steady_clock::now() - m_start;
	const double durationMs = std::chrono::duration<double, std::milli>(elapsed).count();

	if (std::uncaught_exceptions() > m_uncaught) {
		m_reporter(StageEvent{m_stage, StageStatus::Failed, durationMs, "exception"});
	} else if (m_failed) {
		m_reporter(StageEvent{m_stage, StageStatus::Failed, durationMs, m_failure});
	} else {
		m_reporter(StageEvent{m_stage, StageStatus::Ok, durationMs});
	}
}

void ScopedStage::fail(std::string detail) {
	m_failed  = true;
	m_failure = std::move(detail);
}

} // namespace cutprec::precision::core
