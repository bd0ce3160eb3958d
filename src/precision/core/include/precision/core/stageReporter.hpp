#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace cutprec::precision::core {

enum class StageStatus { Started, Ok, Failed };

//! Progress notification emitted by the measurement driver.
struct StageEvent {
	std::string stage;       //!< Stage name, e.g. "extract.ideal".
	StageStatus status;      //!< Started, finished or aborted by an exception.
	double durationMs{0.0};  //!< Elapsed time. Zero for Started.
	std::string detail{};    //!< Optional free text (failure reason, exception message).
};

//! Receives stage events. An empty reporter discards them.
using StageReporter = std::function<void(const StageEvent&)>;

const char* toString(StageStatus status);

//! Reports Started on construction and Ok or Failed (stack unwinding) on destruction.
class ScopedStage {
public:
	ScopedStage(const StageReporter& reporter, std::string stage);
	~ScopedStage();

	ScopedStage(const ScopedStage&)            = delete;
	ScopedStage& operator=(const ScopedStage&) = delete;

	//! Mark the stage failed without throwing.
	void fail(std::string detail);

private:
	const StageReporter& m_reporter;
	std::string m_stage;
	std::string m_failure{};
	bool m_failed{false};
	int m_uncaught{0};
	std::chrono::steady_clock::time_point m_start;
};

} // namespace cutprec::precision::core
