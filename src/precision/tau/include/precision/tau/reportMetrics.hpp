#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cutprec::precision::tau {

//! Units a tau value was derived in.
enum class TauUnits { Px, Mm };

const char* toString(TauUnits units);

//! Metric fields of a measurement report needed for tau calibration. Missing or non-numeric fields are absent.
struct ReportMetrics {
	std::optional<double> madPx{};
	std::optional<double> scalePx{};
	std::optional<double> madMm{};
	std::optional<double> scaleMm{};

	bool has(TauUnits units) const; //!< Both mad and scale present in the given units.

	//! mad / scale in the given units if both are present, mad >= 0 and scale > 0.
	std::optional<double> ratio(TauUnits units) const;
};

//! Read the "metrics" object of a report. Empty if the file is unreadable, not JSON or has no metrics object.
std::optional<ReportMetrics> loadReportMetrics(const std::filesystem::path& reportPath);

//! Expand glob patterns to absolute, de-duplicated, sorted paths. Patterns without matches contribute nothing.
std::vector<std::string> collectReportPaths(const std::vector<std::string>& patterns);

} // namespace cutprec::precision::tau
