#include "precision/tau/reportMetrics.hpp"

#include <algorithm>
#include <fstream>

#include <glob.h>

#include <nlohmann/json.hpp>

namespace cutprec::precision::tau {

namespace {

static std::optional<double> numberField(const nlohmann::json& metrics, const char* key) {
	const auto it = metrics.find(key);
	if (it == metrics.end() || !it->is_number()) {
		return std::nullopt;
	}
	return it->get<double>();
}

//! Matches of one glob pattern. Empty on no match or error.
static std::vector<std::string> globPattern(const std::string& pattern) {
	glob_t matches{};
	std::vector<std::string> out;
	if (::glob(pattern.c_str(), 0, nullptr, &matches) == 0) {
		for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
			out.emplace_back(matches.gl_pathv[i]);
		}
	}
	::globfree(&matches);
	return out;
}

} // namespace

const char* toString(TauUnits units) {
	return units == TauUnits::Mm ? "mm" : "px";
}

bool ReportMetrics::has(TauUnits units) const {
	return units == TauUnits::Mm ? (madMm && scaleMm) : (madPx && scalePx);
}

std::optional<double> ReportMetrics::ratio(TauUnits units) const {
	const auto& mad   = units == TauUnits::Mm ? madMm : madPx;
	const auto& scale = units == TauUnits::Mm ? scaleMm : scalePx;
	if (!mad || !scale || *mad < 0.0 || *scale <= 0.0) {
		return std::nullopt;
	}
	return *mad / *scale;
}

std::optional<ReportMetrics> loadReportMetrics(const std::filesystem::path& reportPath) {
	std::ifstream in(reportPath);
	if (!in) {
		return std::nullopt;
	}

	// Invalid JSON is treated like a missing report.
	const nlohmann::json payload = nlohmann::json::parse(in, nullptr, false);
	if (payload.is_discarded() || !payload.is_object()) {
		return std::nullopt;
	}

	const auto metrics = payload.find("metrics");
	if (metrics == payload.end() || !metrics->is_object()) {
		return std::nullopt;
	}

	ReportMetrics out{};
	out.madPx   = numberField(*metrics, "mad_px");
	out.scalePx = numberField(*metrics, "scale_px");
	out.madMm   = numberField(*metrics, "mad_mm");
	out.scaleMm = numberField(*metrics, "scale_mm");
	return out;
}

std::vector<std::string> collectReportPaths(const std::vector<std::string>& patterns) {
	std::vector<std::string> paths;
	for (const auto& pattern: patterns) {
		for (const auto& match: globPattern(pattern)) {
			std::error_code ec;
			const auto resolved = std::filesystem::weakly_canonical(match, ec);
			paths.push_back(ec ? std::filesystem::absolute(match).string() : resolved.string());
		}
	}

	std::sort(paths.begin(), paths.end());
	paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
	return paths;
}

} // namespace cutprec::precision::tau
