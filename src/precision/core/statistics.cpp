#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <numeric>
#include <stdexcept>

namespace cutprec::precision::core {

double mean(const std::vector<double>& values) {
	if (values.empty()) {
		throw std::invalid_argument("mean of empty sequence");
	}
	return std::reduce(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double populationStddev(const std::vector<double>& values) {
	const double m          = mean(values);
	const double sumSquares = std::transform_reduce(values.begin(), values.end(), 0.0, std::plus<>(), [m](double x) { return (x - m) * (x - m); });
	return std::sqrt(sumSquares / static_cast<double>(values.size()));
}

double median(std::vector<double> values) {
	if (values.empty()) {
		throw std::invalid_argument("median of empty sequence");
	}

	const std::size_t n   = values.size();
	const std::size_t mid = n / 2;

	std::nth_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid), values.end());
	double m = values[mid];

	if (n % 2 == 0) {
		// Lower half is partitioned in front of mid, its max is the other middle element.
		m = 0.5 * (m + *std::max_element(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(mid)));
	}

	return m;
}

double percentile(std::vector<double> values, double q) {
	if (values.empty()) {
		throw std::invalid_argument("percentile of empty sequence");
	}

	std::sort(values.begin(), values.end());
	const double rank  = std::clamp(q, 0.0, 100.0) / 100.0 * static_cast<double>(values.size() - 1);
	const auto lower   = static_cast<std::size_t>(std::floor(rank));
	const auto upper   = std::min(lower + 1, values.size() - 1);
	const double alpha = rank - static_cast<double>(lower);

	return values[lower] + alpha * (values[upper] - values[lower]);
}

} // namespace cutprec::precision::core
