#pragma once

#include <vector>

namespace cutprec::precision::core {

// All helpers throw std::invalid_argument on an empty sequence.

double mean(const std::vector<double>& values);
double populationStddev(const std::vector<double>& values);
double median(std::vector<double> values);

//! Linear interpolation between closest ranks. q in [0, 100].
double percentile(std::vector<double> values, double q);

} // namespace cutprec::precision::core
