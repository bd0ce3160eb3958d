#include "statistics.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <vector>

namespace cutprec::precision::core {
namespace gtest {

TEST(Statistics, MeanAndStddev) {
	const std::vector<double> values{2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
	EXPECT_DOUBLE_EQ(mean(values), 5.0);
	EXPECT_DOUBLE_EQ(populationStddev(values), 2.0);

	EXPECT_DOUBLE_EQ(mean({3.5}), 3.5);
	EXPECT_DOUBLE_EQ(populationStddev({3.5}), 0.0);
}

TEST(Statistics, MedianAndPercentile) {
	EXPECT_DOUBLE_EQ(median({5.0, 1.0, 3.0}), 3.0);
	EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);

	const std::vector<double> values{0.0, 10.0, 20.0, 30.0, 40.0};
	EXPECT_DOUBLE_EQ(percentile(values, 0.0), 0.0);
	EXPECT_DOUBLE_EQ(percentile(values, 50.0), 20.0);
	EXPECT_NEAR(percentile(values, 95.0), 38.0, 1e-9);
	EXPECT_DOUBLE_EQ(percentile(values, 100.0), 40.0);
}

TEST(Statistics, EmptySequenceThrows) {
	const std::vector<double> empty;
	EXPECT_THROW(mean(empty), std::invalid_argument);
	EXPECT_THROW(populationStddev(empty), std::invalid_argument);
	EXPECT_THROW(median(empty), std::invalid_argument);
	EXPECT_THROW(percentile(empty, 50.0), std::invalid_argument);
}

} // namespace gtest
} // namespace cutprec::precision::core
