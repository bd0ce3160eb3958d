#include "precision/core/stageReporter.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

namespace cutprec::precision::core {
namespace gtest {

TEST(StageReporter, Scope_ReportsStartAndEnd) {
	std::vector<StageEvent> events;
	const StageReporter reporter = [&](const StageEvent& e) { events.push_back(e); };

	{ ScopedStage stage(reporter, "resample"); }

	ASSERT_EQ(events.size(), 2u);
	EXPECT_EQ(events[0].stage, "resample");
	EXPECT_EQ(events[0].status, StageStatus::Started);
	EXPECT_EQ(events[1].status, StageStatus::Ok);
	EXPECT_GE(events[1].durationMs, 0.0);
	EXPECT_TRUE(events[1].detail.empty());
}

TEST(StageReporter, Scope_ExplicitFailure) {
	std::vector<StageEvent> events;
	const StageReporter reporter = [&](const StageEvent& e) { events.push_back(e); };

	{
		ScopedStage stage(reporter, "extract.real");
		stage.fail("no_real_contour_found");
	}

	ASSERT_EQ(events.size(), 2u);
	EXPECT_EQ(events[1].status, StageStatus::Failed);
	EXPECT_EQ(events[1].detail, "no_real_contour_found");
}

TEST(StageReporter, Scope_ExceptionMarksFailure) {
	std::vector<StageEvent> events;
	const StageReporter reporter = [&](const StageEvent& e) { events.push_back(e); };

	EXPECT_THROW(
	        {
		        ScopedStage stage(reporter, "image.load");
		        throw std::runtime_error("boom");
	        },
	        std::runtime_error);

	ASSERT_EQ(events.size(), 2u);
	EXPECT_EQ(events[1].status, StageStatus::Failed);
	EXPECT_EQ(events[1].detail, "exception");
}

TEST(StageReporter, EmptyReporter_IsIgnored) {
	const StageReporter reporter{};
	EXPECT_NO_THROW({ ScopedStage stage(reporter, "metrics.compute"); });
}

TEST(StageReporter, StatusNames) {
	EXPECT_STREQ(toString(StageStatus::Started), "started");
	EXPECT_STREQ(toString(StageStatus::Ok), "ok");
	EXPECT_STREQ(toString(StageStatus::Failed), "failed");
}

} // namespace gtest
} // namespace cutprec::precision::core
