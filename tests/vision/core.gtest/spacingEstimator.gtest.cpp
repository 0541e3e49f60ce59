#include "vision/core/spacingEstimator.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace gridscale::vision::core {
namespace gtest {

//! Equally spaced positions.
static std::vector<double> makeLines(double start, double spacing, int count) {
	std::vector<double> lines;
	for (int i = 0; i < count; ++i)
		lines.push_back(start + i * spacing);
	return lines;
}

TEST(SpacingEstimator, Spacings_Consecutive) {
	EXPECT_EQ(computeSpacings({1.0, 4.0, 10.0}), (std::vector<double>{3.0, 6.0}));
	EXPECT_TRUE(computeSpacings({5.0}).empty());
	EXPECT_TRUE(computeSpacings({}).empty());
}

TEST(SpacingEstimator, Group_FirstFit) {
	const auto groups = groupSimilarValues({10.0, 10.5, 21.0, 10.2}, 0.2);
	ASSERT_EQ(groups.size(), 2u);

	EXPECT_DOUBLE_EQ(groups[0].representative, 10.0);
	EXPECT_EQ(groups[0].members, (std::vector<double>{10.0, 10.2, 10.5}));
	EXPECT_DOUBLE_EQ(groups[1].representative, 21.0);
	EXPECT_EQ(groups[1].members, (std::vector<double>{21.0}));

	const SpacingGroup* dominant = dominantGroup(groups);
	ASSERT_NE(dominant, nullptr);
	EXPECT_DOUBLE_EQ(dominant->representative, 10.0);
	EXPECT_EQ(dominant->members.size(), 3u);
}

TEST(SpacingEstimator, Group_RepresentativeIsNotMean) {
	// 12 is within 20% of 10. 14 is not within 20% of 10 even though it is close to 12.
	const auto groups = groupSimilarValues({14.0, 12.0, 10.0}, 0.2);
	ASSERT_EQ(groups.size(), 2u);
	EXPECT_EQ(groups[0].members, (std::vector<double>{10.0, 12.0}));
	EXPECT_EQ(groups[1].members, (std::vector<double>{14.0}));
}

TEST(SpacingEstimator, Group_ToleranceInclusive) {
	const auto groups = groupSimilarValues({10.0, 12.0}, 0.2);
	ASSERT_EQ(groups.size(), 1u);
}

TEST(SpacingEstimator, Dominant_TieKeepsFirst) {
	const auto groups = groupSimilarValues({10.0, 10.0, 50.0, 50.0}, 0.2);
	ASSERT_EQ(groups.size(), 2u);
	EXPECT_DOUBLE_EQ(dominantGroup(groups)->representative, 10.0);
	EXPECT_EQ(dominantGroup({}), nullptr);
}

TEST(SpacingEstimator, Pitch_MinimumOfAxes) {
	const PitchEstimate pitch = estimatePitch(makeLines(10.0, 40.0, 8), makeLines(5.0, 50.0, 8));
	ASSERT_TRUE(pitch.success());
	EXPECT_DOUBLE_EQ(pitch.horizontalSpacing, 40.0);
	EXPECT_DOUBLE_EQ(pitch.verticalSpacing, 50.0);
	EXPECT_DOUBLE_EQ(pitch.pitchPx, 40.0);
}

TEST(SpacingEstimator, Pitch_ThreeLinesIsInsufficient) {
	const PitchEstimate pitch = estimatePitch(makeLines(0.0, 50.0, 3), makeLines(0.0, 50.0, 10));
	EXPECT_FALSE(pitch.success());
	EXPECT_EQ(pitch.failure, GridFailure::InsufficientLines);
}

TEST(SpacingEstimator, Pitch_AxisWithoutRecurringSpacingIgnored) {
	// Vertical gaps 20, 45, 90, 200: every group has one member.
	const PitchEstimate pitch = estimatePitch(makeLines(0.0, 60.0, 6), {0.0, 20.0, 65.0, 155.0, 355.0});
	ASSERT_TRUE(pitch.success());
	EXPECT_DOUBLE_EQ(pitch.pitchPx, 60.0);
}

TEST(SpacingEstimator, Pitch_NoRecurringSpacing) {
	const std::vector<double> irregular = {0.0, 20.0, 65.0, 155.0, 355.0};
	const PitchEstimate pitch           = estimatePitch(irregular, irregular);
	EXPECT_FALSE(pitch.success());
	EXPECT_EQ(pitch.failure, GridFailure::InconsistentGrid);
	EXPECT_EQ(pitch.reason, "No consistent grid spacing found");
}

} // namespace gtest
} // namespace gridscale::vision::core
