#pragma once

#include "vision/core/gridTypes.hpp"

#include <string>
#include <vector>

namespace gridscale::vision::core {

//! Spacings considered equivalent to the representative (the first spacing that opened the group).
struct SpacingGroup {
	double representative;
	std::vector<double> members;
};

struct SpacingConfig {
	double relativeTolerance{0.2}; //!< |v - rep| / rep allowed inside one group.
	std::size_t minLinesForGrid{4}; //!< Lines needed per axis before spacings are looked at.
	std::size_t minGroupSize{3};    //!< Members a dominant group needs to be a pitch candidate.
};

//! Outcome of the pitch consensus. On failure only `failure` and `reason` are meaningful.
struct PitchEstimate {
	GridFailure failure{GridFailure::None};
	std::string reason{};
	double pitchPx{0.0};           //!< Unified grid pitch. Smallest accepted axis candidate.
	double horizontalSpacing{0.0}; //!< Dominant spacing between horizontal lines (0 if none).
	double verticalSpacing{0.0};   //!< Dominant spacing between vertical lines (0 if none).

	bool success() const { return failure == GridFailure::None; }
};

//! Differences between consecutive positions.
std::vector<double> computeSpacings(const std::vector<double>& positions);

/*! First-fit grouping of values by relative difference.
 *  Values are visited in ascending order. Each joins the first group (in creation order) whose representative is within
 *  `tolerance`, else opens a new group. This is not an optimal clustering; ambiguous inputs depend on the visiting order.
 */
std::vector<SpacingGroup> groupSimilarValues(std::vector<double> values, double tolerance);

//! Group with the most members. Earliest group wins a tie. nullptr if there are no groups.
const SpacingGroup* dominantGroup(const std::vector<SpacingGroup>& groups);

/*! Find the grid pitch (px) from the line positions of both axes.
 * \param [in] horizontal Sorted y-positions of horizontal lines.
 * \param [in] vertical   Sorted x-positions of vertical lines.
 * \param [in] config     Grouping parameters.
 * \return     Pitch and per axis dominant spacing, or InsufficientLines / InconsistentGrid.
 */
PitchEstimate estimatePitch(const std::vector<double>& horizontal, const std::vector<double>& vertical, const SpacingConfig& config = SpacingConfig{});

} // namespace gridscale::vision::core
