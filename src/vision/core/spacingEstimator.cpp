#include "vision/core/spacingEstimator.hpp"

#include "statistics.hpp"

#include <algorithm>

namespace gridscale::vision::core {

std::vector<double> computeSpacings(const std::vector<double>& positions) {
	std::vector<double> spacings;
	if (positions.size() < 2u) {
		return spacings;
	}

	spacings.reserve(positions.size() - 1);
	for (std::size_t i = 1; i < positions.size(); ++i) {
		spacings.push_back(positions[i] - positions[i - 1]);
	}
	return spacings;
}

std::vector<SpacingGroup> groupSimilarValues(std::vector<double> values, double tolerance) {
	std::sort(values.begin(), values.end());

	std::vector<SpacingGroup> groups;
	for (double v: values) {
		auto it = std::find_if(groups.begin(), groups.end(), [&](const SpacingGroup& g) { return relativeDifference(v, g.representative) <= tolerance; });
		if (it != groups.end()) {
			it->members.push_back(v);
		} else {
			groups.push_back({v, {v}});
		}
	}
	return groups;
}

const SpacingGroup* dominantGroup(const std::vector<SpacingGroup>& groups) {
	if (groups.empty()) {
		return nullptr;
	}

	// max_element keeps the first of equally large groups.
	const auto it = std::max_element(groups.begin(), groups.end(), [](const SpacingGroup& a, const SpacingGroup& b) { return a.members.size() < b.members.size(); });
	return &*it;
}

PitchEstimate estimatePitch(const std::vector<double>& horizontal, const std::vector<double>& vertical, const SpacingConfig& config) {
	PitchEstimate result;
	if (horizontal.size() < config.minLinesForGrid || vertical.size() < config.minLinesForGrid) {
		result.failure = GridFailure::InsufficientLines;
		result.reason  = "Not enough consistent lines for a grid";
		return result;
	}

	const auto hGroups = groupSimilarValues(computeSpacings(horizontal), config.relativeTolerance);
	const auto vGroups = groupSimilarValues(computeSpacings(vertical), config.relativeTolerance);

	const SpacingGroup* hDominant = dominantGroup(hGroups);
	const SpacingGroup* vDominant = dominantGroup(vGroups);
	result.horizontalSpacing      = hDominant ? hDominant->representative : 0.0;
	result.verticalSpacing        = vDominant ? vDominant->representative : 0.0;

	// An axis only votes if its spacing recurs often enough.
	std::vector<double> candidates;
	if (hDominant && hDominant->members.size() >= config.minGroupSize)
		candidates.push_back(hDominant->representative);
	if (vDominant && vDominant->members.size() >= config.minGroupSize)
		candidates.push_back(vDominant->representative);

	if (candidates.empty()) {
		result.failure = GridFailure::InconsistentGrid;
		result.reason  = "No consistent grid spacing found";
		return result;
	}

	// The smaller recurring spacing is the cell pitch.
	result.pitchPx = *std::min_element(candidates.begin(), candidates.end());
	return result;
}

} // namespace gridscale::vision::core
