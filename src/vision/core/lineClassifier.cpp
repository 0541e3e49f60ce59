#include "vision/core/lineClassifier.hpp"
#include "vision/core/lineExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace gridscale::vision::core {

std::vector<double> filterDuplicateLines(const std::vector<double>& sortedPositions, double tolerance) {
	if (sortedPositions.empty()) {
		return {};
	}

	std::vector<double> kept{sortedPositions.front()};
	for (std::size_t i = 1; i < sortedPositions.size(); ++i) {
		if (sortedPositions[i] - kept.back() >= tolerance) {
			kept.push_back(sortedPositions[i]);
		}
	}
	return kept;
}

double segmentAngleDeg(const cv::Vec4i& segment) {
	const int dx = segment[2] - segment[0];
	const int dy = segment[3] - segment[1];
	if (dx == 0) {
		return 90.0;
	}
	return std::abs(std::atan2(static_cast<double>(dy), static_cast<double>(dx)) * 180.0 / std::numbers::pi);
}

AxisLines classifyLines(const std::vector<cv::Vec4i>& segments, const ClassifierConfig& config) {
	AxisLines result;
	const double tol = config.angleToleranceDeg;

	for (const auto& l: segments) {
		if (segmentLength(l) < config.minLineLength) {
			continue;
		}

		const double angle = segmentAngleDeg(l);
		if (angle < tol || angle > 180.0 - tol) {
			result.horizontal.push_back(0.5 * (l[1] + l[3]));
		} else if (std::abs(angle - 90.0) < tol) {
			result.vertical.push_back(0.5 * (l[0] + l[2]));
		}
		// Anything else is diagonal noise.
	}

	std::sort(result.horizontal.begin(), result.horizontal.end());
	std::sort(result.vertical.begin(), result.vertical.end());

	result.horizontal = filterDuplicateLines(result.horizontal, config.duplicateTolerance);
	result.vertical   = filterDuplicateLines(result.vertical, config.duplicateTolerance);
	return result;
}

} // namespace gridscale::vision::core
