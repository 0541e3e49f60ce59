#include "vision/core/sizeReconciler.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <opencv2/core.hpp>

namespace gridscale::vision::core {

double spacingConsistency(const std::vector<double>& positions, double expectedSpacing) {
	if (positions.size() < 2u || expectedSpacing <= 0.0) {
		return 0.0;
	}

	std::vector<double> errors;
	errors.reserve(positions.size() - 1);
	for (std::size_t i = 1; i < positions.size(); ++i) {
		errors.push_back(relativeDifference(positions[i] - positions[i - 1], expectedSpacing));
	}

	const double avgError = std::min(1.0, mean(errors));
	return 1.0 - avgError;
}

double closestStandardSize(double sizeM) {
	double best         = STANDARD_GRID_SIZES.front();
	double bestDistance = std::numeric_limits<double>::infinity();
	for (double s: STANDARD_GRID_SIZES) {
		const double d = relativeDifference(sizeM, s);
		if (d < bestDistance) {
			bestDistance = d;
			best         = s;
		}
	}
	return best;
}

double standardSizeScore(double rawGridSizeM, const ScoringConfig& config) {
	const double toPreferred = relativeDifference(rawGridSizeM, PREFERRED_GRID_SIZE);
	if (toPreferred < config.preferredWindow) {
		return 1.0 - toPreferred;
	}

	const double toClosest = relativeDifference(rawGridSizeM, closestStandardSize(rawGridSizeM));
	return std::max(0.0, 1.0 - toClosest);
}

double lineCountScore(std::size_t horizontalCount, std::size_t verticalCount, const ScoringConfig& config) {
	return std::min(1.0, static_cast<double>(horizontalCount + verticalCount) / config.lineCountSaturation);
}

SizeDecision decideGridSize(double cellsAcross, double rawGridSizeM, double confidence, const ScoringConfig& config) {
	SizeDecision decision{rawGridSizeM, confidence};

	const auto match = std::find_if(CELL_COUNT_OVERRIDES.begin(), CELL_COUNT_OVERRIDES.end(),
	                                [&](const CellCountOverride& o) { return cellsAcross >= o.minCells && cellsAcross <= o.maxCells; });

	if (match != CELL_COUNT_OVERRIDES.end()) {
		decision.gridSizeM  = match->gridSizeM;
		decision.confidence = std::max(confidence, match->confidenceFloor);
	} else {
		const double closest = closestStandardSize(rawGridSizeM);
		if (relativeDifference(rawGridSizeM, closest) < config.snapTolerance) {
			decision.gridSizeM = closest;
		} else {
			decision.gridSizeM = std::round(rawGridSizeM * 100.0) / 100.0; // nearest cm
		}
	}

	decision.gridSizeM  = std::clamp(decision.gridSizeM, MIN_GRID_SIZE, MAX_GRID_SIZE);
	decision.confidence = std::clamp(decision.confidence, 0.0, 1.0);
	return decision;
}

GridEstimate reconcile(double pixelPitch, int imageWidthPx, std::vector<double> horizontal, std::vector<double> vertical, double horizontalSpacing,
                       double verticalSpacing, const ScoringConfig& config) {
	CV_Assert(pixelPitch > 0.0 && imageWidthPx > 0);

	GridEstimate estimate;
	estimate.detected     = true;
	estimate.gridSizePx   = pixelPitch;
	estimate.rawGridSizeM = pixelPitch / static_cast<double>(imageWidthPx) * REFERENCE_WIDTH_M;
	estimate.cellsAcross  = static_cast<double>(imageWidthPx) / pixelPitch;

	const double hConsistency    = spacingConsistency(horizontal, horizontalSpacing);
	const double vConsistency    = spacingConsistency(vertical, verticalSpacing);
	estimate.scores.consistency  = 0.5 * (hConsistency + vConsistency);
	estimate.scores.standardSize = standardSizeScore(estimate.rawGridSizeM, config);
	estimate.scores.lineCount    = lineCountScore(horizontal.size(), vertical.size(), config);

	const double confidence = config.consistencyWeight * estimate.scores.consistency + config.standardSizeWeight * estimate.scores.standardSize +
	                          config.lineCountWeight * estimate.scores.lineCount;

	const SizeDecision decision = decideGridSize(estimate.cellsAcross, estimate.rawGridSizeM, confidence, config);
	estimate.gridSizeM          = decision.gridSizeM;
	estimate.confidence         = decision.confidence;

	estimate.horizontalLines   = std::move(horizontal);
	estimate.verticalLines     = std::move(vertical);
	estimate.horizontalSpacing = horizontalSpacing;
	estimate.verticalSpacing   = verticalSpacing;
	return estimate;
}

} // namespace gridscale::vision::core
