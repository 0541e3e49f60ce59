#pragma once

#include "vision/core/gridTypes.hpp"

#include <array>
#include <vector>

namespace gridscale::vision::core {

//! Confidence model parameters. Weights sum to 1.
struct ScoringConfig {
	double consistencyWeight{0.4};
	double standardSizeWeight{0.4};
	double lineCountWeight{0.2};
	double preferredWindow{0.1};     //!< Relative window around the preferred size where it alone is scored.
	double lineCountSaturation{30.}; //!< Lines (both axes) that give a full line count score.
	double snapTolerance{0.15};      //!< Relative distance to snap a raw size to a standard size.
};

//! "Nice" layouts that override numeric snapping. Checked in order, first match wins.
struct CellCountOverride {
	double minCells;
	double maxCells;
	double gridSizeM;
	double confidenceFloor;
};

inline constexpr std::array<CellCountOverride, 3> CELL_COUNT_OVERRIDES = {{
        {9.0, 11.0, 0.1, 0.9},   // 10 cells
        {19.0, 21.0, 0.05, 0.85}, // 20 cells
        {4.5, 5.5, 0.2, 0.85},    // 5 cells
}};

//! Regularity of the gaps between `positions` against `expectedSpacing`, in [0, 1].
//! 1 - mean relative deviation (deviation capped at 1). 0 for fewer than two positions.
double spacingConsistency(const std::vector<double>& positions, double expectedSpacing);

//! Score how close a raw physical size is to the preferred size, or else to any standard size.
double standardSizeScore(double rawGridSizeM, const ScoringConfig& config = ScoringConfig{});

//! min(1, lines / saturation).
double lineCountScore(std::size_t horizontalCount, std::size_t verticalCount, const ScoringConfig& config = ScoringConfig{});

//! Standard size with the smallest relative distance to `sizeM`. The smaller size wins a tie.
double closestStandardSize(double sizeM);

//! Final grid size and confidence after applying the override table and the numeric fallback.
struct SizeDecision {
	double gridSizeM;
	double confidence;
};

//! Apply CELL_COUNT_OVERRIDES, else snap within config.snapTolerance, else round to 0.01. Result clamped.
SizeDecision decideGridSize(double cellsAcross, double rawGridSizeM, double confidence, const ScoringConfig& config = ScoringConfig{});

/*! Turn a pixel pitch into a physical grid estimate with confidence.
 * \param [in] pixelPitch        Grid pitch (px), > 0.
 * \param [in] imageWidthPx      Image width (px). Spans REFERENCE_WIDTH_M.
 * \param [in] horizontal        Horizontal line positions.
 * \param [in] vertical          Vertical line positions.
 * \param [in] horizontalSpacing Dominant horizontal spacing (px).
 * \param [in] verticalSpacing   Dominant vertical spacing (px).
 * \param [in] config            Scoring parameters.
 * \return     Detected estimate with scores, snapped size and clamped confidence.
 */
GridEstimate reconcile(double pixelPitch, int imageWidthPx, std::vector<double> horizontal, std::vector<double> vertical, double horizontalSpacing,
                       double verticalSpacing, const ScoringConfig& config = ScoringConfig{});

} // namespace gridscale::vision::core
