#pragma once

#include "vision/core/debugVisualizer.hpp"
#include "vision/core/gridTypes.hpp"
#include "vision/core/lineClassifier.hpp"
#include "vision/core/lineExtractor.hpp"
#include "vision/core/sizeReconciler.hpp"
#include "vision/core/spacingEstimator.hpp"

#include <opencv2/core/mat.hpp>

// Grid detection infers the physical pitch of a measurement grid (printed drawing, scanned layout) from its image.
// The image width is assumed to span exactly 1m. Process:
//   1) Extract straight line segments (lineExtractor).
//   2) Classify them into horizontal/vertical positions and merge near duplicates (lineClassifier).
//   3) Find the recurring spacing per axis and take the smaller one as pitch (spacingEstimator).
//   4) Convert to meters, snap to standard sizes and score the result (sizeReconciler).
namespace gridscale::vision::core {

//! Full grid detection configuration.
struct GridDetectionConfig {
	LineExtractionConfig extraction{};
	ClassifierConfig classifier{};
	SpacingConfig spacing{};
	ScoringConfig scoring{};
};

/*! Detect a grid in an image and estimate its physical size.
 * \param [in]     image    Decoded raster image. Not modified.
 * \param [in]     config   Detection configuration.
 * \param [in,out] debugger Optional debug visualizer.
 * \return         Estimate. On failure `detected` is false and `failure`/`reason` tell why. Never throws.
 */
GridEstimate detectGrid(const cv::Mat& image, const GridDetectionConfig& config = GridDetectionConfig{}, DebugVisualizer* debugger = nullptr);

} // namespace gridscale::vision::core
