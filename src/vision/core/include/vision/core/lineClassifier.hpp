#pragma once

#include <opencv2/core/matx.hpp>

#include <vector>

namespace gridscale::vision::core {

//! Orientation classification and duplicate merging parameters.
struct ClassifierConfig {
	double minLineLength{50.0};     //!< Segments shorter than this are ignored (px).
	double angleToleranceDeg{2.0};  //!< Allowed deviation from 0/180 (horizontal) or 90 (vertical) degrees.
	double duplicateTolerance{10.}; //!< Kept positions are at least this far apart (px).
};

//! Line positions per axis. Sorted ascending and free of near duplicates.
struct AxisLines {
	std::vector<double> horizontal; //!< y-positions of horizontal lines.
	std::vector<double> vertical;   //!< x-positions of vertical lines.
};

//! Greedy single pass merge of a sorted position list.
//! A position is kept if it lies at least `tolerance` after the last kept one, so the first of a close pair survives.
std::vector<double> filterDuplicateLines(const std::vector<double>& sortedPositions, double tolerance);

//! Angle of a segment against the x-axis in degrees, in [0, 180]. Exactly 90 for dx == 0.
double segmentAngleDeg(const cv::Vec4i& segment);

/*! Split segments into horizontal and vertical grid line positions.
 *  Horizontal segments contribute their mean y, vertical ones their mean x. Diagonal segments are dropped.
 *
 * \param [in] segments Line segments from extractLines().
 * \param [in] config   Classification parameters.
 * \return     Deduplicated, sorted line positions per axis.
 */
AxisLines classifyLines(const std::vector<cv::Vec4i>& segments, const ClassifierConfig& config = ClassifierConfig{});

} // namespace gridscale::vision::core
