#pragma once

#include "vision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

#include <vector>

namespace gridscale::vision::core {

//! Preprocessing and Hough parameters of the line extraction stage.
struct LineExtractionConfig {
	int blurKernelSize{5};          //!< Gaussian blur kernel (odd, square).
	int adaptiveBlockSize{11};      //!< Neighbourhood of the adaptive threshold (odd).
	double adaptiveBias{2.0};       //!< Constant subtracted from the weighted neighbourhood mean.
	int closeKernelSize{3};         //!< Morphological closing kernel. Bridges 1-2px gaps in lines.
	double cannyLow{50.0};          //!< Lower Canny hysteresis threshold.
	double cannyHigh{150.0};        //!< Upper Canny hysteresis threshold.
	int houghThreshold{50};         //!< Accumulator votes needed for a segment.
	double houghMinLineLength{50.}; //!< Shorter segments are dropped (px).
	double houghMaxLineGap{10.};    //!< Largest gap bridged within one segment (px).
};

//! Convert an image to a single channel 8 bit intensity image.
//! \param [in]  image   Gray, BGR or BGRA image of any depth.
//! \param [out] outGray 8 bit single channel image.
//! \returns     False if the channel layout is not supported.
bool convertToGray(const cv::Mat& image, cv::Mat& outGray);

//! Length of a line segment in pixels.
double segmentLength(const cv::Vec4i& segment);

/*! Detect straight line segments in an image of a grid.
 *  gray -> blur -> adaptive threshold (lines foreground) -> close -> Canny -> probabilistic Hough.
 *
 * \param [in]     image    Decoded raster image. Not modified.
 * \param [in]     config   Extraction parameters.
 * \param [in,out] debugger Optional debug visualizer collecting the intermediate images.
 * \return         Segments (x1, y1, x2, y2) exactly as returned by the Hough transform.
 * \throws         cv::Exception if OpenCV rejects the input.
 */
std::vector<cv::Vec4i> detectSegments(const cv::Mat& image, const LineExtractionConfig& config = LineExtractionConfig{}, DebugVisualizer* debugger = nullptr);

//! Segments at least minLength long, in input order.
std::vector<cv::Vec4i> dropShortSegments(std::vector<cv::Vec4i> segments, double minLength);

//! detectSegments() followed by dropShortSegments() with config.houghMinLineLength.
std::vector<cv::Vec4i> extractLines(const cv::Mat& image, const LineExtractionConfig& config = LineExtractionConfig{}, DebugVisualizer* debugger = nullptr);

} // namespace gridscale::vision::core
