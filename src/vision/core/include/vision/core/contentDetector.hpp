#pragma once

#include "vision/core/debugVisualizer.hpp"

#include <opencv2/core/mat.hpp>

#include <optional>

namespace gridscale::vision::core {

//! Envelope of the detected content in pixel coordinates. xMax/yMax are exclusive.
struct ContentBox {
	int xMin;
	int yMin;
	int xMax;
	int yMax;

	int width() const { return xMax - xMin; }
	int height() const { return yMax - yMin; }
};

//! How a content box was obtained.
enum class ContentStrategy {
	FullDetection,    //!< Threshold + contour analysis.
	DegradedFallback, //!< Fixed margin box, no image analysis.
};

struct ContentDetectionConfig {
	ContentStrategy strategy{ContentStrategy::FullDetection};
	double minContourAreaFraction{0.01}; //!< Contours must be larger than this fraction of the image area.
	double fallbackMarginFraction{0.1};  //!< Margin per side of the degraded fallback box.
};

//! Tagged result: the strategy that ran and its box. No box means no content was found.
struct ContentResult {
	ContentStrategy strategy{ContentStrategy::FullDetection};
	std::optional<ContentBox> box{};
};

/*! Find the bounding box of all significant content in an image.
 *  Light backgrounds are thresholded inverted, dark backgrounds directly (Otsu). Contours at or below the area fraction
 *  are noise. Blank images have no content.
 *
 * \param [in]     image    Decoded raster image. Not modified.
 * \param [in]     config   Detection configuration.
 * \param [in,out] debugger Optional debug visualizer.
 * \return         Tagged result. Never throws.
 */
ContentResult detectContent(const cv::Mat& image, const ContentDetectionConfig& config = ContentDetectionConfig{}, DebugVisualizer* debugger = nullptr);

//! Box with a fixed margin on every side. Used when no analysis is wanted.
ContentBox fallbackContentBox(int width, int height, double marginFraction);

} // namespace gridscale::vision::core
