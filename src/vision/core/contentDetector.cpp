#include "vision/core/contentDetector.hpp"
#include "vision/core/lineExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace gridscale::vision::core {

namespace {

//! Midpoint of the 8 bit intensity range. Brighter mean -> light background.
static constexpr double INTENSITY_MIDPOINT = 127.5;

static bool contentDebugEnabled() {
	const char* env = std::getenv("GRIDSCALE_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

static std::optional<ContentBox> findContentBox(const cv::Mat& image, const ContentDetectionConfig& config, DebugVisualizer* debugger) {
	cv::Mat gray;
	if (!convertToGray(image, gray)) {
		CV_Error(cv::Error::StsUnsupportedFormat, "Unsupported channel count: " + std::to_string(image.channels()));
	}
	if (debugger)
		debugger->add("Grayscale", gray);

	// A uniform image has no content. Otsu would otherwise mark all of it foreground on dark backgrounds.
	double minV = 0.0, maxV = 0.0;
	cv::minMaxLoc(gray, &minV, &maxV);
	if (maxV - minV < 1.0) {
		return std::nullopt;
	}

	const bool lightBackground = cv::mean(gray)[0] > INTENSITY_MIDPOINT;
	const int thresholdType    = (lightBackground ? cv::THRESH_BINARY_INV : cv::THRESH_BINARY) | cv::THRESH_OTSU;

	cv::Mat binary;
	cv::threshold(gray, binary, 0.0, 255.0, thresholdType);
	if (debugger)
		debugger->add(lightBackground ? "Otsu (inverted)" : "Otsu", binary);

	std::vector<std::vector<cv::Point>> contours;
	cv::findContours(binary, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

	const double minArea = static_cast<double>(gray.total()) * config.minContourAreaFraction;

	std::optional<cv::Rect> envelope;
	std::size_t significant = 0;
	for (const auto& contour: contours) {
		if (cv::contourArea(contour) <= minArea) {
			continue; // noise
		}
		++significant;
		const cv::Rect r = cv::boundingRect(contour);
		envelope         = envelope ? (*envelope | r) : r;
	}

	if (debugger) {
		debugger->note("contours", static_cast<double>(contours.size()));
		debugger->note("significant", static_cast<double>(significant));
	}
	if (contentDebugEnabled())
		std::cout << "[content-debug] contours=" << contours.size() << " significant=" << significant << " lightBackground=" << lightBackground << '\n';

	if (!envelope) {
		return std::nullopt;
	}
	return ContentBox{envelope->x, envelope->y, envelope->x + envelope->width, envelope->y + envelope->height};
}

} // namespace

ContentBox fallbackContentBox(int width, int height, double marginFraction) {
	const int marginX = static_cast<int>(std::lround(width * marginFraction));
	const int marginY = static_cast<int>(std::lround(height * marginFraction));
	return {marginX, marginY, width - marginX, height - marginY};
}

ContentResult detectContent(const cv::Mat& image, const ContentDetectionConfig& config, DebugVisualizer* debugger) {
	ContentResult result{config.strategy, std::nullopt};
	if (image.empty()) {
		std::cerr << "[Error] Content detection called with an empty image.\n";
		return result;
	}

	if (config.strategy == ContentStrategy::DegradedFallback) {
		result.box = fallbackContentBox(image.cols, image.rows, config.fallbackMarginFraction);
		return result;
	}

	if (debugger) {
		debugger->beginStage("Detect Content");
		debugger->add("Input", image);
	}

	try {
		result.box = findContentBox(image, config, debugger);
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Content detection failed: " << e.what() << '\n';
		result.box.reset();
	} catch (const std::exception& e) {
		std::cerr << "[Error] Content detection failed: " << e.what() << '\n';
		result.box.reset();
	}

	if (debugger) {
		if (result.box)
			debugger->add("Content Box", debugging::drawBox(image, result.box->xMin, result.box->yMin, result.box->xMax, result.box->yMax));
		debugger->endStage();
	}
	return result;
}

} // namespace gridscale::vision::core
