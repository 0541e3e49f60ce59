#include "vision/core/lineExtractor.hpp"

#include <cmath>
#include <numbers>
#include <string>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

namespace gridscale::vision::core {

bool convertToGray(const cv::Mat& image, cv::Mat& outGray) {
	cv::Mat gray;
	switch (image.channels()) {
	case 1:
		gray = image;
		break;
	case 3:
		cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
		break;
	case 4:
		cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY); // Alpha is dropped.
		break;
	default:
		return false;
	}

	if (gray.depth() == CV_8U) {
		outGray = gray.clone();
	} else if (gray.depth() == CV_16U) {
		gray.convertTo(outGray, CV_8U, 1.0 / 257.0);
	} else {
		cv::normalize(gray, outGray, 0.0, 255.0, cv::NORM_MINMAX, CV_8U);
	}
	return true;
}

double segmentLength(const cv::Vec4i& segment) {
	const double dx = segment[2] - segment[0];
	const double dy = segment[3] - segment[1];
	return std::sqrt(dx * dx + dy * dy);
}

std::vector<cv::Vec4i> detectSegments(const cv::Mat& image, const LineExtractionConfig& config, DebugVisualizer* debugger) {
	if (debugger) {
		debugger->beginStage("Extract Lines");
		debugger->add("Input", image);
	}

	cv::Mat gray, blurred, binary, edges;
	if (!convertToGray(image, gray)) {
		CV_Error(cv::Error::StsUnsupportedFormat, "Unsupported channel count: " + std::to_string(image.channels()));
	}
	if (debugger)
		debugger->add("Grayscale", gray);

	cv::GaussianBlur(gray, blurred, cv::Size(config.blurKernelSize, config.blurKernelSize), 0); // Suppress sensor/compression noise
	if (debugger)
		debugger->add("Gaussian Blur", blurred);

	// Illumination varies across photographed grids, so threshold locally. Dark lines become foreground.
	cv::adaptiveThreshold(blurred, binary, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, config.adaptiveBlockSize, config.adaptiveBias);
	if (debugger)
		debugger->add("Adaptive Threshold", binary);

	const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(config.closeKernelSize, config.closeKernelSize));
	cv::morphologyEx(binary, binary, cv::MORPH_CLOSE, kernel);
	if (debugger)
		debugger->add("Close", binary);

	cv::Canny(binary, edges, config.cannyLow, config.cannyHigh);
	if (debugger)
		debugger->add("Canny Edge", edges);

	std::vector<cv::Vec4i> lines;
	cv::HoughLinesP(edges, lines,
	                1,                       // rho resolution
	                std::numbers::pi / 180., // theta resolution
	                config.houghThreshold,   // threshold (votes)
	                config.houghMinLineLength,
	                config.houghMaxLineGap);

	if (debugger) {
		debugger->add("Segments", debugging::drawSegments(image, lines));
		debugger->note("segments", static_cast<double>(lines.size()));
		debugger->endStage();
	}

	return lines;
}

std::vector<cv::Vec4i> dropShortSegments(std::vector<cv::Vec4i> segments, double minLength) {
	// HoughLinesP may still return segments slightly below minLineLength.
	std::erase_if(segments, [&](const cv::Vec4i& l) { return segmentLength(l) < minLength; });
	return segments;
}

std::vector<cv::Vec4i> extractLines(const cv::Mat& image, const LineExtractionConfig& config, DebugVisualizer* debugger) {
	return dropShortSegments(detectSegments(image, config, debugger), config.houghMinLineLength);
}

} // namespace gridscale::vision::core
