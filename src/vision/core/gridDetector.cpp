#include "vision/core/gridDetector.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string_view>

#include <opencv2/core.hpp>

namespace gridscale::vision::core {

namespace {

//! Enable verbose per stage diagnostics via environment variable.
bool gridDebugEnabled() {
	const char* env = std::getenv("GRIDSCALE_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

GridEstimate runPipeline(const cv::Mat& image, const GridDetectionConfig& config, DebugVisualizer* debugger) {
	const bool verbose = gridDebugEnabled();

	// 1. Line segments. The floor applies to the raw Hough output.
	const std::vector<cv::Vec4i> raw = detectSegments(image, config.extraction, debugger);
	if (verbose)
		std::cout << "[grid-debug] segments=" << raw.size() << '\n';
	if (raw.size() < config.spacing.minLinesForGrid) {
		return makeFailure(GridFailure::InsufficientLines, "Not enough lines detected");
	}
	const std::vector<cv::Vec4i> segments = dropShortSegments(raw, config.extraction.houghMinLineLength);

	// 2. Line positions per axis
	AxisLines lines = classifyLines(segments, config.classifier);
	if (verbose)
		std::cout << "[grid-debug] horizontal=" << lines.horizontal.size() << " vertical=" << lines.vertical.size() << '\n';
	if (debugger) {
		debugger->beginStage("Grid Lines");
		debugger->add("Axis Lines", debugging::drawAxisLines(image, lines.vertical, lines.horizontal));
		debugger->note("horizontal", static_cast<double>(lines.horizontal.size()));
		debugger->note("vertical", static_cast<double>(lines.vertical.size()));
	}

	// 3. Pitch in pixels
	const PitchEstimate pitch = estimatePitch(lines.horizontal, lines.vertical, config.spacing);
	if (!pitch.success()) {
		if (verbose)
			std::cout << "[grid-debug] no pitch: " << pitch.reason << '\n';
		if (debugger)
			debugger->endStage();
		return makeFailure(pitch.failure, pitch.reason);
	}
	if (verbose)
		std::cout << std::format("[grid-debug] pitch={:.2f}px hSpacing={:.2f}px vSpacing={:.2f}px\n", pitch.pitchPx, pitch.horizontalSpacing, pitch.verticalSpacing);

	// 4. Physical size and confidence
	GridEstimate estimate = reconcile(pitch.pitchPx, image.cols, std::move(lines.horizontal), std::move(lines.vertical), pitch.horizontalSpacing,
	                                  pitch.verticalSpacing, config.scoring);
	if (verbose) {
		std::cout << std::format("[grid-debug] raw={:.4f}m size={:.4f}m cells={:.2f} confidence={:.3f} (consistency={:.2f} standard={:.2f} lines={:.2f})\n",
		                         estimate.rawGridSizeM, estimate.gridSizeM, estimate.cellsAcross, estimate.confidence, estimate.scores.consistency,
		                         estimate.scores.standardSize, estimate.scores.lineCount);
	}
	if (debugger) {
		debugger->note("pitch px", estimate.gridSizePx);
		debugger->note("grid m", estimate.gridSizeM);
		debugger->note("confidence", estimate.confidence);
		debugger->endStage();
	}
	return estimate;
}

} // namespace

GridEstimate detectGrid(const cv::Mat& image, const GridDetectionConfig& config, DebugVisualizer* debugger) {
	if (image.empty()) {
		std::cerr << "[Error] Grid detection called with an empty image.\n";
		return makeFailure(GridFailure::ProcessingError, "Error: empty image");
	}

	try {
		return runPipeline(image, config, debugger);
	} catch (const cv::Exception& e) {
		std::cerr << "[Error] Grid detection failed: " << e.what() << '\n';
		return makeFailure(GridFailure::ProcessingError, "Error: " + e.err);
	} catch (const std::exception& e) {
		std::cerr << "[Error] Grid detection failed: " << e.what() << '\n';
		return makeFailure(GridFailure::ProcessingError, std::string("Error: ") + e.what());
	}
}

} // namespace gridscale::vision::core
