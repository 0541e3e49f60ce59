#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/highgui.hpp>
#include <opencv2/imgcodecs.hpp>

#include "vision/core/contentDetector.hpp"
#include "vision/core/gridDetector.hpp"
#include "vision/core/gridService.hpp"

namespace gridscale::vision::core {

struct InspectorOptions {
	bool content{false};  //!< Also run content detection.
	bool debug{false};    //!< Show the debug report per image.
	bool degraded{false}; //!< Content detection without image analysis.
};

static bool isImageFile(const std::filesystem::path& path) {
	static constexpr std::array<std::string_view, 6> EXTENSIONS = {".png", ".jpg", ".jpeg", ".bmp", ".gif", ".tiff"};

	std::string ext = path.extension().string();
	std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return std::find(EXTENSIONS.begin(), EXTENSIONS.end(), ext) != EXTENSIONS.end();
}

static void printGrid(const GridEstimate& result) {
	if (!result.detected) {
		std::cout << "\nNO GRID DETECTED\n";
		std::cout << "Reason: " << result.reason << " (" << toString(result.failure) << ")\n";
		return;
	}

	std::cout << "\nGRID DETECTED:\n";
	std::cout << std::format("Raw grid size: {:.4f}m\n", result.rawGridSizeM);
	std::cout << std::format("Adjusted grid size: {:.4f}m\n", result.gridSizeM);
	std::cout << std::format("Cells across 1.0m width: {:.2f}\n", result.cellsAcross);
	std::cout << std::format("Confidence: {:.2f}%\n", result.confidence * 100.0);
	std::cout << "Vertical lines: " << result.verticalLines.size() << '\n';
	std::cout << "Horizontal lines: " << result.horizontalLines.size() << '\n';

	std::cout << "\nSCORE BREAKDOWN:\n";
	std::cout << std::format("Consistency score: {:.2f}\n", result.scores.consistency);
	std::cout << std::format("Standard size score: {:.2f}\n", result.scores.standardSize);
	std::cout << std::format("Number of lines score: {:.2f}\n", result.scores.lineCount);

	// How a viewer would take over the detected size.
	GridService service;
	const double adjusted = service.setGridSize(result.gridSizeM);
	std::cout << "\nGRID SERVICE:\n";
	std::cout << std::format("Detected size: {:.4f}m -> service size: {:.4f}m\n", result.gridSizeM, adjusted);
	std::cout << "Is standard grid size: " << (GridService::isStandardGridSize(adjusted) ? "yes" : "no") << '\n';
	std::cout << "Cells per meter: " << service.cellsPerMeter() << '\n';

	if (result.cellsAcross >= 9.0 && result.cellsAcross <= 11.0) {
		std::cout << "\nNOTE: Grid layout matches preferred 10-cell pattern (0.1m)!\n";
	}
}

static bool inspect(const std::filesystem::path& path, const InspectorOptions& options) {
	std::cout << "Inspecting: " << path.filename().string() << '\n';

	const cv::Mat image = cv::imread(path.string(), cv::IMREAD_UNCHANGED);
	if (image.empty()) {
		std::cerr << "[Error] Failed to load image: " << path << '\n';
		return false;
	}

	const PhysicalFrame frame = PhysicalFrame::fromImage(image.cols, image.rows);
	std::cout << "Image size: " << image.cols << "x" << image.rows << std::format(" px ({:.1f}m x {:.1f}m)\n", frame.width(), frame.height());

	DebugVisualizer debug;
	DebugVisualizer* debugger = options.debug ? &debug : nullptr;

	printGrid(detectGrid(image, GridDetectionConfig{}, debugger));

	if (options.content) {
		ContentDetectionConfig contentConfig{};
		if (options.degraded)
			contentConfig.strategy = ContentStrategy::DegradedFallback;

		const ContentResult content = detectContent(image, contentConfig, debugger);
		const std::string_view mode = content.strategy == ContentStrategy::FullDetection ? "full" : "degraded";
		if (content.box) {
			std::cout << std::format("\nContent ({}): x=[{}, {}) y=[{}, {})\n", mode, content.box->xMin, content.box->xMax, content.box->yMin, content.box->yMax);
		} else {
			std::cout << "\nContent (" << mode << "): none\n";
		}
	}

	if (debugger) {
		const cv::Mat report = debug.buildReport();
		if (!report.empty()) {
			cv::imshow("gridInspector", report);
			cv::waitKey(0);
			cv::destroyWindow("gridInspector");
		}
	}

	std::cout << '\n' << std::string(50, '-') << "\n\n";
	return true;
}

} // namespace gridscale::vision::core

static void printUsage() {
	std::cout << "Usage: gridInspector [--content] [--degraded] [--debug] <image_path_or_directory>\n";
	std::cout << "  --content   Also detect the content bounding box.\n";
	std::cout << "  --degraded  Content detection uses the fixed margin fallback.\n";
	std::cout << "  --debug     Show intermediate images of every stage.\n";
}

int main(int argc, char** argv) {
	gridscale::vision::core::InspectorOptions options;
	std::filesystem::path input;

	for (int i = 1; i < argc; ++i) {
		const std::string_view arg = argv[i];
		if (arg == "--content") {
			options.content = true;
		} else if (arg == "--degraded") {
			options.content  = true;
			options.degraded = true;
		} else if (arg == "--debug") {
			options.debug = true;
		} else if (arg == "-h" || arg == "--help") {
			printUsage();
			return 0;
		} else if (input.empty()) {
			input = arg;
		} else {
			std::cerr << "[Error] Unexpected argument: " << arg << '\n';
			printUsage();
			return 1;
		}
	}

	if (input.empty()) {
		printUsage();
		return 1;
	}

	std::error_code ec;
	if (std::filesystem::is_regular_file(input, ec)) {
		return gridscale::vision::core::inspect(input, options) ? 0 : 1;
	}

	if (!std::filesystem::is_directory(input, ec)) {
		std::cerr << "[Error] Invalid path: " << input << '\n';
		return 1;
	}

	std::vector<std::filesystem::path> files;
	for (const auto& entry: std::filesystem::directory_iterator(input, ec)) {
		if (entry.is_regular_file() && gridscale::vision::core::isImageFile(entry.path()))
			files.push_back(entry.path());
	}
	std::sort(files.begin(), files.end());

	if (files.empty()) {
		std::cout << "No image files found in " << input << '\n';
		return 0;
	}

	std::cout << "Found " << files.size() << " image files\n\n";
	std::size_t failed = 0;
	for (const auto& file: files) {
		if (!gridscale::vision::core::inspect(file, options))
			++failed;
	}
	std::cout << "Completed inspecting " << files.size() << " images (" << failed << " unreadable)\n";
	return failed == 0 ? 0 : 1;
}
