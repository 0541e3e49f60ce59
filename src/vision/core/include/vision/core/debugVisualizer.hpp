#pragma once

#include <opencv2/core/mat.hpp>

#include <optional>
#include <string>
#include <vector>

namespace gridscale::vision::core {

//! One intermediate image of a pipeline stage.
struct DebugStep {
	std::string name; //!< Label drawn above the thumbnail.
	cv::Mat image;    //!< Image produced by the step (deep copy).
};

//! Measurement recorded by a stage, e.g. "segments" = 48 or "pitch px" = 50.2.
struct DebugNote {
	std::string key;
	double value{0.0};
};

//! Images and measurements of one pipeline stage (extract lines, grid lines, content, ...).
struct DebugStage {
	std::string name;
	std::vector<DebugStep> steps{};
	std::vector<DebugNote> notes{};
};

/*! Collects what the detection pipelines see, stage by stage.
 *  Pass a pointer to detectGrid()/detectContent() and render the result with buildReport().
 */
class DebugVisualizer {
public:
	void beginStage(std::string name);              //!< Ends an open stage first.
	void add(std::string name, const cv::Mat& img); //!< Ignored (with an error log) if no stage is open.
	void note(std::string key, double value);       //!< Attach a measurement to the open stage.
	void endStage();
	void clear();

	//! One row per stage: summary panel with the stage name and its notes, followed by the step thumbnails.
	//! Ends the open stage. Empty if nothing was collected.
	cv::Mat buildReport();

	const std::vector<DebugStage>& stages() const { return m_stages; }

private:
	std::optional<DebugStage> m_open;   //!< Stage currently receiving steps and notes.
	std::vector<DebugStage> m_stages{}; //!< Finished stages in pipeline order.
};

namespace debugging {

cv::Mat toBgr8U(const cv::Mat& in); //!< Any depth/channel layout to 8 bit BGR for display.

//! Full height/width lines at the given positions.
cv::Mat drawAxisLines(const cv::Mat& image, const std::vector<double>& vertical, const std::vector<double>& horizontal);

//! Raw Hough segments.
cv::Mat drawSegments(const cv::Mat& image, const std::vector<cv::Vec4i>& segments);

//! Rectangle from (xMin, yMin) to (xMax, yMax).
cv::Mat drawBox(const cv::Mat& image, int xMin, int yMin, int xMax, int yMax);

} // namespace debugging

} // namespace gridscale::vision::core
