#include "vision/core/debugVisualizer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace gridscale::vision::core {

namespace {

static constexpr int PANEL_W     = 240; //!< Summary panel left of each stage row.
static constexpr int THUMB_H     = 180; //!< Thumbnail height. Width follows the aspect ratio.
static constexpr int MAX_THUMB_W = 320;
static constexpr int LABEL_H     = 22;
static constexpr int LINE_H      = 20; //!< Text line height in the summary panel.
static constexpr int GAP         = 6;

static const cv::Scalar REPORT_BG(32, 32, 32);
static const cv::Scalar PANEL_BG(60, 45, 20);
static const cv::Scalar TEXT_FG(235, 235, 235);
static const cv::Scalar NOTE_FG(120, 220, 255);

cv::Size thumbnailSize(const cv::Mat& image) {
	if (image.empty())
		return {THUMB_H, THUMB_H};
	const int w = static_cast<int>(std::lround(static_cast<double>(image.cols) * THUMB_H / image.rows));
	return {std::clamp(w, 1, MAX_THUMB_W), THUMB_H};
}

int rowHeight(const DebugStage& stage) {
	const int panelH = LINE_H * (2 + static_cast<int>(stage.notes.size()));
	const int thumbH = stage.steps.empty() ? 0 : LABEL_H + THUMB_H;
	return std::max(panelH, thumbH) + GAP;
}

int rowWidth(const DebugStage& stage) {
	int width = PANEL_W + GAP;
	for (const auto& step: stage.steps)
		width += thumbnailSize(step.image).width + GAP;
	return width;
}

void drawPanel(cv::Mat& row, const DebugStage& stage) {
	cv::Mat panel = row(cv::Rect(0, 0, PANEL_W, row.rows));
	panel.setTo(PANEL_BG);

	cv::putText(panel, stage.name, cv::Point(8, LINE_H), cv::FONT_HERSHEY_SIMPLEX, 0.6, TEXT_FG, 1, cv::LINE_AA);
	int y = 2 * LINE_H;
	for (const auto& n: stage.notes) {
		cv::putText(panel, std::format("{}: {:.4g}", n.key, n.value), cv::Point(12, y), cv::FONT_HERSHEY_PLAIN, 1.0, NOTE_FG, 1, cv::LINE_AA);
		y += LINE_H;
	}
}

void drawStep(cv::Mat& row, int x, const DebugStep& step) {
	const cv::Size size = thumbnailSize(step.image);
	cv::putText(row, step.name, cv::Point(x, LABEL_H - 6), cv::FONT_HERSHEY_PLAIN, 1.0, TEXT_FG, 1, cv::LINE_AA);
	if (step.image.empty())
		return;

	cv::Mat thumb;
	cv::resize(debugging::toBgr8U(step.image), thumb, size, 0.0, 0.0, cv::INTER_AREA);
	thumb.copyTo(row(cv::Rect(x, LABEL_H, size.width, size.height)));
}

} // namespace

void DebugVisualizer::beginStage(std::string name) {
	endStage();
	m_open.emplace();
	m_open->name = std::move(name);
}

void DebugVisualizer::add(std::string name, const cv::Mat& img) {
	if (!m_open) {
		std::cerr << "[Error] DebugVisualizer::add(" << name << ") called without an open stage.\n";
		return;
	}
	m_open->steps.push_back(DebugStep{std::move(name), img.clone()});
}

void DebugVisualizer::note(std::string key, double value) {
	if (!m_open) {
		std::cerr << "[Error] DebugVisualizer::note(" << key << ") called without an open stage.\n";
		return;
	}
	m_open->notes.push_back(DebugNote{std::move(key), value});
}

void DebugVisualizer::endStage() {
	if (m_open) {
		m_stages.push_back(std::move(*m_open));
		m_open.reset();
	}
}

void DebugVisualizer::clear() {
	m_open.reset();
	m_stages.clear();
}

cv::Mat DebugVisualizer::buildReport() {
	endStage();
	if (m_stages.empty())
		return {};

	int width  = 0;
	int height = 0;
	for (const auto& stage: m_stages) {
		width = std::max(width, rowWidth(stage));
		height += rowHeight(stage);
	}

	cv::Mat report(height, width, CV_8UC3, REPORT_BG);
	int y = 0;
	for (const auto& stage: m_stages) {
		const int h = rowHeight(stage);
		cv::Mat row = report(cv::Rect(0, y, width, h - GAP));
		drawPanel(row, stage);

		int x = PANEL_W + GAP;
		for (const auto& step: stage.steps) {
			drawStep(row, x, step);
			x += thumbnailSize(step.image).width + GAP;
		}
		y += h;
	}
	return report;
}

namespace debugging {

cv::Mat toBgr8U(const cv::Mat& in) {
	cv::Mat out;

	// Stretch other depths to the full 8 bit range
	if (in.depth() != CV_8U) {
		double minV = 0.0, maxV = 0.0;
		cv::minMaxLoc(in.reshape(1), &minV, &maxV);
		const double range = maxV - minV;
		in.convertTo(out, CV_8U, range < 1e-9 ? 1.0 : 255.0 / range, range < 1e-9 ? 0.0 : -minV * 255.0 / range);
	} else {
		out = in.clone();
	}

	if (out.channels() == 1) {
		cv::cvtColor(out, out, cv::COLOR_GRAY2BGR);
	} else if (out.channels() == 4) {
		cv::cvtColor(out, out, cv::COLOR_BGRA2BGR);
	}
	return out;
}

cv::Mat drawAxisLines(const cv::Mat& image, const std::vector<double>& vertical, const std::vector<double>& horizontal) {
	cv::Mat drawn = toBgr8U(image);

	for (double x: vertical) {
		const int xi = static_cast<int>(std::lround(x));
		cv::line(drawn, cv::Point(xi, 0), cv::Point(xi, drawn.rows - 1), cv::Scalar(255, 0, 0), 2);
	}
	for (double y: horizontal) {
		const int yi = static_cast<int>(std::lround(y));
		cv::line(drawn, cv::Point(0, yi), cv::Point(drawn.cols - 1, yi), cv::Scalar(100, 0, 150), 2);
	}
	return drawn;
}

cv::Mat drawSegments(const cv::Mat& image, const std::vector<cv::Vec4i>& segments) {
	cv::Mat drawn = toBgr8U(image);
	for (const auto& s: segments) {
		cv::line(drawn, cv::Point(s[0], s[1]), cv::Point(s[2], s[3]), cv::Scalar(0, 200, 0), 2, cv::LINE_AA);
	}
	return drawn;
}

cv::Mat drawBox(const cv::Mat& image, int xMin, int yMin, int xMax, int yMax) {
	cv::Mat drawn = toBgr8U(image);
	cv::rectangle(drawn, cv::Point(xMin, yMin), cv::Point(xMax - 1, yMax - 1), cv::Scalar(0, 0, 255), 3);
	return drawn;
}

} // namespace debugging

} // namespace gridscale::vision::core
