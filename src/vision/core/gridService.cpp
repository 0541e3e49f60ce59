#include "vision/core/gridService.hpp"

#include "vision/core/gridTypes.hpp"
#include "vision/core/sizeReconciler.hpp"

#include "statistics.hpp"

#include <algorithm>
#include <cmath>

namespace gridscale::vision::core {

//! Relative distance to snap a requested size onto a standard size.
static constexpr double SNAP_TOLERANCE = 0.15;
//! Relative distance under which a size counts as standard.
static constexpr double STANDARD_MATCH_TOLERANCE = 0.01;
//! Smallest physical height (m). Heights are rounded to this step.
static constexpr double MIN_HEIGHT = 0.1;

double GridService::setGridSize(double sizeM) {
	// The 10 cell grid is exact.
	if (sizeM >= 0.095 && sizeM <= 0.105) {
		m_gridSize = PREFERRED_GRID_SIZE;
		return m_gridSize;
	}

	const double closest = closestStandardSize(sizeM);
	if (relativeDifference(sizeM, closest) <= SNAP_TOLERANCE) {
		sizeM = closest;
	} else {
		sizeM = std::round(sizeM * 100.0) / 100.0;
	}

	m_gridSize = std::clamp(sizeM, MIN_GRID_SIZE, MAX_GRID_SIZE);
	return m_gridSize;
}

double GridService::resetToStandardGrid() {
	m_gridSize = PREFERRED_GRID_SIZE;
	return m_gridSize;
}

bool GridService::toggleGrid() {
	m_visible = !m_visible;
	return m_visible;
}

int GridService::cellsPerMeter() const {
	return static_cast<int>(std::lround(1.0 / m_gridSize));
}

bool GridService::isStandardGridSize(double sizeM) {
	return std::any_of(STANDARD_GRID_SIZES.begin(), STANDARD_GRID_SIZES.end(),
	                   [sizeM](double s) { return relativeDifference(sizeM, s) < STANDARD_MATCH_TOLERANCE; });
}

static double roundHeight(double heightM) {
	return std::max(MIN_HEIGHT, std::round(heightM * 10.0) / 10.0);
}

PhysicalFrame PhysicalFrame::fromImage(int widthPx, int heightPx) {
	PhysicalFrame frame;
	if (widthPx > 0 && heightPx > 0) {
		frame.m_height = roundHeight(frame.m_width * static_cast<double>(heightPx) / static_cast<double>(widthPx));
	}
	return frame;
}

void PhysicalFrame::setHeight(double heightM) {
	m_height = roundHeight(heightM);
}

double PhysicalFrame::aspectRatio() const {
	return m_width == 0.0 ? 1.0 : m_height / m_width;
}

} // namespace gridscale::vision::core
