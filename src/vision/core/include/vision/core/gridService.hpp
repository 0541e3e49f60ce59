#pragma once

namespace gridscale::vision::core {

//! Grid overlay state of a viewer. Keeps the grid size on standard values.
class GridService {
public:
	/*! Set the grid size, adjusted to standard sizes.
	 *  Sizes within [0.095, 0.105] become exactly 0.1. Otherwise the closest standard size is used if within 15%,
	 *  else the value is rounded to 0.01. The result is clamped to [0.01, 0.5].
	 * \returns The stored grid size (m).
	 */
	double setGridSize(double sizeM);

	double resetToStandardGrid(); //!< Back to the 10 cell grid (0.1m). Returns the new size.
	bool toggleGrid();            //!< Flip overlay visibility. Returns the new state.

	double gridSize() const { return m_gridSize; }
	bool isGridVisible() const { return m_visible; }

	int cellsPerMeter() const; //!< Whole cells across one meter at the current size.

	//! True if `sizeM` is within 1% of a standard size.
	static bool isStandardGridSize(double sizeM);

private:
	double m_gridSize{0.1}; //!< Current grid size (m).
	bool m_visible{false};  //!< Grid overlay shown.
};

//! Physical extent of an image. The width is fixed at 1m, the height follows the aspect ratio.
class PhysicalFrame {
public:
	//! Derive the frame of an image. Height rounded to 0.1m, at least 0.1m.
	static PhysicalFrame fromImage(int widthPx, int heightPx);

	void setHeight(double heightM); //!< Manual override. Same rounding and minimum as fromImage().

	double width() const { return m_width; }
	double height() const { return m_height; }
	double aspectRatio() const; //!< height / width.

private:
	double m_width{1.0};
	double m_height{1.0};
};

} // namespace gridscale::vision::core
