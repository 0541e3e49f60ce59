#pragma once

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace gridscale::vision::core {

//! The image width always maps to this physical span (m).
inline constexpr double REFERENCE_WIDTH_M = 1.0;

//! Physical grid sizes (m) preferred over raw measurements. Ascending.
inline constexpr std::array<double, 7> STANDARD_GRID_SIZES = {0.01, 0.02, 0.05, 0.1, 0.2, 0.25, 0.5};

//! 10 cells across the reference width.
inline constexpr double PREFERRED_GRID_SIZE = 0.1;

inline constexpr double MIN_GRID_SIZE = 0.01; //!< Smallest reported grid size (m).
inline constexpr double MAX_GRID_SIZE = 0.5;  //!< Largest reported grid size (m).

//! Why a grid detection did not produce a grid.
enum class GridFailure {
	None,              //!< Grid detected.
	InsufficientLines, //!< Too few lines overall or on one axis.
	InconsistentGrid,  //!< Lines found, but no axis has a recurring spacing.
	ProcessingError,   //!< Unexpected internal failure (OpenCV error, unsupported input).
};

std::string_view toString(GridFailure failure);

//! Components of the confidence value.
struct GridScores {
	double consistency{0.0};  //!< How regular the spacings are (mean of both axes).
	double standardSize{0.0}; //!< Closeness of the raw size to a standard size.
	double lineCount{0.0};    //!< Saturating measure of how many lines support the grid.
};

//! Result of detectGrid(). Immutable once returned.
struct GridEstimate {
	bool detected{false};
	GridFailure failure{GridFailure::None};
	std::string reason{}; //!< Human readable failure reason. Empty on success.

	double gridSizePx{0.0};    //!< Grid pitch in pixels.
	double gridSizeM{0.0};     //!< Grid pitch (m) after snapping to standard sizes and clamping.
	double rawGridSizeM{0.0};  //!< Grid pitch (m) as measured.
	double cellsAcross{0.0};   //!< Image width / pixel pitch.
	double confidence{0.0};    //!< In [0, 1].

	std::vector<double> horizontalLines{}; //!< y-positions (px).
	std::vector<double> verticalLines{};   //!< x-positions (px).
	double horizontalSpacing{0.0};         //!< Dominant spacing of the horizontal lines (px).
	double verticalSpacing{0.0};           //!< Dominant spacing of the vertical lines (px).

	GridScores scores{};

	std::size_t supportingLines() const { return horizontalLines.size() + verticalLines.size(); }
};

//! Build a failed estimate.
GridEstimate makeFailure(GridFailure failure, std::string reason);

} // namespace gridscale::vision::core
