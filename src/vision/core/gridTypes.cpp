#include "vision/core/gridTypes.hpp"

#include <utility>

namespace gridscale::vision::core {

std::string_view toString(GridFailure failure) {
	switch (failure) {
	case GridFailure::None:
		return "None";
	case GridFailure::InsufficientLines:
		return "InsufficientLines";
	case GridFailure::InconsistentGrid:
		return "InconsistentGrid";
	case GridFailure::ProcessingError:
		return "ProcessingError";
	}
	return "Unknown";
}

GridEstimate makeFailure(GridFailure failure, std::string reason) {
	GridEstimate estimate;
	estimate.detected = false;
	estimate.failure  = failure;
	estimate.reason   = std::move(reason);
	return estimate;
}

} // namespace gridscale::vision::core
