#include "statistics.hpp"

#include <cmath>
#include <limits>
#include <numeric>

namespace gridscale::vision::core {

double mean(const std::vector<double>& v) {
	if (v.empty()) {
		return 0.0;
	}
	return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double relativeDifference(double value, double reference) {
	if (reference == 0.0) {
		return value == 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
	}
	return std::abs(value - reference) / std::abs(reference);
}

} // namespace gridscale::vision::core
