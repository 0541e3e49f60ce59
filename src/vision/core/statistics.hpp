#pragma once

#include <vector>

namespace gridscale::vision::core {

double mean(const std::vector<double>& v); //!< Arithmetic mean. 0 for an empty vector.

//! |value - reference| / reference.
double relativeDifference(double value, double reference);

} // namespace gridscale::vision::core
