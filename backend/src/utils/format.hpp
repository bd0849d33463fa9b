#pragma once

#include <iomanip>
#include <sstream>
#include <string>

namespace proptrade::utils {

// Shortest natural rendering, e.g. 0.0001 or 100
inline std::string formatNumber(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

inline std::string formatFixed(double value, int decimals = 2) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimals) << value;
    return out.str();
}

} // namespace proptrade::utils
