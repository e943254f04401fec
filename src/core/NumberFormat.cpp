#include "NumberFormat.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <sstream>

namespace AutoScrub {

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());

    if (!std::isfinite(value)) {
        oss << value;
        return oss.str();
    }

    // Never let %g switch to exponent form for values with integer digits
    int minPrecision = 1;
    if (std::fabs(value) >= 1.0) {
        oss << std::fixed << std::setprecision(0) << std::trunc(std::fabs(value));
        minPrecision = static_cast<int>(oss.str().size());
        oss.str("");
        oss.unsetf(std::ios_base::floatfield);
    }

    // 17 significant digits always round-trip a double
    const int maxPrecision = std::max(minPrecision, 17);
    std::string text;
    for (int precision = minPrecision; precision <= maxPrecision; ++precision) {
        oss.str("");
        oss << std::setprecision(precision) << value;
        text = oss.str();
        if (std::strtod(text.c_str(), nullptr) == value) {
            break;
        }
    }

    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

} // namespace AutoScrub
