#pragma once

#include <string>

namespace AutoScrub {

// Shortest decimal text that parses back to the same double, always carrying
// a fractional part ("0.0", "8.0", "10.25"). Used for every number written
// into a filter graph so output is reproducible byte for byte.
std::string formatNumber(double value);

} // namespace AutoScrub
