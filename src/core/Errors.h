#pragma once

#include <stdexcept>
#include <string>

namespace AutoScrub {

// Raised when tuning parameters violate an invariant (e.g. margin >= half the
// minimum silence duration). Always fatal and raised before any ffmpeg run.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace AutoScrub
