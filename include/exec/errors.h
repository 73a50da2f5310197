#pragma once

#include <stdexcept>

namespace eqjoin {

// Raised while a join is being set up, before any row flows.
struct ConfigurationError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Raised when the build side cannot be materialised in memory.
struct ResourceExhaustedError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace eqjoin
