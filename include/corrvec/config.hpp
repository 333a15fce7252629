#pragma once

/// @file include/corrvec/config.hpp
/// @brief VectorConfig — options passed to every CorrelationVector factory.

#include "corrvec/entropy.hpp"

#include <memory>

namespace corrvec {

/// Configuration for creating and deriving correlation vectors.
struct VectorConfig {
    /// Reject malformed received vectors in `extend` and `spin` with a
    /// `FormatError` instead of reinterpreting them.
    bool validate_during_creation = false;

    /// Source for base characters and spin entropy.
    std::shared_ptr<RandomSource> random = default_random_source();

    /// Source for the spin time component.
    ClockSource clock = default_clock_source();

    /// If true, report frozen vectors and rejected input on stderr.
    bool verbose = false;
};

} // namespace corrvec
