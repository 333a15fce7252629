#pragma once

/// @file include/corrvec/entropy.hpp
/// @brief Injectable sources of randomness and time.
///
/// Base seeding and spin entropy draw from a `RandomSource`; spin reads the
/// current time from a `ClockSource`. Both default to process-wide sources
/// and can be replaced through `VectorConfig` for deterministic tests.
///
/// ## Thread Safety
/// The default random source keeps one `std::mt19937_64` per thread, so it
/// may be shared freely. Custom sources must provide their own guarantees.

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace corrvec {

/// Uniform integer generator.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    /// Uniform integer in [0, bound). `bound` is at least 1.
    [[nodiscard]] virtual std::uint64_t next_below(std::uint64_t bound) = 0;
};

/// `std::mt19937_64` per calling thread, seeded from `std::random_device`.
class ThreadLocalRandomSource final : public RandomSource {
public:
    [[nodiscard]] std::uint64_t next_below(std::uint64_t bound) override;
};

/// Shared instance of `ThreadLocalRandomSource`.
[[nodiscard]] std::shared_ptr<RandomSource> default_random_source();

/// Current wall-clock time.
using ClockSource = std::function<std::chrono::system_clock::time_point()>;

[[nodiscard]] ClockSource default_clock_source();

} // namespace corrvec
