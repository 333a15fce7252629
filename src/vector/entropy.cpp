/// @file src/vector/entropy.cpp
/// @brief Default random and clock sources.

#include "corrvec/entropy.hpp"

#include <random>

namespace corrvec {

std::uint64_t ThreadLocalRandomSource::next_below(std::uint64_t bound) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    if (bound <= 1) {
        return 0;
    }
    std::uniform_int_distribution<std::uint64_t> dist(0, bound - 1);
    return dist(rng);
}

std::shared_ptr<RandomSource> default_random_source() {
    static const auto source = std::make_shared<ThreadLocalRandomSource>();
    return source;
}

ClockSource default_clock_source() {
    return [] { return std::chrono::system_clock::now(); };
}

} // namespace corrvec
