#pragma once

#include <cstddef>
#include <string_view>

/// @file include/corrvec/constants.hpp
/// @brief Wire-format and sizing constants for correlation vectors.

namespace corrvec::constants {

// ─── Wire Format ──────────────────────────────────────────────────────────────

/// Header that carries the correlation vector between services.
static constexpr std::string_view HEADER_NAME = "MS-CV";

/// Appended to a vector that can no longer grow.
static constexpr char TERMINATION_SIGN = '!';

/// Separator between the base and each extension segment.
static constexpr char SEGMENT_SEPARATOR = '.';

/// Alphabet used to seed a fresh base value (64 characters).
static constexpr std::string_view BASE64_CHARSET =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

// ─── Version Limits ───────────────────────────────────────────────────────────

/// V1: 16-character base, 63 characters total.
static constexpr std::size_t BASE_LENGTH_V1 = 16;
static constexpr std::size_t MAX_VECTOR_LENGTH_V1 = 63;

/// V2: 22-character base, 127 characters total.
static constexpr std::size_t BASE_LENGTH_V2 = 22;
static constexpr std::size_t MAX_VECTOR_LENGTH_V2 = 127;

// ─── Spin Clock ───────────────────────────────────────────────────────────────

/// Low bits dropped from a 100 ns tick counter for the coarse interval.
/// 2^24 × 100 ns ≈ 1.67 s.
static constexpr int COARSE_TICKS_BITS_TO_DROP = 24;

/// Low bits dropped for the fine interval. 2^16 × 100 ns ≈ 6.5 ms.
static constexpr int FINE_TICKS_BITS_TO_DROP = 16;

} // namespace corrvec::constants
