#pragma once

/// @file include/corrvec/spin_parameters.hpp
/// @brief SpinParameters — how the spin operator samples time and entropy.
///
/// # Module: Spin Parameters
///
/// ## Responsibility
/// Describe the shape of the segment appended by `CorrelationVector::spin`:
///
///   segment = ((ticks >> ticks_bits_to_drop) << entropy_bits | random)
///             & (2^total_bits − 1)
///
/// where `ticks` counts 100 ns intervals since the Unix epoch.
///
/// ## Guarantees
/// - `total_bits()` never exceeds 64
/// - Pure value type, no state beyond its three fields

namespace corrvec {

/// Granularity of the spin counter.
enum class SpinCounterInterval {
    Coarse,  ///< ≈1.67 s per tick
    Fine,    ///< ≈6.5 ms per tick
};

/// How many counter bits survive in the segment, i.e. how long before the
/// time component wraps around.
enum class SpinCounterPeriodicity {
    None,    ///< no counter bits, entropy only
    Short,   ///< 16 bits
    Medium,  ///< 24 bits
    Long,    ///< 32 bits
};

/// Bytes of random entropy mixed into the segment.
enum class SpinEntropy {
    None  = 0,
    One   = 1,
    Two   = 2,
    Three = 3,
    Four  = 4,
};

/// Configuration of the spin operator. Defaults to {Coarse, Short, Two}.
struct SpinParameters {
    SpinCounterInterval    interval    = SpinCounterInterval::Coarse;
    SpinCounterPeriodicity periodicity = SpinCounterPeriodicity::Short;
    SpinEntropy            entropy     = SpinEntropy::Two;

    /// Low-order tick bits discarded: 24 for Coarse, 16 for Fine.
    [[nodiscard]] int ticks_bits_to_drop() const noexcept;

    /// Counter bits kept: 0, 16, 24 or 32 depending on periodicity.
    [[nodiscard]] int counter_bits() const noexcept;

    /// `entropy × 8`.
    [[nodiscard]] int entropy_bits() const noexcept;

    /// `counter_bits() + entropy_bits()`.
    [[nodiscard]] int total_bits() const noexcept;
};

} // namespace corrvec
