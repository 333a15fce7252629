/// @file src/vector/spin_parameters.cpp
/// @brief SpinParameters derived bit widths.

#include "corrvec/spin_parameters.hpp"
#include "corrvec/constants.hpp"

namespace corrvec {

int SpinParameters::ticks_bits_to_drop() const noexcept {
    switch (interval) {
        case SpinCounterInterval::Coarse: return constants::COARSE_TICKS_BITS_TO_DROP;
        case SpinCounterInterval::Fine:   return constants::FINE_TICKS_BITS_TO_DROP;
    }
    return constants::COARSE_TICKS_BITS_TO_DROP;
}

int SpinParameters::counter_bits() const noexcept {
    switch (periodicity) {
        case SpinCounterPeriodicity::None:   return 0;
        case SpinCounterPeriodicity::Short:  return 16;
        case SpinCounterPeriodicity::Medium: return 24;
        case SpinCounterPeriodicity::Long:   return 32;
    }
    return 0;
}

int SpinParameters::entropy_bits() const noexcept {
    return static_cast<int>(entropy) * 8;
}

int SpinParameters::total_bits() const noexcept {
    // Long periodicity (32) + Four entropy bytes (32) is the widest case.
    return counter_bits() + entropy_bits();
}

} // namespace corrvec
