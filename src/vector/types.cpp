/// @file src/vector/types.cpp
/// @brief String conversions for Version and FormatError.

#include "corrvec/types.hpp"

#include <fmt/format.h>

namespace corrvec {

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::V1: return "V1";
        case Version::V2: return "V2";
    }
    return "Unknown";
}

std::string_view to_string(FormatErrorReason reason) noexcept {
    switch (reason) {
        case FormatErrorReason::NullOrOversized:   return "NullOrOversized";
        case FormatErrorReason::BadBaseLength:     return "BadBaseLength";
        case FormatErrorReason::BadExtensionValue: return "BadExtensionValue";
    }
    return "Unknown";
}

std::string FormatError::to_string() const {
    return fmt::format("{}: {}", corrvec::to_string(reason), message);
}

} // namespace corrvec
