#pragma once

/// @file include/corrvec/types.hpp
/// @brief Shared value types for the corrvec library.
///
/// Defines the version enum, the format-error reason codes reported by strict
/// validation, and `Result<T>`, the typed success-or-error return used by the
/// factories that accept a received vector.

#include "corrvec/constants.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace corrvec {

// ─── Version ──────────────────────────────────────────────────────────────────

/// Selects the base length and maximum encoded length of a vector.
enum class Version {
    V1,  ///< 16-character base, 63 characters max
    V2,  ///< 22-character base, 127 characters max
};

/// "V1" or "V2".
[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Required base length for `version`.
[[nodiscard]] constexpr std::size_t base_length(Version version) noexcept {
    return version == Version::V2 ? constants::BASE_LENGTH_V2
                                  : constants::BASE_LENGTH_V1;
}

/// Maximum rendered length for `version`, termination sign included.
[[nodiscard]] constexpr std::size_t max_length(Version version) noexcept {
    return version == Version::V2 ? constants::MAX_VECTOR_LENGTH_V2
                                  : constants::MAX_VECTOR_LENGTH_V1;
}

// ─── FormatError ──────────────────────────────────────────────────────────────

/// Which validation constraint a received vector violated.
enum class FormatErrorReason {
    NullOrOversized,    ///< Empty, or longer than the version's max length
    BadBaseLength,      ///< Fewer than two segments, or wrong base length
    BadExtensionValue,  ///< An extension segment is not a non-negative integer
};

[[nodiscard]] std::string_view to_string(FormatErrorReason reason) noexcept;

/// Rejection reported by strict validation.
struct FormatError {
    FormatErrorReason reason;
    std::string       message;  ///< Human-readable detail, names the offending part

    /// "<reason>: <message>"
    [[nodiscard]] std::string to_string() const;
};

// ─── Result ───────────────────────────────────────────────────────────────────

/// Either a `T` or a `FormatError`.
///
/// ```cpp
/// auto cv = CorrelationVector::extend(header, strict_config);
/// if (!cv) {
///     fmt::print(stderr, "rejected: {}\n", cv.error().to_string());
/// }
/// ```
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(FormatError error) : data_(std::move(error)) {}

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(data_);
    }
    explicit operator bool() const noexcept { return has_value(); }

    /// Throws `std::bad_variant_access` when holding an error.
    [[nodiscard]] T&       value() &       { return std::get<T>(data_); }
    [[nodiscard]] const T& value() const&  { return std::get<T>(data_); }
    [[nodiscard]] T&&      value() &&      { return std::get<T>(std::move(data_)); }

    /// Throws `std::bad_variant_access` when holding a value.
    [[nodiscard]] const FormatError& error() const& {
        return std::get<FormatError>(data_);
    }

    T&       operator*() &      { return value(); }
    const T& operator*() const& { return value(); }
    T*       operator->()       { return &value(); }
    const T* operator->() const { return &value(); }

private:
    std::variant<T, FormatError> data_;
};

} // namespace corrvec
