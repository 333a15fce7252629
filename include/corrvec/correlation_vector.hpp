#pragma once

/// @file include/corrvec/correlation_vector.hpp
/// @brief CorrelationVector — lightweight vector for identifying and
///        measuring causality across service boundaries.
///
/// # Module: Correlation Vector Engine
///
/// ## Responsibility
/// Own the string encoding of a correlation vector, version inference, size
/// limits, and the derivation operators:
///
/// | Factory      | When to use                                   |
/// |--------------|-----------------------------------------------|
/// | `create`     | no vector arrived with the request            |
/// | `extend`     | entry point of an operation, vector received  |
/// | `spin`       | entry point, time/entropy-ordered sub-branch  |
/// | `parse`      | rebuild a vector from its full string         |
///
/// `increment()` advances the extension before each outbound call.
///
/// ## Encoding
/// ```
/// <base>.<ext>[.<ext>...][!]
/// ```
/// `base` is 16 (V1) or 22 (V2) base64 characters; the whole value never
/// exceeds 63 (V1) or 127 (V2) characters. A trailing `!` marks a vector
/// that ran out of room and must not grow further.
///
/// ## Usage
/// ```cpp
/// auto cv = CorrelationVector::extend(request.header("MS-CV"));
/// outbound.set_header(constants::HEADER_NAME, cv->increment());
/// ```
///
/// ## Guarantees
/// - Oversize never fails: the vector freezes instead
/// - In lenient mode (default) every input yields a vector
/// - In strict mode malformed input yields a `FormatError` and no vector
///
/// ## NOT Responsible For
/// - Transporting the value between processes
/// - Synchronising concurrent `increment()` calls on one instance

#include "corrvec/config.hpp"
#include "corrvec/spin_parameters.hpp"
#include "corrvec/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace corrvec {

class CorrelationVector {
public:
    // ── Factories ─────────────────────────────────────────────────────────────

    /// New root vector with a random base and extension 0.
    [[nodiscard]] static CorrelationVector
    create(Version version = Version::V1,
           const VectorConfig& config = VectorConfig{});

    /// First hop under a received vector: base = `received`, extension 0.
    ///
    /// # Returns
    /// - `parse(received)` if `received` already ends in `!`
    /// - `parse(received + "!")` if there is no room for `.0`
    /// - `FormatError` if strict validation is on and `received` is malformed
    [[nodiscard]] static Result<CorrelationVector>
    extend(std::string_view received,
           const VectorConfig& config = VectorConfig{});

    /// Append a time- and entropy-derived segment to the received vector.
    ///
    /// # Returns
    /// - `parse(received)` if `received` already ends in `!`
    /// - `parse(received + "!")` if the new segment does not fit; the
    ///   segment is dropped, never truncated
    /// - `FormatError` if strict validation is on and `received` is malformed
    [[nodiscard]] static Result<CorrelationVector>
    spin(std::string_view received,
         const SpinParameters& parameters = SpinParameters{},
         const VectorConfig& config = VectorConfig{});

    /// Rebuild a vector from its rendered form. Never validates.
    ///
    /// Falls back to `create(V1)` when the value is empty, has no `.` past
    /// position 0, or the last segment is not a non-negative integer.
    [[nodiscard]] static CorrelationVector
    parse(std::string_view value,
          const VectorConfig& config = VectorConfig{});

    // ── Mutation ──────────────────────────────────────────────────────────────

    /// Advance the extension by one and return the new value.
    ///
    /// A frozen vector, or one whose extension is at its maximum, is left
    /// untouched. If the next extension would not fit, the vector freezes and
    /// the current value (now ending in `!`) is returned.
    std::string increment();

    // ── Observers ─────────────────────────────────────────────────────────────

    /// `base.extension`, plus `!` if immutable.
    [[nodiscard]] std::string value() const;
    [[nodiscard]] std::string to_string() const { return value(); }

    [[nodiscard]] const std::string& base_vector() const noexcept { return base_vector_; }
    [[nodiscard]] std::uint64_t extension() const noexcept { return extension_; }
    [[nodiscard]] Version version() const noexcept { return version_; }
    [[nodiscard]] bool immutable() const noexcept { return immutable_; }

    friend bool operator==(const CorrelationVector& a,
                           const CorrelationVector& b) noexcept {
        return a.version_ == b.version_ && a.immutable_ == b.immutable_ &&
               a.extension_ == b.extension_ && a.base_vector_ == b.base_vector_;
    }

    // ── Encoding Rules ────────────────────────────────────────────────────────

    /// V2 if the part before the first `.` has 22 characters, otherwise V1.
    [[nodiscard]] static Version infer_version(std::string_view value) noexcept;

    /// True iff `value` ends with the termination sign.
    [[nodiscard]] static bool is_immutable(std::string_view value) noexcept;

    /// True iff `base.extension!` would exceed the version's max length.
    /// An empty base is never oversized.
    [[nodiscard]] static bool is_oversized(std::string_view base,
                                           std::uint64_t extension,
                                           Version version) noexcept;

    /// Strict format check.
    ///
    /// # Returns
    /// `nullopt` if `value` is well formed for `version`, otherwise the first
    /// violated constraint.
    [[nodiscard]] static std::optional<FormatError>
    validate(std::string_view value, Version version);

private:
    CorrelationVector(std::string base_vector,
                      std::uint64_t extension,
                      Version version,
                      bool immutable);

    /// Random base of the version's length.
    [[nodiscard]] static std::string
    seed(Version version, RandomSource& random);

    /// Time/entropy segment value for `spin`.
    [[nodiscard]] static std::uint64_t
    spin_segment(const SpinParameters& parameters, const VectorConfig& config);

    /// Infer the version and, in strict mode, validate `received`.
    [[nodiscard]] static Result<Version>
    check_received(std::string_view received, const VectorConfig& config);

    /// `parse(received + "!")`.
    [[nodiscard]] static CorrelationVector
    freeze(std::string_view received, const VectorConfig& config);

    std::string   base_vector_;
    std::uint64_t extension_ = 0;
    Version       version_   = Version::V1;
    bool          immutable_ = false;
};

} // namespace corrvec
