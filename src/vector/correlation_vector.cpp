/// @file src/vector/correlation_vector.cpp
/// @brief CorrelationVector encoding, derivation and increment.

#include "corrvec/correlation_vector.hpp"
#include "corrvec/constants.hpp"

#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <limits>
#include <ratio>
#include <system_error>

namespace corrvec {

namespace {

/// Parse a complete segment as an unsigned decimal. Rejects empty input,
/// signs, trailing characters and values that do not fit in 64 bits.
std::optional<std::uint64_t> parse_extension(std::string_view text) noexcept {
    if (text.empty()) {
        return std::nullopt;
    }
    std::uint64_t value = 0;
    const auto* first = text.data();
    const auto* last  = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

/// Digits beyond the first: floor(log10(n)) for n > 0, and 0 for n == 0.
std::size_t extra_digits(std::uint64_t n) noexcept {
    std::size_t extra = 0;
    while (n >= 10) {
        n /= 10;
        ++extra;
    }
    return extra;
}

RandomSource& random_of(const VectorConfig& config) {
    if (config.random) {
        return *config.random;
    }
    static const auto fallback = default_random_source();
    return *fallback;
}

} // anonymous namespace

// ─── Constructor ──────────────────────────────────────────────────────────────

CorrelationVector::CorrelationVector(std::string base_vector,
                                     std::uint64_t extension,
                                     Version version,
                                     bool immutable)
    : base_vector_(std::move(base_vector))
    , extension_(extension)
    , version_(version)
    , immutable_(immutable || is_oversized(base_vector_, extension, version))
{}

// ─── Encoding rules ───────────────────────────────────────────────────────────

Version CorrelationVector::infer_version(std::string_view value) noexcept {
    const auto index = value.find(constants::SEGMENT_SEPARATOR);
    if (index == constants::BASE_LENGTH_V1) {
        return Version::V1;
    }
    if (index == constants::BASE_LENGTH_V2) {
        return Version::V2;
    }
    // Anything else is read as V1 without complaint.
    return Version::V1;
}

bool CorrelationVector::is_immutable(std::string_view value) noexcept {
    return !value.empty() && value.back() == constants::TERMINATION_SIGN;
}

bool CorrelationVector::is_oversized(std::string_view base,
                                     std::uint64_t extension,
                                     Version version) noexcept {
    if (base.empty()) {
        return false;
    }
    const std::size_t size = base.size() + 1 + extra_digits(extension) + 1;
    return size > max_length(version);
}

std::optional<FormatError>
CorrelationVector::validate(std::string_view value, Version version) {
    const std::size_t max_len  = max_length(version);
    const std::size_t base_len = base_length(version);

    if (value.empty() || value.size() > max_len) {
        return FormatError{
            FormatErrorReason::NullOrOversized,
            fmt::format("The {} correlation vector can not be null or bigger than {} characters",
                        corrvec::to_string(version), max_len),
        };
    }

    const auto first_dot = value.find(constants::SEGMENT_SEPARATOR);
    const std::string_view head = value.substr(0, first_dot);
    if (first_dot == std::string_view::npos || head.size() != base_len) {
        return FormatError{
            FormatErrorReason::BadBaseLength,
            fmt::format("Invalid correlation vector {}. Invalid base value {}", value, head),
        };
    }

    std::string_view rest = value.substr(first_dot + 1);
    while (true) {
        const auto dot = rest.find(constants::SEGMENT_SEPARATOR);
        const std::string_view part = rest.substr(0, dot);
        if (!parse_extension(part)) {
            return FormatError{
                FormatErrorReason::BadExtensionValue,
                fmt::format("Invalid correlation vector {}. Invalid extension value {}", value, part),
            };
        }
        if (dot == std::string_view::npos) {
            break;
        }
        rest = rest.substr(dot + 1);
    }

    return std::nullopt;
}

// ─── Factories ────────────────────────────────────────────────────────────────

std::string CorrelationVector::seed(Version version, RandomSource& random) {
    const std::size_t length = base_length(version);
    std::string base;
    base.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        const auto index = random.next_below(constants::BASE64_CHARSET.size());
        base.push_back(constants::BASE64_CHARSET[index]);
    }
    return base;
}

CorrelationVector CorrelationVector::create(Version version,
                                            const VectorConfig& config) {
    return CorrelationVector(seed(version, random_of(config)), 0, version, false);
}

Result<Version>
CorrelationVector::check_received(std::string_view received,
                                  const VectorConfig& config) {
    const Version version = infer_version(received);
    if (!config.validate_during_creation) {
        return version;
    }
    auto error = validate(received, version);
    if (error) {
        if (config.verbose) {
            fmt::print(stderr, "[corrvec] rejected '{}': {}\n",
                       received, error->to_string());
        }
        return std::move(*error);
    }
    return version;
}

CorrelationVector CorrelationVector::freeze(std::string_view received,
                                            const VectorConfig& config) {
    if (config.verbose) {
        fmt::print(stderr, "[corrvec] no room to grow '{}', freezing\n", received);
    }
    std::string frozen(received);
    frozen.push_back(constants::TERMINATION_SIGN);
    return parse(frozen, config);
}

Result<CorrelationVector>
CorrelationVector::extend(std::string_view received,
                          const VectorConfig& config) {
    if (is_immutable(received)) {
        return parse(received, config);
    }

    auto version = check_received(received, config);
    if (!version) {
        return version.error();
    }

    if (is_oversized(received, 0, *version)) {
        return freeze(received, config);
    }

    return CorrelationVector(std::string(received), 0, *version, false);
}

std::uint64_t CorrelationVector::spin_segment(const SpinParameters& parameters,
                                              const VectorConfig& config) {
    using Ticks = std::chrono::duration<std::int64_t, std::ratio<1, 10'000'000>>;

    const auto now = config.clock ? config.clock() : std::chrono::system_clock::now();
    const auto ticks = std::chrono::duration_cast<Ticks>(now.time_since_epoch()).count();

    std::uint64_t value = static_cast<std::uint64_t>(ticks < 0 ? 0 : ticks)
                          >> parameters.ticks_bits_to_drop();

    const int entropy_bits = parameters.entropy_bits();
    if (entropy_bits > 0) {
        const std::uint64_t entropy =
            random_of(config).next_below(std::uint64_t{1} << (entropy_bits - 1));
        value = (value << entropy_bits) | entropy;
    }

    const int total_bits = parameters.total_bits();
    const std::uint64_t mask = total_bits >= 64
        ? std::numeric_limits<std::uint64_t>::max()
        : (std::uint64_t{1} << total_bits) - 1;
    return value & mask;
}

Result<CorrelationVector>
CorrelationVector::spin(std::string_view received,
                        const SpinParameters& parameters,
                        const VectorConfig& config) {
    if (is_immutable(received)) {
        return parse(received, config);
    }

    auto version = check_received(received, config);
    if (!version) {
        return version.error();
    }

    std::string base = fmt::format("{}{}{}", received, constants::SEGMENT_SEPARATOR,
                                   spin_segment(parameters, config));
    if (is_oversized(base, 0, *version)) {
        return freeze(received, config);
    }

    return CorrelationVector(std::move(base), 0, *version, false);
}

CorrelationVector CorrelationVector::parse(std::string_view value,
                                           const VectorConfig& config) {
    if (!value.empty()) {
        const auto p = value.rfind(constants::SEGMENT_SEPARATOR);
        const bool frozen = is_immutable(value);
        if (p != std::string_view::npos && p > 0) {
            std::string_view digits = value.substr(p + 1);
            if (frozen) {
                digits.remove_suffix(1);
            }
            const auto ext = parse_extension(digits);
            if (ext) {
                return CorrelationVector(std::string(value.substr(0, p)),
                                         *ext,
                                         infer_version(value),
                                         frozen);
            }
        }
    }

    return create(Version::V1, config);
}

// ─── increment ────────────────────────────────────────────────────────────────

std::string CorrelationVector::increment() {
    if (immutable_) {
        return value();
    }
    if (extension_ == std::numeric_limits<std::uint64_t>::max()) {
        return value();
    }
    const std::uint64_t next = extension_ + 1;
    if (is_oversized(base_vector_, next, version_)) {
        immutable_ = true;
        return value();
    }
    extension_ = next;
    return value();
}

// ─── value ────────────────────────────────────────────────────────────────────

std::string CorrelationVector::value() const {
    if (immutable_) {
        return fmt::format("{}{}{}{}", base_vector_, constants::SEGMENT_SEPARATOR,
                           extension_, constants::TERMINATION_SIGN);
    }
    return fmt::format("{}{}{}", base_vector_, constants::SEGMENT_SEPARATOR, extension_);
}

} // namespace corrvec
