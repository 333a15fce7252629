/// @file src/main.cpp
/// @brief corrvec CLI entry point.
///
/// Usage:
///   corrvec --create [v1|v2]             Print a fresh correlation vector
///   corrvec --extend <cv> [--strict]     Extend a received vector
///   corrvec --spin <cv> [options]        Spin a received vector
///   corrvec --parse <cv>                 Show the parts of a vector
///   corrvec --increment <cv> [count]     Increment a vector count times
///   corrvec --validate <cv>              Strict format check
///   corrvec --help                       Print usage

#include "corrvec/correlation_vector.hpp"
#include "corrvec/constants.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

using corrvec::CorrelationVector;

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  corrvec --create [v1|v2]             Print a fresh correlation vector\n"
        "  corrvec --extend <cv> [--strict]     Extend a received vector\n"
        "  corrvec --spin <cv> [--strict] [--fine]\n"
        "                  [--periodicity none|short|medium|long]\n"
        "                  [--entropy 0-4]      Spin a received vector\n"
        "  corrvec --parse <cv>                 Show the parts of a vector\n"
        "  corrvec --increment <cv> [count]     Increment a vector count times\n"
        "  corrvec --validate <cv>              Strict format check\n"
        "  corrvec --help                       Show this help\n"
        "\n"
        "--extend and --spin accept --verbose to report frozen or rejected input.\n"
        "\n"
        "Vectors travel in the '{}' header.\n",
        corrvec::constants::HEADER_NAME
    );
}

std::optional<std::uint64_t> parse_count(std::string_view text) {
    std::uint64_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void print_vector(const CorrelationVector& cv) {
    fmt::print("{}\n", cv.value());
}

void print_parts(const CorrelationVector& cv) {
    fmt::print("value:     {}\n", cv.value());
    fmt::print("base:      {}\n", cv.base_vector());
    fmt::print("extension: {}\n", cv.extension());
    fmt::print("version:   {}\n", corrvec::to_string(cv.version()));
    fmt::print("immutable: {}\n", cv.immutable());
}

int run_create(const std::vector<std::string_view>& args) {
    corrvec::Version version = corrvec::Version::V1;
    if (!args.empty()) {
        if (args[0] == "v2" || args[0] == "V2") {
            version = corrvec::Version::V2;
        } else if (args[0] != "v1" && args[0] != "V1") {
            fmt::print(stderr, "Error: unknown version '{}'\n", args[0]);
            return 1;
        }
    }
    print_vector(CorrelationVector::create(version));
    return 0;
}

/// Parse the options shared by --extend and --spin.
/// Returns false on an unknown or malformed option.
bool parse_derive_options(const std::vector<std::string_view>& args,
                          corrvec::VectorConfig& config,
                          corrvec::SpinParameters& params) {
    for (std::size_t i = 1; i < args.size(); ++i) {
        const auto arg = args[i];
        if (arg == "--strict") {
            config.validate_during_creation = true;
        } else if (arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--fine") {
            params.interval = corrvec::SpinCounterInterval::Fine;
        } else if (arg == "--periodicity" && i + 1 < args.size()) {
            const auto p = args[++i];
            if (p == "none") {
                params.periodicity = corrvec::SpinCounterPeriodicity::None;
            } else if (p == "short") {
                params.periodicity = corrvec::SpinCounterPeriodicity::Short;
            } else if (p == "medium") {
                params.periodicity = corrvec::SpinCounterPeriodicity::Medium;
            } else if (p == "long") {
                params.periodicity = corrvec::SpinCounterPeriodicity::Long;
            } else {
                fmt::print(stderr, "Error: unknown periodicity '{}'\n", p);
                return false;
            }
        } else if (arg == "--entropy" && i + 1 < args.size()) {
            const auto bytes = parse_count(args[++i]);
            if (!bytes || *bytes > 4) {
                fmt::print(stderr, "Error: --entropy expects 0-4\n");
                return false;
            }
            params.entropy = static_cast<corrvec::SpinEntropy>(*bytes);
        } else {
            fmt::print(stderr, "Unknown option: {}\n", arg);
            return false;
        }
    }
    return true;
}

/// --extend and --spin. Returns 0 on success, 1 on error.
int run_derive(bool spin, const std::vector<std::string_view>& args) {
    if (args.empty()) {
        fmt::print(stderr, "Error: {} requires a correlation vector\n",
                   spin ? "--spin" : "--extend");
        return 1;
    }

    corrvec::VectorConfig config;
    corrvec::SpinParameters params;
    if (!parse_derive_options(args, config, params)) {
        return 1;
    }

    auto result = spin ? CorrelationVector::spin(args[0], params, config)
                       : CorrelationVector::extend(args[0], config);
    if (!result) {
        fmt::print(stderr, "Error: {}\n", result.error().to_string());
        return 1;
    }
    print_vector(*result);
    return 0;
}

int run_increment(const std::vector<std::string_view>& args) {
    if (args.empty()) {
        fmt::print(stderr, "Error: --increment requires a correlation vector\n");
        return 1;
    }
    std::uint64_t count = 1;
    if (args.size() > 1) {
        const auto parsed = parse_count(args[1]);
        if (!parsed) {
            fmt::print(stderr, "Error: invalid count '{}'\n", args[1]);
            return 1;
        }
        count = *parsed;
    }

    auto cv = CorrelationVector::parse(args[0]);
    for (std::uint64_t i = 0; i < count; ++i) {
        fmt::print("{}\n", cv.increment());
        if (cv.immutable()) {
            break;
        }
    }
    return 0;
}

int run_validate(const std::vector<std::string_view>& args) {
    if (args.empty()) {
        fmt::print(stderr, "Error: --validate requires a correlation vector\n");
        return 1;
    }
    const auto version = CorrelationVector::infer_version(args[0]);
    const auto error = CorrelationVector::validate(args[0], version);
    if (error) {
        fmt::print(stderr, "Error: {}\n", error->to_string());
        return 1;
    }
    fmt::print("valid {} correlation vector\n", corrvec::to_string(version));
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    const std::string_view mode(argv[1]);
    const std::vector<std::string_view> args(argv + 2, argv + argc);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }
    if (mode == "--create") {
        return run_create(args);
    }
    if (mode == "--extend") {
        return run_derive(false, args);
    }
    if (mode == "--spin") {
        return run_derive(true, args);
    }
    if (mode == "--parse") {
        if (args.empty()) {
            fmt::print(stderr, "Error: --parse requires a correlation vector\n");
            return 1;
        }
        print_parts(CorrelationVector::parse(args[0]));
        return 0;
    }
    if (mode == "--increment") {
        return run_increment(args);
    }
    if (mode == "--validate") {
        return run_validate(args);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
