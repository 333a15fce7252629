/**
 * @file  fuzz_parse.cpp
 * @brief libFuzzer target for parse / extend / spin / increment.
 *
 * Build:
 *   cmake -DCORRVEC_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_parse
 *
 * Run for 60 seconds:
 *   ./fuzz_parse -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. parse() always yields a vector whose value re-parses to itself.
 *   3. Lenient extend() and spin() always yield a vector.
 *   4. Strict extend() either yields a vector or a FormatError, never both.
 *   5. A frozen vector's value never changes under increment().
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "corrvec/correlation_vector.hpp"
#include "corrvec/constants.hpp"

using namespace corrvec;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    // Invariant 2: parse round-trips whatever it produced.
    auto parsed = CorrelationVector::parse(input);
    const std::string value = parsed.value();
    assert(CorrelationVector::parse(value).value() == value);

    // Invariant 3: lenient derivations never fail.
    const auto extended = CorrelationVector::extend(input);
    assert(extended.has_value());
    const auto spun = CorrelationVector::spin(input);
    assert(spun.has_value());

    // Invariant 4: strict mode agrees with validate().
    VectorConfig strict;
    strict.validate_during_creation = true;
    const auto checked = CorrelationVector::extend(input, strict);
    if (!CorrelationVector::is_immutable(input)) {
        const auto error = CorrelationVector::validate(
            input, CorrelationVector::infer_version(input));
        assert(checked.has_value() == !error.has_value());
    }

    // Invariant 5: frozen values are stable.
    for (int i = 0; i < 4; ++i) {
        const bool was_frozen = parsed.immutable();
        const std::string before = parsed.value();
        const std::string after  = parsed.increment();
        if (was_frozen) {
            assert(after == before);
        }
    }

    return 0;
}
