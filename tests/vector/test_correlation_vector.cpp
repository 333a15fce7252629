/// @file tests/vector/test_correlation_vector.cpp
/// @brief Tests for CorrelationVector::create, increment and rendering.

#include "corrvec/correlation_vector.hpp"
#include "corrvec/constants.hpp"
#include "scripted_sources.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace corrvec;
using namespace corrvec::constants;
using corrvec::test_support::scripted_config;

namespace {

bool in_charset(const std::string& s) {
    return s.find_first_not_of(BASE64_CHARSET) == std::string::npos;
}

std::vector<std::uint64_t> iota_draws(std::size_t n) {
    std::vector<std::uint64_t> draws(n);
    for (std::size_t i = 0; i < n; ++i) {
        draws[i] = i;
    }
    return draws;
}

/// V1 vector of exactly 63 characters whose last extension is 99.
std::string vector_at_v1_ceiling() {
    std::string s = "KeLbMqOWLU+gL5dq";
    for (int i = 0; i < 22; ++i) {
        s += ".1";
    }
    s += ".99";
    return s;
}

}  // namespace

// ─── create ───────────────────────────────────────────────────────────────────

TEST(CorrelationVectorCreate, V1HasSixteenCharBase) {
    const auto cv = CorrelationVector::create(Version::V1);
    EXPECT_EQ(cv.base_vector().size(), BASE_LENGTH_V1);
    EXPECT_TRUE(in_charset(cv.base_vector()));
    EXPECT_EQ(cv.extension(), 0u);
    EXPECT_FALSE(cv.immutable());
    EXPECT_EQ(cv.version(), Version::V1);
    EXPECT_EQ(cv.value(), cv.base_vector() + ".0");
}

TEST(CorrelationVectorCreate, V2HasTwentyTwoCharBase) {
    const auto cv = CorrelationVector::create(Version::V2);
    EXPECT_EQ(cv.base_vector().size(), BASE_LENGTH_V2);
    EXPECT_TRUE(in_charset(cv.base_vector()));
    EXPECT_EQ(cv.extension(), 0u);
    EXPECT_FALSE(cv.immutable());
    EXPECT_EQ(cv.version(), Version::V2);
}

TEST(CorrelationVectorCreate, DefaultsToV1) {
    EXPECT_EQ(CorrelationVector::create().version(), Version::V1);
}

TEST(CorrelationVectorCreate, ManyFreshVectorsStayInAlphabet) {
    for (int i = 0; i < 500; ++i) {
        const auto cv = CorrelationVector::create(i % 2 ? Version::V2 : Version::V1);
        ASSERT_TRUE(in_charset(cv.base_vector())) << cv.value();
        ASSERT_FALSE(cv.immutable());
    }
}

TEST(CorrelationVectorCreate, BaseDrawnFromInjectedSource) {
    const auto config = scripted_config(iota_draws(16));
    const auto cv = CorrelationVector::create(Version::V1, config);
    EXPECT_EQ(cv.value(), "ABCDEFGHIJKLMNOP.0");
}

TEST(CorrelationVectorCreate, EachCharacterDrawsBelowSixtyFour) {
    auto source = std::make_shared<corrvec::test_support::ScriptedRandomSource>(
        std::vector<std::uint64_t>{63, 62, 26});
    VectorConfig config;
    config.random = source;
    const auto cv = CorrelationVector::create(Version::V2, config);
    ASSERT_EQ(source->bounds().size(), BASE_LENGTH_V2);
    for (auto bound : source->bounds()) {
        EXPECT_EQ(bound, 64u);
    }
    EXPECT_EQ(cv.base_vector().substr(0, 3), "/+a");
}

TEST(CorrelationVectorCreate, DrawIndexesAlphabetDirectly) {
    std::vector<std::uint64_t> draws;
    for (std::uint64_t i = 42; i < 64; ++i) {
        draws.push_back(i);
    }
    const auto cv = CorrelationVector::create(Version::V2, scripted_config(draws));
    EXPECT_EQ(cv.base_vector(), BASE64_CHARSET.substr(42));
}

TEST(CorrelationVectorCreate, NullRandomSourceFallsBackToDefault) {
    VectorConfig config;
    config.random = nullptr;
    const auto cv = CorrelationVector::create(Version::V1, config);
    EXPECT_EQ(cv.base_vector().size(), BASE_LENGTH_V1);
}

// ─── increment ────────────────────────────────────────────────────────────────

TEST(CorrelationVectorIncrement, ReturnsNewValue) {
    auto cv = CorrelationVector::parse("KeLbMqOWLU+gL5dq.0");
    EXPECT_EQ(cv.increment(), "KeLbMqOWLU+gL5dq.1");
    EXPECT_EQ(cv.extension(), 1u);
    EXPECT_EQ(cv.value(), "KeLbMqOWLU+gL5dq.1");
}

TEST(CorrelationVectorIncrement, KIncrementsYieldBaseDotK) {
    auto cv = CorrelationVector::create(Version::V1);
    const std::string base = cv.base_vector();
    for (int k = 1; k <= 250; ++k) {
        ASSERT_EQ(cv.increment(), base + "." + std::to_string(k));
    }
    EXPECT_EQ(cv.value(), base + ".250");
    EXPECT_FALSE(cv.immutable());
}

TEST(CorrelationVectorIncrement, FrozenVectorIsNoOp) {
    auto cv = CorrelationVector::parse("KeLbMqOWLU+gL5dqi3L5YA.5!");
    ASSERT_TRUE(cv.immutable());
    EXPECT_EQ(cv.increment(), "KeLbMqOWLU+gL5dqi3L5YA.5!");
    EXPECT_EQ(cv.extension(), 5u);
}

TEST(CorrelationVectorIncrement, AtV1CeilingFreezesAndKeepsValue) {
    const std::string at_ceiling = vector_at_v1_ceiling();
    ASSERT_EQ(at_ceiling.size(), MAX_VECTOR_LENGTH_V1);

    auto cv = CorrelationVector::parse(at_ceiling);
    ASSERT_FALSE(cv.immutable());
    ASSERT_EQ(cv.extension(), 99u);

    EXPECT_EQ(cv.increment(), at_ceiling + "!");
    EXPECT_TRUE(cv.immutable());
    EXPECT_EQ(cv.extension(), 99u);

    // Frozen for good.
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(cv.increment(), at_ceiling + "!");
    }
}

TEST(CorrelationVectorIncrement, SameDigitCountStillFitsAtCeiling) {
    // 63 characters ending in ".1": 1 → 2 does not grow the string.
    std::string s = "KeLbMqOWLU+gL5dq.0";
    while (s.size() + 2 <= MAX_VECTOR_LENGTH_V1) {
        s += ".1";
    }
    s += "1";  // last segment becomes "11", length 63
    ASSERT_EQ(s.size(), MAX_VECTOR_LENGTH_V1);

    auto cv = CorrelationVector::parse(s);
    EXPECT_EQ(cv.increment(), s.substr(0, s.size() - 2) + "12");
    EXPECT_FALSE(cv.immutable());
}

TEST(CorrelationVectorIncrement, V2AllowsLongerValues) {
    std::string s = "KeLbMqOWLU+gL5dqi3L5YA";
    while (s.size() + 2 <= 100) {
        s += ".1";
    }
    s += ".9";
    auto cv = CorrelationVector::parse(s);
    ASSERT_EQ(cv.version(), Version::V2);
    EXPECT_EQ(cv.increment(), s.substr(0, s.size() - 1) + "10");
    EXPECT_FALSE(cv.immutable());
}

TEST(CorrelationVectorIncrement, MaxExtensionIsNoOp) {
    const std::string max = std::to_string(std::numeric_limits<std::uint64_t>::max());
    const std::string s = "KeLbMqOWLU+gL5dq." + max;
    auto cv = CorrelationVector::parse(s);
    ASSERT_EQ(cv.extension(), std::numeric_limits<std::uint64_t>::max());
    EXPECT_EQ(cv.increment(), s);
    EXPECT_EQ(cv.value(), s);
    EXPECT_FALSE(cv.immutable());
}

// ─── value / equality ─────────────────────────────────────────────────────────

TEST(CorrelationVectorValue, ToStringMatchesValue) {
    const auto cv = CorrelationVector::parse("KeLbMqOWLU+gL5dq.7.3");
    EXPECT_EQ(cv.to_string(), cv.value());
    EXPECT_EQ(cv.value(), "KeLbMqOWLU+gL5dq.7.3");
}

TEST(CorrelationVectorValue, ImmutableCarriesTerminationSign) {
    const auto cv = CorrelationVector::parse("KeLbMqOWLU+gL5dq.2!");
    EXPECT_EQ(cv.value().back(), TERMINATION_SIGN);
}

TEST(CorrelationVectorValue, EqualityComparesAllFields) {
    const auto a = CorrelationVector::parse("KeLbMqOWLU+gL5dq.2");
    const auto b = CorrelationVector::parse("KeLbMqOWLU+gL5dq.2");
    const auto c = CorrelationVector::parse("KeLbMqOWLU+gL5dq.2!");
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

TEST(CorrelationVectorValue, HeaderNameIsMsCv) {
    EXPECT_EQ(HEADER_NAME, "MS-CV");
}
