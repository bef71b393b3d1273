/**
 * @file TestError.cpp
 * @brief Unit tests for core::Error and the Expected helpers.
 */

#include <catch2/catch_test_macros.hpp>

#include "aur/core/Expected.hpp"

#include <string>

namespace aur::core {

namespace {

Expected<int> parseLength(int value)
{
    if (value <= 0)
        return makeError(ErrorCode::kInvalidLength, "length must be positive");
    return value;
}

Expected<int> doubled(int value)
{
    const int parsed = AUR_TRY(parseLength(value));
    return parsed * 2;
}

ExpectedVoid checkRate(u32 rate)
{
    if (rate != 44'100)
        return makeSampleRateError(rate, 44'100, "rate mismatch");
    return {};
}

ExpectedVoid checkTwice(u32 rate)
{
    AUR_TRY_VOID(checkRate(rate));
    AUR_TRY_VOID(checkRate(rate));
    return {};
}

} // namespace

TEST_CASE("errorCodeName labels every code", "[core][error]")
{
    REQUIRE(errorCodeName(ErrorCode::kNone) == "None");
    REQUIRE(errorCodeName(ErrorCode::kIoError) == "IoError");
    REQUIRE(errorCodeName(ErrorCode::kInvalidFileFormat) == "InvalidFileFormat");
    REQUIRE(errorCodeName(ErrorCode::kInvalidSampleRate) == "InvalidSampleRate");
    REQUIRE(errorCodeName(ErrorCode::kInvalidLength) == "InvalidLength");
}

TEST_CASE("Error carries code, message and location", "[core][error]")
{
    const auto result = parseLength(-1);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == ErrorCode::kInvalidLength);
    REQUIRE(result.error().message() == "length must be positive");
    REQUIRE_FALSE(result.error().sampleRates().has_value());

    const std::string text = result.error().format();
    REQUIRE(text.starts_with("[InvalidLength] length must be positive"));
    REQUIRE(text.find("TestError.cpp") != std::string::npos);
}

TEST_CASE("Sample rate errors report both rates", "[core][error]")
{
    const auto result = checkRate(48'000);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code() == ErrorCode::kInvalidSampleRate);

    const auto rates = result.error().sampleRates();
    REQUIRE(rates.has_value());
    REQUIRE(rates->actual == 48'000);
    REQUIRE(rates->required == 44'100);

    const std::string text = result.error().format();
    REQUIRE(text.find("48000") != std::string::npos);
    REQUIRE(text.find("44100") != std::string::npos);
}

TEST_CASE("AUR_TRY propagates errors and unwraps values", "[core][expected]")
{
    SECTION("success")
    {
        const auto result = doubled(21);
        REQUIRE(result.has_value());
        REQUIRE(*result == 42);
    }

    SECTION("failure")
    {
        const auto result = doubled(0);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code() == ErrorCode::kInvalidLength);
    }

    SECTION("void")
    {
        REQUIRE(checkTwice(44'100).has_value());
        REQUIRE(checkTwice(22'050).error().code() == ErrorCode::kInvalidSampleRate);
    }
}

} // namespace aur::core
