/**
 * @file log_guard_test.cpp
 * @brief Tests for log entry gating
 *
 * @copyright Copyright (c) 2025
 */

#include <catch2/catch_test_macros.hpp>

#include "pii/detection/rule_based_recognizer.hpp"
#include "pii/engine/log_guard.hpp"

#include "../mocks/mock_thread_pool.hpp"

using namespace pii;
using namespace pii::engine;
using pii::integration::testing::mock_thread_pool;

namespace {

auto shared_engine() -> std::shared_ptr<const sanitizer_engine> {
    return std::make_shared<const sanitizer_engine>(
        engine_config{}, std::make_shared<detection::rule_based_recognizer>(),
        std::make_shared<mock_thread_pool>());
}

auto decide(log_mode mode, std::string_view entry) -> log_decision {
    log_guard guard(shared_engine(), mode);
    auto result = guard.evaluate(entry);
    REQUIRE(result.is_ok());
    return result.value();
}

} // namespace

TEST_CASE("Log mode names", "[engine][log_guard]") {
    auto block = parse_log_mode("BLOCK");
    REQUIRE(block.is_ok());
    CHECK(block.value() == log_mode::block);

    auto mask = parse_log_mode("mask");
    REQUIRE(mask.is_ok());
    CHECK(mask.value() == log_mode::mask);

    auto unknown = parse_log_mode("drop");
    REQUIRE(unknown.is_err());
    CHECK(unknown.error().code == error_codes::invalid_configuration);
}

TEST_CASE("Clean entries pass in every mode", "[engine][log_guard]") {
    for (auto mode : {log_mode::block, log_mode::mask, log_mode::log}) {
        auto decision = decide(mode, "cache warmed in 12 ms");
        CHECK_FALSE(decision.contains_pii);
        CHECK(decision.loggable);
        CHECK(decision.text == "cache warmed in 12 ms");
        CHECK(decision.pii_count == 0);
    }
}

TEST_CASE("Entries with PII", "[engine][log_guard]") {
    std::string entry = "login failed for john@example.com";

    SECTION("Block") {
        auto decision = decide(log_mode::block, entry);
        CHECK(decision.contains_pii);
        CHECK_FALSE(decision.loggable);
        CHECK(decision.text.empty());
        CHECK(decision.pii_count == 1);
    }

    SECTION("Mask") {
        auto decision = decide(log_mode::mask, entry);
        CHECK(decision.contains_pii);
        CHECK(decision.loggable);
        CHECK(decision.text == "login failed for [REDACTED_EMAIL]");
    }

    SECTION("Log") {
        auto decision = decide(log_mode::log, entry);
        CHECK(decision.contains_pii);
        CHECK(decision.loggable);
        CHECK(decision.text == entry);
    }
}

TEST_CASE("Null engine is rejected", "[engine][log_guard]") {
    CHECK_THROWS_AS(log_guard(nullptr, log_mode::mask), std::invalid_argument);
}
