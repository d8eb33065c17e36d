/**
 * @file thread_pool_adapter_test.cpp
 * @brief Tests for the thread_system backed recognizer executor
 *
 * @copyright Copyright (c) 2025
 */

#include <pii/integration/thread_pool_adapter.hpp>
#include <pii/engine/sanitizer_engine.hpp>

#include "../mocks/mock_entity_recognizer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace pii::integration;
using namespace std::chrono_literals;

namespace {

auto pool_config(std::size_t workers, std::string name = "test_pool") -> thread_pool_config {
    return thread_pool_config{.worker_count = workers, .name = std::move(name)};
}

}  // namespace

TEST_CASE("thread_pool_adapter construction", "[thread_pool_adapter][config]") {
    SECTION("Default configuration") {
        thread_pool_adapter adapter;
        CHECK(adapter.config().worker_count == 2);
        CHECK(adapter.config().name == "pii_recognizer_pool");
    }

    SECTION("Zero workers is raised to one") {
        thread_pool_adapter adapter(pool_config(0));
        CHECK(adapter.config().worker_count == 1);
    }

    SECTION("Null pool is rejected") {
        REQUIRE_THROWS_AS(
            thread_pool_adapter(std::shared_ptr<kcenon::thread::thread_pool>{}),
            std::invalid_argument);
    }
}

// thread_system start() is unstable on some macOS ARM64 builds; pool tests
// are allowed to fail there.

TEST_CASE("thread_pool_adapter lifecycle", "[thread_pool_adapter][pool][!mayfail]") {
    thread_pool_adapter adapter(pool_config(2));

    SECTION("Workers appear on start") {
        REQUIRE_FALSE(adapter.is_running());
        CHECK(adapter.worker_count() == 0);
        REQUIRE(adapter.start());
        REQUIRE(adapter.is_running());
        CHECK(adapter.worker_count() == 2);
    }

    SECTION("start is idempotent") {
        REQUIRE(adapter.start());
        REQUIRE(adapter.start());
        REQUIRE(adapter.is_running());
    }

    SECTION("shutdown stops the workers") {
        REQUIRE(adapter.start());
        adapter.shutdown(true);
        REQUIRE_FALSE(adapter.is_running());
        CHECK(adapter.worker_count() == 0);
    }
}

// =============================================================================
// Job Submission Tests
// =============================================================================

TEST_CASE("thread_pool_adapter job submission",
          "[thread_pool_adapter][submit][!mayfail]") {
    thread_pool_adapter adapter(pool_config(2));

    SECTION("First job starts the workers") {
        std::atomic<bool> ran{false};
        auto future = adapter.enqueue([&ran]() { ran = true; });

        REQUIRE(future.wait_for(5s) == std::future_status::ready);
        future.get();
        REQUIRE(ran.load());
        REQUIRE(adapter.is_running());
    }

    SECTION("Exceptions reach the future") {
        auto future = adapter.enqueue(
            job_priority::high, []() { throw std::runtime_error("job failed"); });

        REQUIRE(future.wait_for(5s) == std::future_status::ready);
        REQUIRE_THROWS_AS(future.get(), std::runtime_error);
    }

    SECTION("Concurrent submissions all run") {
        constexpr int kJobs = 50;
        std::atomic<int> counter{0};
        std::vector<std::future<void>> futures;
        futures.reserve(kJobs);

        for (int i = 0; i < kJobs; ++i) {
            futures.push_back(adapter.enqueue([&counter]() { ++counter; }));
        }
        for (auto& future : futures) {
            REQUIRE(future.wait_for(5s) == std::future_status::ready);
        }
        REQUIRE(counter.load() == kJobs);
    }
}

// =============================================================================
// Engine Tests
// =============================================================================

TEST_CASE("Engine with a real pool", "[thread_pool_adapter][engine][!mayfail]") {
    using pii::detection::testing::mock_entity_recognizer;

    auto pool = std::make_shared<thread_pool_adapter>(pool_config(2, "engine_pool"));
    auto recognizer = std::make_shared<mock_entity_recognizer>();

    SECTION("Recognizer answers in time") {
        pii::engine::sanitizer_engine engine(pii::engine::engine_config{}, recognizer, pool);
        auto report = engine.report("mail john@example.com",
                                    pii::redaction::redaction_policy::generic);
        REQUIRE(report.is_ok());
        REQUIRE(report.value().is_complete());
        REQUIRE(recognizer->get_call_count() == 1);
    }

    SECTION("Slow recognizer is abandoned after the timeout") {
        recognizer->set_behavior(mock_entity_recognizer::behavior::slow);
        recognizer->set_delay(300ms);

        pii::engine::engine_config config;
        config.ner_timeout = 20ms;
        pii::engine::sanitizer_engine engine(config, recognizer, pool);

        auto start = std::chrono::steady_clock::now();
        auto report = engine.report("mail john@example.com",
                                    pii::redaction::redaction_policy::generic);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(report.is_ok());
        REQUIRE_FALSE(report.value().is_complete());
        REQUIRE(report.value().output_text() == "mail [REDACTED_EMAIL]");
        REQUIRE(elapsed < 300ms);
    }

    pool->shutdown(true);
}
