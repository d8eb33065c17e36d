/**
 * @file thread_pool_interface.hpp
 * @brief Executor seam used by the sanitizer engine
 *
 * The engine hands the entity recognizer to an executor so that a slow or
 * hung model never blocks the caller past the configured timeout. Production
 * code uses thread_pool_adapter; tests inject testing::mock_thread_pool.
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <string>
#include <utility>

namespace pii::integration {

/// Lower value runs first when the executor honours priorities.
enum class job_priority {
    critical = 0,
    high = 1,
    normal = 2,
    low = 3
};

struct thread_pool_config {
    std::size_t worker_count = 2;
    std::string name = "pii_recognizer_pool";
};

/**
 * @brief Runs recognizer jobs off the calling thread
 *
 * Implementations must accept enqueue() from several threads at once. A job
 * that throws completes its future with that exception; an executor that
 * cannot take the job at all throws std::runtime_error from enqueue().
 */
class thread_pool_interface {
public:
    virtual ~thread_pool_interface() = default;

    /// Idempotent. Returns false when the workers could not be brought up.
    [[nodiscard]] virtual auto start() -> bool = 0;
    [[nodiscard]] virtual auto is_running() const noexcept -> bool = 0;
    virtual void shutdown(bool drain = true) = 0;

    [[nodiscard]] virtual auto enqueue(job_priority priority, std::function<void()> job)
        -> std::future<void> = 0;

    [[nodiscard]] auto enqueue(std::function<void()> job) -> std::future<void> {
        return enqueue(job_priority::normal, std::move(job));
    }

    [[nodiscard]] virtual auto worker_count() const -> std::size_t = 0;
    [[nodiscard]] virtual auto pending_count() const -> std::size_t = 0;

protected:
    thread_pool_interface() = default;

    thread_pool_interface(const thread_pool_interface&) = delete;
    thread_pool_interface& operator=(const thread_pool_interface&) = delete;
};

}  // namespace pii::integration
