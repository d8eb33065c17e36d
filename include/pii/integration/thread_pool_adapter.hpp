/**
 * @file thread_pool_adapter.hpp
 * @brief thread_pool_interface backed by kcenon::thread::thread_pool
 *
 * @copyright Copyright (c) 2025
 */

#pragma once

#include <pii/integration/thread_pool_interface.hpp>

#include <cstddef>
#include <memory>
#include <mutex>

namespace kcenon::thread {
class thread_pool;
}  // namespace kcenon::thread

namespace pii::integration {

/**
 * @brief Recognizer executor on top of thread_system
 *
 * Workers are created on start() or, failing that, on the first enqueue().
 * thread_system's base pool has a single FIFO queue, so job_priority is
 * accepted but not reordered.
 */
class thread_pool_adapter final : public thread_pool_interface {
public:
    /// worker_count of zero is raised to one.
    explicit thread_pool_adapter(thread_pool_config config = {});

    /// Adopts a pool that already has its workers. Throws std::invalid_argument on null.
    explicit thread_pool_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool);

    ~thread_pool_adapter() override;

    thread_pool_adapter(const thread_pool_adapter&) = delete;
    thread_pool_adapter& operator=(const thread_pool_adapter&) = delete;

    [[nodiscard]] auto start() -> bool override;
    [[nodiscard]] auto is_running() const noexcept -> bool override;
    void shutdown(bool drain = true) override;

    using thread_pool_interface::enqueue;
    [[nodiscard]] auto enqueue(job_priority priority, std::function<void()> job)
        -> std::future<void> override;

    [[nodiscard]] auto worker_count() const -> std::size_t override;
    [[nodiscard]] auto pending_count() const -> std::size_t override;

    [[nodiscard]] auto config() const noexcept -> const thread_pool_config& { return config_; }

private:
    [[nodiscard]] auto start_locked() -> bool;

    thread_pool_config config_;
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    mutable std::mutex mutex_;
    bool started_{false};
};

}  // namespace pii::integration
