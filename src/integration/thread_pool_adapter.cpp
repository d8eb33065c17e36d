/**
 * @file thread_pool_adapter.cpp
 * @brief Implementation of thread_pool_adapter
 *
 * @copyright Copyright (c) 2025
 */

#include <pii/integration/thread_pool_adapter.hpp>

#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/interfaces/thread_context.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pii::integration {

namespace {

auto make_pool(const std::string& name) -> std::shared_ptr<kcenon::thread::thread_pool> {
    kcenon::thread::thread_context context;
    return std::make_shared<kcenon::thread::thread_pool>(name, context);
}

}  // namespace

thread_pool_adapter::thread_pool_adapter(thread_pool_config config)
    : config_(std::move(config)) {
    if (config_.worker_count == 0) {
        config_.worker_count = 1;
    }
    pool_ = make_pool(config_.name);
}

thread_pool_adapter::thread_pool_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool)
    : pool_(std::move(pool)), started_(true) {
    if (!pool_) {
        throw std::invalid_argument("thread_pool_adapter: pool is null");
    }
}

thread_pool_adapter::~thread_pool_adapter() {
    shutdown(true);
}

auto thread_pool_adapter::start() -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_locked();
}

auto thread_pool_adapter::start_locked() -> bool {
    if (started_ && pool_ && pool_->is_running()) {
        return true;
    }
    if (!pool_) {
        pool_ = make_pool(config_.name);
    }

    kcenon::thread::thread_context context;
    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(config_.worker_count);
    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>(false, context));
    }

    if (pool_->enqueue_batch(std::move(workers)).is_err()) {
        return false;
    }
    if (pool_->start().is_err()) {
        return false;
    }

    started_ = true;
    return true;
}

auto thread_pool_adapter::is_running() const noexcept -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ && pool_->is_running();
}

void thread_pool_adapter::shutdown(bool drain) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_ && pool_->is_running()) {
        // stop(true) discards queued jobs
        pool_->stop(!drain);
    }
    started_ = false;
}

auto thread_pool_adapter::enqueue(job_priority /*priority*/, std::function<void()> job)
    -> std::future<void> {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!(started_ && pool_ && pool_->is_running()) && !start_locked()) {
        throw std::runtime_error("thread_pool_adapter: workers could not be started");
    }

    try {
        (void)pool_->submit([job = std::move(job), promise]() mutable {
            try {
                job();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("thread_pool_adapter: submit failed: ") + e.what());
    }
    return future;
}

auto thread_pool_adapter::worker_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ ? config_.worker_count : 0;
}

auto thread_pool_adapter::pending_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ ? pool_->get_pending_task_count() : 0;
}

}  // namespace pii::integration
