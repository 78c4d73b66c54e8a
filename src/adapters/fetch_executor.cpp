// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file fetch_executor.cpp
 * @brief Executor implementations for concurrent chunk fetches
 */

#include "kcenon/parallel_fetch/adapters/fetch_executor.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::parallel_fetch::adapters {

namespace {

auto default_worker_count() -> size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

}  // namespace

// ============================================================================
// thread_system_fetch_executor implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job running one chunk fetch on a thread_system worker
 */
class fetch_job : public kcenon::thread::job {
public:
    explicit fetch_job(std::function<void()> func)
        : job("chunk_fetch"), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_fetch_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    size_t worker_count{0};
    std::atomic<size_t> in_flight{0};
};

thread_system_fetch_executor::thread_system_fetch_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->worker_count = worker_count;
}

thread_system_fetch_executor::~thread_system_fetch_executor() = default;

std::shared_ptr<thread_system_fetch_executor>
thread_system_fetch_executor::create(size_t worker_count) {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>("parallel_fetch_pool");

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_fetch_executor>(std::move(pool), worker_count);
}

std::future<void> thread_system_fetch_executor::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    pimpl_->in_flight.fetch_add(1, std::memory_order_relaxed);
    auto* counter = &pimpl_->in_flight;
    auto wrapped = [task = std::move(task), promise, counter]() {
        try {
            task();
        } catch (...) {
            counter->fetch_sub(1, std::memory_order_relaxed);
            promise->set_exception(std::current_exception());
            return;
        }
        counter->fetch_sub(1, std::memory_order_relaxed);
        promise->set_value();
    };

    pimpl_->pool->enqueue(std::make_unique<fetch_job>(std::move(wrapped)));
    return future;
}

size_t thread_system_fetch_executor::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_fetch_executor::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_fetch_executor::pending_tasks() const {
    return pimpl_->in_flight.load(std::memory_order_relaxed);
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_pool_fetch_executor implementation
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_pool_fetch_executor::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
};

network_pool_fetch_executor::network_pool_fetch_executor(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
}

network_pool_fetch_executor::~network_pool_fetch_executor() = default;

std::shared_ptr<network_pool_fetch_executor>
network_pool_fetch_executor::create(size_t worker_count) {
    auto pool =
        std::make_shared<kcenon::network::integration::basic_thread_pool>(worker_count);
    return std::make_shared<network_pool_fetch_executor>(std::move(pool));
}

std::future<void> network_pool_fetch_executor::submit(std::function<void()> task) {
    return pimpl_->pool->submit(std::move(task));
}

size_t network_pool_fetch_executor::worker_count() const {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

bool network_pool_fetch_executor::is_running() const {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

size_t network_pool_fetch_executor::pending_tasks() const {
    return pimpl_->pool ? pimpl_->pool->pending_tasks() : 0;
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// async_fetch_executor implementation
// ============================================================================

struct async_fetch_executor::impl {
    std::atomic<size_t> active_tasks{0};
};

async_fetch_executor::async_fetch_executor() : pimpl_(std::make_shared<impl>()) {}

async_fetch_executor::~async_fetch_executor() = default;

std::future<void> async_fetch_executor::submit(std::function<void()> task) {
    pimpl_->active_tasks.fetch_add(1, std::memory_order_relaxed);

    // Tasks keep the state alive in case the executor is released first
    auto state = pimpl_;
    return std::async(std::launch::async, [state, task = std::move(task)]() {
        try {
            task();
        } catch (...) {
            state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
            throw;
        }
        state->active_tasks.fetch_sub(1, std::memory_order_relaxed);
    });
}

size_t async_fetch_executor::worker_count() const {
    return default_worker_count();
}

bool async_fetch_executor::is_running() const { return true; }

size_t async_fetch_executor::pending_tasks() const {
    return pimpl_->active_tasks.load(std::memory_order_relaxed);
}

// ============================================================================
// fetch_executor_factory implementation
// ============================================================================

std::shared_ptr<fetch_executor_interface> fetch_executor_factory::create(
    size_t worker_count) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_fetch_executor::create(worker_count);
#elif KCENON_WITH_NETWORK_SYSTEM
    return network_pool_fetch_executor::create(worker_count);
#else
    (void)worker_count;
    return std::make_shared<async_fetch_executor>();
#endif
}

}  // namespace kcenon::parallel_fetch::adapters
