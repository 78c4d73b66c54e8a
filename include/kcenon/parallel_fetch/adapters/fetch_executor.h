// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file fetch_executor.h
 * @brief Executors running the concurrent chunk fetches of a download
 *
 * The orchestrator dispatches one task per planned range and joins all of
 * them before validation. Executors decide where those tasks run:
 * - thread_system's thread_pool when available
 * - network_system's basic_thread_pool when only network_system is present
 * - one std::async task per chunk otherwise
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::parallel_fetch::adapters {

/**
 * @brief Interface for running chunk fetch tasks
 *
 * @note A task that throws stores the exception in its future.
 */
class fetch_executor_interface {
public:
    virtual ~fetch_executor_interface() = default;

    /**
     * @brief Submit a task for execution
     * @param task The task to execute
     * @return Future completed when the task has finished
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Number of tasks that can run at the same time
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Number of submitted tasks that have not finished yet
     */
    [[nodiscard]] virtual size_t pending_tasks() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor backed by thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_fetch_executor : public fetch_executor_interface {
public:
    /**
     * @brief Construct with an existing thread_pool
     * @param pool Shared pointer to thread_system's thread_pool
     * @param worker_count Number of workers in the pool (for reporting)
     */
    explicit thread_system_fetch_executor(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        size_t worker_count = 0);

    ~thread_system_fetch_executor() override;

    thread_system_fetch_executor(const thread_system_fetch_executor&) = delete;
    thread_system_fetch_executor& operator=(const thread_system_fetch_executor&) = delete;

    /**
     * @brief Create a started pool with the given number of workers
     * @param worker_count Number of worker threads (0 = hardware concurrency)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_fetch_executor> create(
        size_t worker_count = 0);

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Executor backed by network_system's thread_pool_interface
 *
 * Used when thread_system is not available but network_system is, so the
 * fetches share the pool family of the transport.
 */
class network_pool_fetch_executor : public fetch_executor_interface {
public:
    explicit network_pool_fetch_executor(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool);

    ~network_pool_fetch_executor() override;

    network_pool_fetch_executor(const network_pool_fetch_executor&) = delete;
    network_pool_fetch_executor& operator=(const network_pool_fetch_executor&) = delete;

    /**
     * @brief Create an executor over network_system's basic_thread_pool
     * @param worker_count Number of worker threads (0 = auto-detect)
     */
    [[nodiscard]] static std::shared_ptr<network_pool_fetch_executor> create(
        size_t worker_count = 0);

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fallback executor running every task on its own std::async thread
 *
 * All chunks of a download run at once, which matches a requested
 * parallelism equal to the number of planned ranges.
 */
class async_fetch_executor : public fetch_executor_interface {
public:
    async_fetch_executor();
    ~async_fetch_executor() override;

    async_fetch_executor(const async_fetch_executor&) = delete;
    async_fetch_executor& operator=(const async_fetch_executor&) = delete;

    std::future<void> submit(std::function<void()> task) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t pending_tasks() const override;

private:
    struct impl;
    std::shared_ptr<impl> pimpl_;
};

/**
 * @brief Factory selecting the best available executor
 *
 * Priority:
 * 1. thread_system_fetch_executor (when KCENON_WITH_THREAD_SYSTEM)
 * 2. network_pool_fetch_executor (when KCENON_WITH_NETWORK_SYSTEM only)
 * 3. async_fetch_executor (fallback)
 */
class fetch_executor_factory {
public:
    /**
     * @brief Create the best available executor
     * @param worker_count Number of concurrent fetches (0 = auto-detect)
     */
    [[nodiscard]] static std::shared_ptr<fetch_executor_interface> create(
        size_t worker_count = 0);

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }

    [[nodiscard]] static constexpr bool has_network_pool() noexcept {
#if KCENON_WITH_NETWORK_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::parallel_fetch::adapters
