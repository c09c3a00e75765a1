// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool.h
 * @brief Worker pool abstraction for concurrent sender sessions
 *
 * The sender runs its accept loop and one task per inbound stream on a
 * worker pool. Each task owns its stream; tasks share no transfer state.
 *
 * Implementations, in order of preference:
 * - thread_system_worker_pool (KCENON_WITH_THREAD_SYSTEM)
 * - network_worker_pool (KCENON_WITH_NETWORK_SYSTEM)
 * - async_worker_pool (std::async fallback)
 */

#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::fastdrop::adapters {

/// Stage name for the sender's accept loop
inline constexpr const char* accept_stage = "sender_accept";

/// Stage name for per-peer sender sessions
inline constexpr const char* session_stage = "sender_session";

/**
 * @brief Worker pool interface
 */
class worker_pool_interface {
public:
    virtual ~worker_pool_interface() = default;

    /**
     * @brief Submit a task for execution
     * @return Future for the task completion
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task and count it against a stage until it finishes
     * @param stage_name e.g. session_stage
     */
    virtual std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) = 0;

    [[nodiscard]] virtual size_t worker_count() const = 0;

    [[nodiscard]] virtual bool is_running() const = 0;

    /**
     * @brief Tasks of a stage that have been submitted but not finished
     */
    [[nodiscard]] virtual size_t active_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Worker pool backed by thread_system::thread_pool
 *
 * @note Thread-safe: All public methods are safe to call from multiple threads.
 */
class thread_system_worker_pool : public worker_pool_interface {
public:
    explicit thread_system_worker_pool(
        std::shared_ptr<kcenon::thread::thread_pool> pool,
        const std::string& pool_name = "fastdrop_pool",
        size_t worker_count = 0);

    ~thread_system_worker_pool() override;

    thread_system_worker_pool(const thread_system_worker_pool&) = delete;
    thread_system_worker_pool& operator=(const thread_system_worker_pool&) = delete;

    /**
     * @brief Create and start a pool
     * @param worker_count Number of worker threads (0 = hardware concurrency, at least 2)
     */
    [[nodiscard]] static std::shared_ptr<thread_system_worker_pool> create_default(
        size_t worker_count = 0,
        const std::string& pool_name = "fastdrop_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t active_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::shared_ptr<kcenon::thread::thread_pool> underlying_pool() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Worker pool sharing network_system's thread pool
 */
class network_worker_pool : public worker_pool_interface {
public:
    explicit network_worker_pool(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
        const std::string& pool_name = "fastdrop_pool");

    ~network_worker_pool() override;

    network_worker_pool(const network_worker_pool&) = delete;
    network_worker_pool& operator=(const network_worker_pool&) = delete;

    /**
     * @brief Create a pool on network_system's basic_thread_pool
     */
    [[nodiscard]] static std::shared_ptr<network_worker_pool> create_basic(
        size_t worker_count = 0,
        const std::string& pool_name = "fastdrop_pool");

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t active_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Fallback: one std::async thread per task
 *
 * worker_count() reports hardware concurrency; there is no queue, so every
 * submitted task starts immediately.
 */
class async_worker_pool : public worker_pool_interface {
public:
    async_worker_pool();
    ~async_worker_pool() override;

    async_worker_pool(const async_worker_pool&) = delete;
    async_worker_pool& operator=(const async_worker_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(
        std::function<void()> task,
        const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] bool is_running() const override;
    [[nodiscard]] size_t active_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects the best available worker pool
 */
class worker_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<worker_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "fastdrop_pool");

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

}  // namespace kcenon::fastdrop::adapters
