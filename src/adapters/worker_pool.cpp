// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file worker_pool.cpp
 * @brief Worker pool implementations for fastdrop
 */

#include "kcenon/fastdrop/adapters/worker_pool.h"

#include <algorithm>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::fastdrop::adapters {

namespace {

/**
 * @brief Per-stage in-flight task counts
 */
class stage_counter {
public:
    void enter(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void leave(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it == counts_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

/**
 * @brief Leaves the stage when the task returns or throws
 */
class stage_scope {
public:
    stage_scope(stage_counter& counter, std::string stage)
        : counter_(counter), stage_(std::move(stage)) {}
    ~stage_scope() { counter_.leave(stage_); }

    stage_scope(const stage_scope&) = delete;
    stage_scope& operator=(const stage_scope&) = delete;

private:
    stage_counter& counter_;
    std::string stage_;
};

auto default_worker_count(size_t requested) -> size_t {
    if (requested == 0) {
        requested = std::thread::hardware_concurrency();
    }
    // The accept loop holds one worker for the pool's lifetime
    return std::max<size_t>(requested, 2);
}

}  // namespace

// ============================================================================
// thread_system_worker_pool implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_worker_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    stage_counter stages;

    auto enqueue(std::function<void()> task, const std::string& job_name) -> std::future<void> {
        auto promise = std::make_shared<std::promise<void>>();
        auto future = promise->get_future();

        auto wrapped = [task = std::move(task), promise]() {
            try {
                task();
                promise->set_value();
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        };

        pool->enqueue(std::make_unique<function_job>(std::move(wrapped), job_name));
        return future;
    }
};

thread_system_worker_pool::thread_system_worker_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_worker_pool::~thread_system_worker_pool() = default;

std::shared_ptr<thread_system_worker_pool> thread_system_worker_pool::create_default(
    size_t worker_count, const std::string& pool_name) {
    worker_count = default_worker_count(worker_count);

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_worker_pool>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_worker_pool::submit(std::function<void()> task) {
    return pimpl_->enqueue(std::move(task), "fastdrop_task");
}

std::future<void> thread_system_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->stages.enter(stage_name);

    auto* stages = &pimpl_->stages;
    auto staged = [task = std::move(task), stages, stage = stage_name]() {
        stage_scope scope(*stages, stage);
        task();
    };
    return pimpl_->enqueue(std::move(staged), stage_name);
}

size_t thread_system_worker_pool::worker_count() const {
    return pimpl_->worker_count;
}

bool thread_system_worker_pool::is_running() const {
    return pimpl_->pool != nullptr;
}

size_t thread_system_worker_pool::active_tasks(const std::string& stage_name) const {
    return pimpl_->stages.count(stage_name);
}

std::shared_ptr<kcenon::thread::thread_pool> thread_system_worker_pool::underlying_pool() const {
    return pimpl_->pool;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_worker_pool implementation
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

struct network_worker_pool::impl {
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool;
    std::string pool_name;
    stage_counter stages;
};

network_worker_pool::network_worker_pool(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool,
    const std::string& pool_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
}

network_worker_pool::~network_worker_pool() = default;

std::shared_ptr<network_worker_pool> network_worker_pool::create_basic(
    size_t worker_count, const std::string& pool_name) {
    auto pool = std::make_shared<kcenon::network::integration::basic_thread_pool>(
        default_worker_count(worker_count));
    return std::make_shared<network_worker_pool>(std::move(pool), pool_name);
}

std::future<void> network_worker_pool::submit(std::function<void()> task) {
    return pimpl_->pool->submit(std::move(task));
}

std::future<void> network_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->stages.enter(stage_name);

    auto* stages = &pimpl_->stages;
    auto staged = [task = std::move(task), stages, stage = stage_name]() {
        stage_scope scope(*stages, stage);
        task();
    };
    return pimpl_->pool->submit(std::move(staged));
}

size_t network_worker_pool::worker_count() const {
    return pimpl_->pool ? pimpl_->pool->worker_count() : 0;
}

bool network_worker_pool::is_running() const {
    return pimpl_->pool ? pimpl_->pool->is_running() : false;
}

size_t network_worker_pool::active_tasks(const std::string& stage_name) const {
    return pimpl_->stages.count(stage_name);
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// async_worker_pool implementation
// ============================================================================

struct async_worker_pool::impl {
    stage_counter stages;
};

async_worker_pool::async_worker_pool() : pimpl_(std::make_unique<impl>()) {}

async_worker_pool::~async_worker_pool() = default;

std::future<void> async_worker_pool::submit(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

std::future<void> async_worker_pool::submit_to_stage(
    std::function<void()> task, const std::string& stage_name) {
    pimpl_->stages.enter(stage_name);

    auto* stages = &pimpl_->stages;
    return std::async(std::launch::async, [task = std::move(task), stages, stage = stage_name]() {
        stage_scope scope(*stages, stage);
        task();
    });
}

size_t async_worker_pool::worker_count() const {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

bool async_worker_pool::is_running() const { return true; }

size_t async_worker_pool::active_tasks(const std::string& stage_name) const {
    return pimpl_->stages.count(stage_name);
}

// ============================================================================
// worker_pool_factory implementation
// ============================================================================

std::shared_ptr<worker_pool_interface> worker_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_worker_pool::create_default(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    return network_worker_pool::create_basic(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_worker_pool>();
#endif
}

}  // namespace kcenon::fastdrop::adapters
