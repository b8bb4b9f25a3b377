// Copyright (c) FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/thread.h"
#include "core/logging.h"

#include <algorithm>
#include <utility>

#include <pthread.h>

namespace core {

namespace {
thread_local std::string g_thread_name;
}

void set_thread_name(std::string_view name)
{
    g_thread_name.assign(name);
    char kernel_name[16] = {};
    name.copy(kernel_name, sizeof(kernel_name) - 1);
    pthread_setname_np(pthread_self(), kernel_name);
}

std::string_view current_thread_name() noexcept
{
    return g_thread_name;
}

int get_num_cores()
{
    return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

ThreadGroup::~ThreadGroup()
{
    for (auto& t : take_threads()) {
        if (t.joinable()) t.join();
    }
}

void ThreadGroup::create_thread(std::string name, std::function<void()> func)
{
    auto body = [this, name = std::move(name), func = std::move(func)]() {
        set_thread_name(name);
        try {
            func();
        } catch (const std::exception& e) {
            LOG_ERROR(LogCategory::NONE, "worker failed: " + std::string(e.what()));
            record_failure(std::current_exception());
        }
    };
    std::lock_guard<std::mutex> guard(mutex_);
    threads_.emplace_back(std::move(body));
}

std::vector<std::thread> ThreadGroup::take_threads()
{
    std::lock_guard<std::mutex> guard(mutex_);
    return std::exchange(threads_, {});
}

void ThreadGroup::record_failure(std::exception_ptr error)
{
    std::lock_guard<std::mutex> guard(mutex_);
    if (!failure_) failure_ = std::move(error);
}

void ThreadGroup::join_all()
{
    // Workers lock mutex_ to record failures, so join without holding it.
    for (auto& t : take_threads()) {
        if (t.joinable()) t.join();
    }

    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        failure = std::exchange(failure_, nullptr);
    }
    if (failure) std::rethrow_exception(failure);
}

size_t ThreadGroup::size() const
{
    std::lock_guard<std::mutex> guard(mutex_);
    return threads_.size();
}

}  // namespace core
