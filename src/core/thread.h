#pragma once

// Copyright (c) FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace core {

/// Names the calling thread. The full name is kept for log lines; the
/// kernel copy is cut to 15 characters.
void set_thread_name(std::string_view name);

/// Name given to the calling thread, empty if none was set.
std::string_view current_thread_name() noexcept;

/// Number of logical CPU cores, at least 1.
int get_num_cores();

/// Named worker threads joined together. The first exception thrown by
/// any worker is rethrown from join_all() once all of them are done.
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup();

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    void create_thread(std::string name, std::function<void()> func);

    void join_all();

    size_t size() const;

private:
    std::vector<std::thread> take_threads();
    void record_failure(std::exception_ptr error);

    mutable std::mutex mutex_;
    std::vector<std::thread> threads_;
    std::exception_ptr failure_;
};

}  // namespace core
