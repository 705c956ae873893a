#pragma once

#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

// Runs task(0..count-1) on at most max_workers threads and joins them all.
// Results keep input order. The first exception thrown by a task is rethrown
// after every worker has finished.
template <typename T>
std::vector<T> parallel_map(size_t count, size_t max_workers, const std::function<T(size_t)>& task) {
    std::vector<T> results(count);
    if (count == 0) return results;

    size_t workers = std::max<size_t>(1, std::min(count, max_workers));
    std::atomic<size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto worker = [&]() {
        while (true) {
            size_t index = next++;
            if (index >= count) break;
            try {
                results[index] = task(index);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mutex);
                if (!failure) failure = std::current_exception();
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    try {
        for (size_t i = 0; i < workers; ++i) {
            threads.emplace_back(worker);
        }
    } catch (...) {
        // Started workers drain the remaining tasks and must be joined before unwinding
        for (auto& t : threads) {
            t.join();
        }
        throw;
    }
    for (auto& t : threads) {
        t.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
    return results;
}
