#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace gf {

// Runs task(i) for every i in [0, count) on at most maxConcurrency threads
// and returns the results indexed like the inputs, whatever order the tasks
// finished in. Each task writes only its own slot. Returns after every task
// has completed.
template <typename T>
std::vector<T> fanOut(size_t count, int maxConcurrency, const std::function<T(size_t)>& task)
{
    std::vector<T> results(count);
    if (count == 0) {
        return results;
    }

    const size_t workers = std::min(count, static_cast<size_t>(std::max(maxConcurrency, 1)));
    if (workers == 1) {
        for (size_t i = 0; i < count; ++i) {
            results[i] = task(i);
        }
        return results;
    }

    std::atomic<size_t> next{0};
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&] {
            for (size_t i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                results[i] = task(i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    return results;
}

} // namespace gf
