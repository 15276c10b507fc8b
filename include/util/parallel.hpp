#pragma once
#include <algorithm>
#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace par
{

// Runs fn(i) for every i in [0, n) on up to `threads` workers. Each index runs exactly once;
// fn must only touch state owned by index i. threads <= 1 runs inline on the caller.
inline void for_each_index(std::size_t n, unsigned threads, const std::function<void(std::size_t)> &fn)
{
    if (n == 0)
        return;
    const std::size_t workers = std::min<std::size_t>(threads == 0 ? 1 : threads, n);
    if (workers <= 1)
    {
        for (std::size_t i = 0; i < n; ++i)
            fn(i);
        return;
    }

    std::atomic<std::size_t> next{0};
    auto                     worker = [&]() {
        for (;;)
        {
            const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= n)
                return;
            fn(i);
        }
    };

    std::vector<std::thread> pool;
    pool.reserve(workers - 1);
    for (std::size_t t = 1; t < workers; ++t)
        pool.emplace_back(worker);
    worker();
    for (auto &th : pool)
        th.join();
}

}  // namespace par
