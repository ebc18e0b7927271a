#pragma once

#include "errors.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace shoreline::core {

inline int resolve_worker_count(int configured, size_t n_items) {
    int workers = std::max(1, configured);
    const unsigned hw = std::thread::hardware_concurrency();
    if (hw > 0) {
        workers = std::min(workers, static_cast<int>(hw));
    }
    if (n_items < static_cast<size_t>(workers)) {
        workers = std::max(1, static_cast<int>(n_items));
    }
    return workers;
}

// Runs fn(worker_index, item_index) for every item on a pool of workers
// pulling from a shared atomic index. The first failure is rethrown as a
// PipelineError once all workers have joined.
template <typename Fn>
void parallel_for(size_t n_items, int workers, Fn&& fn) {
    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::string first_error;

    auto worker = [&](int worker_index) {
        while (!failed.load(std::memory_order_relaxed)) {
            const size_t i = next.fetch_add(1);
            if (i >= n_items) {
                break;
            }
            try {
                fn(worker_index, i);
            } catch (const std::exception& e) {
                failed.store(true, std::memory_order_relaxed);
                std::lock_guard<std::mutex> lock(error_mutex);
                if (first_error.empty()) {
                    first_error = e.what();
                }
            }
        }
    };

    if (workers > 1) {
        std::vector<std::thread> pool;
        pool.reserve(static_cast<size_t>(workers));
        for (int w = 0; w < workers; ++w) {
            pool.emplace_back(worker, w);
        }
        for (auto& t : pool) {
            if (t.joinable()) {
                t.join();
            }
        }
    } else {
        worker(0);
    }

    if (failed.load(std::memory_order_relaxed)) {
        throw PipelineError(first_error.empty() ? "worker_failed" : first_error);
    }
}

} // namespace shoreline::core
