#ifndef SCORECARD_UTILS_PARALLEL_HPP
#define SCORECARD_UTILS_PARALLEL_HPP

#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <optional>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace scorecard::utils {

inline unsigned int hardware_concurrency() noexcept {
    unsigned int n = std::thread::hardware_concurrency();
    return n > 0 ? n : 1;
}

// Threads started for one batch of work, joined when the group goes out of scope
class WorkerGroup {
public:
    WorkerGroup() = default;
    ~WorkerGroup() { join(); }

    WorkerGroup(const WorkerGroup &) = delete;
    WorkerGroup &operator=(const WorkerGroup &) = delete;

    template <typename F>
    void spawn(F &&body) {
        workers_.emplace_back(std::forward<F>(body));
    }

    void join() {
        for (auto &worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
    }

    std::size_t size() const noexcept { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
};

// Number of workers for a batch: 0 picks the hardware concurrency, and a batch
// never gets more workers than items
inline std::size_t worker_count(unsigned int jobs, std::size_t items) noexcept {
    const std::size_t wanted = jobs == 0 ? hardware_concurrency() : jobs;
    return std::max<std::size_t>(1, std::min(wanted, items));
}

/**
 * Applies f to every item using up to `jobs` threads. Workers claim the next
 * unprocessed index, so results keep the input order regardless of timing.
 * Every item is processed even when one throws; the exception of the lowest
 * failing index is then rethrown.
 */
template <typename T, typename F>
auto parallel_map(const std::vector<T> &items, F f, unsigned int jobs = 0)
    -> std::vector<std::invoke_result_t<F &, const T &>> {
    using result_type = std::invoke_result_t<F &, const T &>;

    std::vector<std::optional<result_type>> slots(items.size());
    std::vector<std::exception_ptr> errors(items.size());
    std::atomic<std::size_t> next{0};

    auto drain = [&]() {
        for (std::size_t i = next++; i < items.size(); i = next++) {
            try {
                slots[i].emplace(f(items[i]));
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };

    const std::size_t workers = worker_count(jobs, items.size());
    if (workers == 1) {
        drain();
    } else {
        WorkerGroup group;
        for (std::size_t w = 0; w < workers; ++w) {
            group.spawn(drain);
        }
        group.join();
    }

    for (const auto &error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    std::vector<result_type> results;
    results.reserve(items.size());
    for (auto &slot : slots) {
        results.push_back(std::move(*slot));
    }
    return results;
}

} // namespace scorecard::utils

#endif // SCORECARD_UTILS_PARALLEL_HPP
