#pragma once

// Internal header, not installed.
// Fixed-size std::jthread pool used by the batch diff entry points.

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <latch>
#include <mutex>
#include <thread>
#include <vector>

namespace jsondiff_cpp::detail {

class ThreadPool {
public:
    explicit ThreadPool(unsigned int num_threads) {
        workers_.reserve(num_threads);
        for (unsigned int i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this](std::stop_token st) { worker_loop(st); });
        }
    }

    ~ThreadPool() {
        // Signal every worker before the first join in ~jthread.
        for (auto& w : workers_) w.request_stop();
    }

    ThreadPool(const ThreadPool&) = delete;
    auto operator=(const ThreadPool&) -> ThreadPool& = delete;
    ThreadPool(ThreadPool&&) = delete;
    auto operator=(ThreadPool&&) -> ThreadPool& = delete;

    /// Call fn(index) once for every index in [0, count) and block until all
    /// calls have returned. Indices are handed out one at a time, so a few
    /// expensive items do not stall a whole chunk. fn must not throw.
    /// Not reentrant: one caller at a time.
    template <typename Fn>
    void for_each_index(std::size_t count, Fn&& fn) {
        if (count == 0) return;
        if (workers_.empty()) {
            for (std::size_t i = 0; i < count; ++i) fn(i);
            return;
        }

        auto next = std::atomic<std::size_t>{0};
        auto done = std::latch{static_cast<std::ptrdiff_t>(workers_.size())};
        {
            auto lock = std::scoped_lock{mutex_};
            job_ = [&] {
                for (auto i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                    fn(i);
                }
                done.count_down();
            };
            ++generation_;
        }
        cv_.notify_all();
        done.wait();

        auto lock = std::scoped_lock{mutex_};
        job_ = nullptr;
    }

    auto size() const -> std::size_t { return workers_.size(); }

private:
    void worker_loop(std::stop_token st) {
        auto seen = std::size_t{0};
        while (true) {
            auto job = std::function<void()>{};
            {
                auto lock = std::unique_lock{mutex_};
                cv_.wait(lock, st, [&] { return generation_ != seen; });
                if (st.stop_requested()) return;
                seen = generation_;
                job = job_;
            }
            job();
        }
    }

    std::function<void()> job_;
    std::size_t generation_{0};
    std::mutex mutex_;
    std::condition_variable_any cv_;
    // Last, so the workers are joined before the state they wait on dies.
    std::vector<std::jthread> workers_;
};

}  // namespace jsondiff_cpp::detail
