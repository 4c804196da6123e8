#pragma once

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

namespace ssg {

// Resolve a configured thread count (0 or negative = auto)
inline int resolveThreadCount(int requested) {
    if (requested > 0) {
        return requested;
    }
    return std::max(1u, std::thread::hardware_concurrency());
}

// Worker threads joined on destruction, so a failure while spawning never
// leaves a joinable std::thread behind
class WorkerGroup {
public:
    WorkerGroup() = default;
    WorkerGroup(WorkerGroup const&) = delete;
    WorkerGroup& operator=(WorkerGroup const&) = delete;
    ~WorkerGroup() { join(); }

    template <typename Fn>
    void spawn(Fn&& fn) {
        workers_.emplace_back(std::forward<Fn>(fn));
    }

    void join() {
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
};

// Run fn(i) for every i in [0, count), split into contiguous chunks with one
// thread per chunk. Blocks until every chunk is done. The first exception
// thrown by a worker is rethrown on the calling thread after the join.
template <typename Fn>
void parallelFor(size_t count, int thread_count, Fn&& fn) {
    if (count == 0) {
        return;
    }

    size_t const threads = std::min(count, static_cast<size_t>(resolveThreadCount(thread_count)));
    if (threads == 1) {
        for (size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }

    size_t const chunk_size = count / threads;
    std::vector<std::exception_ptr> errors(threads);
    {
        WorkerGroup workers;
        for (size_t t = 0; t < threads; ++t) {
            size_t start = t * chunk_size;
            size_t end = (t == threads - 1) ? count : start + chunk_size;

            workers.spawn([&fn, &errors, t, start, end]() {
                try {
                    for (size_t i = start; i < end; ++i) {
                        fn(i);
                    }
                } catch (...) {
                    errors[t] = std::current_exception();
                }
            });
        }
    }

    for (auto const& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
}

} // namespace ssg
