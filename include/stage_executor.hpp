#pragma once

#include <atomic>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

// Cooperative cancellation flag, checked by the pipeline between stages only
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Worker pool for the independent per-entity tasks of one stage. Tasks write
// only their own result slot; the caller merges the slots after run() returns.
class StageExecutor {
public:
    explicit StageExecutor(unsigned int numThreads = std::thread::hardware_concurrency());
    ~StageExecutor();

    StageExecutor(const StageExecutor&) = delete;
    StageExecutor& operator=(const StageExecutor&) = delete;

    // Run task(i) for every i in [0, count) and wait for all of them.
    // The first exception thrown by a task is rethrown here.
    void run(size_t count, const std::function<void(size_t)>& task);

    // Apply fn to every item, results in item order. Result must not be bool,
    // whose vector specialization packs slots into shared words.
    template <typename Result, typename Item, typename Fn>
    std::vector<Result> map(const std::vector<Item>& items, Fn fn) {
        std::vector<Result> results(items.size());
        run(items.size(), [&](size_t i) { results[i] = fn(items[i]); });
        return results;
    }

    unsigned int threadCount() const { return numThreads_; }

    // True if some run() since the last clearFallback() could not start its
    // threads and fell back to the caller's thread. A pool of one is not a fallback.
    bool ranSequentially() const { return ranSequentially_; }
    void clearFallback() { ranSequentially_ = false; }

private:
    unsigned int numThreads_;
    std::vector<std::thread> workers_;
    std::queue<size_t> taskQueue_;
    std::mutex queueMutex_;
    std::mutex errorMutex_;
    std::exception_ptr firstError_;
    bool ranSequentially_ = false;

    void workerThread(const std::function<void(size_t)>& task);
    void runSequentially(const std::function<void(size_t)>& task);
    void joinAll();
};
