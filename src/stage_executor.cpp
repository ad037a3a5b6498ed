#include "stage_executor.hpp"
#include <algorithm>
#include <iostream>
#include <system_error>

StageExecutor::StageExecutor(unsigned int numThreads)
    : numThreads_(numThreads == 0 ? 1 : numThreads) {}

StageExecutor::~StageExecutor() {
    joinAll();
}

void StageExecutor::joinAll() {
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
}

void StageExecutor::run(size_t count, const std::function<void(size_t)>& task) {
    // Reset state
    taskQueue_ = std::queue<size_t>();
    firstError_ = nullptr;

    if (count == 0) {
        return;
    }
    for (size_t i = 0; i < count; ++i) {
        taskQueue_.push(i);
    }

    // Use at most numThreads_ or count threads
    unsigned int actualThreads = static_cast<unsigned int>(
        std::min<size_t>(numThreads_, count));

    if (actualThreads <= 1) {
        runSequentially(task);
    } else {
        try {
            workers_.emplace_back(&StageExecutor::workerThread, this, std::cref(task));
            for (unsigned int i = 1; i < actualThreads; ++i) {
                try {
                    workers_.emplace_back(&StageExecutor::workerThread, this, std::cref(task));
                } catch (const std::system_error& e) {
                    // Keep going with the threads we already have
                    std::cerr << "Warning: Could not create additional thread: " << e.what() << std::endl;
                    break;
                }
            }
            joinAll();
        } catch (const std::system_error& e) {
            std::cerr << "Warning: Thread creation failed: " << e.what() << std::endl;
            std::cerr << "Falling back to single-threaded execution" << std::endl;
            joinAll();
            ranSequentially_ = true;
            runSequentially(task);
        }
    }

    if (firstError_) {
        std::exception_ptr error = firstError_;
        firstError_ = nullptr;
        std::rethrow_exception(error);
    }
}

void StageExecutor::runSequentially(const std::function<void(size_t)>& task) {
    while (!taskQueue_.empty()) {
        size_t index = taskQueue_.front();
        taskQueue_.pop();
        task(index);
    }
}

void StageExecutor::workerThread(const std::function<void(size_t)>& task) {
    while (true) {
        size_t index;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (taskQueue_.empty()) {
                return;
            }
            index = taskQueue_.front();
            taskQueue_.pop();
        }

        // Run the task outside the lock
        try {
            task(index);
        } catch (...) {
            std::lock_guard<std::mutex> lock(errorMutex_);
            if (!firstError_) {
                firstError_ = std::current_exception();
            }
        }
    }
}
