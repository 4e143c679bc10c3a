#ifndef THREAD_POOL_QUEUE_HPP
#define THREAD_POOL_QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Structure to hold task and its enqueue time
struct TimedTask {
    std::function<void()> task;
    std::chrono::steady_clock::time_point enqueued_time;
};

// Fixed pool of worker threads draining a FIFO of dispatch tasks.
class ThreadPoolQueue {
public:
    ThreadPoolQueue(
        size_t thread_count,
        std::shared_ptr<ILogger> logger,
        std::shared_ptr<IStatsDClient> statsd_client)
        : logger_(logger),
        statsd_client_(statsd_client),
        shutdown_(false) {
        if (!logger_) {
            throw std::invalid_argument("Logger cannot be null for ThreadPoolQueue");
        }
        if (!statsd_client_) {
            throw std::invalid_argument("StatsDClient cannot be null for ThreadPoolQueue");
        }
        if (thread_count == 0) {
            throw std::invalid_argument("ThreadPoolQueue needs at least one thread");
        }
        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this] { worker_thread(); });
        }
        logger_->setup("ThreadPoolQueue initialized with " + std::to_string(thread_count) + " threads");
    }

    ~ThreadPoolQueue() {
        shutdown();
    }

    ThreadPoolQueue(const ThreadPoolQueue&) = delete;
    ThreadPoolQueue& operator=(const ThreadPoolQueue&) = delete;

    // Returns false once the pool is shutting down.
    bool enqueue(std::function<void()> fn) {
        if (shutdown_) {
            logger_->error("Attempted to enqueue task on shutdown queue.");
            return false;
        }
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            task_queue_.push_back({std::move(fn), std::chrono::steady_clock::now()});
        }
        cv_.notify_one();
        return true;
    }

    // Drains the queue, then joins the workers.
    void shutdown() {
        if (shutdown_.exchange(true)) {
             return;
        }
        logger_->debug("Shutting down ThreadPoolQueue...");
        cv_.notify_all();
        for (std::thread& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        logger_->debug("ThreadPoolQueue shut down complete.");
    }

private:
    void worker_thread() {
        while (true) {
            TimedTask current_task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return !task_queue_.empty() || shutdown_; });

                if (shutdown_ && task_queue_.empty()) {
                    return;
                }

                current_task = std::move(task_queue_.front());
                task_queue_.pop_front();
            }

            if (logger_->getLogLevel() <= LogUtils::LogLevel::DEBUG) {
                auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - current_task.enqueued_time);
                logger_->debug("Task waited " + std::to_string(waited.count()) + "ms in queue");
            }

            try {
                current_task.task();
            } catch (const std::exception& e) {
                statsd_client_->increment(MetricsDefinitions::CODE_EXCEPTION);
                logger_->error("Exception caught in worker thread task: " + std::string(e.what()));
            }
        }
    }

    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::deque<TimedTask> task_queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::vector<std::thread> threads_;
    std::atomic<bool> shutdown_;
};

#endif // THREAD_POOL_QUEUE_HPP
