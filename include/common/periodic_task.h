#ifndef SKYVIEW_PERIODIC_TASK_H
#define SKYVIEW_PERIODIC_TASK_H

#include <chrono>
#include <thread>
#include <atomic>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace skyview {

// Runs execute() on a dedicated thread once per period until stop() is called.
// Sleeps are interruptible so stop() returns promptly even during long waits.
class PeriodicTask {
public:
    explicit PeriodicTask(std::chrono::milliseconds period)
        : period_(period)
        , running_(false) {
    }

    virtual ~PeriodicTask() {
        stop();
    }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start() {
        if (!running_) {
            running_ = true;
            thread_ = std::thread(&PeriodicTask::run, this);
        }
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        wake_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    bool isRunning() const { return running_; }

    // Get execution time statistics (microseconds)
    int64_t getBestExecutionTime() const { return best_execution_time_; }
    int64_t getWorstExecutionTime() const { return worst_execution_time_; }
    uint64_t getExecutionCount() const { return execution_count_; }

    // Period management
    void setPeriod(std::chrono::milliseconds new_period) {
        std::lock_guard<std::mutex> lock(mutex_);
        period_ = new_period;
    }

    std::chrono::milliseconds getPeriod() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return period_;
    }

protected:
    virtual void execute() = 0;

    // Sleep for up to `duration`. Returns false if the task was stopped meanwhile.
    bool waitFor(std::chrono::milliseconds duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        wake_.wait_for(lock, duration, [this] { return !running_; });
        return running_;
    }

private:
    void run() {
        while (running_) {
            auto start = std::chrono::steady_clock::now();

            execute();
            auto exec_end = std::chrono::steady_clock::now();

            auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
                exec_end - start).count();
            updateExecutionStats(duration);

            std::chrono::milliseconds current_period;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                current_period = period_;
            }

            auto sleep_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                start + current_period - std::chrono::steady_clock::now());
            if (sleep_time.count() > 0) {
                waitFor(sleep_time);
            }
        }
    }

    void updateExecutionStats(int64_t duration) {
        ++execution_count_;
        if (duration < best_execution_time_ || best_execution_time_ == 0) {
            best_execution_time_ = duration;
        }
        if (duration > worst_execution_time_) {
            worst_execution_time_ = duration;
        }
    }

    std::chrono::milliseconds period_;
    std::atomic<bool> running_;
    std::thread thread_;
    std::atomic<int64_t> best_execution_time_{0};
    std::atomic<int64_t> worst_execution_time_{0};
    std::atomic<uint64_t> execution_count_{0};
    mutable std::mutex mutex_;
    std::condition_variable wake_;
};

} // namespace skyview

#endif // SKYVIEW_PERIODIC_TASK_H
