/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: SerialQueue.cpp
 * ============================================================================
 */

#include "SerialQueue.hpp"
#include "log.hpp"

#include <exception>
#include <utility>

namespace conduit {

SerialQueue::SerialQueue(std::string label)
    : label_(std::move(label)) {
    worker_ = std::thread([this] { WorkerLoop(); });
}

SerialQueue::~SerialQueue() {
    Stop();
}

bool SerialQueue::Post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stopping_) {
            conduit_log("WARN", "Queue '" + label_ + "' is stopped; task dropped.");
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

void SerialQueue::Flush() {
    std::unique_lock<std::mutex> lock(mu_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && !busy_; });
}

void SerialQueue::Stop() {
    {
        std::lock_guard<std::mutex> lock(mu_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool SerialQueue::IsRunning() const {
    std::lock_guard<std::mutex> lock(mu_);
    return !stopping_;
}

// ----------------------------------------------------------------------------
// WorkerLoop
// Pops one task at a time. A task that throws is logged and the loop keeps
// going; a broken plugin must not take the whole router down with it.
// ----------------------------------------------------------------------------
void SerialQueue::WorkerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mu_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                // stopping_ and nothing left to drain
                idle_cv_.notify_all();
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
            busy_ = true;
        }

        try {
            task();
        } catch (const std::exception& e) {
            conduit_log("ERROR", "Queue '" + label_ + "' task threw: " + std::string(e.what()));
        } catch (...) {
            conduit_log("ERROR", "Queue '" + label_ + "' task threw a non-standard exception.");
        }

        {
            std::lock_guard<std::mutex> lock(mu_);
            busy_ = false;
            if (tasks_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }
}

} // namespace conduit
