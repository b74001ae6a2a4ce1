/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: SerialQueue.hpp
 * ============================================================================
 * * DESCRIPTION:
 * A labelled first-in-first-out task queue drained by exactly one worker
 * thread. Every plugin command runs here, so two commands never execute
 * at the same time through the router, and the thread that asked for a
 * command is never blocked by it.
 * ============================================================================
 */

#ifndef CONDUIT_SERIAL_QUEUE_HPP
#define CONDUIT_SERIAL_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace conduit {

    class SerialQueue {
    public:
        using Task = std::function<void()>;

        /**
         * @brief Starts the worker thread.
         * @param label Name used in log lines (e.g. "ipc").
         */
        explicit SerialQueue(std::string label);

        /**
         * @brief Drains whatever is still queued, then joins the worker.
         */
        ~SerialQueue();

        SerialQueue(const SerialQueue&) = delete;
        SerialQueue& operator=(const SerialQueue&) = delete;

        /**
         * @brief Appends a task. Tasks run in submission order.
         * @return false if the queue has been stopped and the task was dropped.
         */
        bool Post(Task task);

        /**
         * @brief Blocks until every task posted before this call has run.
         * Must not be called from the worker thread itself.
         */
        void Flush();

        /**
         * @brief Refuses new tasks, runs the remaining ones and joins.
         * Safe to call more than once.
         */
        void Stop();

        const std::string& label() const { return label_; }
        bool IsRunning() const;

    private:
        void WorkerLoop();

        std::string label_;
        mutable std::mutex mu_;
        std::condition_variable cv_;
        std::condition_variable idle_cv_;
        std::deque<Task> tasks_;
        bool stopping_ = false;
        bool busy_ = false;
        std::thread worker_;
    };

} // namespace conduit

#endif // CONDUIT_SERIAL_QUEUE_HPP
