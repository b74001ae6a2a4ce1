/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: EchoPlugin.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Reference plugin shipped with the host. One command per calling
 * convention:
 *   ping      (sync)      resolves "pong"
 *   echo      (sync)      resolves its arguments back
 *   validate  (fallible)  fails unless the arguments carry "value"
 *   stream    (async)     sends {"index": i} count times on "channel",
 *                         then resolves {"sent": count}
 *
 * Config: {"prefix": "..."} is prepended to string values echoed back.
 * ============================================================================
 */

#ifndef CONDUIT_ECHO_PLUGIN_HPP
#define CONDUIT_ECHO_PLUGIN_HPP

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../interface/conduit_plugin.hpp"

namespace conduit {
namespace plugins {

    class EchoPlugin : public Plugin {
    public:
        EchoPlugin();

        /**
         * @brief Joins any stream workers still running.
         */
        ~EchoPlugin() override;

        void set_config(const std::string& config) override;
        void load(const Surface& surface) override;

        const std::string& prefix() const { return prefix_; }
        int surfaces_loaded() const;

        // Stream workers not joined yet. Finished ones are reaped on the next stream.
        std::size_t live_workers() const;

    private:
        struct Worker {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> finished;
        };

        void ReapFinishedWorkers();

        void Ping(Invoke& invoke);
        void Echo(Invoke& invoke);
        void Validate(Invoke& invoke, std::string& error);
        void Stream(Invoke& invoke, Completion done);

        std::string prefix_;

        mutable std::mutex mu_;
        int surfaces_loaded_ = 0;
        std::vector<Worker> workers_;
    };

} // namespace plugins
} // namespace conduit

#endif // CONDUIT_ECHO_PLUGIN_HPP
