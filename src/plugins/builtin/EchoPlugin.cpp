/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: EchoPlugin.cpp
 * ============================================================================
 */

#include "EchoPlugin.hpp"
#include "../../core/log.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <iterator>
#include <memory>

namespace conduit {
namespace plugins {

EchoPlugin::EchoPlugin() {
    register_sync_command("ping", [this](Invoke& invoke) { Ping(invoke); });
    register_sync_command("echo", [this](Invoke& invoke) { Echo(invoke); });
    register_fallible_command("validate", [this](Invoke& invoke, std::string& error) { Validate(invoke, error); });
    register_async_command("stream", [this](Invoke& invoke, Completion done) { Stream(invoke, done); });
}

EchoPlugin::~EchoPlugin() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mu_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

void EchoPlugin::set_config(const std::string& config) {
    Plugin::set_config(config);
    if (config.empty()) {
        return;
    }

    try {
        json parsed = json::parse(config);
        if (parsed.is_object() && parsed.contains("prefix")) {
            prefix_ = parsed.at("prefix").get<std::string>();
        }
    } catch (const std::exception& e) {
        conduit_log("WARN", "Echo plugin ignoring invalid config: " + std::string(e.what()));
    }
}

void EchoPlugin::load(const Surface& surface) {
    (void)surface;
    std::lock_guard<std::mutex> lock(mu_);
    ++surfaces_loaded_;
}

int EchoPlugin::surfaces_loaded() const {
    std::lock_guard<std::mutex> lock(mu_);
    return surfaces_loaded_;
}

std::size_t EchoPlugin::live_workers() const {
    std::lock_guard<std::mutex> lock(mu_);
    return workers_.size();
}

void EchoPlugin::ReapFinishedWorkers() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto split = std::partition(workers_.begin(), workers_.end(),
                                    [](const Worker& w) { return !w.finished->load(); });
        std::move(split, workers_.end(), std::back_inserter(finished));
        workers_.erase(split, workers_.end());
    }
    for (auto& worker : finished) {
        worker.thread.join();
    }
}

void EchoPlugin::Ping(Invoke& invoke) {
    invoke.resolve(json("pong"));
}

void EchoPlugin::Echo(Invoke& invoke) {
    json args = invoke.parse_args();
    if (!prefix_.empty() && args.is_object()) {
        for (auto& value : args) {
            if (value.is_string()) {
                value = prefix_ + value.get<std::string>();
            }
        }
    }
    invoke.resolve(args);
}

void EchoPlugin::Validate(Invoke& invoke, std::string& error) {
    json args = invoke.parse_args();
    if (!args.is_object() || !args.contains("value")) {
        error = "missing field `value`";
        return;
    }
    invoke.resolve(json{{"valid", true}});
}

// ----------------------------------------------------------------------------
// Stream
// The channel messages go out from a worker thread, outside the router's
// serial queue. The worker keeps the invocation alive through
// shared_from_this() until it has resolved and completed. Workers that have
// finished are joined here, so the list stays bounded by the streams in flight.
// ----------------------------------------------------------------------------
void EchoPlugin::Stream(Invoke& invoke, Completion done) {
    ReapFinishedWorkers();

    json args = invoke.parse_args();
    if (!args.is_object() || !args.contains("channel")) {
        done(std::string("missing field `channel`"));
        return;
    }
    std::uint64_t channel = args.at("channel").get<std::uint64_t>();
    int count = args.value("count", 1);

    std::shared_ptr<Invoke> keep = invoke.shared_from_this();
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(mu_);
    Worker worker;
    worker.finished = finished;
    worker.thread = std::thread([keep, done, channel, count, finished] {
        for (int i = 0; i < count; ++i) {
            keep->send_channel_data(channel, json{{"index", i}}.dump());
        }
        keep->resolve(json{{"sent", count}});
        done();
        finished->store(true);
    });
    workers_.push_back(std::move(worker));
}

} // namespace plugins
} // namespace conduit
