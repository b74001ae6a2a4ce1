/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: PluginClient.cpp
 * ============================================================================
 */

#include "PluginClient.hpp"
#include "log.hpp"

#include <atomic>
#include <future>
#include <utility>

namespace conduit {

namespace {

// Invocation ids are unique across every client in the process.
std::atomic<std::int64_t> next_invocation_id{0};

} // namespace

std::string ErrorResponse::to_string() const {
    std::string out;
    if (code) {
        out += "[" + *code + "]";
        if (message) {
            out += " - ";
        }
    }
    if (message) {
        out += *message;
    }
    return out;
}

ErrorResponse ErrorResponse::from_payload(const std::string& payload) {
    ErrorResponse response;

    json doc = json::parse(payload, nullptr, false);
    if (doc.is_discarded()) {
        response.message = payload;
        return response;
    }

    if (doc.is_string()) {
        response.message = doc.get<std::string>();
    } else if (doc.is_object()) {
        for (auto it = doc.begin(); it != doc.end(); ++it) {
            if (it.key() == "code" && it.value().is_string()) {
                response.code = it.value().get<std::string>();
            } else if (it.key() == "message" && it.value().is_string()) {
                response.message = it.value().get<std::string>();
            } else {
                response.data[it.key()] = it.value();
            }
        }
    } else if (!doc.is_null()) {
        response.data["value"] = doc;
    }
    return response;
}

PluginInvokeError::PluginInvokeError(Kind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

PluginInvokeError::PluginInvokeError(ErrorResponse response)
    : std::runtime_error(response.to_string()),
      kind_(Kind::InvokeRejected),
      response_(std::move(response)) {}

PluginClient::PluginClient(Runtime& runtime, std::string plugin_name)
    : runtime_(runtime),
      plugin_name_(std::move(plugin_name)),
      timeout_(runtime.config().invoke_timeout),
      shared_(std::make_shared<Shared>()) {}

PluginClient::~PluginClient() {
    std::lock_guard<std::mutex> lock(shared_->mu);
    if (!shared_->pending.empty()) {
        conduit_log("WARN", "Plugin client for '" + plugin_name_ + "' destroyed with " +
                            std::to_string(shared_->pending.size()) + " call(s) still pending.");
    }
    shared_->pending.clear();
    shared_->channels.clear();
}

// ----------------------------------------------------------------------------
// Run
// The blocking call. Waits on a promise filled by the response handler; on
// timeout the pending entry is withdrawn so a late answer is ignored.
// ----------------------------------------------------------------------------
json PluginClient::Run(const std::string& command, const json& payload) {
    std::string body;
    try {
        body = payload.dump();
    } catch (const json::exception& e) {
        throw PluginInvokeError(PluginInvokeError::Kind::CannotSerializePayload,
                                "failed to serialize payload: " + std::string(e.what()));
    }

    auto promise = std::make_shared<std::promise<PluginResponse>>();
    std::future<PluginResponse> future = promise->get_future();

    std::int64_t id = RunAsync(command, body, [promise](const PluginResponse& response) {
        promise->set_value(response);
    });

    if (timeout_.count() > 0) {
        if (future.wait_for(timeout_) != std::future_status::ready) {
            bool withdrawn = false;
            {
                std::lock_guard<std::mutex> lock(shared_->mu);
                withdrawn = shared_->pending.erase(id) > 0;
            }
            if (withdrawn) {
                conduit_log("WARN", "Command '" + command + "' on plugin '" + plugin_name_ + "' timed out after " +
                                    std::to_string(timeout_.count()) + "ms.");
                throw PluginInvokeError(PluginInvokeError::Kind::Timeout,
                                        "command " + command + " timed out");
            }
        }
    }

    PluginResponse response = future.get();
    if (!response.success) {
        throw PluginInvokeError(ErrorResponse::from_payload(response.payload));
    }

    try {
        return json::parse(response.payload);
    } catch (const json::parse_error& e) {
        throw PluginInvokeError(PluginInvokeError::Kind::CannotDeserializeResponse,
                                "failed to deserialize response: " + std::string(e.what()) +
                                ", data: " + response.payload);
    }
}

std::int64_t PluginClient::RunAsync(const std::string& command, const std::string& payload, ResponseHandler handler) {
    std::int64_t id = next_invocation_id.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(shared_->mu);
        shared_->pending[id] = std::move(handler);
    }

    std::shared_ptr<Shared> shared = shared_;
    runtime_.RunCommand(
        id, plugin_name_, command, payload,
        [shared](std::int64_t invocation_id, bool success, const std::string& body) {
            OnResponse(shared, invocation_id, success, body);
        },
        [shared](std::uint64_t channel_id, const std::string& body) {
            OnChannelData(shared, channel_id, body);
        });
    return id;
}

std::uint64_t PluginClient::OpenChannel(ChannelHandler handler) {
    std::lock_guard<std::mutex> lock(shared_->mu);
    std::uint64_t id = shared_->next_channel_id++;
    shared_->channels[id] = std::move(handler);
    return id;
}

void PluginClient::CloseChannel(std::uint64_t channel_id) {
    std::lock_guard<std::mutex> lock(shared_->mu);
    shared_->channels.erase(channel_id);
}

std::size_t PluginClient::PendingCount() const {
    std::lock_guard<std::mutex> lock(shared_->mu);
    return shared_->pending.size();
}

void PluginClient::OnResponse(const std::shared_ptr<Shared>& shared, std::int64_t id, bool success,
                              const std::string& payload) {
    ResponseHandler handler;
    {
        std::lock_guard<std::mutex> lock(shared->mu);
        auto it = shared->pending.find(id);
        if (it == shared->pending.end()) {
            // Timed out, or the client is gone.
            return;
        }
        handler = std::move(it->second);
        shared->pending.erase(it);
    }
    if (handler) {
        handler(PluginResponse{success, payload});
    }
}

void PluginClient::OnChannelData(const std::shared_ptr<Shared>& shared, std::uint64_t channel_id,
                                 const std::string& payload) {
    ChannelHandler handler;
    {
        std::lock_guard<std::mutex> lock(shared->mu);
        auto it = shared->channels.find(channel_id);
        if (it == shared->channels.end()) {
            return;
        }
        handler = it->second;
    }

    json value = json::parse(payload, nullptr, false);
    if (value.is_discarded()) {
        value = payload;
    }
    handler(value);
}

} // namespace conduit
