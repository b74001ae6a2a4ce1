/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: Invoke.cpp
 * ============================================================================
 */

#include "Invoke.hpp"
#include "../../core/log.hpp"

#include <utility>

namespace conduit {
namespace plugins {

Invoke::Invoke(std::string command,
               std::uint64_t callback_tag,
               std::uint64_t error_tag,
               ResponseFn send_response,
               ChannelFn send_channel,
               std::string data)
    : command_(std::move(command)),
      callback_tag_(callback_tag),
      error_tag_(error_tag),
      send_response_(std::move(send_response)),
      send_channel_(std::move(send_channel)),
      data_(std::move(data)) {}

// ----------------------------------------------------------------------------
// send_response
// The exchange on completed_ is the single gate for the terminal response:
// only the first caller gets through, regardless of thread.
// ----------------------------------------------------------------------------
bool Invoke::send_response(std::uint64_t tag, const std::optional<std::string>& payload) {
    if (completed_.exchange(true)) {
        conduit_log("WARN", "ProtocolMisuse: second terminal response for command '" + command_ + "' dropped.");
        return false;
    }
    if (send_response_) {
        send_response_(tag, payload);
    }
    return true;
}

bool Invoke::send_channel_data(std::uint64_t channel_id, const std::string& payload) {
    if (completed_.load()) {
        conduit_log("WARN", "ProtocolMisuse: channel " + std::to_string(channel_id) +
                            " data after terminal response for command '" + command_ + "' rejected.");
        return false;
    }
    if (send_channel_) {
        send_channel_(channel_id, payload);
    }
    return true;
}

bool Invoke::resolve() {
    return send_response(callback_tag_, std::nullopt);
}

bool Invoke::resolve(const json& value) {
    return send_response(callback_tag_, value.dump());
}

bool Invoke::resolve_raw(const std::string& payload) {
    return send_response(callback_tag_, payload);
}

bool Invoke::resolve_if_pending() {
    if (completed_.exchange(true)) {
        return false;
    }
    if (send_response_) {
        send_response_(callback_tag_, std::nullopt);
    }
    return true;
}

bool Invoke::reject(const std::string& message) {
    return send_response(error_tag_, message);
}

bool Invoke::reject(const std::string& message, const std::string& code, const json& data) {
    json body = {{"message", message}};
    if (!code.empty()) {
        body["code"] = code;
    }
    if (!data.is_null()) {
        body["data"] = data;
    }
    return send_response(error_tag_, body.dump());
}

json Invoke::parse_args() const {
    if (data_.empty()) {
        return json::object();
    }
    return json::parse(data_);
}

Completion::Completion(Fn fn)
    : state_(std::make_shared<State>()) {
    state_->fn = std::move(fn);
}

void Completion::operator()(const std::optional<std::string>& error) const {
    if (!state_) {
        return;
    }
    if (state_->fired.exchange(true)) {
        conduit_log("WARN", "ProtocolMisuse: completion handler called more than once; ignored.");
        return;
    }
    if (state_->fn) {
        state_->fn(error);
    }
}

bool Completion::fired() const {
    return state_ && state_->fired.load();
}

} // namespace plugins
} // namespace conduit
