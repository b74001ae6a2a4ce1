/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: PluginClient.hpp
 * ============================================================================
 * * DESCRIPTION:
 * Host-side convenience over Runtime::RunCommand. It hands out invocation
 * ids, keeps the table of calls still waiting for an answer, decodes the
 * JSON payloads and routes channel data to whoever opened the channel.
 *
 * USAGE:
 *   conduit::PluginClient echo(runtime, "echo");
 *   json pong = echo.Run("ping", json::object());   // "pong"
 * ============================================================================
 */

#ifndef CONDUIT_PLUGIN_CLIENT_HPP
#define CONDUIT_PLUGIN_CLIENT_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "Runtime.hpp"

using json = nlohmann::json;

namespace conduit {

    /**
     * @brief Error body sent back by a plugin: {"code", "message", ...}.
     * Keys other than code and message are kept in data.
     */
    struct ErrorResponse {
        std::optional<std::string> code;
        std::optional<std::string> message;
        json data = json::object();

        // "[code] - message", "[code]", "message" or "".
        std::string to_string() const;

        /**
         * @brief Decodes an error payload. Objects are split into
         * code/message/data, a JSON string becomes the message, and text that
         * is not JSON at all is taken verbatim as the message.
         */
        static ErrorResponse from_payload(const std::string& payload);
    };

    class PluginInvokeError : public std::runtime_error {
    public:
        enum class Kind {
            InvokeRejected,
            CannotDeserializeResponse,
            CannotSerializePayload,
            Timeout
        };

        PluginInvokeError(Kind kind, const std::string& what);
        PluginInvokeError(ErrorResponse response);

        Kind kind() const { return kind_; }

        // Only meaningful for Kind::InvokeRejected.
        const ErrorResponse& response() const { return response_; }

    private:
        Kind kind_;
        ErrorResponse response_;
    };

    struct PluginResponse {
        bool success = false;
        std::string payload;
    };

    class PluginClient {
    public:
        using ResponseHandler = std::function<void(const PluginResponse&)>;
        using ChannelHandler = std::function<void(const json&)>;

        PluginClient(Runtime& runtime, std::string plugin_name);
        ~PluginClient();

        PluginClient(const PluginClient&) = delete;
        PluginClient& operator=(const PluginClient&) = delete;

        /**
         * @brief Runs command and waits for its terminal response.
         * @return The decoded success payload ("null" becomes json null).
         * @throws PluginInvokeError
         */
        json Run(const std::string& command, const json& payload);

        /**
         * @brief Fire-and-forget form. handler runs once, on whatever thread
         * the plugin answered from.
         * @return The invocation id.
         */
        std::int64_t RunAsync(const std::string& command, const std::string& payload, ResponseHandler handler);

        /**
         * @brief Opens a channel for streamed data. Put the returned id in the
         * request payload so the plugin knows where to send.
         *
         * The handler is invoked on a copy taken under the lock, so it can
         * still run once after CloseChannel() or after the client is gone.
         * Anything it captures must outlive that call.
         */
        std::uint64_t OpenChannel(ChannelHandler handler);
        void CloseChannel(std::uint64_t channel_id);

        // Zero (the default) waits forever.
        void SetTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

        const std::string& plugin_name() const { return plugin_name_; }
        std::size_t PendingCount() const;

    private:
        struct Shared {
            std::mutex mu;
            std::map<std::int64_t, ResponseHandler> pending;
            std::map<std::uint64_t, ChannelHandler> channels;
            std::uint64_t next_channel_id = 1;
        };

        static void OnResponse(const std::shared_ptr<Shared>& shared, std::int64_t id, bool success,
                               const std::string& payload);
        static void OnChannelData(const std::shared_ptr<Shared>& shared, std::uint64_t channel_id,
                                  const std::string& payload);

        Runtime& runtime_;
        std::string plugin_name_;
        std::chrono::milliseconds timeout_{0};
        std::shared_ptr<Shared> shared_;
    };

} // namespace conduit

#endif // CONDUIT_PLUGIN_CLIENT_HPP
