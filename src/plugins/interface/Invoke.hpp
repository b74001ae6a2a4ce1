/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: Invoke.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The invocation context handed to a plugin command. It carries the
 * command name and the opaque request payload, plus the two ways back to
 * the caller:
 *   - the terminal response (exactly one success-or-error per call)
 *   - channel data (any number of non-terminal messages, any channel)
 *
 * The router owns an Invoke through a shared_ptr for the length of the
 * call; asynchronous commands may keep it alive longer through
 * shared_from_this().
 * ============================================================================
 */

#ifndef CONDUIT_INVOKE_HPP
#define CONDUIT_INVOKE_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace conduit {
namespace plugins {

    class Invoke : public std::enable_shared_from_this<Invoke> {
    public:
        // payload is empty (std::nullopt) when the handler sent no value at all.
        using ResponseFn = std::function<void(std::uint64_t tag, const std::optional<std::string>& payload)>;
        using ChannelFn = std::function<void(std::uint64_t channel_id, const std::string& payload)>;

        /**
         * @param command       Command name, matched verbatim against handlers.
         * @param callback_tag  Tag reported with a success response.
         * @param error_tag     Tag reported with an error response.
         * @param send_response Terminal callback, fired at most once.
         * @param send_channel  Channel data callback.
         * @param data          Raw request payload, never parsed by the router.
         */
        Invoke(std::string command,
               std::uint64_t callback_tag,
               std::uint64_t error_tag,
               ResponseFn send_response,
               ChannelFn send_channel,
               std::string data);

        Invoke(const Invoke&) = delete;
        Invoke& operator=(const Invoke&) = delete;

        const std::string& command() const { return command_; }
        const std::string& data() const { return data_; }
        std::uint64_t callback_tag() const { return callback_tag_; }
        std::uint64_t error_tag() const { return error_tag_; }

        /**
         * @brief Sends the terminal response.
         * @return false if a terminal response was already sent; the second
         * one is dropped and logged, never delivered.
         */
        bool send_response(std::uint64_t tag, const std::optional<std::string>& payload);

        /**
         * @brief Streams one message on a channel.
         * @return false once the terminal response has gone out.
         */
        bool send_channel_data(std::uint64_t channel_id, const std::string& payload);

        // Success without a payload. The caller sees "null".
        bool resolve();
        bool resolve(const json& value);
        bool resolve_raw(const std::string& payload);

        /**
         * @brief Success without a payload, but only if nothing has been sent
         * yet. Unlike resolve(), losing the race is not a protocol misuse and
         * is not logged.
         */
        bool resolve_if_pending();

        // Error whose payload is the message itself.
        bool reject(const std::string& message);

        /**
         * @brief Error with a structured payload:
         * {"message": ..., "code": ..., "data": ...}. Empty code and null data
         * are left out.
         */
        bool reject(const std::string& message, const std::string& code, const json& data = nullptr);

        /**
         * @brief Parses data() as JSON. An empty payload parses as {}.
         * @throws json::parse_error on malformed input.
         */
        json parse_args() const;

        bool is_completed() const { return completed_.load(); }

    private:
        std::string command_;
        std::uint64_t callback_tag_;
        std::uint64_t error_tag_;
        ResponseFn send_response_;
        ChannelFn send_channel_;
        std::string data_;
        std::atomic<bool> completed_{false};
    };

    /**
     * @brief One-shot completion handle for asynchronous commands.
     *
     * Copies share state: whichever copy fires first wins, every later call
     * is logged and ignored.
     */
    class Completion {
    public:
        using Fn = std::function<void(const std::optional<std::string>& error)>;

        Completion() = default;
        explicit Completion(Fn fn);

        // Signals completion; pass an error message to fail the call.
        void operator()(const std::optional<std::string>& error = std::nullopt) const;

        bool fired() const;

    private:
        struct State {
            std::atomic<bool> fired{false};
            Fn fn;
        };
        std::shared_ptr<State> state_;
    };

} // namespace plugins
} // namespace conduit

#endif // CONDUIT_INVOKE_HPP
