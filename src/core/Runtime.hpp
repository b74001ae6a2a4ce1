/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: Runtime.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The context the host application constructs once during setup and
 * passes around by reference. Its three methods are the router's entry
 * points: register a plugin, announce a surface, run a command.
 * ============================================================================
 */

#ifndef CONDUIT_RUNTIME_HPP
#define CONDUIT_RUNTIME_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "config.hpp"
#include "../plugins/interface/PluginManager.hpp"

namespace conduit {

    class Runtime {
    public:
        // Fixed response tags; isSuccess is tag == kCallbackTag.
        static constexpr std::uint64_t kCallbackTag = 0;
        static constexpr std::uint64_t kErrorTag = 1;

        using ResultFn = std::function<void(std::int64_t invocation_id, bool success, const std::string& payload)>;
        using ChannelDataFn = std::function<void(std::uint64_t channel_id, const std::string& payload)>;

        explicit Runtime(const RuntimeConfig& config = RuntimeConfig());

        Runtime(const Runtime&) = delete;
        Runtime& operator=(const Runtime&) = delete;

        /**
         * @brief Registers (or replaces) a plugin. With a surface, the plugin
         * is attached immediately.
         */
        void RegisterPlugin(const std::string& name,
                            std::shared_ptr<plugins::Plugin> plugin,
                            const std::string& config,
                            std::optional<plugins::Surface> surface = std::nullopt);

        /**
         * @brief Records the surface owner (not owned) and attaches the
         * surface to every plugin that has none yet.
         */
        void SurfaceCreated(const plugins::Surface& surface, void* owner);

        /**
         * @brief Runs command on plugin_name. on_result fires once with the
         * terminal response; an absent payload is reported as "null".
         * on_channel_data may fire any number of times before that.
         */
        void RunCommand(std::int64_t invocation_id,
                        const std::string& plugin_name,
                        const std::string& command,
                        const std::string& data,
                        ResultFn on_result,
                        ChannelDataFn on_channel_data);

        void* surface_owner() const { return surface_owner_.load(); }
        const RuntimeConfig& config() const { return config_; }
        plugins::PluginManager& plugin_manager() { return plugin_manager_; }

    private:
        RuntimeConfig config_;
        std::atomic<void*> surface_owner_{nullptr};
        plugins::PluginManager plugin_manager_;
    };

} // namespace conduit

#endif // CONDUIT_RUNTIME_HPP
