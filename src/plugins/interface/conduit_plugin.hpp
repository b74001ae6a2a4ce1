/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: conduit_plugin.hpp
 * ============================================================================
 * * DESCRIPTION:
 * This is the primary SDK header for Conduit plugins. To create a plugin,
 * inherit from conduit::plugins::Plugin and declare your commands in the
 * constructor with register_sync_command / register_fallible_command /
 * register_async_command.
 *
 * A plugin built as its own library exposes itself to the host through
 * CONDUIT_PLUGIN_BINDING, which produces the extern "C" init function the
 * host hands to conduit_register_plugin().
 * ============================================================================
 */

#ifndef CONDUIT_PLUGIN_HPP
#define CONDUIT_PLUGIN_HPP

#include <memory>
#include <string>
#include "CommandResolver.hpp"
#include "Invoke.hpp"

// Opaque plugin box crossing the C ABI (defined in core/bridge.cpp).
struct conduit_plugin;

namespace conduit {
namespace plugins {

    /**
     * @brief Rendering surface created by the embedding application.
     * Conduit never owns it; it only forwards the native handle.
     */
    struct Surface {
        void* native = nullptr;

        bool operator==(const Surface& other) const { return native == other.native; }
        bool operator!=(const Surface& other) const { return native != other.native; }
    };

    /**
     * @brief Base class of every plugin.
     */
    class Plugin {
    public:
        virtual ~Plugin() {}

        /**
         * @brief Receives the plugin's configuration blob (usually JSON text)
         * before any command can be dispatched. The default keeps it for
         * config().
         */
        virtual void set_config(const std::string& config) { config_ = config; }

        /**
         * @brief Called once when a rendering surface becomes available.
         */
        virtual void load(const Surface& surface) { (void)surface; }

        const std::string& config() const { return config_; }
        const CommandTable& commands() const { return commands_; }

    protected:
        void register_sync_command(const std::string& name, SyncCommand fn) {
            commands_.add_sync(name, std::move(fn));
        }
        void register_fallible_command(const std::string& name, FallibleCommand fn) {
            commands_.add_fallible(name, std::move(fn));
        }
        void register_async_command(const std::string& name, AsyncCommand fn) {
            commands_.add_async(name, std::move(fn));
        }

    private:
        std::string config_;
        CommandTable commands_;
    };

    /**
     * @brief Boxes a plugin instance for the C ABI. The returned pointer is
     * consumed by conduit_register_plugin (or conduit_plugin_release).
     */
    conduit_plugin* ExportPlugin(std::shared_ptr<Plugin> plugin);

} // namespace plugins
} // namespace conduit

/**
 * Declares `extern "C" conduit_plugin* fn_name()` creating a PluginType.
 */
#define CONDUIT_PLUGIN_BINDING(fn_name, PluginType)                              \
    extern "C" conduit_plugin* fn_name() {                                       \
        return ::conduit::plugins::ExportPlugin(std::make_shared<PluginType>()); \
    }

#endif // CONDUIT_PLUGIN_HPP
