/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: PluginManager.hpp
 * ============================================================================
 * * DESCRIPTION:
 * This header defines the dispatch engine. It keeps the plugin registry,
 * pushes rendering surfaces to plugins, and routes a command to the right
 * handler on the plugin it names.
 * * DESIGN PHILOSOPHY:
 * - Exactly once: every invocation ends in a single terminal response,
 *   whichever calling convention the handler uses.
 * - Serialized: commands run one after another on a dedicated queue, off
 *   the caller's thread.
 * - Reported, never fatal: unknown plugins, unknown commands and failing
 *   handlers all turn into an error response.
 * ============================================================================
 */

#ifndef CONDUIT_PLUGIN_MANAGER_HPP
#define CONDUIT_PLUGIN_MANAGER_HPP

#include <atomic>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "conduit_plugin.hpp"
#include "../../core/SerialQueue.hpp"

namespace conduit {
namespace plugins {

    /**
     * @brief Registry slot for one plugin name.
     */
    struct PluginHandle {
        std::shared_ptr<Plugin> instance;
        bool attached = false;      // a surface has been pushed to instance
        std::string directory;      // BuildCommandDirectory() at registration
    };

    enum class DispatchError {
        PluginNotFound,
        CommandNotFound,
        HandlerError,
        ProtocolMisuse
    };

    std::string DispatchErrorName(DispatchError error);

    class PluginManager {
    public:
        /**
         * @param queue_label Label of the serial execution queue.
         */
        explicit PluginManager(const std::string& queue_label = "ipc");

        /**
         * @brief Drains queued commands before the registry goes away.
         */
        ~PluginManager();

        PluginManager(const PluginManager&) = delete;
        PluginManager& operator=(const PluginManager&) = delete;

        /**
         * @brief Adds or replaces the plugin stored under name.
         *
         * The config blob is applied before the plugin becomes visible to
         * dispatch. If a surface is passed, or one was already announced
         * through AttachSurface, the plugin is loaded with it right away.
         * A plugin whose set_config throws is not registered. A plugin whose
         * load throws is registered unattached.
         */
        void RegisterPlugin(const std::string& name,
                            std::shared_ptr<Plugin> plugin,
                            const std::string& config,
                            std::optional<Surface> surface = std::nullopt);

        /**
         * @brief Pushes surface to every plugin not attached yet. Plugins that
         * already have a surface are skipped, so calling this twice is harmless.
         * A load that throws affects only its own plugin, which stays
         * unattached and is retried on the next call.
         */
        void AttachSurface(const Surface& surface);

        /**
         * @brief The main entry point. Looks the plugin up on the calling
         * thread and runs the command on the serial queue.
         *
         * Unknown plugin names are rejected immediately with
         * "Plugin <name> not initialized".
         */
        void ExecutePluginCommand(const std::string& name, std::shared_ptr<Invoke> invoke);

        bool HasPlugin(const std::string& name) const;
        bool IsAttached(const std::string& name) const;
        std::vector<std::string> RegisteredPlugins() const;

        // Empty string when the plugin is unknown.
        std::string CommandDirectory(const std::string& name) const;

        /**
         * @brief Blocks until every command queued so far has run.
         */
        void Flush();

    private:
        // Runs plugin->load(surface). A throwing load is logged and the
        // handle under name is marked unattached again so a later
        // AttachSurface retries it. Returns false on failure.
        bool LoadOrDetach(const std::string& name,
                          const std::shared_ptr<Plugin>& plugin,
                          const Surface& surface);

        void Dispatch(const std::string& name,
                      const std::shared_ptr<Plugin>& plugin,
                      const std::string& directory,
                      const std::shared_ptr<Invoke>& invoke);

        mutable std::shared_mutex registry_mu_;
        std::map<std::string, PluginHandle> registry_;
        std::optional<Surface> surface_;
        std::atomic<bool> dispatch_started_{false};

        // Declared last: destroyed first, so pending commands still see the registry.
        SerialQueue queue_;
    };

} // namespace plugins
} // namespace conduit

#endif // CONDUIT_PLUGIN_MANAGER_HPP
