/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: PluginManager.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Implementation of the PluginManager. This class is the traffic
 * controller between the host and the registered plugins: it resolves the
 * calling convention of the requested command and drives it to a single
 * terminal response.
 * ============================================================================
 */

#include "PluginManager.hpp"
#include "../../core/log.hpp"

#include <exception>
#include <mutex>
#include <utility>

namespace conduit {
namespace plugins {

std::string DispatchErrorName(DispatchError error) {
    switch (error) {
        case DispatchError::PluginNotFound: return "PluginNotFound";
        case DispatchError::CommandNotFound: return "CommandNotFound";
        case DispatchError::HandlerError: return "HandlerError";
        case DispatchError::ProtocolMisuse: return "ProtocolMisuse";
    }
    return "Unknown";
}

PluginManager::PluginManager(const std::string& queue_label)
    : queue_(queue_label) {
    conduit_log("INFO", "Plugin Manager initialised (queue '" + queue_label + "').");
}

PluginManager::~PluginManager() {
    queue_.Stop();
    conduit_log("INFO", "Plugin Manager shutting down.");
}

// ----------------------------------------------------------------------------
// RegisterPlugin
// Configures the instance, then publishes it under its name. The surface to
// load with is picked inside the same critical section as the insert, so a
// concurrent AttachSurface either sees the new handle or has already set
// surface_. Last registration for a name wins.
// ----------------------------------------------------------------------------
void PluginManager::RegisterPlugin(const std::string& name,
                                   std::shared_ptr<Plugin> plugin,
                                   const std::string& config,
                                   std::optional<Surface> surface) {
    if (!plugin) {
        conduit_log("ERROR", "Refusing to register null plugin '" + name + "'.");
        return;
    }
    if (dispatch_started_.load()) {
        conduit_log("WARN", "Plugin '" + name + "' registered after dispatch started; "
                            "commands issued before now could not have reached it.");
    }

    try {
        plugin->set_config(config);
    } catch (const std::exception& e) {
        conduit_log("ERROR", "Plugin '" + name + "' rejected its config, not registered: " + e.what());
        return;
    } catch (...) {
        conduit_log("ERROR", "Plugin '" + name + "' rejected its config with an unknown exception, not registered.");
        return;
    }

    PluginHandle handle;
    handle.instance = plugin;
    handle.directory = BuildCommandDirectory(plugin->commands());

    bool replaced = false;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mu_);
        if (!surface) {
            surface = surface_;
        }
        handle.attached = surface.has_value();
        replaced = registry_.count(name) > 0;
        registry_[name] = std::move(handle);
    }

    bool attached = surface && LoadOrDetach(name, plugin, *surface);

    conduit_log("INFO", std::string(replaced ? "Replaced" : "Registered") + " plugin '" + name + "'" +
                        (attached ? " (surface attached)." : "."));
}

// ----------------------------------------------------------------------------
// AttachSurface
// Marks the pending handles under the lock, then calls into plugin code
// with the lock released so load() may use the manager itself.
// ----------------------------------------------------------------------------
void PluginManager::AttachSurface(const Surface& surface) {
    std::vector<std::pair<std::string, std::shared_ptr<Plugin>>> pending;
    {
        std::unique_lock<std::shared_mutex> lock(registry_mu_);
        surface_ = surface;
        for (auto& pair : registry_) {
            if (!pair.second.attached) {
                pair.second.attached = true;
                pending.emplace_back(pair.first, pair.second.instance);
            }
        }
    }

    for (auto& entry : pending) {
        if (LoadOrDetach(entry.first, entry.second, surface)) {
            conduit_log("INFO", "Surface attached to plugin '" + entry.first + "'.");
        }
    }
}

bool PluginManager::LoadOrDetach(const std::string& name,
                                 const std::shared_ptr<Plugin>& plugin,
                                 const Surface& surface) {
    std::string failure;
    try {
        plugin->load(surface);
        return true;
    } catch (const std::exception& e) {
        failure = e.what();
    } catch (...) {
        failure = "unknown exception";
    }

    conduit_log("ERROR", "Plugin '" + name + "' failed to load surface: " + failure);

    // Only clear the flag if the slot still holds this instance.
    std::unique_lock<std::shared_mutex> lock(registry_mu_);
    auto it = registry_.find(name);
    if (it != registry_.end() && it->second.instance == plugin) {
        it->second.attached = false;
    }
    return false;
}

void PluginManager::ExecutePluginCommand(const std::string& name, std::shared_ptr<Invoke> invoke) {
    if (!invoke) {
        conduit_log("ERROR", "ExecutePluginCommand called without an invocation for plugin '" + name + "'.");
        return;
    }
    dispatch_started_.store(true);

    std::shared_ptr<Plugin> plugin;
    std::string directory;
    {
        std::shared_lock<std::shared_mutex> lock(registry_mu_);
        auto it = registry_.find(name);
        if (it != registry_.end()) {
            plugin = it->second.instance;
            directory = it->second.directory;
        }
    }

    if (!plugin) {
        conduit_log("WARN", DispatchErrorName(DispatchError::PluginNotFound) + ": '" + name + "'.");
        invoke->reject("Plugin " + name + " not initialized");
        return;
    }

    bool queued = queue_.Post([this, name, plugin, directory, invoke] {
        Dispatch(name, plugin, directory, invoke);
    });
    if (!queued) {
        invoke->reject("Plugin " + name + " is shutting down");
    }
}

// ----------------------------------------------------------------------------
// Dispatch
// Runs on the serial queue. Async beats Fallible beats Sync; see
// ResolveCommand. Anything a handler throws becomes a HandlerError response.
// ----------------------------------------------------------------------------
void PluginManager::Dispatch(const std::string& name,
                             const std::shared_ptr<Plugin>& plugin,
                             const std::string& directory,
                             const std::shared_ptr<Invoke>& invoke) {
    const std::string& command = invoke->command();
    ResolvedCommand resolved = ResolveCommand(plugin->commands(), command);

    if (!resolved) {
        conduit_log("WARN", DispatchErrorName(DispatchError::CommandNotFound) + ": '" + command +
                            "' on plugin '" + name + "'.");
        invoke->reject("No command " + command + " found for plugin " + name +
                       ".\nAvailable selectors:\n" + directory);
        return;
    }

    try {
        switch (resolved.convention) {
            case Convention::Async: {
                Completion done([invoke, name](const std::optional<std::string>& error) {
                    if (error) {
                        conduit_log("WARN", DispatchErrorName(DispatchError::HandlerError) + ": '" +
                                            invoke->command() + "' on plugin '" + name + "': " + *error);
                        invoke->reject("Swift async error: " + *error);
                    } else {
                        invoke->resolve_if_pending();
                    }
                });
                resolved.entry->async(*invoke, done);
                break;
            }
            case Convention::Fallible: {
                std::string error;
                resolved.entry->fallible(*invoke, error);
                if (!error.empty()) {
                    conduit_log("WARN", DispatchErrorName(DispatchError::HandlerError) + ": '" + command +
                                        "' on plugin '" + name + "': " + error);
                    invoke->reject(error);
                } else if (!invoke->is_completed()) {
                    conduit_log("WARN", DispatchErrorName(DispatchError::ProtocolMisuse) + ": '" + command +
                                        "' on plugin '" + name + "' returned without responding.");
                }
                break;
            }
            case Convention::Sync: {
                resolved.entry->sync(*invoke);
                if (!invoke->is_completed()) {
                    conduit_log("WARN", DispatchErrorName(DispatchError::ProtocolMisuse) + ": '" + command +
                                        "' on plugin '" + name + "' returned without responding.");
                }
                break;
            }
            case Convention::None:
                break;
        }
    } catch (const std::exception& e) {
        conduit_log("ERROR", DispatchErrorName(DispatchError::HandlerError) + ": '" + command +
                             "' on plugin '" + name + "' threw: " + std::string(e.what()));
        invoke->reject(e.what());
    } catch (...) {
        conduit_log("ERROR", DispatchErrorName(DispatchError::HandlerError) + ": '" + command +
                             "' on plugin '" + name + "' threw a non-standard exception.");
        invoke->reject("unknown handler exception");
    }
}

bool PluginManager::HasPlugin(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(registry_mu_);
    return registry_.count(name) > 0;
}

bool PluginManager::IsAttached(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(registry_mu_);
    auto it = registry_.find(name);
    return it != registry_.end() && it->second.attached;
}

std::vector<std::string> PluginManager::RegisteredPlugins() const {
    std::shared_lock<std::shared_mutex> lock(registry_mu_);
    std::vector<std::string> names;
    for (const auto& pair : registry_) {
        names.push_back(pair.first);
    }
    return names;
}

std::string PluginManager::CommandDirectory(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(registry_mu_);
    auto it = registry_.find(name);
    if (it == registry_.end()) {
        return "";
    }
    return it->second.directory;
}

void PluginManager::Flush() {
    queue_.Flush();
}

} // namespace plugins
} // namespace conduit
