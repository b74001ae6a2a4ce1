/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router
 * MODULE: Runtime.cpp
 * ============================================================================
 */

#include "Runtime.hpp"
#include "log.hpp"

#include <utility>

namespace conduit {

constexpr std::uint64_t Runtime::kCallbackTag;
constexpr std::uint64_t Runtime::kErrorTag;

Runtime::Runtime(const RuntimeConfig& config)
    : config_(config),
      plugin_manager_(config.queue_label) {
    set_log_capacity(config.log_capacity);
}

void Runtime::RegisterPlugin(const std::string& name,
                             std::shared_ptr<plugins::Plugin> plugin,
                             const std::string& config,
                             std::optional<plugins::Surface> surface) {
    plugin_manager_.RegisterPlugin(name, std::move(plugin), config, surface);
}

void Runtime::SurfaceCreated(const plugins::Surface& surface, void* owner) {
    surface_owner_.store(owner);
    plugin_manager_.AttachSurface(surface);
}

void Runtime::RunCommand(std::int64_t invocation_id,
                         const std::string& plugin_name,
                         const std::string& command,
                         const std::string& data,
                         ResultFn on_result,
                         ChannelDataFn on_channel_data) {
    auto invoke = std::make_shared<plugins::Invoke>(
        command, kCallbackTag, kErrorTag,
        [invocation_id, on_result](std::uint64_t tag, const std::optional<std::string>& payload) {
            if (on_result) {
                on_result(invocation_id, tag == kCallbackTag, payload ? *payload : "null");
            }
        },
        [on_channel_data](std::uint64_t channel_id, const std::string& payload) {
            if (on_channel_data) {
                on_channel_data(channel_id, payload);
            }
        },
        data);

    plugin_manager_.ExecutePluginCommand(plugin_name, std::move(invoke));
}

} // namespace conduit
