/**
 * ============================================================================
 * SOFTWARE: Conduit: Plugin Invocation Router - Host
 * MODULE: main.cpp
 * ============================================================================
 * * DESCRIPTION:
 * Reference host. Builds the runtime from configuration, registers the
 * built-in plugins and exposes command invocation over HTTP.
 * ============================================================================
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "log.hpp"
#include "PluginClient.hpp"
#include "Runtime.hpp"
#include "../plugins/builtin/EchoPlugin.hpp"

using json = nlohmann::json;
using conduit::conduit_log;

int main() {
    conduit::RuntimeConfig config = conduit::load_runtime_config_from_env();
    conduit::Runtime runtime(config);

    runtime.RegisterPlugin("echo", std::make_shared<conduit::plugins::EchoPlugin>(),
                           conduit::plugin_config_for(config, "echo"));

    httplib::Server svr;
    conduit_log("INFO", "Conduit host: engine active.");

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        std::string log_msg = "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status);
        conduit_log("INFO", log_msg);
    });

    // === [PLUGIN INVOCATION] ===
    // Body is the JSON payload. Channel data streamed by the command is
    // collected and returned next to the result.
    svr.Post(R"(/api/plugin/([^/]+)/([^/]+))", [&](const httplib::Request &req, httplib::Response &res) {
        std::string plugin_name = req.matches[1];
        std::string command = req.matches[2];

        json payload;
        try {
            payload = req.body.empty() ? json::object() : json::parse(req.body);
        } catch (const json::parse_error &e) {
            res.status = 400;
            res.set_content(json{{"status", "ERROR"}, {"message", std::string("Invalid JSON body: ") + e.what()}}.dump(),
                            "application/json");
            return;
        }

        conduit::PluginClient client(runtime, plugin_name);

        // Owned by the handler as well: a plugin worker may still deliver
        // data after this request has returned.
        struct ChannelLog {
            std::mutex mu;
            json messages = json::array();
        };
        auto channel_log = std::make_shared<ChannelLog>();
        std::uint64_t channel_id = client.OpenChannel([channel_log](const json &message) {
            std::lock_guard<std::mutex> lock(channel_log->mu);
            channel_log->messages.push_back(message);
        });
        if (payload.is_object() && !payload.contains("channel")) {
            payload["channel"] = channel_id;
        }

        try {
            json result = client.Run(command, payload);
            client.CloseChannel(channel_id);

            std::lock_guard<std::mutex> lock(channel_log->mu);
            res.set_content(json{{"status", "SUCCESS"}, {"result", result}, {"channel", channel_log->messages}}.dump(),
                            "application/json");
        } catch (const conduit::PluginInvokeError &e) {
            client.CloseChannel(channel_id);
            res.status = e.kind() == conduit::PluginInvokeError::Kind::Timeout ? 504 : 422;
            json body = {{"status", "ERROR"}, {"message", e.what()}};
            if (e.kind() == conduit::PluginInvokeError::Kind::InvokeRejected && e.response().code) {
                body["code"] = *e.response().code;
            }
            res.set_content(body.dump(), "application/json");
        }
    });

    svr.Get("/api/plugins/active", [&](const httplib::Request &, httplib::Response &res) {
        json plugins = json::array();
        for (const auto &name : runtime.plugin_manager().RegisteredPlugins()) {
            plugins.push_back({
                {"name", name},
                {"attached", runtime.plugin_manager().IsAttached(name)},
                {"commands", runtime.plugin_manager().CommandDirectory(name)}
            });
        }
        res.set_content(plugins.dump(), "application/json");
    });

    svr.Get("/api/system/logs", [&](const httplib::Request &, httplib::Response &res) {
        json response;
        response["logs"] = conduit::recent_logs();
        res.set_content(response.dump(), "application/json");
    });

    // === [SERVER INITIALIZATION] ===
    conduit_log("INFO", "Conduit host listening on " + config.listen_host + ":" + std::to_string(config.listen_port));
    if (!svr.listen(config.listen_host.c_str(), config.listen_port)) {
        conduit_log("FATAL", "Failed to bind " + config.listen_host + ":" + std::to_string(config.listen_port));
        return 1;
    }

    return 0;
}
