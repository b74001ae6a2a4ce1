// File: tests/test_bridge.cpp
// Purpose: The extern "C" entry points drive the runtime and tolerate null
//          arguments.

#include <gtest/gtest.h>

#include "core/bridge.hpp"
#include "plugins/interface/conduit_plugin.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

using conduit::plugins::Invoke;
using conduit::plugins::Plugin;
using conduit::plugins::Surface;

namespace
{
class BridgePlugin : public Plugin
{
  public:
    BridgePlugin()
    {
        register_sync_command("hello", [](Invoke &invoke) {
            invoke.send_channel_data(11, "tick");
            invoke.resolve_raw("world:" + invoke.data());
        });
    }

    void load(const Surface &) override { ++loads; }

    static int loads;
};

int BridgePlugin::loads = 0;

class FragilePlugin : public Plugin
{
  public:
    void load(const Surface &) override { throw std::runtime_error("surface lost"); }
};

struct CallRecord
{
    std::int64_t id;
    bool success;
    std::string payload;
};

std::mutex g_mu;
std::condition_variable g_cv;
std::vector<CallRecord> g_calls;
std::vector<std::string> g_channel;

void onResult(int64_t id, bool success, const char *payload)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_calls.push_back({id, success, payload});
    g_cv.notify_all();
}

void onChannel(uint64_t channel, const char *payload)
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_channel.push_back(std::to_string(channel) + ":" + payload);
}

bool waitCalls(std::size_t n)
{
    std::unique_lock<std::mutex> lock(g_mu);
    return g_cv.wait_for(lock, std::chrono::seconds(2), [&] { return g_calls.size() >= n; });
}

void reset()
{
    std::lock_guard<std::mutex> lock(g_mu);
    g_calls.clear();
    g_channel.clear();
    BridgePlugin::loads = 0;
}
} // namespace

CONDUIT_PLUGIN_BINDING(init_bridge_plugin, BridgePlugin)
CONDUIT_PLUGIN_BINDING(init_fragile_plugin, FragilePlugin)

TEST(BridgeTest, RegisterAndRunThroughCAbi)
{
    reset();
    conduit_runtime *rt = conduit_runtime_create();
    ASSERT_NE(rt, nullptr);

    conduit_register_plugin(rt, "bridge", init_bridge_plugin(), "{}", nullptr);
    conduit_run_plugin_command(rt, 42, "bridge", "hello", "x", onResult, onChannel);
    ASSERT_TRUE(waitCalls(1));
    conduit_runtime_destroy(rt);

    std::lock_guard<std::mutex> lock(g_mu);
    EXPECT_EQ(g_calls[0].id, 42);
    EXPECT_TRUE(g_calls[0].success);
    EXPECT_EQ(g_calls[0].payload, "world:x");
    ASSERT_EQ(g_channel.size(), 1u);
    EXPECT_EQ(g_channel[0], "11:tick");
}

TEST(BridgeTest, SurfaceAtRegistrationAndLater)
{
    reset();
    conduit_runtime *rt = conduit_runtime_create();
    int native = 0;
    auto *surface = reinterpret_cast<conduit_surface *>(&native);

    conduit_register_plugin(rt, "a", init_bridge_plugin(), "{}", surface);
    EXPECT_EQ(BridgePlugin::loads, 1);

    conduit_register_plugin(rt, "b", init_bridge_plugin(), "{}", nullptr);
    conduit_surface_created(rt, surface, nullptr);
    conduit_surface_created(rt, surface, nullptr);
    EXPECT_EQ(BridgePlugin::loads, 2);

    conduit_runtime_destroy(rt);
}

TEST(BridgeTest, ThrowingLoadDoesNotCrossTheCAbi)
{
    reset();
    conduit_runtime *rt = conduit_runtime_create();
    int native = 0;
    auto *surface = reinterpret_cast<conduit_surface *>(&native);

    conduit_register_plugin(rt, "fragile", init_fragile_plugin(), "{}", nullptr);
    conduit_register_plugin(rt, "steady", init_bridge_plugin(), "{}", nullptr);
    EXPECT_NO_THROW(conduit_surface_created(rt, surface, nullptr));
    EXPECT_EQ(BridgePlugin::loads, 1);

    EXPECT_NO_THROW(conduit_register_plugin(rt, "fragile2", init_fragile_plugin(), "{}", surface));

    conduit_run_plugin_command(rt, 7, "steady", "hello", "y", onResult, onChannel);
    ASSERT_TRUE(waitCalls(1));
    conduit_runtime_destroy(rt);

    std::lock_guard<std::mutex> lock(g_mu);
    EXPECT_TRUE(g_calls[0].success);
    EXPECT_EQ(g_calls[0].payload, "world:y");
}

TEST(BridgeTest, NullArgumentsAreRejectedNotFatal)
{
    reset();
    conduit_runtime *rt = conduit_runtime_create();

    conduit_register_plugin(nullptr, "x", init_bridge_plugin(), "{}", nullptr);
    conduit_register_plugin(rt, nullptr, init_bridge_plugin(), "{}", nullptr);
    conduit_register_plugin(rt, "x", nullptr, "{}", nullptr);
    conduit_surface_created(rt, nullptr, nullptr);
    conduit_run_plugin_command(rt, 9, nullptr, "hello", "", onResult, onChannel);
    conduit_run_plugin_command(rt, 10, "x", "hello", nullptr, nullptr, nullptr);

    ASSERT_TRUE(waitCalls(1));
    {
        std::lock_guard<std::mutex> lock(g_mu);
        EXPECT_EQ(g_calls[0].id, 9);
        EXPECT_FALSE(g_calls[0].success);
    }

    conduit_runtime_destroy(rt);
    conduit_runtime_destroy(nullptr);
    conduit_plugin_release(init_bridge_plugin());
}
