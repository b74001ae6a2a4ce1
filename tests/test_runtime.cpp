// File: tests/test_runtime.cpp
// Purpose: End-to-end behaviour of the three host entry points on an
//          explicitly constructed runtime.

#include <gtest/gtest.h>

#include "core/Runtime.hpp"
#include "test_support.hpp"

#include <memory>
#include <string>
#include <thread>
#include <vector>

using conduit::Runtime;
using conduit::plugins::Completion;
using conduit::plugins::Invoke;
using conduit::plugins::Plugin;
using conduit::plugins::Surface;
using conduit_test::Recorder;

namespace
{
class PingPlugin : public Plugin
{
  public:
    PingPlugin()
    {
        register_sync_command("ping", [](Invoke &invoke) {
            invoke.send_response(invoke.callback_tag(), std::string("pong"));
        });
        register_sync_command("nothing", [](Invoke &invoke) { invoke.resolve(); });
        register_sync_command("stream", [](Invoke &invoke) {
            invoke.send_channel_data(3, "one");
            invoke.send_channel_data(4, "two");
            invoke.resolve_raw("done");
        });
    }
};

class DualPlugin : public Plugin
{
  public:
    DualPlugin()
    {
        register_sync_command("run", [](Invoke &invoke) { invoke.resolve_raw("sync"); });
        register_async_command("run", [](Invoke &invoke, Completion done) {
            invoke.resolve_raw("async");
            done();
        });
    }
};

class CountingPlugin : public Plugin
{
  public:
    void load(const Surface &) override { ++loads; }
    int loads = 0;
};
} // namespace

TEST(RuntimeTest, EchoPingRespondsPong)
{
    Runtime runtime;
    runtime.RegisterPlugin("echo", std::make_shared<PingPlugin>(), "{}");

    Recorder rec;
    runtime.RunCommand(1, "echo", "ping", "", rec.resultFn(), rec.channelFn());
    ASSERT_TRUE(rec.waitForResults(1));

    auto results = rec.results();
    EXPECT_EQ(results[0].id, 1);
    EXPECT_TRUE(results[0].success);
    EXPECT_EQ(results[0].payload, "pong");
}

TEST(RuntimeTest, MissingPluginReportsNotInitialized)
{
    Runtime runtime;
    runtime.RegisterPlugin("echo", std::make_shared<PingPlugin>(), "{}");

    Recorder rec;
    runtime.RunCommand(2, "missing", "x", "", rec.resultFn(), rec.channelFn());
    ASSERT_TRUE(rec.waitForResults(1));

    auto results = rec.results();
    EXPECT_EQ(results[0].id, 2);
    EXPECT_FALSE(results[0].success);
    EXPECT_EQ(results[0].payload, "Plugin missing not initialized");
}

TEST(RuntimeTest, MissingCommandReportsDiagnostic)
{
    Runtime runtime;
    runtime.RegisterPlugin("echo", std::make_shared<PingPlugin>(), "{}");

    Recorder rec;
    runtime.RunCommand(3, "echo", "boom", "", rec.resultFn(), rec.channelFn());
    ASSERT_TRUE(rec.waitForResults(1));

    auto results = rec.results();
    EXPECT_EQ(results[0].id, 3);
    EXPECT_FALSE(results[0].success);
    EXPECT_NE(results[0].payload.find("No command boom found for plugin echo"), std::string::npos);
    EXPECT_NE(results[0].payload.find("ping: (Object) -> Void"), std::string::npos);
}

TEST(RuntimeTest, AbsentPayloadBecomesNullLiteral)
{
    Runtime runtime;
    runtime.RegisterPlugin("echo", std::make_shared<PingPlugin>(), "{}");

    Recorder rec;
    runtime.RunCommand(4, "echo", "nothing", "", rec.resultFn(), rec.channelFn());
    ASSERT_TRUE(rec.waitForResults(1));
    EXPECT_TRUE(rec.results()[0].success);
    EXPECT_EQ(rec.results()[0].payload, "null");
}

TEST(RuntimeTest, AsyncHandlerWinsOverSync)
{
    Runtime runtime;
    runtime.RegisterPlugin("dual", std::make_shared<DualPlugin>(), "{}");

    Recorder rec;
    runtime.RunCommand(5, "dual", "run", "", rec.resultFn(), rec.channelFn());
    ASSERT_TRUE(rec.waitForResults(1));
    runtime.plugin_manager().Flush();

    ASSERT_EQ(rec.results().size(), 1u);
    EXPECT_EQ(rec.results()[0].payload, "async");
}

TEST(RuntimeTest, ChannelDataPrecedesTerminalResponse)
{
    Runtime runtime;
    runtime.RegisterPlugin("echo", std::make_shared<PingPlugin>(), "{}");

    Recorder rec;
    runtime.RunCommand(6, "echo", "stream", "", rec.resultFn(), rec.channelFn());
    ASSERT_TRUE(rec.waitForResults(1));

    auto channel = rec.channel();
    ASSERT_EQ(channel.size(), 2u);
    EXPECT_EQ(channel[0].first, 3u);
    EXPECT_EQ(channel[0].second, "one");
    EXPECT_EQ(channel[1].first, 4u);
    EXPECT_EQ(rec.results()[0].payload, "done");
}

TEST(RuntimeTest, UnregisteredNameNeverSucceeds)
{
    Runtime runtime;
    runtime.RegisterPlugin("P", std::make_shared<PingPlugin>(), "{}");

    Recorder rec;
    const char *others[] = {"Q", "p", "P ", ""};
    for (const char *name : others)
        runtime.RunCommand(7, name, "ping", "", rec.resultFn(), rec.channelFn());
    ASSERT_TRUE(rec.waitForResults(4));

    for (const auto &r : rec.results())
    {
        EXPECT_FALSE(r.success);
        EXPECT_NE(r.payload.find("not initialized"), std::string::npos);
    }
}

TEST(RuntimeTest, SurfaceCreatedStoresOwnerAndAttachesOnce)
{
    Runtime runtime;
    auto plugin = std::make_shared<CountingPlugin>();
    runtime.RegisterPlugin("ui", plugin, "{}");

    int native = 0;
    int owner = 0;
    Surface surface;
    surface.native = &native;
    runtime.SurfaceCreated(surface, &owner);
    runtime.SurfaceCreated(surface, &owner);

    EXPECT_EQ(plugin->loads, 1);
    EXPECT_EQ(runtime.surface_owner(), &owner);
}

TEST(RuntimeTest, SurfaceOwnerCanBeReadWhileSurfacesArrive)
{
    Runtime runtime;
    int native = 0;
    int owners[2] = {0, 0};
    Surface surface;
    surface.native = &native;

    std::thread announcer([&] {
        for (int i = 0; i < 200; ++i)
            runtime.SurfaceCreated(surface, &owners[i % 2]);
    });
    std::vector<void *> seen;
    for (int i = 0; i < 200; ++i)
        seen.push_back(runtime.surface_owner());
    announcer.join();

    for (void *owner : seen)
        EXPECT_TRUE(owner == nullptr || owner == &owners[0] || owner == &owners[1]);
    EXPECT_EQ(runtime.surface_owner(), &owners[1]);
}

TEST(RuntimeTest, ResponseTagsAreFixed)
{
    EXPECT_EQ(Runtime::kCallbackTag, 0u);
    EXPECT_EQ(Runtime::kErrorTag, 1u);
}
