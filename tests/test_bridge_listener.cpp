#include "rotbridge/bridge/Listener.hpp"
#include "TestHarness.hpp"

#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using rotbridge::bridge::Listener;
using rotbridge::config::BridgeConfig;
using rotbridge::core::CancellationToken;
using testsupport::FakeRt21Device;
using testsupport::RawClient;
using testsupport::waitUntil;

static BridgeConfig loopbackConfig(unsigned short devicePort) {
    BridgeConfig config;
    config.rt21Host = "127.0.0.1";
    config.rt21Port = devicePort;
    config.listenAddress = "127.0.0.1";
    config.listenPort = 0;
    config.connectTimeout = 1000ms;
    config.ackTimeout = 200ms;
    return config;
}

static void testConcurrentClientsGetOwnLinks() {
    FakeRt21Device device(testsupport::positionResponder("123;"));
    Listener listener(loopbackConfig(device.port()), CancellationToken{});
    REQUIRE_TRUE(listener.open().has_value(), "open");
    ASSERT_TRUE(listener.port() != 0, "ephemeral port");

    std::thread acceptLoop([&listener]{ listener.run(); });

    {
        RawClient first(listener.port());
        RawClient second(listener.port());

        ASSERT_EQ(first.request("C"), std::string("AZ=123\r\n"), "first client served");
        ASSERT_EQ(second.request("C"), std::string("AZ=123\r\n"), "second client served");
        ASSERT_EQ(first.request("M5"), std::string("OK\r\n"), "first client still served");

        ASSERT_EQ(device.connectionsAccepted(), 2, "one RT21 link per client");
        ASSERT_EQ(listener.sessionsStarted(), std::size_t{2}, "two sessions");
        ASSERT_EQ(listener.activeSessions(), std::size_t{2}, "both active");
    }

    ASSERT_TRUE(waitUntil([&]{ return listener.activeSessions() == 0; }), "sessions end with their clients");
    ASSERT_TRUE(waitUntil([&]{ return device.connectionsClosedByPeer() == 2; }), "RT21 links closed");

    listener.stop();
    acceptLoop.join();
}

static void testStopClosesConnectedClients() {
    FakeRt21Device device(testsupport::positionResponder("001;"));
    Listener listener(loopbackConfig(device.port()), CancellationToken{});
    REQUIRE_TRUE(listener.open().has_value(), "open");

    std::thread acceptLoop([&listener]{ listener.run(); });

    RawClient idle(listener.port());
    ASSERT_EQ(idle.request("C"), std::string("AZ=001\r\n"), "connected");

    const auto started = std::chrono::steady_clock::now();
    listener.stop();
    acceptLoop.join();
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(elapsed < 2000ms, "run returns promptly");
    ASSERT_TRUE(idle.waitForClose(), "idle client disconnected on stop");
    ASSERT_EQ(listener.activeSessions(), std::size_t{0}, "no sessions left");
    ASSERT_TRUE(waitUntil([&]{ return device.connectionsClosedByPeer() == 1; }), "RT21 link closed");
}

static void testStopBeforeRun() {
    Listener listener(loopbackConfig(testsupport::closedLoopbackPort()), CancellationToken{});
    REQUIRE_TRUE(listener.open().has_value(), "open");
    listener.stop();
    listener.run();
    ASSERT_EQ(listener.sessionsStarted(), std::size_t{0}, "nothing accepted");
}

static void testSharedTokenStopsListener() {
    CancellationToken token;
    Listener listener(loopbackConfig(testsupport::closedLoopbackPort()), token);
    REQUIRE_TRUE(listener.open().has_value(), "open");

    std::thread acceptLoop([&listener]{ listener.run(); });
    std::this_thread::sleep_for(50ms);

    token.cancel();
    // The token alone does not wake a blocked accept; one more client does.
    RawClient nudge(listener.port());
    acceptLoop.join();
    ASSERT_TRUE(token.isCancelled(), "token cancelled");
}

static void testBusyPortFailsToOpen() {
    Listener first(loopbackConfig(testsupport::closedLoopbackPort()), CancellationToken{});
    REQUIRE_TRUE(first.open().has_value(), "first open");

    auto config = loopbackConfig(testsupport::closedLoopbackPort());
    config.listenPort = first.port();
    Listener second(config, CancellationToken{});
    auto opened = second.open();
    ASSERT_TRUE(!opened, "port already taken");
    ASSERT_TRUE(!opened && opened.error() == rotbridge::net::asio::error::address_in_use, "address in use");
}

int main() {
    rotbridge::net::ensureNetService();
    rotbridge::setInfoLogHandler([](std::string_view) {});

    testConcurrentClientsGetOwnLinks();
    testStopClosesConnectedClients();
    testStopBeforeRun();
    testSharedTokenStopsListener();
    testBusyPortFailsToOpen();

    rotbridge::resetLogHandlers();
    return finishTests("Listener tests");
}
