#include <catch2/catch.hpp>

#include "printrelay/Utils/SocketIoChannel.hpp"

#include "libprintrelay/Exception.hpp"

#include "test_utils/MockPrinter.hpp"
#include "test_utils/MockSocketIoServer.hpp"

#include <algorithm>
#include <chrono>

using namespace PrintRelay;
using Test::MockSocketIoServer;

namespace {

SocketIoChannelOptions options_for(const std::string &url, const std::string &tenant = "tenant-1")
{
    SocketIoChannelOptions options;
    options.backend_url        = url;
    options.tenant_id          = tenant;
    options.connect_timeout_ms = 3000;
    options.write_timeout_ms   = 2000;
    return options;
}

bool contains(const std::vector<std::string> &frames, const std::string &frame)
{
    return std::find(frames.begin(), frames.end(), frame) != frames.end();
}

} // namespace

TEST_CASE("Channel joins the controller namespace", "[SocketIoChannel]")
{
    MockSocketIoServer server([](MockSocketIoServer::Peer &peer) {
        peer.handshake(300, 200);
        peer.drain();
    });

    {
        SocketIoChannel channel(options_for(server.url(), "acme corp"));
        channel.open();
        REQUIRE(channel.is_open());
        REQUIRE(channel.open_info().sid == "eio-sid");
        REQUIRE(channel.open_info().ping_interval_ms == 300);
        REQUIRE(channel.open_info().ping_timeout_ms == 200);

        channel.close();
        REQUIRE_FALSE(channel.is_open());
        // Idempotent.
        channel.close();
    }
    server.join();

    REQUIRE(server.error().empty());
    REQUIRE(server.request_target() == "/socket.io/?EIO=4&transport=websocket&tenant=acme%20corp");
    REQUIRE(server.user_agent() == "PrintRelay/1.0.0");

    std::vector<std::string> frames = server.received();
    REQUIRE(frames.size() == 2);
    REQUIRE(frames[0] == R"(40/pc-agent,{"tenantId":"acme corp"})");
    REQUIRE(frames[1] == "41/pc-agent");
}

TEST_CASE("Channel exchanges events", "[SocketIoChannel]")
{
    MockSocketIoServer server([](MockSocketIoServer::Peer &peer) {
        peer.handshake();
        // Other namespaces are not ours.
        peer.send(R"(42["pc-agent:print-job",{"jobId":"root"}])");
        peer.send(R"(42/pc-agent,["pc-agent:print-job",{"jobId":"abc","text":"SGVsbG8="}])");
        peer.receive();
        peer.drain();
    });

    {
        SocketIoChannel channel(options_for(server.url()));
        channel.open();

        std::vector<ControllerEvent> events = channel.poll(3000);
        REQUIRE(events.size() == 1);
        REQUIRE(events.front().name == SocketIo::EVENT_PRINT_JOB);
        REQUIRE(events.front().data["jobId"] == "abc");

        channel.emit(SocketIo::EVENT_PRINT_RESULT, { { "jobId", "abc" }, { "success", true }, { "message", "Print job sent successfully" } });
        channel.close();
    }
    server.join();

    REQUIRE(server.error().empty());
    REQUIRE(contains(server.received(), R"(42/pc-agent,["pc-agent:print-result",{"jobId":"abc","message":"Print job sent successfully","success":true}])"));
}

TEST_CASE("Channel answers pings", "[SocketIoChannel]")
{
    MockSocketIoServer server([](MockSocketIoServer::Peer &peer) {
        peer.handshake();
        peer.send("2");
        peer.receive();
        peer.drain();
    });

    {
        SocketIoChannel channel(options_for(server.url()));
        channel.open();
        REQUIRE(channel.poll(300).empty());
        REQUIRE(channel.is_open());
        channel.close();
    }
    server.join();

    std::vector<std::string> frames = server.received();
    REQUIRE(frames.size() >= 2);
    REQUIRE(frames[1] == "3");
}

TEST_CASE("Channel detects a silent controller", "[SocketIoChannel]")
{
    MockSocketIoServer server([](MockSocketIoServer::Peer &peer) {
        peer.handshake(50, 50);
        peer.drain();
    });

    SocketIoChannel channel(options_for(server.url()));
    channel.open();

    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(channel.poll(300), ChannelError);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2000));
    REQUIRE_FALSE(channel.is_open());
    REQUIRE_THROWS_AS(channel.emit(SocketIo::EVENT_HEALTH, { { "status", "running" } }), ChannelError);
}

TEST_CASE("Channel reports a lost controller", "[SocketIoChannel]")
{
    SECTION("WebSocket close") {
        MockSocketIoServer server([](MockSocketIoServer::Peer &peer) {
            peer.handshake();
            peer.close();
        });

        SocketIoChannel channel(options_for(server.url()));
        channel.open();
        REQUIRE_THROWS_AS(channel.poll(3000), ChannelError);
        REQUIRE_FALSE(channel.is_open());
        server.join();
    }

    SECTION("namespace disconnect") {
        MockSocketIoServer server([](MockSocketIoServer::Peer &peer) {
            peer.handshake();
            peer.send("41/pc-agent");
            peer.drain();
        });

        SocketIoChannel channel(options_for(server.url()));
        channel.open();
        REQUIRE_THROWS_WITH(channel.poll(3000), Catch::Contains("server disconnected namespace"));
        REQUIRE_FALSE(channel.is_open());
    }
}

TEST_CASE("Channel open failures", "[SocketIoChannel]")
{
    SECTION("rejected tenant") {
        MockSocketIoServer server([](MockSocketIoServer::Peer &peer) {
            peer.send(R"(0{"sid":"eio-sid","upgrades":[],"pingInterval":25000,"pingTimeout":20000})");
            peer.receive();
            peer.send(R"(44/pc-agent,{"message":"Invalid tenant"})");
            peer.drain();
        });

        SocketIoChannel channel(options_for(server.url()));
        REQUIRE_THROWS_WITH(channel.open(), "Controller rejected the session: Invalid tenant");
        REQUIRE_FALSE(channel.is_open());
    }

    SECTION("nothing listening") {
        SocketIoChannel channel(options_for("http://127.0.0.1:" + std::to_string(Test::MockPrinter::unused_port())));
        REQUIRE_THROWS_AS(channel.open(), ConnectError);
        REQUIRE_FALSE(channel.is_open());
    }

    SECTION("TLS is refused") {
        SocketIoChannel channel(options_for("https://ctl.example.com"));
        REQUIRE_THROWS_AS(channel.open(), ConnectError);
    }

    SECTION("malformed URL") {
        SocketIoChannel channel(options_for("http://"));
        REQUIRE_THROWS_AS(channel.open(), ConnectError);
    }

    SECTION("polling a closed channel") {
        SocketIoChannel channel(options_for("http://127.0.0.1:1"));
        REQUIRE_THROWS_AS(channel.poll(10), ChannelError);
    }
}
