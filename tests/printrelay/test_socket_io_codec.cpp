#include <catch2/catch.hpp>

#include "printrelay/Utils/SocketIoCodec.hpp"

using namespace PrintRelay;
using namespace PrintRelay::SocketIo;

TEST_CASE("Engine.IO framing", "[SocketIo]")
{
    EnginePacket packet;

    REQUIRE(decode_engine_packet("2", packet));
    REQUIRE(packet.type == EnginePacketType::ping);
    REQUIRE(packet.data.empty());

    REQUIRE(decode_engine_packet("3payload", packet));
    REQUIRE(packet.type == EnginePacketType::pong);
    REQUIRE(packet.data == "payload");

    REQUIRE_FALSE(decode_engine_packet("", packet));
    REQUIRE_FALSE(decode_engine_packet("x", packet));
    REQUIRE_FALSE(decode_engine_packet("9", packet));

    REQUIRE(encode_engine_packet(EnginePacketType::pong) == "3");
    REQUIRE(encode_engine_packet(EnginePacketType::pong, "payload") == "3payload");
}

TEST_CASE("Handshake parameters", "[SocketIo]")
{
    OpenInfo info;
    REQUIRE(parse_open_packet(R"({"sid":"lv_VI97HAXpY6yYWAAAC","upgrades":[],"pingInterval":300,"pingTimeout":200,"maxPayload":1000000})", info));
    REQUIRE(info.sid == "lv_VI97HAXpY6yYWAAAC");
    REQUIRE(info.ping_interval_ms == 300);
    REQUIRE(info.ping_timeout_ms == 200);

    OpenInfo defaults;
    REQUIRE(parse_open_packet(R"({"sid":"abc"})", defaults));
    REQUIRE(defaults.ping_interval_ms == 25000);
    REQUIRE(defaults.ping_timeout_ms == 20000);

    OpenInfo broken;
    REQUIRE_FALSE(parse_open_packet(R"({"pingInterval":300})", broken));
    REQUIRE_FALSE(parse_open_packet("not json", broken));
}

TEST_CASE("Socket.IO packets of the controller namespace", "[SocketIo]")
{
    SECTION("encoding") {
        REQUIRE(encode_connect(NAMESPACE, { { "tenantId", "tenant-1" } }) == R"(40/pc-agent,{"tenantId":"tenant-1"})");
        REQUIRE(encode_connect("/", nullptr) == "40");
        REQUIRE(encode_disconnect(NAMESPACE) == "41/pc-agent");
        REQUIRE(encode_event(NAMESPACE, EVENT_PRINT_RESULT, { { "jobId", "abc" }, { "success", true } }) ==
                R"(42/pc-agent,["pc-agent:print-result",{"jobId":"abc","success":true}])");
        REQUIRE(encode_event("/", "hello", 1) == R"(42["hello",1])");
    }

    SECTION("events") {
        SocketPacket packet;
        REQUIRE(decode_socket_packet(R"(2/pc-agent,["pc-agent:print-job",{"jobId":"abc","text":"SGk="}])", packet));
        REQUIRE(packet.type == SocketPacketType::event);
        REQUIRE(packet.nsp == "/pc-agent");

        std::string    name;
        nlohmann::json data;
        REQUIRE(split_event(packet.data, name, data));
        REQUIRE(name == EVENT_PRINT_JOB);
        REQUIRE(data["jobId"] == "abc");
    }

    SECTION("acknowledgement ids are skipped") {
        SocketPacket packet;
        REQUIRE(decode_socket_packet(R"(2/pc-agent,17["pc-agent:connected"])", packet));
        std::string    name;
        nlohmann::json data;
        REQUIRE(split_event(packet.data, name, data));
        REQUIRE(name == EVENT_CONNECTED);
        REQUIRE(data.is_null());
    }

    SECTION("root namespace") {
        SocketPacket packet;
        REQUIRE(decode_socket_packet(R"(2["hello",1])", packet));
        REQUIRE(packet.nsp == "/");
    }

    SECTION("namespace control packets") {
        SocketPacket packet;
        REQUIRE(decode_socket_packet(R"(0/pc-agent,{"sid":"x"})", packet));
        REQUIRE(packet.type == SocketPacketType::connect);
        REQUIRE(packet.data["sid"] == "x");

        REQUIRE(decode_socket_packet("1/pc-agent", packet));
        REQUIRE(packet.type == SocketPacketType::disconnect);
        REQUIRE(packet.nsp == "/pc-agent");
        REQUIRE(packet.data.is_null());

        REQUIRE(decode_socket_packet(R"(4/pc-agent,{"message":"Invalid tenant"})", packet));
        REQUIRE(packet.type == SocketPacketType::connect_error);
    }

    SECTION("unsupported or malformed") {
        SocketPacket packet;
        REQUIRE_FALSE(decode_socket_packet(R"(51-/pc-agent,["upload",{"_placeholder":true,"num":0}])", packet));
        REQUIRE_FALSE(decode_socket_packet("2/pc-agent,[\"broken", packet));
        REQUIRE_FALSE(decode_socket_packet("", packet));

        std::string    name;
        nlohmann::json data;
        REQUIRE_FALSE(split_event(nlohmann::json::array(), name, data));
        REQUIRE_FALSE(split_event({ { "name", "x" } }, name, data));
    }
}

TEST_CASE("Controller URL", "[SocketIo]")
{
    ControllerUrl url;

    SECTION("plain host and port") {
        REQUIRE(parse_controller_url("http://localhost:3000", "tenant-1", url));
        REQUIRE(url.host == "localhost");
        REQUIRE(url.port == "3000");
        REQUIRE_FALSE(url.secure);
        REQUIRE(url.target == "/socket.io/?EIO=4&transport=websocket&tenant=tenant-1");
    }

    SECTION("base path and default port") {
        REQUIRE(parse_controller_url("https://ctl.example.com/api/?x=1", "acme corp", url));
        REQUIRE(url.host == "ctl.example.com");
        REQUIRE(url.port == "443");
        REQUIRE(url.secure);
        REQUIRE(url.target == "/api/socket.io/?EIO=4&transport=websocket&tenant=acme%20corp");

        REQUIRE(parse_controller_url("ws://ctl.example.com", "t", url));
        REQUIRE(url.port == "80");
        REQUIRE_FALSE(url.secure);
    }

    SECTION("IPv6 literal") {
        REQUIRE(parse_controller_url("http://[::1]:8080", "t", url));
        REQUIRE(url.host == "::1");
        REQUIRE(url.port == "8080");
    }

    SECTION("malformed") {
        REQUIRE_FALSE(parse_controller_url("", "t", url));
        REQUIRE_FALSE(parse_controller_url("http://", "t", url));
        REQUIRE_FALSE(parse_controller_url("http://[::1", "t", url));
    }

    REQUIRE(url_encode("a b&c=d/é") == "a%20b%26c%3Dd%2F%C3%A9");
}
