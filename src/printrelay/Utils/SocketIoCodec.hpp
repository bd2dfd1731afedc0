#ifndef __SOCKET_IO_CODEC_HPP__
#define __SOCKET_IO_CODEC_HPP__

#include <string>

#include <nlohmann/json.hpp>

namespace PrintRelay {
namespace SocketIo {

// Namespace and events of the controller protocol.
constexpr const char *NAMESPACE          = "/pc-agent";
constexpr const char *EVENT_REGISTER     = "pc-agent:register";
constexpr const char *EVENT_PRINT_RESULT = "pc-agent:print-result";
constexpr const char *EVENT_HEALTH       = "pc-agent:health";
constexpr const char *EVENT_PRINT_JOB    = "pc-agent:print-job";
constexpr const char *EVENT_CONNECTED    = "pc-agent:connected";
constexpr const char *EVENT_ERROR        = "pc-agent:error";

/**
 * Engine.IO v4 packet types, the first character of every WebSocket text frame.
 */
enum class EnginePacketType {
    open    = 0,
    close   = 1,
    ping    = 2,
    pong    = 3,
    message = 4,
    upgrade = 5,
    noop    = 6
};

/**
 * Socket.IO v5 packet types, carried inside an Engine.IO message packet.
 */
enum class SocketPacketType {
    connect       = 0,
    disconnect    = 1,
    event         = 2,
    ack           = 3,
    connect_error = 4
};

struct EnginePacket
{
    EnginePacketType type = EnginePacketType::noop;
    std::string      data;
};

struct SocketPacket
{
    SocketPacketType type = SocketPacketType::event;
    std::string      nsp  = "/";
    nlohmann::json   data;
};

// Parameters of the Engine.IO open packet.
struct OpenInfo
{
    std::string sid;
    int         ping_interval_ms = 25000;
    int         ping_timeout_ms  = 20000;
};

// Location of the Socket.IO endpoint derived from the controller base URL.
struct ControllerUrl
{
    std::string host;
    std::string port;
    std::string target;
    bool        secure = false;
};

bool        decode_engine_packet(const std::string &frame, EnginePacket &packet);
std::string encode_engine_packet(EnginePacketType type, const std::string &data = std::string());

// Binary packets (attachments) are not supported and fail to decode.
bool        decode_socket_packet(const std::string &payload, SocketPacket &packet);
// Returns the Engine.IO message frame carrying the packet, e.g. 42/pc-agent,["name",{...}]
std::string encode_socket_packet(const SocketPacket &packet);

bool        parse_open_packet(const std::string &data, OpenInfo &info);

std::string encode_connect(const std::string &nsp, const nlohmann::json &auth);
std::string encode_disconnect(const std::string &nsp);
std::string encode_event(const std::string &nsp, const std::string &event, const nlohmann::json &data);
// Splits an event payload ["name", data] into its parts. data is null when absent.
bool        split_event(const nlohmann::json &payload, std::string &event, nlohmann::json &data);

// http(s)://host[:port][/base] -> ws target /base/socket.io/?EIO=4&transport=websocket&tenant=<id>
bool        parse_controller_url(const std::string &base_url, const std::string &tenant_id, ControllerUrl &url);
std::string url_encode(const std::string &value);

} // namespace SocketIo
} // namespace PrintRelay

#endif // __SOCKET_IO_CODEC_HPP__
