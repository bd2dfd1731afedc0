#include "SocketIoCodec.hpp"

#include <cctype>
#include <cstdio>

#include <boost/algorithm/string/predicate.hpp>

namespace PrintRelay {
namespace SocketIo {

bool decode_engine_packet(const std::string &frame, EnginePacket &packet)
{
    if (frame.empty() || frame[0] < '0' || frame[0] > '6')
        return false;

    packet.type = static_cast<EnginePacketType>(frame[0] - '0');
    packet.data = frame.substr(1);
    return true;
}

std::string encode_engine_packet(EnginePacketType type, const std::string &data)
{
    return std::to_string(static_cast<int>(type)) + data;
}

bool decode_socket_packet(const std::string &payload, SocketPacket &packet)
{
    if (payload.empty() || payload[0] < '0' || payload[0] > '4')
        return false;

    packet.type = static_cast<SocketPacketType>(payload[0] - '0');
    packet.nsp  = "/";
    packet.data = nullptr;

    size_t pos = 1;
    if (pos < payload.size() && payload[pos] == '/') {
        size_t comma = payload.find(',', pos);
        if (comma == std::string::npos) {
            packet.nsp = payload.substr(pos);
            return true;
        }
        packet.nsp = payload.substr(pos, comma - pos);
        pos        = comma + 1;
    }

    // Acknowledgement id, not used by the controller.
    while (pos < payload.size() && std::isdigit(static_cast<unsigned char>(payload[pos])))
        ++pos;

    if (pos >= payload.size())
        return true;

    packet.data = nlohmann::json::parse(payload.begin() + pos, payload.end(), nullptr, false);
    return !packet.data.is_discarded();
}

std::string encode_socket_packet(const SocketPacket &packet)
{
    std::string out = encode_engine_packet(EnginePacketType::message) + std::to_string(static_cast<int>(packet.type));
    if (!packet.nsp.empty() && packet.nsp != "/")
        out += packet.nsp + ",";
    if (!packet.data.is_null())
        out += packet.data.dump();
    return out;
}

bool parse_open_packet(const std::string &data, OpenInfo &info)
{
    auto j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return false;

    if (auto it = j.find("sid"); it != j.end() && it->is_string())
        info.sid = it->get<std::string>();
    if (auto it = j.find("pingInterval"); it != j.end() && it->is_number_integer())
        info.ping_interval_ms = it->get<int>();
    if (auto it = j.find("pingTimeout"); it != j.end() && it->is_number_integer())
        info.ping_timeout_ms = it->get<int>();
    return !info.sid.empty();
}

std::string encode_connect(const std::string &nsp, const nlohmann::json &auth)
{
    SocketPacket packet;
    packet.type = SocketPacketType::connect;
    packet.nsp  = nsp;
    packet.data = auth;
    return encode_socket_packet(packet);
}

std::string encode_disconnect(const std::string &nsp)
{
    SocketPacket packet;
    packet.type = SocketPacketType::disconnect;
    packet.nsp  = nsp;
    return encode_socket_packet(packet);
}

std::string encode_event(const std::string &nsp, const std::string &event, const nlohmann::json &data)
{
    SocketPacket packet;
    packet.type = SocketPacketType::event;
    packet.nsp  = nsp;
    packet.data = nlohmann::json::array({ event, data });
    return encode_socket_packet(packet);
}

bool split_event(const nlohmann::json &payload, std::string &event, nlohmann::json &data)
{
    if (!payload.is_array() || payload.empty() || !payload[0].is_string())
        return false;

    event = payload[0].get<std::string>();
    data  = payload.size() > 1 ? payload[1] : nlohmann::json();
    return true;
}

std::string url_encode(const std::string &value)
{
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

bool parse_controller_url(const std::string &base_url, const std::string &tenant_id, ControllerUrl &url)
{
    if (base_url.empty())
        return false;

    std::string rest = base_url;
    if (boost::istarts_with(rest, "https://") || boost::istarts_with(rest, "wss://")) {
        url.secure = true;
        rest       = rest.substr(rest.find("://") + 3);
    } else if (boost::istarts_with(rest, "http://") || boost::istarts_with(rest, "ws://")) {
        url.secure = false;
        rest       = rest.substr(rest.find("://") + 3);
    }

    std::string authority = rest;
    std::string path;
    if (auto slash = rest.find('/'); slash != std::string::npos) {
        authority = rest.substr(0, slash);
        path      = rest.substr(slash);
    }
    if (auto query = path.find_first_of("?#"); query != std::string::npos)
        path = path.substr(0, query);
    while (!path.empty() && path.back() == '/')
        path.pop_back();

    if (authority.empty())
        return false;

    url.host = authority;
    url.port = url.secure ? "443" : "80";
    if (authority.front() == '[') {
        // [v6addr]:port
        auto close = authority.find(']');
        if (close == std::string::npos)
            return false;
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
            url.port = authority.substr(close + 2);
    } else if (auto colon = authority.rfind(':'); colon != std::string::npos) {
        url.host = authority.substr(0, colon);
        url.port = authority.substr(colon + 1);
    }

    url.target = path + "/socket.io/?EIO=4&transport=websocket";
    if (!tenant_id.empty())
        url.target += "&tenant=" + url_encode(tenant_id);

    return !url.host.empty() && !url.port.empty();
}

} // namespace SocketIo
} // namespace PrintRelay
