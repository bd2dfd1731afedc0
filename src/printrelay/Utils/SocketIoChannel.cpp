#include "SocketIoChannel.hpp"

#include "libprintrelay/Exception.hpp"
#include "libprintrelay/libprintrelay.h"

#include <algorithm>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/log/trivial.hpp>

namespace PrintRelay {

namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
namespace net       = boost::asio;
using tcp           = net::ip::tcp;

namespace {

constexpr int CLOSE_TIMEOUT_MS = 1000;

}

SocketIoChannel::SocketIoChannel(SocketIoChannelOptions options) : m_options(std::move(options)) {}

SocketIoChannel::~SocketIoChannel()
{
    close();
}

void SocketIoChannel::open()
{
    SocketIo::ControllerUrl url;
    if (!SocketIo::parse_controller_url(m_options.backend_url, m_options.tenant_id, url))
        throw ConnectError("Invalid controller URL: " + m_options.backend_url);
    if (url.secure) {
        BOOST_LOG_TRIVIAL(warning) << "SocketIoChannel: wss not supported for backend_url=" << m_options.backend_url;
        throw ConnectError("TLS is not supported for controller URL: " + m_options.backend_url);
    }

    const std::string where    = url.host + ":" + url.port;
    const auto        deadline = Clock::now() + std::chrono::milliseconds(m_options.connect_timeout_ms);

    beast::error_code ec;
    tcp::resolver     resolver{m_ioc};
    auto const        results = resolver.resolve(url.host, url.port, ec);
    if (ec)
        throw ConnectError("Cannot resolve controller " + url.host + ": " + ec.message());

    m_ws         = std::make_unique<WebSocket>(m_ioc);
    auto &stream = beast::get_lowest_layer(*m_ws);

    // Connect and upgrade share the connect timeout; the stream timer only bounds async operations.
    ec = net::error::would_block;
    stream.expires_at(deadline);
    stream.async_connect(results, [&ec](const beast::error_code &e, const tcp::endpoint &) { ec = e; });
    m_ioc.restart();
    m_ioc.run();
    if (ec == beast::error::timeout) {
        abort_stream();
        throw ConnectTimeout("Timeout connecting to controller at " + where);
    }
    if (ec) {
        abort_stream();
        throw ConnectError("Cannot connect to controller at " + where + ": " + ec.message());
    }

    m_ws->set_option(websocket::stream_base::decorator([](websocket::request_type &req) {
        req.set(http::field::user_agent, std::string(PRINTRELAY_APP_NAME) + "/" + PRINTRELAY_VERSION);
    }));

    std::string host_header = url.host;
    if (!url.port.empty() && url.port != "80")
        host_header += ":" + url.port;

    ec = net::error::would_block;
    m_ws->async_handshake(host_header, url.target, [&ec](const beast::error_code &e) { ec = e; });
    m_ioc.restart();
    m_ioc.run();
    if (ec == beast::error::timeout) {
        abort_stream();
        throw ConnectTimeout("Timeout upgrading controller connection at " + where);
    }
    if (ec) {
        abort_stream();
        throw ConnectError("WebSocket handshake with controller failed: " + ec.message());
    }

    // From here on the Engine.IO ping watchdog detects a dead uplink.
    stream.expires_never();
    m_ws->text(true);
    m_last_ping = Clock::now();

    std::string frame;
    if (!read_frame(frame, deadline)) {
        abort_stream();
        throw ConnectTimeout("Timeout waiting for Engine.IO handshake from " + where);
    }
    SocketIo::EnginePacket packet;
    if (!SocketIo::decode_engine_packet(frame, packet) || packet.type != SocketIo::EnginePacketType::open ||
        !SocketIo::parse_open_packet(packet.data, m_open_info)) {
        abort_stream();
        throw ChannelError("Unexpected Engine.IO handshake: " + frame);
    }

    write_frame(SocketIo::encode_connect(m_options.nsp, { { "tenantId", m_options.tenant_id } }));

    std::vector<ControllerEvent> early;
    while (!m_joined) {
        if (!read_frame(frame, deadline)) {
            abort_stream();
            throw ConnectTimeout("Timeout joining controller namespace " + m_options.nsp);
        }
        handle_frame(frame, early);
    }

    BOOST_LOG_TRIVIAL(info) << "SocketIoChannel: joined " << m_options.nsp << " at " << where << " (sid " << m_open_info.sid
                            << ", ping interval " << m_open_info.ping_interval_ms << "ms)";
}

std::vector<ControllerEvent> SocketIoChannel::poll(int timeout_ms)
{
    if (!is_open())
        throw ChannelError("Controller channel is not open");

    std::vector<ControllerEvent> events;
    const auto  deadline = Clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));
    std::string frame;
    while (events.empty() && read_frame(frame, deadline))
        handle_frame(frame, events);

    check_ping_timeout();
    return events;
}

void SocketIoChannel::emit(const std::string &event, const nlohmann::json &data)
{
    if (!is_open())
        throw ChannelError("Controller channel is not open");

    write_frame(SocketIo::encode_event(m_options.nsp, event, data));
    BOOST_LOG_TRIVIAL(trace) << "SocketIoChannel: emitted " << event;
}

void SocketIoChannel::close() noexcept
{
    if (!m_ws)
        return;

    if (m_joined && m_ws->is_open()) {
        // Leave the namespace and close the WebSocket, bounded; the socket is torn down regardless.
        const auto  deadline = Clock::now() + std::chrono::milliseconds(CLOSE_TIMEOUT_MS);
        std::string frame    = SocketIo::encode_disconnect(m_options.nsp);

        bool done = false;
        m_ws->async_write(net::buffer(frame), [&done](const beast::error_code &, size_t) { done = true; });
        if (run_until(done, deadline)) {
            done = false;
            m_ws->async_close(websocket::close_code::normal, [&done](const beast::error_code &) { done = true; });
            run_until(done, deadline);
        }
        BOOST_LOG_TRIVIAL(debug) << "SocketIoChannel: left " << m_options.nsp;
    }

    abort_stream();
}

bool SocketIoChannel::is_open() const
{
    return m_ws && m_joined && m_ws->is_open();
}

bool SocketIoChannel::run_until(const bool &done, Clock::time_point deadline)
{
    if (m_ioc.stopped())
        m_ioc.restart();
    m_ioc.poll();
    while (!done && Clock::now() < deadline) {
        if (m_ioc.stopped())
            m_ioc.restart();
        m_ioc.run_one_until(deadline);
    }
    return done;
}

bool SocketIoChannel::read_frame(std::string &frame, Clock::time_point deadline)
{
    if (!m_ws)
        lost("channel is closed");

    if (!m_read_pending) {
        m_read_pending = true;
        m_read_done    = false;
        m_buffer.consume(m_buffer.size());
        m_ws->async_read(m_buffer, [this](const beast::error_code &ec, size_t) {
            m_read_ec   = ec;
            m_read_done = true;
        });
    }

    if (!run_until(m_read_done, deadline))
        return false;

    m_read_pending = false;
    if (m_read_ec == websocket::error::closed)
        lost("controller closed the connection");
    if (m_read_ec)
        lost("read error: " + m_read_ec.message());

    frame = beast::buffers_to_string(m_buffer.data());
    m_buffer.consume(m_buffer.size());
    return true;
}

void SocketIoChannel::write_frame(const std::string &frame)
{
    if (!m_ws)
        lost("channel is closed");

    bool              done = false;
    beast::error_code ec;
    m_ws->async_write(net::buffer(frame), [&done, &ec](const beast::error_code &e, size_t) {
        ec   = e;
        done = true;
    });

    // A pending read may complete meanwhile, its result is kept for the next read_frame().
    if (!run_until(done, Clock::now() + std::chrono::milliseconds(m_options.write_timeout_ms)))
        lost("write timeout");
    if (ec)
        lost("write error: " + ec.message());
}

void SocketIoChannel::handle_frame(const std::string &frame, std::vector<ControllerEvent> &events)
{
    SocketIo::EnginePacket packet;
    if (!SocketIo::decode_engine_packet(frame, packet)) {
        BOOST_LOG_TRIVIAL(warning) << "SocketIoChannel: ignoring malformed frame: " << frame;
        return;
    }

    switch (packet.type) {
    case SocketIo::EnginePacketType::ping:
        m_last_ping = Clock::now();
        write_frame(SocketIo::encode_engine_packet(SocketIo::EnginePacketType::pong, packet.data));
        return;
    case SocketIo::EnginePacketType::close:
        lost("server closed the Engine.IO session");
    case SocketIo::EnginePacketType::message:
        break;
    default:
        return;
    }

    SocketIo::SocketPacket sp;
    if (!SocketIo::decode_socket_packet(packet.data, sp)) {
        BOOST_LOG_TRIVIAL(warning) << "SocketIoChannel: ignoring malformed Socket.IO packet: " << packet.data;
        return;
    }
    if (sp.nsp != m_options.nsp)
        return;

    switch (sp.type) {
    case SocketIo::SocketPacketType::connect:
        m_joined = true;
        break;
    case SocketIo::SocketPacketType::disconnect:
        lost("server disconnected namespace " + m_options.nsp);
    case SocketIo::SocketPacketType::connect_error: {
        std::string message = sp.data.is_object() && sp.data.contains("message") && sp.data["message"].is_string() ?
                                  sp.data["message"].get<std::string>() :
                                  sp.data.dump();
        abort_stream();
        throw ChannelError("Controller rejected the session: " + message);
    }
    case SocketIo::SocketPacketType::event: {
        ControllerEvent event;
        if (SocketIo::split_event(sp.data, event.name, event.data))
            events.push_back(std::move(event));
        else
            BOOST_LOG_TRIVIAL(warning) << "SocketIoChannel: ignoring event without a name: " << sp.data.dump();
        break;
    }
    case SocketIo::SocketPacketType::ack:
        break;
    }
}

void SocketIoChannel::check_ping_timeout()
{
    const auto silence = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - m_last_ping).count();
    if (silence > m_open_info.ping_interval_ms + m_open_info.ping_timeout_ms)
        lost("ping timeout (" + std::to_string(silence) + "ms without a server ping)");
}

void SocketIoChannel::lost(const std::string &reason)
{
    BOOST_LOG_TRIVIAL(debug) << "SocketIoChannel: " << reason;
    abort_stream();
    throw ChannelError("Controller connection lost: " + reason);
}

void SocketIoChannel::abort_stream() noexcept
{
    if (!m_ws)
        return;

    beast::error_code ec;
    auto &stream = beast::get_lowest_layer(*m_ws);
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    stream.close();

    // Completion handlers of aborted operations reference this object and stack frames up the call chain.
    m_ioc.restart();
    m_ioc.run();

    m_ws.reset();
    m_read_pending = false;
    m_read_done    = false;
    m_joined       = false;
    m_buffer.consume(m_buffer.size());
}

} // namespace PrintRelay
