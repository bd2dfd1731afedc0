#ifndef __SOCKET_IO_CHANNEL_HPP__
#define __SOCKET_IO_CHANNEL_HPP__

#include "IControllerChannel.hpp"
#include "SocketIoCodec.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/websocket/stream.hpp>

namespace PrintRelay {

struct SocketIoChannelOptions
{
    std::string backend_url;
    std::string tenant_id;
    std::string nsp                = SocketIo::NAMESPACE;
    // Covers TCP connect, WebSocket upgrade and the namespace join.
    int         connect_timeout_ms = 20000;
    int         write_timeout_ms   = 10000;
};

// Socket.IO client over a plain WebSocket (Engine.IO v4, websocket transport only).
//
// All I/O runs on a private io_context driven by the calling thread. A read stays pending
// across poll() calls, so a poll timeout never tears down the stream.
class SocketIoChannel : public IControllerChannel
{
public:
    explicit SocketIoChannel(SocketIoChannelOptions options);
    ~SocketIoChannel() override;

    SocketIoChannel(const SocketIoChannel &) = delete;
    SocketIoChannel &operator=(const SocketIoChannel &) = delete;

    void                         open() override;
    std::vector<ControllerEvent> poll(int timeout_ms) override;
    void                         emit(const std::string &event, const nlohmann::json &data) override;
    void                         close() noexcept override;
    bool                         is_open() const override;

    const SocketIo::OpenInfo &open_info() const { return m_open_info; }

private:
    using Clock     = std::chrono::steady_clock;
    using WebSocket = boost::beast::websocket::stream<boost::beast::tcp_stream>;

    // Returns false on timeout with the read still pending. Throws ChannelError on a broken stream.
    bool read_frame(std::string &frame, Clock::time_point deadline);
    // Drives the io_context until done is set or the deadline passes. Returns done.
    bool run_until(const bool &done, Clock::time_point deadline);
    void write_frame(const std::string &frame);
    // Handles Engine.IO framing, appends Socket.IO events of our namespace.
    void handle_frame(const std::string &frame, std::vector<ControllerEvent> &events);
    void check_ping_timeout();
    // Closes the stream and throws ChannelError.
    [[noreturn]] void lost(const std::string &reason);
    void abort_stream() noexcept;

    SocketIoChannelOptions     m_options;
    boost::asio::io_context    m_ioc;
    std::unique_ptr<WebSocket> m_ws;
    boost::beast::flat_buffer  m_buffer;
    bool                       m_read_pending { false };
    bool                       m_read_done { false };
    boost::beast::error_code   m_read_ec;

    SocketIo::OpenInfo         m_open_info;
    Clock::time_point          m_last_ping;
    bool                       m_joined { false };
};

} // namespace PrintRelay

#endif // __SOCKET_IO_CHANNEL_HPP__
