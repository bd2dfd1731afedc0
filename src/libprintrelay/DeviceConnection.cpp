#include "DeviceConnection.hpp"
#include "Exception.hpp"

#include <cerrno>
#include <chrono>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/log/trivial.hpp>

#ifdef _WIN32
#include <winsock2.h>
#define printrelay_poll WSAPoll
#else
#include <poll.h>
#include <sys/socket.h>
#define printrelay_poll ::poll
#endif

namespace PrintRelay {

namespace beast = boost::beast;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

DeviceConnection::DeviceConnection(int write_timeout_ms)
    : m_stream(m_ioc)
    , m_write_timeout_ms(write_timeout_ms > 0 ? write_timeout_ms : DEFAULT_WRITE_TIMEOUT_MS)
{}

DeviceConnection::~DeviceConnection()
{
    close();
}

void DeviceConnection::connect(const std::string &host, uint16_t port, int timeout_ms)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    close_locked();
    m_endpoint = Endpoint(host, port);
    const std::string where = m_endpoint.to_string();

    beast::error_code ec;
    tcp::resolver     resolver{m_ioc};
    auto const        results = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        BOOST_LOG_TRIVIAL(error) << "DeviceConnection: DNS lookup failed for " << where << ": " << ec.message();
        throw ConnectError("Printer connection error: cannot resolve " + where + ": " + ec.message());
    }

    // The stream timeout only bounds asynchronous operations: run the connect on our io_context.
    ec = net::error::would_block;
    m_stream.expires_after(std::chrono::milliseconds(timeout_ms));
    m_stream.async_connect(results, [&ec](const beast::error_code &e, const tcp::endpoint &) { ec = e; });
    m_ioc.restart();
    m_ioc.run();

    if (ec == beast::error::timeout) {
        close_locked();
        BOOST_LOG_TRIVIAL(error) << "DeviceConnection: connect to " << where << " timed out after " << timeout_ms << "ms";
        throw ConnectTimeout("Connection timeout: Could not connect to printer at " + where);
    }
    if (ec) {
        close_locked();
        BOOST_LOG_TRIVIAL(error) << "DeviceConnection: failed to connect to " << where << ": " << ec.message();
        throw ConnectError("Printer connection error: " + ec.message());
    }

    m_stream.expires_never();
    beast::error_code opt_ec;
    m_stream.socket().set_option(tcp::no_delay(true), opt_ec);
    m_stream.socket().set_option(net::socket_base::keep_alive(true), opt_ec);

    BOOST_LOG_TRIVIAL(debug) << "DeviceConnection: connected to printer at " << where;
}

void DeviceConnection::send(const std::vector<uint8_t> &data)
{
    send(data.data(), data.size());
}

void DeviceConnection::send(const uint8_t *data, size_t size)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_stream.socket().is_open())
        throw WriteError("Printer socket is not connected");

    beast::error_code ec      = net::error::would_block;
    size_t            written = 0;
    m_stream.expires_after(std::chrono::milliseconds(m_write_timeout_ms));
    net::async_write(m_stream, net::buffer(data, size), [&](const beast::error_code &e, size_t n) {
        ec      = e;
        written = n;
    });
    m_ioc.restart();
    m_ioc.run();

    if (ec || written != size) {
        const std::string reason = ec ? ec.message() : std::string("short write");
        BOOST_LOG_TRIVIAL(error) << "DeviceConnection: error writing to printer " << m_endpoint.to_string() << ": " << reason
                                 << " (" << written << "/" << size << " bytes)";
        close_locked();
        throw WriteError("Error writing to printer: " + reason);
    }

    m_stream.expires_never();
    m_bytes_sent += written;
    BOOST_LOG_TRIVIAL(trace) << "DeviceConnection: sent " << written << " bytes to printer " << m_endpoint.to_string();
}

void DeviceConnection::close() noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    close_locked();
}

void DeviceConnection::close_locked() noexcept
{
    auto &socket = m_stream.socket();
    if (!socket.is_open())
        return;

    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    m_stream.close();
    BOOST_LOG_TRIVIAL(debug) << "DeviceConnection: printer connection closed " << m_endpoint.to_string();
}

bool DeviceConnection::is_open() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stream.socket().is_open();
}

bool DeviceConnection::is_healthy() const
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto &socket = m_stream.socket();
    if (!socket.is_open())
        return false;

    pollfd pfd {};
    pfd.fd     = socket.native_handle();
    pfd.events = POLLIN | POLLOUT;
    if (printrelay_poll(&pfd, 1, 0) < 0)
        return false;
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        return false;

    if (pfd.revents & POLLIN) {
        // Status bytes from the printer are fine; an orderly shutdown or a reset is not.
        char peek = 0;
#ifdef _WIN32
        int n = ::recv(pfd.fd, &peek, 1, MSG_PEEK);
        if (n == 0 || (n < 0 && WSAGetLastError() != WSAEWOULDBLOCK))
            return false;
#else
        ssize_t n = ::recv(pfd.fd, &peek, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK))
            return false;
#endif
    }

    return (pfd.revents & POLLOUT) != 0;
}

} // namespace PrintRelay
