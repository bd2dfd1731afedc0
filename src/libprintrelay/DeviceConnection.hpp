#ifndef printrelay_DeviceConnection_hpp_
#define printrelay_DeviceConnection_hpp_

#include "Endpoint.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/beast/core/tcp_stream.hpp>

namespace PrintRelay {

// A single TCP session to one printer endpoint.
//
// connect() and send() are blocking calls bounded by their timeouts. Every socket operation
// runs on a private io_context, so a DeviceConnection never shares I/O state with other
// connections of the pool. The object is used by one holder at a time; the internal mutex only
// serializes close() and the health check against an in-flight send.
class DeviceConnection
{
public:
    static constexpr int DEFAULT_WRITE_TIMEOUT_MS = 10000;

    explicit DeviceConnection(int write_timeout_ms = DEFAULT_WRITE_TIMEOUT_MS);
    ~DeviceConnection();

    DeviceConnection(const DeviceConnection &) = delete;
    DeviceConnection &operator=(const DeviceConnection &) = delete;

    // Resolves host and opens the socket.
    // Throws ConnectTimeout when the handshake does not complete within timeout_ms,
    // ConnectError on refusal, unreachable host or DNS failure.
    void connect(const std::string &host, uint16_t port, int timeout_ms);

    // Writes the whole buffer or throws WriteError. A failed write closes the socket,
    // a partially written stream is never reused.
    void send(const std::vector<uint8_t> &data);
    void send(const uint8_t *data, size_t size);

    // Idempotent, never throws.
    void close() noexcept;

    bool is_open() const;
    // Open, writable and not shut down or reset by the peer.
    bool is_healthy() const;

    const Endpoint &endpoint() const { return m_endpoint; }
    uint64_t        bytes_sent() const { return m_bytes_sent.load(); }

private:
    void close_locked() noexcept;

    mutable std::mutex              m_mutex;
    boost::asio::io_context         m_ioc;
    mutable boost::beast::tcp_stream m_stream;
    Endpoint                        m_endpoint;
    int                             m_write_timeout_ms;
    std::atomic<uint64_t>           m_bytes_sent { 0 };
};

} // namespace PrintRelay

#endif // printrelay_DeviceConnection_hpp_
