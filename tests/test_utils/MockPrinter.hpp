#ifndef printrelay_tests_MockPrinter_hpp_
#define printrelay_tests_MockPrinter_hpp_

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>

namespace PrintRelay {
namespace Test {

// Raw TCP printer on the loopback interface, records everything it receives.
class MockPrinter
{
public:
    using tcp = boost::asio::ip::tcp;

    MockPrinter() : m_acceptor(m_ioc, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
    {
        m_port = m_acceptor.local_endpoint().port();
        start_accept();
        m_thread = std::thread([this]() { m_ioc.run(); });
    }

    ~MockPrinter() { stop(); }

    MockPrinter(const MockPrinter &) = delete;
    MockPrinter &operator=(const MockPrinter &) = delete;

    std::string host() const { return "127.0.0.1"; }
    uint16_t    port() const { return m_port; }

    std::string received() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_received;
    }

    size_t accepted() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_accepted;
    }

    bool wait_for_bytes(size_t count, int timeout_ms = 2000) const
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this, count]() { return m_received.size() >= count; });
    }

    // Closes every accepted client socket, like a printer power cycle.
    void drop_clients()
    {
        std::promise<void> done;
        boost::asio::post(m_ioc, [this, &done]() {
            boost::system::error_code ec;
            for (auto &socket : m_clients) {
                socket->shutdown(tcp::socket::shutdown_both, ec);
                socket->close(ec);
            }
            m_clients.clear();
            done.set_value();
        });
        done.get_future().wait();
    }

    void stop()
    {
        if (!m_thread.joinable())
            return;
        std::promise<void> done;
        boost::asio::post(m_ioc, [this, &done]() {
            boost::system::error_code ec;
            m_acceptor.close(ec);
            for (auto &socket : m_clients)
                socket->close(ec);
            m_clients.clear();
            done.set_value();
        });
        done.get_future().wait();
        m_ioc.stop();
        m_thread.join();
    }

    // A loopback port with nothing listening on it.
    static uint16_t unused_port()
    {
        boost::asio::io_context ioc;
        tcp::acceptor           acceptor(ioc, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        return acceptor.local_endpoint().port();
    }

private:
    void start_accept()
    {
        auto socket = std::make_shared<tcp::socket>(m_ioc);
        m_acceptor.async_accept(*socket, [this, socket](const boost::system::error_code &ec) {
            if (ec)
                return;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                ++m_accepted;
            }
            m_clients.push_back(socket);
            start_read(socket, std::make_shared<std::array<char, 4096>>());
            start_accept();
        });
    }

    void start_read(std::shared_ptr<tcp::socket> socket, std::shared_ptr<std::array<char, 4096>> buffer)
    {
        socket->async_read_some(boost::asio::buffer(*buffer), [this, socket, buffer](const boost::system::error_code &ec, size_t n) {
            if (ec)
                return;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_received.append(buffer->data(), n);
            }
            m_cv.notify_all();
            start_read(socket, buffer);
        });
    }

    boost::asio::io_context                   m_ioc;
    tcp::acceptor                             m_acceptor;
    uint16_t                                  m_port = 0;
    std::thread                               m_thread;
    std::vector<std::shared_ptr<tcp::socket>> m_clients;

    mutable std::mutex              m_mutex;
    mutable std::condition_variable m_cv;
    std::string                     m_received;
    size_t                          m_accepted = 0;
};

} // namespace Test
} // namespace PrintRelay

#endif // printrelay_tests_MockPrinter_hpp_
