#include <catch2/catch.hpp>

#include "libprintrelay/DeviceConnection.hpp"
#include "libprintrelay/Exception.hpp"

#include "test_utils/MockPrinter.hpp"

#include <chrono>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

using namespace PrintRelay;
using Test::MockPrinter;

namespace {

bool eventually_unhealthy(const DeviceConnection &conn)
{
    for (int i = 0; i < 100; ++i) {
        if (!conn.is_healthy())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

} // namespace

TEST_CASE("DeviceConnection writes to a reachable printer", "[DeviceConnection]")
{
    MockPrinter      printer;
    DeviceConnection conn;

    conn.connect(printer.host(), printer.port(), 2000);
    REQUIRE(conn.is_open());
    REQUIRE(conn.is_healthy());
    REQUIRE(conn.endpoint() == Endpoint(printer.host(), printer.port()));

    const std::vector<uint8_t> payload { 0x1b, 0x40, 'H', 'e', 'l', 'l', 'o', '\n' };
    conn.send(payload);
    REQUIRE(printer.wait_for_bytes(payload.size()));
    REQUIRE(printer.received() == std::string(payload.begin(), payload.end()));
    REQUIRE(conn.bytes_sent() == payload.size());

    SECTION("close is idempotent") {
        conn.close();
        conn.close();
        REQUIRE_FALSE(conn.is_open());
        REQUIRE_FALSE(conn.is_healthy());
    }

    SECTION("send on a closed connection fails") {
        conn.close();
        REQUIRE_THROWS_AS(conn.send(payload), WriteError);
    }

    SECTION("peer close makes the connection unhealthy") {
        printer.drop_clients();
        REQUIRE(eventually_unhealthy(conn));
    }
}

TEST_CASE("DeviceConnection reports unreachable printers", "[DeviceConnection]")
{
    DeviceConnection conn;

    SECTION("refused") {
        REQUIRE_THROWS_AS(conn.connect("127.0.0.1", MockPrinter::unused_port(), 2000), ConnectError);
        REQUIRE_FALSE(conn.is_open());
    }

    SECTION("unresolvable host") {
        REQUIRE_THROWS_AS(conn.connect("printer.invalid", 9100, 2000), ConnectError);
        REQUIRE_FALSE(conn.is_open());
    }
}

TEST_CASE("DeviceConnection gives up on a printer that never answers", "[DeviceConnection]")
{
    using tcp = boost::asio::ip::tcp;

    // A listener that accepts nothing and whose backlog is full drops further handshakes.
    boost::asio::io_context ioc;
    tcp::acceptor           acceptor(ioc);
    acceptor.open(tcp::v4());
    acceptor.bind(tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    acceptor.listen(0);
    const uint16_t port = acceptor.local_endpoint().port();

    tcp::socket filler(ioc);
    filler.connect(tcp::endpoint(boost::asio::ip::address_v4::loopback(), port));

    DeviceConnection conn;
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(conn.connect("127.0.0.1", port, 300), ConnectTimeout);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(elapsed >= std::chrono::milliseconds(250));
    REQUIRE(elapsed < std::chrono::milliseconds(2000));
    REQUIRE_FALSE(conn.is_open());
}

TEST_CASE("DeviceConnection gives up on a printer that stops reading", "[DeviceConnection]")
{
    using tcp = boost::asio::ip::tcp;

    boost::asio::io_context ioc;
    tcp::acceptor           acceptor(ioc, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
    const uint16_t          port = acceptor.local_endpoint().port();

    DeviceConnection conn(300);
    conn.connect("127.0.0.1", port, 2000);
    tcp::socket peer(ioc);
    acceptor.accept(peer);

    // Far more than the socket buffers of both ends hold.
    const std::vector<uint8_t> payload(64 * 1024 * 1024, 'x');
    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(conn.send(payload), WriteError);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(5000));
    REQUIRE_FALSE(conn.is_open());
    REQUIRE_FALSE(conn.is_healthy());
    REQUIRE(conn.bytes_sent() < payload.size());
}

TEST_CASE("Connection timeouts derive from ConnectError", "[DeviceConnection]")
{
    // Callers handling ConnectError also see timeouts.
    REQUIRE_THROWS_AS(throw ConnectTimeout("Connection timeout"), ConnectError);
    REQUIRE_THROWS_AS(throw ConnectTimeout("Connection timeout"), DeviceError);
    REQUIRE_THROWS_AS(throw WriteError("broken pipe"), DeviceError);
}
