#ifndef printrelay_Endpoint_hpp_
#define printrelay_Endpoint_hpp_

#include <cstdint>
#include <string>
#include <tuple>
#include <utility>

namespace PrintRelay {

// (host, port) of one physical printer. Pools and connection caps are scoped per Endpoint.
struct Endpoint
{
    std::string host;
    uint16_t    port = 0;

    Endpoint() = default;
    Endpoint(std::string host, uint16_t port) : host(std::move(host)), port(port) {}

    std::string to_string() const { return host + ":" + std::to_string(port); }

    bool operator==(const Endpoint &rhs) const { return port == rhs.port && host == rhs.host; }
    bool operator!=(const Endpoint &rhs) const { return !(*this == rhs); }
    bool operator<(const Endpoint &rhs) const { return std::tie(host, port) < std::tie(rhs.host, rhs.port); }
};

} // namespace PrintRelay

#endif // printrelay_Endpoint_hpp_
