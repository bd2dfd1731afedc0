#ifndef printrelay_ConnectionPool_hpp_
#define printrelay_ConnectionPool_hpp_

#include "DeviceConnection.hpp"
#include "Endpoint.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace PrintRelay {

struct PoolConfig
{
    size_t max_connections_per_endpoint = 5;
    int    connect_timeout_ms           = 5000;
    int    write_timeout_ms             = DeviceConnection::DEFAULT_WRITE_TIMEOUT_MS;
    // How long acquire() waits for a busy endpoint before failing with PoolTimeout.
    int    wait_timeout_ms              = 10000;
    int    idle_timeout_ms              = 30000;
    // Period of the idle reaper, 0 disables the background thread.
    int    cleanup_interval_ms          = 10000;
};

// One DeviceConnection tracked by the pool.
// State and last use time are guarded by the owning pool's mutex.
class PooledConnection
{
public:
    using Clock = std::chrono::steady_clock;

    enum class State { InUse, Idle };

    PooledConnection(std::unique_ptr<DeviceConnection> connection, Endpoint endpoint)
        : m_connection(std::move(connection)), m_endpoint(std::move(endpoint)), m_last_used(Clock::now())
    {}

    // Only the caller holding the connection InUse may write to it.
    DeviceConnection       &connection() { return *m_connection; }
    const DeviceConnection &connection() const { return *m_connection; }
    const Endpoint         &endpoint() const { return m_endpoint; }

private:
    friend class ConnectionPool;

    std::unique_ptr<DeviceConnection> m_connection;
    Endpoint                          m_endpoint;
    State                             m_state { State::InUse };
    Clock::time_point                 m_last_used;
};

using PooledConnectionPtr = std::shared_ptr<PooledConnection>;

struct EndpointStats
{
    std::string endpoint;
    size_t      connections = 0;
    size_t      available   = 0;
    size_t      in_use      = 0;
};

struct PoolStats
{
    size_t                     total_pools       = 0;
    size_t                     total_connections = 0;
    std::vector<EndpointStats> per_endpoint;

    // nullptr when the endpoint has no pool entry.
    const EndpointStats *find(const std::string &endpoint) const;
    nlohmann::json       to_json() const;
};

// Bounded pool of reusable printer connections, keyed by endpoint.
//
// acquire() prefers an Idle healthy connection, opens a new one while the endpoint is below its
// cap, and otherwise waits for a release until wait_timeout_ms. Connects run outside the pool
// lock against a reserved slot, so concurrent callers never exceed the cap.
// A reaper thread closes connections that stayed Idle longer than idle_timeout_ms.
class ConnectionPool
{
public:
    explicit ConnectionPool(const PoolConfig &config = PoolConfig());
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool &) = delete;
    ConnectionPool &operator=(const ConnectionPool &) = delete;

    // Throws PoolTimeout, ConnectTimeout or ConnectError.
    PooledConnectionPtr acquire(const std::string &host, uint16_t port);
    PooledConnectionPtr acquire(const Endpoint &endpoint) { return acquire(endpoint.host, endpoint.port); }

    // Returns the connection to Idle. The socket stays open; a connection already closed by a
    // failed send is dropped from the pool instead.
    void release(const PooledConnectionPtr &conn);
    // Closes the connection and removes it from the pool.
    void discard(const PooledConnectionPtr &conn);

    // Closes Idle connections older than idle_timeout_ms. Returns the number closed.
    size_t reclaim_idle();

    PoolStats stats() const;
    void      close_all();

    const PoolConfig &config() const { return m_config; }
    // Number of sockets opened since construction.
    size_t connections_opened() const { return m_connections_opened.load(); }

private:
    struct Entry
    {
        std::vector<PooledConnectionPtr> connections;
        // Connects in flight; they count against the cap but are not live yet.
        size_t                           connecting = 0;
    };

    PooledConnectionPtr take_idle_locked(Entry &entry, const std::string &key);
    void                remove_locked(const PooledConnectionPtr &conn);
    void                drop_if_empty_locked(const std::string &key);
    void                reaper_loop();

    PoolConfig                   m_config;
    mutable std::mutex           m_mutex;
    std::condition_variable      m_slot_freed;
    std::map<std::string, Entry> m_entries;
    std::atomic<size_t>          m_connections_opened { 0 };

    std::mutex                   m_reaper_mutex;
    std::condition_variable      m_reaper_cv;
    bool                         m_reaper_stop { false };
    std::thread                  m_reaper;
};

} // namespace PrintRelay

#endif // printrelay_ConnectionPool_hpp_
