#include "ConnectionPool.hpp"
#include "Exception.hpp"

#include <algorithm>

#include <boost/log/trivial.hpp>

namespace PrintRelay {

using Clock = PooledConnection::Clock;

const EndpointStats *PoolStats::find(const std::string &endpoint) const
{
    auto it = std::find_if(per_endpoint.begin(), per_endpoint.end(),
                           [&endpoint](const EndpointStats &s) { return s.endpoint == endpoint; });
    return it == per_endpoint.end() ? nullptr : &*it;
}

nlohmann::json PoolStats::to_json() const
{
    nlohmann::json j;
    j["totalPools"]       = total_pools;
    j["totalConnections"] = total_connections;
    j["perEndpoint"]      = nlohmann::json::array();
    for (const EndpointStats &s : per_endpoint) {
        j["perEndpoint"].push_back({
            { "endpoint",    s.endpoint },
            { "connections", s.connections },
            { "available",   s.available },
            { "inUse",       s.in_use },
        });
    }
    return j;
}

ConnectionPool::ConnectionPool(const PoolConfig &config) : m_config(config)
{
    if (m_config.max_connections_per_endpoint == 0)
        m_config.max_connections_per_endpoint = 1;

    if (m_config.cleanup_interval_ms > 0)
        m_reaper = std::thread([this]() { reaper_loop(); });
}

ConnectionPool::~ConnectionPool()
{
    {
        std::lock_guard<std::mutex> lock(m_reaper_mutex);
        m_reaper_stop = true;
    }
    m_reaper_cv.notify_all();
    if (m_reaper.joinable())
        m_reaper.join();

    close_all();
}

PooledConnectionPtr ConnectionPool::acquire(const std::string &host, uint16_t port)
{
    const Endpoint    endpoint(host, port);
    const std::string key      = endpoint.to_string();
    const auto        deadline = Clock::now() + std::chrono::milliseconds(m_config.wait_timeout_ms);

    std::unique_lock<std::mutex> lock(m_mutex);
    for (bool waited = false;; waited = true) {
        // The entry may have been dropped by the reaper or close_all() while we were waiting.
        Entry &entry = m_entries[key];

        if (PooledConnectionPtr conn = take_idle_locked(entry, key)) {
            BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: reusing connection from pool for " << key;
            return conn;
        }

        if (entry.connections.size() + entry.connecting < m_config.max_connections_per_endpoint) {
            // Reserve the slot, connect without holding the lock.
            ++entry.connecting;
            break;
        }

        if (Clock::now() >= deadline) {
            BOOST_LOG_TRIVIAL(warning) << "ConnectionPool: timeout waiting for available connection to " << key;
            throw PoolTimeout("Timeout waiting for available connection to " + key);
        }
        if (!waited)
            BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: " << key << " saturated (" << entry.connections.size()
                                     << " connections), waiting for a release";
        m_slot_freed.wait_until(lock, deadline);
    }
    lock.unlock();

    std::unique_ptr<DeviceConnection> device;
    try {
        device = std::make_unique<DeviceConnection>(m_config.write_timeout_ms);
        device->connect(host, port, m_config.connect_timeout_ms);
    } catch (const std::exception &) {
        // The failed slot never enters the pool and no longer counts against the cap.
        lock.lock();
        auto it = m_entries.find(key);
        if (it != m_entries.end()) {
            --it->second.connecting;
            drop_if_empty_locked(key);
        }
        lock.unlock();
        m_slot_freed.notify_all();
        throw;
    }
    ++m_connections_opened;

    auto conn = std::make_shared<PooledConnection>(std::move(device), endpoint);
    lock.lock();
    Entry &entry = m_entries[key];
    --entry.connecting;
    entry.connections.push_back(conn);
    BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: created new connection for " << key << " (pool size: " << entry.connections.size() << ")";
    return conn;
}

PooledConnectionPtr ConnectionPool::take_idle_locked(Entry &entry, const std::string &key)
{
    auto &conns = entry.connections;
    for (auto it = conns.begin(); it != conns.end();) {
        PooledConnectionPtr &conn = *it;
        if (conn->m_state != PooledConnection::State::Idle) {
            ++it;
            continue;
        }
        if (!conn->m_connection->is_healthy()) {
            BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: dropping dead idle connection for " << key;
            conn->m_connection->close();
            it = conns.erase(it);
            continue;
        }
        conn->m_state     = PooledConnection::State::InUse;
        conn->m_last_used = Clock::now();
        return conn;
    }
    return nullptr;
}

void ConnectionPool::release(const PooledConnectionPtr &conn)
{
    if (!conn)
        return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_entries.find(conn->m_endpoint.to_string());
        bool tracked = it != m_entries.end() &&
            std::find(it->second.connections.begin(), it->second.connections.end(), conn) != it->second.connections.end();

        if (!tracked) {
            // Removed by close_all() while the caller was holding it.
            conn->m_connection->close();
        } else if (!conn->m_connection->is_open()) {
            BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: released connection to " << conn->m_endpoint.to_string()
                                     << " is closed, removing it";
            remove_locked(conn);
        } else {
            conn->m_state     = PooledConnection::State::Idle;
            conn->m_last_used = Clock::now();
        }
    }
    m_slot_freed.notify_all();
}

void ConnectionPool::discard(const PooledConnectionPtr &conn)
{
    if (!conn)
        return;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        remove_locked(conn);
    }
    conn->m_connection->close();
    BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: discarded connection to " << conn->m_endpoint.to_string();
    m_slot_freed.notify_all();
}

void ConnectionPool::remove_locked(const PooledConnectionPtr &conn)
{
    const std::string key = conn->m_endpoint.to_string();
    auto it = m_entries.find(key);
    if (it == m_entries.end())
        return;

    auto &conns = it->second.connections;
    conns.erase(std::remove(conns.begin(), conns.end(), conn), conns.end());
    drop_if_empty_locked(key);
}

void ConnectionPool::drop_if_empty_locked(const std::string &key)
{
    auto it = m_entries.find(key);
    if (it != m_entries.end() && it->second.connections.empty() && it->second.connecting == 0)
        m_entries.erase(it);
}

size_t ConnectionPool::reclaim_idle()
{
    std::vector<PooledConnectionPtr> reclaimed;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const auto now          = Clock::now();
        const auto idle_timeout = std::chrono::milliseconds(m_config.idle_timeout_ms);

        for (auto entry = m_entries.begin(); entry != m_entries.end();) {
            auto &conns = entry->second.connections;
            for (auto it = conns.begin(); it != conns.end();) {
                const PooledConnectionPtr &conn = *it;
                if (conn->m_state == PooledConnection::State::Idle &&
                    (now - conn->m_last_used > idle_timeout || !conn->m_connection->is_healthy())) {
                    reclaimed.push_back(conn);
                    it = conns.erase(it);
                } else
                    ++it;
            }
            if (conns.empty() && entry->second.connecting == 0)
                entry = m_entries.erase(entry);
            else
                ++entry;
        }
    }

    for (const PooledConnectionPtr &conn : reclaimed) {
        conn->m_connection->close();
        BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: closed idle connection for " << conn->m_endpoint.to_string();
    }
    if (!reclaimed.empty())
        m_slot_freed.notify_all();
    return reclaimed.size();
}

PoolStats ConnectionPool::stats() const
{
    PoolStats stats;
    std::lock_guard<std::mutex> lock(m_mutex);
    stats.total_pools = m_entries.size();
    for (const auto &kvp : m_entries) {
        EndpointStats s;
        s.endpoint    = kvp.first;
        s.connections = kvp.second.connections.size();
        s.available   = std::count_if(kvp.second.connections.begin(), kvp.second.connections.end(),
                                      [](const PooledConnectionPtr &c) { return c->m_state == PooledConnection::State::Idle; });
        s.in_use      = s.connections - s.available;
        stats.total_connections += s.connections;
        stats.per_endpoint.push_back(std::move(s));
    }
    return stats;
}

void ConnectionPool::close_all()
{
    std::vector<PooledConnectionPtr> all;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto entry = m_entries.begin(); entry != m_entries.end();) {
            auto &conns = entry->second.connections;
            all.insert(all.end(), conns.begin(), conns.end());
            conns.clear();
            // Keep reservations of connects in flight, so the cap still holds when they land.
            if (entry->second.connecting == 0)
                entry = m_entries.erase(entry);
            else
                ++entry;
        }
    }

    for (const PooledConnectionPtr &conn : all)
        conn->m_connection->close();
    m_slot_freed.notify_all();

    if (!all.empty())
        BOOST_LOG_TRIVIAL(info) << "ConnectionPool: all printer connection pools closed (" << all.size() << " connections)";
}

void ConnectionPool::reaper_loop()
{
    std::unique_lock<std::mutex> lock(m_reaper_mutex);
    while (!m_reaper_cv.wait_for(lock, std::chrono::milliseconds(m_config.cleanup_interval_ms), [this]() { return m_reaper_stop; })) {
        lock.unlock();
        try {
            size_t closed = reclaim_idle();
            if (closed > 0)
                BOOST_LOG_TRIVIAL(debug) << "ConnectionPool: reaper closed " << closed << " idle connections";
        } catch (const std::exception &e) {
            BOOST_LOG_TRIVIAL(error) << "ConnectionPool: idle cleanup failed: " << e.what();
        }
        lock.lock();
    }
}

} // namespace PrintRelay
