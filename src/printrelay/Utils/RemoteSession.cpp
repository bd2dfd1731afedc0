#include "RemoteSession.hpp"
#include "SocketIoCodec.hpp"

#include "libprintrelay/AgentState.hpp"
#include "libprintrelay/Exception.hpp"
#include "libprintrelay/Time.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>

namespace PrintRelay {

const char *session_state_string(SessionState state)
{
    switch (state) {
    case SessionState::Disconnected: return "Disconnected";
    case SessionState::Connecting:   return "Connecting";
    case SessionState::Connected:    return "Connected";
    case SessionState::Reconnecting: return "Reconnecting";
    case SessionState::Failed:       return "Failed";
    }
    return "Unknown";
}

bool is_valid_transition(SessionState from, SessionState to)
{
    switch (from) {
    case SessionState::Disconnected:
        return to == SessionState::Connecting;
    case SessionState::Connecting:
        return to == SessionState::Connected || to == SessionState::Reconnecting || to == SessionState::Disconnected;
    case SessionState::Connected:
        return to == SessionState::Reconnecting || to == SessionState::Disconnected;
    case SessionState::Reconnecting:
        return to == SessionState::Connecting || to == SessionState::Failed || to == SessionState::Disconnected;
    case SessionState::Failed:
        return false;
    }
    return false;
}

int reconnect_delay_ms(int attempt, int base_delay_ms, int max_delay_ms)
{
    long long delay = std::max(base_delay_ms, 0);
    for (int i = 0; i < attempt && delay < max_delay_ms; ++i)
        delay *= 2;
    return static_cast<int>(std::min<long long>(delay, max_delay_ms));
}

bool parse_print_job(const nlohmann::json &data, PrintJob &job, std::string &error)
{
    if (!data.is_object()) {
        error = "Invalid request";
        return false;
    }

    if (auto id = data.find("jobId"); id != data.end()) {
        if (id->is_string())
            job.job_id = id->get<std::string>();
        else if (id->is_number())
            job.job_id = id->dump();
    }
    if (job.job_id.empty()) {
        error = "Missing required field: jobId";
        return false;
    }

    auto text = data.find("text");
    if (text == data.end() || !text->is_string()) {
        error = "Missing required field: text";
        return false;
    }
    job.data = text->get<std::string>();

    if (auto format = data.find("format"); format != data.end() && !format->is_null()) {
        if (!format->is_string()) {
            error = "Unsupported format";
            return false;
        }
        job.format = format->get<std::string>();
    }

    auto ip   = data.find("printerIp");
    auto port = data.find("printerPort");
    bool has_ip   = ip != data.end() && ip->is_string() && !ip->get_ref<const std::string &>().empty();
    bool has_port = port != data.end() && !port->is_null();
    if (has_ip || has_port) {
        Endpoint printer;
        if (has_ip)
            printer.host = ip->get<std::string>();
        if (has_port) {
            if (!port->is_number_integer() || port->get<long long>() < 1 || port->get<long long>() > 65535) {
                error = "Port must be between 1 and 65535";
                return false;
            }
            printer.port = static_cast<uint16_t>(port->get<int>());
        }
        job.printer = printer;
    }
    return true;
}

namespace {

std::string notice_message(const nlohmann::json &data)
{
    if (data.is_object()) {
        auto it = data.find("message");
        if (it != data.end() && it->is_string())
            return it->get<std::string>();
    }
    if (data.is_string())
        return data.get<std::string>();
    return data.dump();
}

} // namespace

RemoteSession::RemoteSession(SessionConfig config, ControllerChannelFactory channel_factory, PrintDelivery &delivery, AgentState *agent_state)
    : m_config(std::move(config))
    , m_channel_factory(std::move(channel_factory))
    , m_delivery(delivery)
    , m_agent_state(agent_state)
{}

RemoteSession::~RemoteSession()
{
    disconnect();
}

void RemoteSession::set_on_state_changed(OnStateChangedFn fn)
{
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_on_state_changed = std::move(fn);
}

void RemoteSession::set_on_reconnect_scheduled(OnReconnectScheduledFn fn)
{
    std::lock_guard<std::mutex> lock(m_listener_mutex);
    m_on_reconnect_scheduled = std::move(fn);
}

SessionState RemoteSession::state() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

int RemoteSession::reconnect_attempt() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_reconnect_attempt;
}

int RemoteSession::current_backoff_ms() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_current_backoff_ms;
}

size_t RemoteSession::pending_results() const
{
    std::lock_guard<std::mutex> lock(m_results_mutex);
    return m_results.size();
}

bool RemoteSession::wait_for_state(SessionState state, int timeout_ms) const
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this, state]() { return m_state == state; });
}

bool RemoteSession::stop_requested() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stop;
}

bool RemoteSession::transition(SessionState to, const std::string &reason)
{
    return change_state(nullptr, to, reason);
}

bool RemoteSession::advance(SessionState from, SessionState to, const std::string &reason)
{
    return change_state(&from, to, reason);
}

bool RemoteSession::change_state(const SessionState *expected, SessionState to, const std::string &reason)
{
    SessionState from;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        from = m_state;
        if (expected && (m_stop || from != *expected)) {
            BOOST_LOG_TRIVIAL(debug) << "RemoteSession: dropped transition " << session_state_string(*expected) << " -> "
                                     << session_state_string(to) << ", session is " << session_state_string(from)
                                     << (m_stop ? " and stopping" : "");
            return false;
        }
        if (!is_valid_transition(from, to)) {
            BOOST_LOG_TRIVIAL(warning) << "RemoteSession: refused transition " << session_state_string(from) << " -> "
                                       << session_state_string(to) << " (" << reason << ")";
            return false;
        }
        m_state = to;
        update_agent_status(to);
    }
    m_cv.notify_all();

    BOOST_LOG_TRIVIAL(info) << "RemoteSession: " << session_state_string(from) << " -> " << session_state_string(to) << ": " << reason;

    OnStateChangedFn fn;
    {
        std::lock_guard<std::mutex> lock(m_listener_mutex);
        fn = m_on_state_changed;
    }
    if (fn)
        fn(from, to, reason);
    return true;
}

void RemoteSession::update_agent_status(SessionState state)
{
    if (!m_agent_state)
        return;
    switch (state) {
    case SessionState::Connected:
        m_agent_state->set_status(AgentStatus::Running);
        break;
    case SessionState::Reconnecting:
    case SessionState::Disconnected:
        m_agent_state->set_status(AgentStatus::Stopped);
        break;
    default:
        break;
    }
}

void RemoteSession::reap_loop()
{
    if (!m_loop.joinable())
        return;
    const SessionState current = state();
    if (current != SessionState::Disconnected && current != SessionState::Failed)
        throw ChannelError(std::string("Cannot connect a session in state ") + session_state_string(current));
    if (m_loop.get_id() == std::this_thread::get_id())
        throw ChannelError("Cannot reconnect a session from its own loop thread");
    // Disconnected or Failed, the loop is on its way out.
    m_loop.join();
    if (m_channel) {
        m_channel->close();
        m_channel.reset();
    }
    if (m_workers) {
        m_workers->join();
        m_workers.reset();
    }
}

void RemoteSession::connect()
{
    // A loop stopped by a listener or by an error has ended but was never joined.
    reap_loop();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop               = false;
        m_reconnect_attempt  = 0;
        m_current_backoff_ms = 0;
    }
    if (!transition(SessionState::Connecting, "connect requested"))
        throw ChannelError(std::string("Cannot connect a session in state ") + session_state_string(state()));

    BOOST_LOG_TRIVIAL(info) << "RemoteSession: connecting to controller as tenant " << m_config.identity;
    try {
        open_channel();
    } catch (const std::exception &e) {
        BOOST_LOG_TRIVIAL(error) << "RemoteSession: failed to connect to controller: " << e.what();
        if (m_channel) {
            m_channel->close();
            m_channel.reset();
        }
        transition(SessionState::Disconnected, e.what());
        throw;
    }

    m_workers = std::make_unique<boost::asio::thread_pool>(std::max<size_t>(m_config.worker_threads, 1));
    m_loop    = std::thread([this]() { run_loop(); });
}

void RemoteSession::disconnect()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stop = true;
    }
    m_cv.notify_all();

    const SessionState current = state();
    if (current != SessionState::Disconnected && current != SessionState::Failed) {
        BOOST_LOG_TRIVIAL(info) << "RemoteSession: disconnecting from controller";
        transition(SessionState::Disconnected, "client disconnect");
    }

    // A listener may call us from the loop thread; the loop then exits on its own.
    if (m_loop.joinable() && m_loop.get_id() == std::this_thread::get_id())
        return;

    if (m_loop.joinable())
        m_loop.join();
    if (m_channel) {
        m_channel->close();
        m_channel.reset();
    }
    if (m_workers) {
        m_workers->join();
        m_workers.reset();
    }
}

void RemoteSession::open_channel()
{
    ControllerChannelPtr channel = m_channel_factory();
    if (!channel)
        throw ChannelError("No controller channel available");

    channel->open();
    channel->emit(SocketIo::EVENT_REGISTER, { { "tenantId", m_config.identity } });

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_reconnect_attempt  = 0;
        m_current_backoff_ms = 0;
    }
    m_channel = std::move(channel);
    if (!advance(SessionState::Connecting, SessionState::Connected, "registered as tenant " + m_config.identity))
        throw ChannelError("Session stopped while connecting");

    m_last_heartbeat = Clock::now();
    flush_results();
}

void RemoteSession::run_loop()
{
    try {
        for (;;) {
            const std::string reason = serve();
            if (m_channel) {
                m_channel->close();
                m_channel.reset();
            }
            if (!advance(SessionState::Connected, SessionState::Reconnecting, reason))
                return;
            if (!reconnect())
                return;
        }
    } catch (const std::exception &e) {
        BOOST_LOG_TRIVIAL(error) << "RemoteSession: session loop failed: " << e.what();
        if (m_channel) {
            m_channel->close();
            m_channel.reset();
        }
        transition(SessionState::Disconnected, e.what());
        if (m_agent_state) {
            m_agent_state->record_error(std::string("Session loop failed: ") + e.what());
            m_agent_state->set_status(AgentStatus::Error);
        }
    }
}

std::string RemoteSession::serve()
{
    while (!stop_requested()) {
        try {
            for (const ControllerEvent &event : m_channel->poll(m_config.poll_interval_ms))
                handle_event(event);

            flush_results();

            if (Clock::now() - m_last_heartbeat >= std::chrono::milliseconds(m_config.heartbeat_interval_ms))
                send_heartbeat();
        } catch (const ChannelError &e) {
            BOOST_LOG_TRIVIAL(warning) << "RemoteSession: disconnected from controller: " << e.what();
            return e.what();
        }
    }
    return "client disconnect";
}

bool RemoteSession::reconnect()
{
    for (;;) {
        int attempt;
        int delay;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stop)
                return false;
            attempt = m_reconnect_attempt;
            if (attempt < m_config.max_reconnect_attempts) {
                delay                = reconnect_delay_ms(attempt, m_config.base_delay_ms, m_config.max_delay_ms);
                m_current_backoff_ms = delay;
            }
        }

        if (attempt >= m_config.max_reconnect_attempts) {
            BOOST_LOG_TRIVIAL(error) << "RemoteSession: max reconnection attempts (" << m_config.max_reconnect_attempts << ") reached";
            if (m_agent_state) {
                m_agent_state->record_error("Max reconnection attempts reached");
                m_agent_state->set_status(AgentStatus::Error);
            }
            transition(SessionState::Failed, "max reconnection attempts reached");
            return false;
        }

        BOOST_LOG_TRIVIAL(info) << "RemoteSession: reconnecting in " << delay << "ms (attempt " << attempt + 1 << "/"
                                << m_config.max_reconnect_attempts << ")";
        OnReconnectScheduledFn fn;
        {
            std::lock_guard<std::mutex> lock(m_listener_mutex);
            fn = m_on_reconnect_scheduled;
        }
        if (fn)
            fn(attempt + 1, delay);

        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_cv.wait_for(lock, std::chrono::milliseconds(delay), [this]() { return m_stop; }))
                return false;
            ++m_reconnect_attempt;
        }

        if (!advance(SessionState::Reconnecting, SessionState::Connecting, "reconnect attempt " + std::to_string(attempt + 1)))
            return false;

        try {
            open_channel();
            BOOST_LOG_TRIVIAL(info) << "RemoteSession: reconnected to controller after " << attempt + 1 << " attempts";
            return true;
        } catch (const std::exception &e) {
            BOOST_LOG_TRIVIAL(warning) << "RemoteSession: reconnect attempt " << attempt + 1 << " failed: " << e.what();
            if (m_channel) {
                m_channel->close();
                m_channel.reset();
            }
            if (!advance(SessionState::Connecting, SessionState::Reconnecting, e.what()))
                return false;
        }
    }
}

void RemoteSession::handle_event(const ControllerEvent &event)
{
    if (event.name == SocketIo::EVENT_PRINT_JOB) {
        PrintJob    job;
        std::string error;
        if (!parse_print_job(event.data, job, error)) {
            BOOST_LOG_TRIVIAL(error) << "RemoteSession: rejected print job " << job.job_id << ": " << error;
            // Without a job id the controller cannot correlate a result.
            if (!job.job_id.empty()) {
                if (m_agent_state)
                    m_agent_state->record_print_job(false);
                post_result({ { "jobId", job.job_id }, { "success", false }, { "message", "Failed to print: " + error } });
            }
            return;
        }

        BOOST_LOG_TRIVIAL(info) << "RemoteSession: received print job " << job.job_id << " (format " << job.format << ")";
        boost::asio::post(*m_workers, [this, job]() { run_job(job); });
    } else if (event.name == SocketIo::EVENT_CONNECTED) {
        BOOST_LOG_TRIVIAL(info) << "RemoteSession: registered successfully: " << notice_message(event.data);
    } else if (event.name == SocketIo::EVENT_ERROR) {
        const std::string message = notice_message(event.data);
        BOOST_LOG_TRIVIAL(error) << "RemoteSession: error from controller: " << message;
        if (m_agent_state)
            m_agent_state->record_error("Controller error: " + message);
    } else {
        BOOST_LOG_TRIVIAL(debug) << "RemoteSession: ignoring event " << event.name;
    }
}

void RemoteSession::run_job(const PrintJob &job)
{
    DeliveryResult result;
    try {
        result = m_delivery.deliver_job(job, m_config.default_printer);
    } catch (const std::exception &e) {
        BOOST_LOG_TRIVIAL(error) << "RemoteSession: job " << job.job_id << " failed: " << e.what();
        result.success = false;
        result.message = std::string("Failed to print: ") + e.what();
    }

    post_result({ { "jobId", job.job_id }, { "success", result.success }, { "message", result.message } });
}

void RemoteSession::post_result(nlohmann::json result)
{
    const size_t limit = std::max<size_t>(m_config.max_pending_results, 1);

    std::lock_guard<std::mutex> lock(m_results_mutex);
    while (m_results.size() >= limit) {
        BOOST_LOG_TRIVIAL(warning) << "RemoteSession: result buffer full, dropping result of job " << m_results.front().value("jobId", std::string());
        m_results.pop_front();
    }
    m_results.push_back(std::move(result));
}

void RemoteSession::flush_results()
{
    std::deque<nlohmann::json> pending;
    {
        std::lock_guard<std::mutex> lock(m_results_mutex);
        pending.swap(m_results);
    }

    while (!pending.empty()) {
        try {
            m_channel->emit(SocketIo::EVENT_PRINT_RESULT, pending.front());
        } catch (const ChannelError &) {
            // Unsent results go back ahead of newer ones and wait for the next connection.
            const size_t limit = std::max<size_t>(m_config.max_pending_results, 1);

            std::lock_guard<std::mutex> lock(m_results_mutex);
            m_results.insert(m_results.begin(), pending.begin(), pending.end());
            while (m_results.size() > limit) {
                BOOST_LOG_TRIVIAL(warning) << "RemoteSession: result buffer full, dropping result of job " << m_results.front().value("jobId", std::string());
                m_results.pop_front();
            }
            throw;
        }
        BOOST_LOG_TRIVIAL(debug) << "RemoteSession: sent result of job " << pending.front().value("jobId", std::string());
        pending.pop_front();
    }
}

void RemoteSession::send_heartbeat()
{
    m_last_heartbeat = Clock::now();

    nlohmann::json health;
    health["status"]    = m_agent_state ? agent_status_string(m_agent_state->status()) : "running";
    health["timestamp"] = Utils::iso_utc_millis_timestamp();
    m_channel->emit(SocketIo::EVENT_HEALTH, health);
    BOOST_LOG_TRIVIAL(trace) << "RemoteSession: heartbeat sent";
}

} // namespace PrintRelay
