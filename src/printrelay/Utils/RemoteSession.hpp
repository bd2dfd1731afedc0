#ifndef __REMOTE_SESSION_HPP__
#define __REMOTE_SESSION_HPP__

#include "IControllerChannel.hpp"

#include "libprintrelay/Endpoint.hpp"
#include "libprintrelay/PrintDelivery.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

namespace PrintRelay {

class AgentState;

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Reconnecting,
    Failed
};

const char *session_state_string(SessionState state);

// Allowed transitions of the session state machine; everything else is refused.
bool is_valid_transition(SessionState from, SessionState to);

// min(base * 2^attempt, max)
int reconnect_delay_ms(int attempt, int base_delay_ms, int max_delay_ms);

// Reads a dispatch event {jobId, text, format, printerIp?, printerPort?}.
// On failure error describes the problem; job.job_id is filled whenever the event carries one.
bool parse_print_job(const nlohmann::json &data, PrintJob &job, std::string &error);

struct SessionConfig
{
    // Tenant id sent on registration.
    std::string identity;
    int         base_delay_ms          = 1000;
    int         max_delay_ms           = 30000;
    int         max_reconnect_attempts = 10;
    int         heartbeat_interval_ms  = 30000;
    // Upper bound for one channel poll; results queued by workers wait at most this long.
    int         poll_interval_ms       = 250;
    Endpoint    default_printer;
    // Results buffered while the uplink is down, the oldest are dropped beyond this.
    size_t      max_pending_results    = 256;
    size_t      worker_threads         = 4;
};

// Outbound session to the remote controller.
//
// connect() opens the first channel on the calling thread and fails if that does not work.
// Afterwards a loop thread owns the channel: it reads dispatch events, hands print jobs to a
// worker pool, sends results and heartbeats, and reconnects with exponential backoff when the
// uplink drops. After max_reconnect_attempts failed attempts the session ends in Failed.
class RemoteSession
{
public:
    using OnStateChangedFn       = std::function<void(SessionState old_state, SessionState new_state, const std::string &reason)>;
    using OnReconnectScheduledFn = std::function<void(int attempt, int delay_ms)>;

    RemoteSession(SessionConfig config, ControllerChannelFactory channel_factory, PrintDelivery &delivery, AgentState *agent_state = nullptr);
    ~RemoteSession();

    RemoteSession(const RemoteSession &) = delete;
    RemoteSession &operator=(const RemoteSession &) = delete;

    // Throws the channel's error when the initial connection fails; the session is then Disconnected.
    void connect();
    // Stops the session and any pending reconnect. Jobs already running finish, their results
    // stay queued.
    void disconnect();

    SessionState state() const;
    bool         is_connected() const { return state() == SessionState::Connected; }
    int          reconnect_attempt() const;
    int          current_backoff_ms() const;
    size_t       pending_results() const;
    const std::string &identity() const { return m_config.identity; }

    // Returns false when the state was not reached within timeout_ms.
    bool wait_for_state(SessionState state, int timeout_ms) const;

    // Listeners run on the thread performing the transition, outside the session lock.
    void set_on_state_changed(OnStateChangedFn fn);
    void set_on_reconnect_scheduled(OnReconnectScheduledFn fn);

private:
    using Clock = std::chrono::steady_clock;

    bool transition(SessionState to, const std::string &reason);
    // Moves from -> to only while the session is in from and no stop was requested, checked
    // in the same critical section that commits the new state.
    bool advance(SessionState from, SessionState to, const std::string &reason);
    bool change_state(const SessionState *expected, SessionState to, const std::string &reason);
    // Uplink state as seen by the health report. Called with m_mutex held.
    void update_agent_status(SessionState state);
    // Joins a loop that already ended and releases what it left behind.
    void reap_loop();
    bool stop_requested() const;

    void        open_channel();
    void        run_loop();
    // Serves the open channel; returns the reason when the uplink is lost or the session stops.
    std::string serve();
    // Returns true once connected again, false when stopped or out of attempts.
    bool        reconnect();

    void handle_event(const ControllerEvent &event);
    void run_job(const PrintJob &job);
    void post_result(nlohmann::json result);
    void flush_results();
    void send_heartbeat();

    SessionConfig            m_config;
    ControllerChannelFactory m_channel_factory;
    PrintDelivery           &m_delivery;
    AgentState              *m_agent_state;

    mutable std::mutex              m_mutex;
    mutable std::condition_variable m_cv;
    SessionState                    m_state { SessionState::Disconnected };
    int                             m_reconnect_attempt { 0 };
    int                             m_current_backoff_ms { 0 };
    bool                            m_stop { false };

    // Owned by the loop thread once it runs.
    ControllerChannelPtr m_channel;
    Clock::time_point    m_last_heartbeat;

    mutable std::mutex         m_results_mutex;
    std::deque<nlohmann::json> m_results;

    std::mutex             m_listener_mutex;
    OnStateChangedFn       m_on_state_changed;
    OnReconnectScheduledFn m_on_reconnect_scheduled;

    std::unique_ptr<boost::asio::thread_pool> m_workers;
    std::thread                               m_loop;
};

} // namespace PrintRelay

#endif // __REMOTE_SESSION_HPP__
