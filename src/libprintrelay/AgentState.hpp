#ifndef printrelay_AgentState_hpp_
#define printrelay_AgentState_hpp_

#include "ConnectionPool.hpp"
#include "libprintrelay.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace PrintRelay {

enum class AgentStatus { Running, Stopping, Stopped, Error };
enum class HealthLevel { Healthy, Degraded, Unhealthy };

const char *agent_status_string(AgentStatus status);
const char *health_level_string(HealthLevel level);

struct HealthReport
{
    HealthLevel server       = HealthLevel::Healthy;
    HealthLevel printer_pool = HealthLevel::Healthy;
    HealthLevel overall      = HealthLevel::Healthy;

    nlohmann::json to_json() const;
};

// Mean in_use/connections over all endpoints: >= 95% unhealthy, >= 80% degraded.
// A pool without connections is healthy.
HealthLevel  grade_pool_health(const PoolStats &stats);
HealthReport grade_health(AgentStatus status, const PoolStats &stats);

struct JobCounters
{
    uint64_t total      = 0;
    uint64_t successful = 0;
    uint64_t failed     = 0;
};

struct LastError
{
    std::string message;
    std::string timestamp;
};

// Process wide status and statistics, shared by the session, the delivery path and main.
// All members are thread safe.
class AgentState
{
public:
    explicit AgentState(nlohmann::json configuration = nlohmann::json::object(), std::string version = PRINTRELAY_VERSION);

    void        set_status(AgentStatus status);
    AgentStatus status() const;

    // Counts one finished job, exactly one of successful/failed is incremented.
    void        record_print_job(bool success);
    JobCounters job_counters() const;
    // Percentage of successful jobs, 100 when nothing was printed yet.
    double      success_rate() const;

    void                     record_error(const std::string &message);
    std::optional<LastError> last_error() const;

    uint64_t    uptime_ms() const;
    std::string formatted_uptime() const;
    const std::string &start_time() const { return m_start_time_iso; }
    const std::string &version() const { return m_version; }

    HealthReport   health(const PoolStats &pool) const;
    nlohmann::json to_json(const PoolStats &pool) const;

private:
    using Clock = std::chrono::steady_clock;

    mutable std::mutex       m_mutex;
    const Clock::time_point  m_started;
    const std::string        m_start_time_iso;
    const std::string        m_version;
    const nlohmann::json     m_configuration;
    AgentStatus              m_status { AgentStatus::Running };
    JobCounters              m_jobs;
    std::optional<LastError> m_last_error;
};

} // namespace PrintRelay

#endif // printrelay_AgentState_hpp_
