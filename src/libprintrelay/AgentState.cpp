#include "AgentState.hpp"
#include "Time.hpp"

#include <boost/log/trivial.hpp>

namespace PrintRelay {

const char *agent_status_string(AgentStatus status)
{
    switch (status) {
    case AgentStatus::Running:  return "running";
    case AgentStatus::Stopping: return "stopping";
    case AgentStatus::Stopped:  return "stopped";
    case AgentStatus::Error:    return "error";
    }
    return "unknown";
}

const char *health_level_string(HealthLevel level)
{
    switch (level) {
    case HealthLevel::Healthy:   return "healthy";
    case HealthLevel::Degraded:  return "degraded";
    case HealthLevel::Unhealthy: return "unhealthy";
    }
    return "unknown";
}

nlohmann::json HealthReport::to_json() const
{
    return {
        { "server",      health_level_string(server) },
        { "printerPool", health_level_string(printer_pool) },
        { "overall",     health_level_string(overall) },
    };
}

HealthLevel grade_pool_health(const PoolStats &stats)
{
    if (stats.total_connections == 0 || stats.per_endpoint.empty())
        return HealthLevel::Healthy;

    double sum = 0.;
    for (const EndpointStats &s : stats.per_endpoint)
        if (s.connections > 0)
            sum += 100. * double(s.in_use) / double(s.connections);
    const double utilization = sum / double(stats.per_endpoint.size());

    if (utilization >= 95.)
        return HealthLevel::Unhealthy;
    if (utilization >= 80.)
        return HealthLevel::Degraded;
    return HealthLevel::Healthy;
}

HealthReport grade_health(AgentStatus status, const PoolStats &stats)
{
    HealthReport report;
    report.server       = status == AgentStatus::Running ? HealthLevel::Healthy : HealthLevel::Unhealthy;
    report.printer_pool = grade_pool_health(stats);

    if (report.server == HealthLevel::Unhealthy || report.printer_pool == HealthLevel::Unhealthy)
        report.overall = HealthLevel::Unhealthy;
    else if (report.printer_pool == HealthLevel::Degraded)
        report.overall = HealthLevel::Degraded;
    else
        report.overall = HealthLevel::Healthy;
    return report;
}

AgentState::AgentState(nlohmann::json configuration, std::string version)
    : m_started(Clock::now())
    , m_start_time_iso(Utils::iso_utc_millis_timestamp())
    , m_version(std::move(version))
    , m_configuration(std::move(configuration))
{}

void AgentState::set_status(AgentStatus status)
{
    AgentStatus old;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        old      = m_status;
        m_status = status;
    }
    if (old != status)
        BOOST_LOG_TRIVIAL(info) << "AgentState: status " << agent_status_string(old) << " -> " << agent_status_string(status);
}

AgentStatus AgentState::status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_status;
}

void AgentState::record_print_job(bool success)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    ++m_jobs.total;
    if (success)
        ++m_jobs.successful;
    else
        ++m_jobs.failed;
}

JobCounters AgentState::job_counters() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_jobs;
}

double AgentState::success_rate() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_jobs.total == 0)
        return 100.;
    return 100. * double(m_jobs.successful) / double(m_jobs.total);
}

void AgentState::record_error(const std::string &message)
{
    BOOST_LOG_TRIVIAL(debug) << "AgentState: last error: " << message;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_error = LastError{ message, Utils::iso_utc_millis_timestamp() };
}

std::optional<LastError> AgentState::last_error() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_error;
}

uint64_t AgentState::uptime_ms() const
{
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - m_started).count());
}

std::string AgentState::formatted_uptime() const
{
    return Utils::format_duration(uptime_ms());
}

HealthReport AgentState::health(const PoolStats &pool) const
{
    return grade_health(status(), pool);
}

nlohmann::json AgentState::to_json(const PoolStats &pool) const
{
    const JobCounters jobs       = job_counters();
    const auto        last_error = this->last_error();

    nlohmann::json j;
    j["status"]          = agent_status_string(status());
    j["uptime"]          = uptime_ms();
    j["formattedUptime"] = formatted_uptime();
    j["startTime"]       = m_start_time_iso;
    j["version"]         = m_version;
    j["configuration"]   = m_configuration;

    nlohmann::json &statistics       = j["statistics"];
    statistics["totalPrintJobs"]      = jobs.total;
    statistics["successfulPrintJobs"] = jobs.successful;
    statistics["failedPrintJobs"]     = jobs.failed;
    statistics["successRate"]         = success_rate();
    statistics["activeConnections"]   = pool.total_connections;
    statistics["poolStatistics"]      = pool.to_json();

    if (last_error)
        j["lastError"] = { { "message", last_error->message }, { "timestamp", last_error->timestamp } };

    j["health"] = health(pool).to_json();
    return j;
}

} // namespace PrintRelay
