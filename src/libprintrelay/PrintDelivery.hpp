#ifndef printrelay_PrintDelivery_hpp_
#define printrelay_PrintDelivery_hpp_

#include "ConnectionPool.hpp"
#include "Endpoint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace PrintRelay {

class AgentState;

struct DeliveryResult
{
    bool        success = false;
    std::string message;
};

// A dispatched job, as received from the controller.
struct PrintJob
{
    std::string             job_id;
    std::string             data;
    std::string             format = "base64";
    // Per-job printer override. An empty host or a zero port falls back to the default printer.
    std::optional<Endpoint> printer;
};

// Decodes a job payload. Supported formats: "base64" and "text".
// Throws PayloadError on an unsupported format, malformed base64 or empty data.
std::vector<uint8_t> decode_payload(const std::string &data, const std::string &format);

// Sends print payloads to printers through the connection pool.
// Every call records exactly one job outcome in the attached AgentState.
class PrintDelivery
{
public:
    explicit PrintDelivery(ConnectionPool &pool, AgentState *state = nullptr);

    // Never throws; pool exhaustion is reported as "Printer busy: ...",
    // device faults as "Failed to print: ...".
    DeliveryResult deliver(const std::string &host, uint16_t port, const std::vector<uint8_t> &payload);
    DeliveryResult deliver(const Endpoint &endpoint, const std::vector<uint8_t> &payload)
    {
        return deliver(endpoint.host, endpoint.port, payload);
    }

    // Decodes the payload and delivers it to the job's printer, or to default_printer.
    DeliveryResult deliver_job(const PrintJob &job, const Endpoint &default_printer);

    PoolStats       pool_stats() const { return m_pool.stats(); }
    ConnectionPool &pool() { return m_pool; }

private:
    void record(const DeliveryResult &result);

    ConnectionPool &m_pool;
    AgentState     *m_state;
};

} // namespace PrintRelay

#endif // printrelay_PrintDelivery_hpp_
