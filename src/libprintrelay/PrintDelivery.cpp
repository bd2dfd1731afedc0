#include "PrintDelivery.hpp"
#include "AgentState.hpp"
#include "Exception.hpp"

#include <algorithm>
#include <cctype>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/log/trivial.hpp>

namespace PrintRelay {

namespace {

bool is_base64_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

std::vector<uint8_t> decode_base64(const std::string &input)
{
    std::string normalized;
    normalized.reserve(input.size());
    for (char c : input)
        if (!std::isspace(static_cast<unsigned char>(c)))
            normalized.push_back(c);

    // Padding is optional, but at most two '=' and only at the end.
    size_t body = normalized.find('=');
    if (body == std::string::npos)
        body = normalized.size();
    if (normalized.size() - body > 2 ||
        std::any_of(normalized.begin() + body, normalized.end(), [](char c) { return c != '='; }) ||
        !std::all_of(normalized.begin(), normalized.begin() + body, is_base64_char) ||
        body % 4 == 1)
        throw PayloadError("Invalid base64 data");

    normalized.resize(body);
    while (normalized.size() % 4 != 0)
        normalized.push_back('=');

    std::vector<uint8_t> out(boost::beast::detail::base64::decoded_size(normalized.size()));
    auto res = boost::beast::detail::base64::decode(out.data(), normalized.data(), normalized.size());
    if (res.second != normalized.size())
        throw PayloadError("Invalid base64 data");
    out.resize(res.first);
    return out;
}

} // namespace

std::vector<uint8_t> decode_payload(const std::string &data, const std::string &format)
{
    const std::string fmt = boost::algorithm::to_lower_copy(format);

    std::vector<uint8_t> bytes;
    if (fmt == "base64")
        bytes = decode_base64(data);
    else if (fmt == "text")
        bytes.assign(data.begin(), data.end());
    else
        throw PayloadError("Unsupported format: " + format);

    if (bytes.empty())
        throw PayloadError("Print data is empty");
    return bytes;
}

PrintDelivery::PrintDelivery(ConnectionPool &pool, AgentState *state) : m_pool(pool), m_state(state) {}

DeliveryResult PrintDelivery::deliver(const std::string &host, uint16_t port, const std::vector<uint8_t> &payload)
{
    const std::string where = Endpoint(host, port).to_string();

    DeliveryResult      result;
    PooledConnectionPtr conn;
    try {
        conn = m_pool.acquire(host, port);
        conn->connection().send(payload);
        m_pool.release(conn);
        conn.reset();

        result.success = true;
        result.message = "Print job sent successfully";
        BOOST_LOG_TRIVIAL(info) << "PrintDelivery: sent " << payload.size() << " bytes to " << where;
    } catch (const PoolTimeout &e) {
        result.message = std::string("Printer busy: ") + e.what();
        BOOST_LOG_TRIVIAL(warning) << "PrintDelivery: " << where << " busy: " << e.what();
    } catch (const std::exception &e) {
        result.message = std::string("Failed to print: ") + e.what();
        BOOST_LOG_TRIVIAL(error) << "PrintDelivery: print to " << where << " failed: " << e.what();
    }

    // Still held only when the send failed, the stream is not reusable.
    if (conn)
        m_pool.discard(conn);

    record(result);
    return result;
}

DeliveryResult PrintDelivery::deliver_job(const PrintJob &job, const Endpoint &default_printer)
{
    std::vector<uint8_t> payload;
    try {
        payload = decode_payload(job.data, job.format);
    } catch (const PayloadError &e) {
        DeliveryResult result;
        result.message = std::string("Failed to print: ") + e.what();
        BOOST_LOG_TRIVIAL(error) << "PrintDelivery: job " << job.job_id << " rejected: " << e.what();
        record(result);
        return result;
    }

    Endpoint target = default_printer;
    if (job.printer) {
        if (!job.printer->host.empty())
            target.host = job.printer->host;
        if (job.printer->port != 0)
            target.port = job.printer->port;
    }
    BOOST_LOG_TRIVIAL(info) << "PrintDelivery: job " << job.job_id << " (" << payload.size() << " bytes) -> " << target.to_string();
    return deliver(target, payload);
}

void PrintDelivery::record(const DeliveryResult &result)
{
    if (m_state == nullptr)
        return;
    m_state->record_print_job(result.success);
    if (!result.success)
        m_state->record_error(result.message);
}

} // namespace PrintRelay
