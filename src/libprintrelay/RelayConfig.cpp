#include "RelayConfig.hpp"
#include "ConnectionPool.hpp"
#include "Exception.hpp"
#include "Utils.hpp"

#include <cstdlib>
#include <fstream>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/trivial.hpp>

namespace PrintRelay {

namespace {

int parse_int(const char *name, const std::string &raw)
{
    const std::string value = boost::algorithm::trim_copy(raw);
    try {
        return boost::lexical_cast<int>(value);
    } catch (const boost::bad_lexical_cast &) {
        throw ConfigError(std::string("Invalid integer for ") + name + ": '" + raw + "'");
    }
}

template<typename T>
void read_json_value(const nlohmann::json &j, const char *key, T &out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception &e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

void RelayConfig::load_from_file(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw ConfigError("Cannot open config file: " + path);

    auto j = nlohmann::json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw ConfigError("Config file is not a JSON object: " + path);

    load_from_json(j);
    BOOST_LOG_TRIVIAL(info) << "RelayConfig: loaded " << path;
}

void RelayConfig::load_from_json(const nlohmann::json &j)
{
    read_json_value(j, "backend_url", backend_url);
    read_json_value(j, "tenant_id", tenant_id);
    read_json_value(j, "heartbeat_interval_ms", heartbeat_interval_ms);
    read_json_value(j, "reconnect_base_delay_ms", reconnect_base_delay_ms);
    read_json_value(j, "reconnect_max_delay_ms", reconnect_max_delay_ms);
    read_json_value(j, "max_reconnect_attempts", max_reconnect_attempts);
    read_json_value(j, "printer_ip", printer_ip);
    read_json_value(j, "printer_port", printer_port);
    read_json_value(j, "max_connections_per_printer", max_connections_per_printer);
    read_json_value(j, "connection_timeout_ms", connection_timeout_ms);
    read_json_value(j, "write_timeout_ms", write_timeout_ms);
    read_json_value(j, "wait_timeout_ms", wait_timeout_ms);
    read_json_value(j, "idle_timeout_ms", idle_timeout_ms);
    read_json_value(j, "cleanup_interval_ms", cleanup_interval_ms);
    read_json_value(j, "log_dir", log_dir);

    auto level = j.find("log_level");
    if (level != j.end()) {
        int parsed = level->is_number_integer() ? level->get<int>() :
                     level->is_string()         ? parse_logging_level(level->get<std::string>()) : -1;
        if (parsed < 0 || parsed > 5)
            throw ConfigError("Invalid value for 'log_level': " + level->dump());
        log_level = static_cast<unsigned>(parsed);
    }
}

void RelayConfig::apply_environment(const GetEnvFn &get_env)
{
    auto str = [&](const char *name, std::string &out) {
        if (const char *v = get_env(name); v != nullptr && *v != '\0')
            out = v;
    };
    auto num = [&](const char *name, int &out) {
        if (const char *v = get_env(name); v != nullptr && *v != '\0')
            out = parse_int(name, v);
    };

    str("BACKEND_URL", backend_url);
    str("TENANT_ID", tenant_id);
    str("PRINTER_IP", printer_ip);
    num("PRINTER_PORT", printer_port);
    num("MAX_PRINTER_CONNECTIONS", max_connections_per_printer);
    num("PRINTER_CONNECTION_TIMEOUT", connection_timeout_ms);
    num("PRINTER_IDLE_TIMEOUT", idle_timeout_ms);
    num("PRINTER_WAIT_TIMEOUT", wait_timeout_ms);
    num("HEARTBEAT_INTERVAL", heartbeat_interval_ms);
    num("RECONNECT_BASE_DELAY", reconnect_base_delay_ms);
    num("RECONNECT_MAX_DELAY", reconnect_max_delay_ms);
    num("MAX_RECONNECT_ATTEMPTS", max_reconnect_attempts);
    str("LOG_DIR", log_dir);

    if (const char *v = get_env("LOG_LEVEL"); v != nullptr && *v != '\0') {
        int parsed = parse_logging_level(v);
        if (parsed < 0)
            throw ConfigError(std::string("Invalid LOG_LEVEL: '") + v + "'");
        log_level = static_cast<unsigned>(parsed);
    }
}

void RelayConfig::apply_environment()
{
    apply_environment([](const char *name) { return std::getenv(name); });
}

void RelayConfig::validate() const
{
    if (boost::algorithm::trim_copy(tenant_id).empty())
        throw ConfigError("TENANT_ID is required");
    if (backend_url.empty())
        throw ConfigError("BACKEND_URL is required");
    if (printer_ip.empty())
        throw ConfigError("PRINTER_IP is required");
    if (printer_port < 1 || printer_port > 65535)
        throw ConfigError("PRINTER_PORT must be between 1 and 65535");
    if (max_connections_per_printer < 1)
        throw ConfigError("MAX_PRINTER_CONNECTIONS must be positive");

    const std::pair<const char*, int> positive[] = {
        { "PRINTER_CONNECTION_TIMEOUT", connection_timeout_ms },
        { "write_timeout_ms",           write_timeout_ms },
        { "PRINTER_WAIT_TIMEOUT",       wait_timeout_ms },
        { "PRINTER_IDLE_TIMEOUT",       idle_timeout_ms },
        { "cleanup_interval_ms",        cleanup_interval_ms },
        { "HEARTBEAT_INTERVAL",         heartbeat_interval_ms },
        { "RECONNECT_BASE_DELAY",       reconnect_base_delay_ms },
        { "RECONNECT_MAX_DELAY",        reconnect_max_delay_ms },
    };
    for (const auto &p : positive)
        if (p.second <= 0)
            throw ConfigError(std::string(p.first) + " must be positive");

    if (reconnect_max_delay_ms < reconnect_base_delay_ms)
        throw ConfigError("RECONNECT_MAX_DELAY must not be smaller than RECONNECT_BASE_DELAY");
    if (max_reconnect_attempts < 0)
        throw ConfigError("MAX_RECONNECT_ATTEMPTS must not be negative");
}

bool RelayConfig::uses_factory_printer() const
{
    return printer_ip == PRINTRELAY_DEFAULT_PRINTER_IP;
}

PoolConfig RelayConfig::pool_config() const
{
    PoolConfig cfg;
    cfg.max_connections_per_endpoint = static_cast<size_t>(max_connections_per_printer);
    cfg.connect_timeout_ms           = connection_timeout_ms;
    cfg.write_timeout_ms             = write_timeout_ms;
    cfg.wait_timeout_ms              = wait_timeout_ms;
    cfg.idle_timeout_ms              = idle_timeout_ms;
    cfg.cleanup_interval_ms          = cleanup_interval_ms;
    return cfg;
}

nlohmann::json RelayConfig::to_json() const
{
    nlohmann::json j;
    j["backendUrl"]               = backend_url;
    j["tenantId"]                 = tenant_id.empty() ? std::string("Not configured") : tenant_id;
    j["defaultPrinterIp"]         = printer_ip;
    j["defaultPrinterPort"]       = printer_port;
    j["maxConnectionsPerPrinter"] = max_connections_per_printer;
    j["connectionTimeout"]        = connection_timeout_ms;
    j["idleTimeout"]              = idle_timeout_ms;
    j["waitTimeout"]              = wait_timeout_ms;
    j["heartbeatInterval"]        = heartbeat_interval_ms;
    j["maxReconnectAttempts"]     = max_reconnect_attempts;
    return j;
}

} // namespace PrintRelay
