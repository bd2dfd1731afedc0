#ifndef printrelay_RelayConfig_hpp_
#define printrelay_RelayConfig_hpp_

#include "Endpoint.hpp"
#include "libprintrelay.h"

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace PrintRelay {

struct PoolConfig;

// Process configuration.
// Sources in increasing precedence: built-in defaults, JSON file, environment variables.
struct RelayConfig
{
    // Controller uplink
    std::string backend_url              = "http://localhost:3000";
    std::string tenant_id;
    int         heartbeat_interval_ms    = 30000;
    int         reconnect_base_delay_ms  = 1000;
    int         reconnect_max_delay_ms   = 30000;
    int         max_reconnect_attempts   = 10;

    // Default printer, used when a job does not name one
    std::string printer_ip               = PRINTRELAY_DEFAULT_PRINTER_IP;
    int         printer_port             = PRINTRELAY_DEFAULT_PRINTER_PORT;

    // Printer connection pool
    int         max_connections_per_printer = 5;
    int         connection_timeout_ms    = 5000;
    int         write_timeout_ms         = 10000;
    int         wait_timeout_ms          = 10000;
    int         idle_timeout_ms          = 30000;
    int         cleanup_interval_ms      = 10000;

    // Logging
    unsigned    log_level                = 3;
    std::string log_dir;

    using GetEnvFn = std::function<const char*(const char*)>;

    // Throws ConfigError when the file cannot be read or a value has the wrong type.
    void load_from_file(const std::string &path);
    void load_from_json(const nlohmann::json &j);
    // Throws ConfigError on malformed numbers.
    void apply_environment(const GetEnvFn &get_env);
    void apply_environment();
    // Throws ConfigError describing the first invalid setting.
    void validate() const;

    Endpoint       default_printer() const { return Endpoint(printer_ip, static_cast<uint16_t>(printer_port)); }
    bool           uses_factory_printer() const;
    PoolConfig     pool_config() const;
    nlohmann::json to_json() const;
};

} // namespace PrintRelay

#endif // printrelay_RelayConfig_hpp_
