#include "libprintrelay/AgentState.hpp"
#include "libprintrelay/ConnectionPool.hpp"
#include "libprintrelay/Exception.hpp"
#include "libprintrelay/PrintDelivery.hpp"
#include "libprintrelay/RelayConfig.hpp"
#include "libprintrelay/Utils.hpp"
#include "libprintrelay/libprintrelay.h"

#include "printrelay/Utils/RemoteSession.hpp"
#include "printrelay/Utils/SocketIoChannel.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/log/trivial.hpp>

using namespace PrintRelay;

namespace {

constexpr int STATUS_LOG_INTERVAL_S = 60;

void log_terminate()
{
    if (std::exception_ptr eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception &ex) {
            BOOST_LOG_TRIVIAL(fatal) << "PrintRelay: terminating on uncaught exception: " << ex.what();
        } catch (...) {
            BOOST_LOG_TRIVIAL(fatal) << "PrintRelay: terminating on uncaught exception of unknown type";
        }
    } else {
        BOOST_LOG_TRIVIAL(fatal) << "PrintRelay: std::terminate called";
    }
    flush_logs();
    std::abort();
}

RelayConfig load_config(int argc, char **argv)
{
    RelayConfig config;

    const char *config_path = argc > 1 ? argv[1] : std::getenv("PRINTRELAY_CONFIG");
    if (config_path != nullptr && *config_path != '\0')
        config.load_from_file(config_path);

    config.apply_environment();
    config.validate();
    return config;
}

void log_status(const AgentState &state, const RemoteSession &session, const PrintDelivery &delivery)
{
    const PoolStats   pool = delivery.pool_stats();
    const JobCounters jobs = state.job_counters();
    BOOST_LOG_TRIVIAL(debug) << "PrintRelay: status " << agent_status_string(state.status())
                             << ", session " << session_state_string(session.state())
                             << ", jobs " << jobs.total << " (" << jobs.successful << " ok, " << jobs.failed << " failed)"
                             << ", " << pool.total_connections << " printer connections in " << pool.total_pools << " pools"
                             << ", health " << health_level_string(state.health(pool).overall)
                             << ", uptime " << state.formatted_uptime();
}

int run(int argc, char **argv)
{
    RelayConfig config;
    try {
        config = load_config(argc, argv);
    } catch (const ConfigError &e) {
        BOOST_LOG_TRIVIAL(fatal) << "PrintRelay: invalid configuration: " << e.what();
        return 1;
    }

    set_logging_level(config.log_level);
    if (!config.log_dir.empty() && !add_file_log(config.log_dir))
        BOOST_LOG_TRIVIAL(warning) << "PrintRelay: cannot write log files to " << config.log_dir;

    BOOST_LOG_TRIVIAL(info) << PRINTRELAY_APP_NAME << " " << PRINTRELAY_VERSION << " starting";
    BOOST_LOG_TRIVIAL(info) << "PrintRelay: controller " << config.backend_url << ", tenant " << config.tenant_id
                            << ", default printer " << config.default_printer().to_string();
    if (config.uses_factory_printer())
        BOOST_LOG_TRIVIAL(warning) << "PrintRelay: PRINTER_IP is still the factory default " << PRINTRELAY_DEFAULT_PRINTER_IP
                                   << ", set it to the address of your printer";

    boost::asio::io_context   ioc;
    boost::asio::signal_set   signals(ioc, SIGINT, SIGTERM);
    boost::asio::steady_timer status_timer(ioc);
    int                       exit_code = 0;

    ConnectionPool pool(config.pool_config());
    AgentState     state(config.to_json());
    PrintDelivery  delivery(pool, &state);

    SessionConfig session_config;
    session_config.identity               = config.tenant_id;
    session_config.base_delay_ms          = config.reconnect_base_delay_ms;
    session_config.max_delay_ms           = config.reconnect_max_delay_ms;
    session_config.max_reconnect_attempts = config.max_reconnect_attempts;
    session_config.heartbeat_interval_ms  = config.heartbeat_interval_ms;
    session_config.default_printer        = config.default_printer();
    session_config.worker_threads         = static_cast<size_t>(config.max_connections_per_printer);

    SocketIoChannelOptions channel_options;
    channel_options.backend_url      = config.backend_url;
    channel_options.tenant_id        = config.tenant_id;
    channel_options.write_timeout_ms = config.write_timeout_ms;

    RemoteSession session(
        session_config, [channel_options]() -> ControllerChannelPtr { return std::make_unique<SocketIoChannel>(channel_options); },
        delivery, &state);

    auto shutdown = [&]() {
        signals.cancel();
        status_timer.cancel();
    };

    session.set_on_state_changed([&](SessionState, SessionState new_state, const std::string &reason) {
        if (new_state != SessionState::Failed)
            return;
        // Nothing left to relay without an uplink.
        boost::asio::post(ioc, [&, reason]() {
            BOOST_LOG_TRIVIAL(fatal) << "PrintRelay: giving up on the controller: " << reason;
            exit_code = 1;
            shutdown();
        });
    });

    try {
        session.connect();
    } catch (const std::exception &e) {
        BOOST_LOG_TRIVIAL(fatal) << "PrintRelay: failed to connect to the controller: " << e.what();
        state.record_error(e.what());
        state.set_status(AgentStatus::Error);
        pool.close_all();
        return 1;
    }

    signals.async_wait([&](const boost::system::error_code &ec, int signo) {
        if (ec)
            return;
        BOOST_LOG_TRIVIAL(info) << "PrintRelay: received signal " << signo << ", shutting down";
        shutdown();
    });

    std::function<void()> schedule_status = [&]() {
        status_timer.expires_after(std::chrono::seconds(STATUS_LOG_INTERVAL_S));
        status_timer.async_wait([&](const boost::system::error_code &ec) {
            if (ec)
                return;
            log_status(state, session, delivery);
            schedule_status();
        });
    };
    schedule_status();

    BOOST_LOG_TRIVIAL(info) << "PrintRelay: running, press Ctrl+C to stop";
    ioc.run();

    state.set_status(AgentStatus::Stopping);
    session.set_on_state_changed(nullptr);
    session.disconnect();
    pool.close_all();
    state.set_status(exit_code == 0 ? AgentStatus::Stopped : AgentStatus::Error);

    const JobCounters jobs = state.job_counters();
    BOOST_LOG_TRIVIAL(info) << "PrintRelay: stopped after " << state.formatted_uptime() << ", " << jobs.total << " jobs ("
                            << jobs.successful << " ok, " << jobs.failed << " failed)";
    return exit_code;
}

} // namespace

int main(int argc, char **argv)
{
    std::set_terminate(log_terminate);

    int code = 1;
    try {
        code = run(argc, argv);
    } catch (const std::exception &e) {
        BOOST_LOG_TRIVIAL(fatal) << "PrintRelay: " << e.what();
    }
    flush_logs();
    return code;
}
