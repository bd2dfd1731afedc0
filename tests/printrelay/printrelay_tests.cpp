#include <catch_main.hpp>

#include "printrelay/Utils/RemoteSession.hpp"

using namespace PrintRelay;

TEST_CASE("Session states have readable names", "[RemoteSession]")
{
    REQUIRE(std::string(session_state_string(SessionState::Disconnected)) == "Disconnected");
    REQUIRE(std::string(session_state_string(SessionState::Connecting)) == "Connecting");
    REQUIRE(std::string(session_state_string(SessionState::Connected)) == "Connected");
    REQUIRE(std::string(session_state_string(SessionState::Reconnecting)) == "Reconnecting");
    REQUIRE(std::string(session_state_string(SessionState::Failed)) == "Failed");
}

TEST_CASE("Session defaults", "[RemoteSession]")
{
    SessionConfig cfg;
    REQUIRE(cfg.base_delay_ms == 1000);
    REQUIRE(cfg.max_delay_ms == 30000);
    REQUIRE(cfg.max_reconnect_attempts == 10);
    REQUIRE(cfg.heartbeat_interval_ms == 30000);
    REQUIRE(cfg.max_pending_results == 256);
}
