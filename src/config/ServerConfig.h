#pragma once

#include "collab/SessionManager.h"
#include "presence/PresenceTracker.h"

#include <boost/json/object.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace coedit::config {

struct ServerConfig {
    std::string bind = "0.0.0.0";
    unsigned short port = 9002;
    unsigned threads = 1;
    std::string data_dir = "data";
    std::string log_level = "info";

    std::int64_t idle_timeout_ms = 5 * 60 * 1000;
    std::int64_t stale_timeout_ms = 30 * 60 * 1000;
    std::int64_t sweep_interval_ms = 60 * 1000;

    std::size_t join_tail = 100;
    std::size_t log_retention = 1000;
    int persist_retries = 2;

    presence::PresenceOptions presence_options() const;
    collab::EngineOptions engine_options() const;

    // Throws std::invalid_argument naming the offending field.
    void validate() const;
};

// Keys use the same camelCase spelling as the wire protocol ("idleTimeoutMs").
void apply_json(ServerConfig& config, const boost::json::object& obj);
ServerConfig load_config_file(const std::string& path);

// "--config FILE" is read first, every other flag then overrides it:
// --port N, --bind ADDR, --threads N, --data-dir DIR, --log-level LEVEL.
ServerConfig parse_command_line(const std::vector<std::string>& args);

std::string usage();

} // namespace coedit::config
