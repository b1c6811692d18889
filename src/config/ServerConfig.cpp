#include "config/ServerConfig.h"

#include "util/Log.h"

#include <boost/json.hpp>

#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace coedit::config {

namespace json = boost::json;

namespace {

std::int64_t parse_int(const std::string& text, const std::string& what) {
    std::int64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) throw std::invalid_argument(what + ": not an integer: '" + text + "'");
    return value;
}

std::int64_t int_field(const json::value& v, const std::string& key) {
    if (const auto* i = v.if_int64()) return *i;
    if (const auto* u = v.if_uint64()) {
        if (*u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw std::invalid_argument(key + ": out of range");
        }
        return static_cast<std::int64_t>(*u);
    }
    throw std::invalid_argument(key + ": expected an integer");
}

std::string string_field(const json::value& v, const std::string& key) {
    if (const auto* s = v.if_string()) return std::string(s->data(), s->size());
    throw std::invalid_argument(key + ": expected a string");
}

unsigned short to_port(std::int64_t value, const std::string& what) {
    if (value < 0 || value > 65535) throw std::invalid_argument(what + ": port out of range");
    return static_cast<unsigned short>(value);
}

unsigned to_threads(std::int64_t value, const std::string& what) {
    if (value < 1 || value > 256) throw std::invalid_argument(what + ": threads must be in [1, 256]");
    return static_cast<unsigned>(value);
}

std::size_t to_count(std::int64_t value, const std::string& what) {
    if (value < 1) throw std::invalid_argument(what + ": must be positive");
    return static_cast<std::size_t>(value);
}

} // namespace

presence::PresenceOptions ServerConfig::presence_options() const {
    presence::PresenceOptions out;
    out.idle_timeout = std::chrono::milliseconds(idle_timeout_ms);
    out.stale_timeout = std::chrono::milliseconds(stale_timeout_ms);
    out.sweep_interval = std::chrono::milliseconds(sweep_interval_ms);
    return out;
}

collab::EngineOptions ServerConfig::engine_options() const {
    collab::EngineOptions out;
    out.join_tail = join_tail;
    out.log_retention = log_retention;
    out.persist_retries = persist_retries;
    return out;
}

void ServerConfig::validate() const {
    if (bind.empty()) throw std::invalid_argument("bind: must not be empty");
    if (threads < 1) throw std::invalid_argument("threads: must be at least 1");
    if (data_dir.empty()) throw std::invalid_argument("dataDir: must not be empty");
    util::Log::parse_level(log_level);
    if (idle_timeout_ms <= 0) throw std::invalid_argument("idleTimeoutMs: must be positive");
    if (stale_timeout_ms <= idle_timeout_ms) {
        throw std::invalid_argument("staleTimeoutMs: must be greater than idleTimeoutMs");
    }
    if (sweep_interval_ms <= 0) throw std::invalid_argument("sweepIntervalMs: must be positive");
    if (join_tail < 1) throw std::invalid_argument("joinTail: must be positive");
    if (log_retention < join_tail) throw std::invalid_argument("logRetention: must be at least joinTail");
    if (persist_retries < 0) throw std::invalid_argument("persistRetries: must not be negative");
}

void apply_json(ServerConfig& config, const json::object& obj) {
    for (const auto& kv : obj) {
        const std::string key(kv.key());
        const json::value& v = kv.value();

        if (key == "bind")                 config.bind = string_field(v, key);
        else if (key == "port")            config.port = to_port(int_field(v, key), key);
        else if (key == "threads")         config.threads = to_threads(int_field(v, key), key);
        else if (key == "dataDir")         config.data_dir = string_field(v, key);
        else if (key == "logLevel")        config.log_level = string_field(v, key);
        else if (key == "idleTimeoutMs")   config.idle_timeout_ms = int_field(v, key);
        else if (key == "staleTimeoutMs")  config.stale_timeout_ms = int_field(v, key);
        else if (key == "sweepIntervalMs") config.sweep_interval_ms = int_field(v, key);
        else if (key == "joinTail")        config.join_tail = to_count(int_field(v, key), key);
        else if (key == "logRetention")    config.log_retention = to_count(int_field(v, key), key);
        else if (key == "persistRetries")  config.persist_retries = static_cast<int>(int_field(v, key));
        else throw std::invalid_argument("unknown config key: " + key);
    }
}

ServerConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::invalid_argument("cannot open config file: " + path);
    std::ostringstream buf;
    buf << in.rdbuf();

    boost::system::error_code ec;
    json::value v = json::parse(buf.str(), ec);
    if (ec) throw std::invalid_argument(path + ": " + ec.message());
    const auto* obj = v.if_object();
    if (!obj) throw std::invalid_argument(path + ": top level must be an object");

    ServerConfig config;
    apply_json(config, *obj);
    return config;
}

ServerConfig parse_command_line(const std::vector<std::string>& args) {
    auto value_of = [&](std::size_t& i) -> const std::string& {
        if (i + 1 >= args.size()) throw std::invalid_argument(args[i] + ": missing value");
        return args[++i];
    };

    ServerConfig config;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--config") config = load_config_file(value_of(i));
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (flag == "--config")         value_of(i);
        else if (flag == "--port")      config.port = to_port(parse_int(value_of(i), flag), flag);
        else if (flag == "--bind")      config.bind = value_of(i);
        else if (flag == "--threads")   config.threads = to_threads(parse_int(value_of(i), flag), flag);
        else if (flag == "--data-dir")  config.data_dir = value_of(i);
        else if (flag == "--log-level") config.log_level = value_of(i);
        else throw std::invalid_argument("unknown option: " + flag);
    }

    config.validate();
    return config;
}

std::string usage() {
    return "usage: coedit [--config FILE] [--port N] [--bind ADDR] [--threads N]\n"
           "              [--data-dir DIR] [--log-level error|warn|info|debug]\n";
}

} // namespace coedit::config
