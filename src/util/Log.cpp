#include "util/Log.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace coedit::util {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_mu;

char level_char(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return 'E';
        case LogLevel::Warn:  return 'W';
        case LogLevel::Info:  return 'I';
        case LogLevel::Debug: return 'D';
    }
    return '?';
}

std::string clock_prefix() {
    using namespace std::chrono;
    const auto now = system_clock::now();
    const auto millis = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&t, &tm);

    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    char out[48]{};
    std::snprintf(out, sizeof(out), "%s.%03lld", buf, static_cast<long long>(millis));
    return out;
}

} // namespace

void Log::set_level(LogLevel level) noexcept { g_level.store(static_cast<int>(level)); }

LogLevel Log::level() noexcept { return static_cast<LogLevel>(g_level.load()); }

bool Log::enabled(LogLevel level) noexcept {
    return static_cast<int>(level) <= g_level.load();
}

LogLevel Log::parse_level(std::string_view name) {
    if (name == "error") return LogLevel::Error;
    if (name == "warn")  return LogLevel::Warn;
    if (name == "info")  return LogLevel::Info;
    if (name == "debug") return LogLevel::Debug;
    throw std::invalid_argument("unknown log level: " + std::string(name));
}

void Log::write(LogLevel level, std::string_view tag, std::string_view text) {
    const std::string stamp = clock_prefix();

    // Errors and warnings go to stderr like the WS session failures always did.
    std::ostream& os = (level <= LogLevel::Warn) ? std::cerr : std::cout;

    std::lock_guard<std::mutex> lk(g_mu);
    os << '[' << level_char(level) << ' ' << stamp << "] [" << tag << "] " << text << '\n';
    os.flush();
}

} // namespace coedit::util
