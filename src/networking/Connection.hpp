#pragma once

#include "networking/Transport.h"

#include <chrono>
#include <cstdint>
#include <set>
#include <string>

namespace coedit::networking {

struct Connection {
    using Clock = std::chrono::steady_clock;

    ClientId id = 0;
    std::string client_id;     // "client-<ulid>"
    std::string user_id;
    std::string workspace_id;
    std::set<std::string> sessions;   // joined through this connection

    Clock::time_point connected_at{};
    Clock::time_point last_seen{};
    std::uint64_t activity = 0;       // larger is more recent

    void touch(std::uint64_t tick) noexcept {
        last_seen = Clock::now();
        activity = tick;
    }
};

} // namespace coedit::networking
