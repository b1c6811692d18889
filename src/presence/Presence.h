#pragma once

#include "collab/Operation.h"

#include <optional>
#include <string>
#include <string_view>

namespace coedit::presence {

using collab::Timestamp;

enum class PresenceStatus { Online, Away, Offline };

const char* to_string(PresenceStatus status) noexcept;
std::optional<PresenceStatus> parse_presence_status(std::string_view name) noexcept;

enum class LocationType { Workspace, Project, Conversation, Document };

const char* to_string(LocationType type) noexcept;
std::optional<LocationType> parse_location_type(std::string_view name) noexcept;

// Back-reference to where the user currently is; owns nothing.
struct Location {
    LocationType type = LocationType::Workspace;
    std::string id;
    std::optional<std::string> name;

    bool operator==(const Location& other) const {
        return type == other.type && id == other.id && name == other.name;
    }
};

struct UserPresence {
    std::string user_id;
    PresenceStatus status = PresenceStatus::Offline;
    Timestamp last_seen = 0;
    std::optional<Location> current_location;
    std::optional<std::string> activity;
};

// Partial update merged by PresenceTracker::update_presence.
struct PresencePatch {
    std::optional<PresenceStatus> status;
    std::optional<Location> location;
    bool clear_location = false;
    std::optional<std::string> activity;
};

} // namespace coedit::presence
