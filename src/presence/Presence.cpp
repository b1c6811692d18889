#include "presence/Presence.h"

namespace coedit::presence {

const char* to_string(PresenceStatus status) noexcept {
    switch (status) {
        case PresenceStatus::Online:  return "online";
        case PresenceStatus::Away:    return "away";
        case PresenceStatus::Offline: return "offline";
    }
    return "offline";
}

std::optional<PresenceStatus> parse_presence_status(std::string_view name) noexcept {
    if (name == "online")  return PresenceStatus::Online;
    if (name == "away")    return PresenceStatus::Away;
    if (name == "offline") return PresenceStatus::Offline;
    return std::nullopt;
}

const char* to_string(LocationType type) noexcept {
    switch (type) {
        case LocationType::Workspace:    return "workspace";
        case LocationType::Project:      return "project";
        case LocationType::Conversation: return "conversation";
        case LocationType::Document:     return "document";
    }
    return "workspace";
}

std::optional<LocationType> parse_location_type(std::string_view name) noexcept {
    if (name == "workspace")    return LocationType::Workspace;
    if (name == "project")      return LocationType::Project;
    if (name == "conversation") return LocationType::Conversation;
    if (name == "document")     return LocationType::Document;
    return std::nullopt;
}

} // namespace coedit::presence
