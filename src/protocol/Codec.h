#pragma once

#include "collab/Operation.h"
#include "collab/Session.h"
#include "presence/Presence.h"

#include <boost/json.hpp>

#include <string_view>

// JSON shapes of the domain values. Decoders throw collab::ValidationError.
namespace coedit::protocol {

namespace json = boost::json;

// Numbers are milliseconds since the epoch; ISO-8601 UTC strings
// ("2026-10-19T08:15:00.250Z") are accepted on input as well.
collab::Timestamp timestamp_from_json(const json::value& v);

json::object to_json(const collab::TextFormat& format);
json::object to_json(const collab::Operation& op);
json::object to_json(const collab::AdmittedOperation& entry);
json::object to_json(const collab::DocumentState& state);
json::object to_json(const collab::CursorPosition& cursor);
json::object to_json(const collab::TextSelection& selection);
json::object to_json(const collab::SessionSnapshot& session);
json::object to_json(const presence::Location& location);
json::object to_json(const presence::UserPresence& presence);

collab::TextFormat text_format_from_json(const json::value& v);
collab::Operation operation_from_json(const json::value& v);
collab::DocumentState document_state_from_json(const json::value& v);
collab::CursorPosition cursor_from_json(const json::value& v);
collab::TextSelection selection_from_json(const json::value& v);
presence::Location location_from_json(const json::value& v);
presence::PresencePatch presence_patch_from_json(const json::value& v);

// Helpers shared with the message decoder.
const json::object& require_object(const json::value& v, std::string_view what);
std::string require_string(const json::object& obj, std::string_view key);
std::int64_t require_int(const json::object& obj, std::string_view key);

} // namespace coedit::protocol
