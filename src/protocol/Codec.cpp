#include "protocol/Codec.h"

#include "collab/Errors.h"

#include <cmath>
#include <cstdio>
#include <ctime>
#include <string>
#include <type_traits>
#include <variant>

namespace coedit::protocol {

using collab::ValidationError;

namespace {

std::string key_str(std::string_view key) { return std::string(key); }

// Integers on the wire stay within the range a double represents exactly.
constexpr std::int64_t kMaxWireInteger = std::int64_t{1} << 53;

std::int64_t number_to_int(const json::value& v, std::string_view what) {
    if (v.is_int64()) {
        const std::int64_t n = v.get_int64();
        if (n > kMaxWireInteger || n < -kMaxWireInteger) {
            throw ValidationError(key_str(what) + " is out of range");
        }
        return n;
    }
    if (v.is_uint64()) {
        if (v.get_uint64() > static_cast<std::uint64_t>(kMaxWireInteger)) {
            throw ValidationError(key_str(what) + " is out of range");
        }
        return static_cast<std::int64_t>(v.get_uint64());
    }
    if (v.is_double()) {
        const double d = v.get_double();
        if (!std::isfinite(d) || std::floor(d) != d) {
            throw ValidationError(key_str(what) + " must be an integer");
        }
        if (std::fabs(d) > static_cast<double>(kMaxWireInteger)) {
            throw ValidationError(key_str(what) + " is out of range");
        }
        return static_cast<std::int64_t>(d);
    }
    throw ValidationError(key_str(what) + " must be a number");
}

std::optional<std::string> optional_string(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    if (!v->is_string()) throw ValidationError(key_str(key) + " must be a string");
    return std::string(v->get_string());
}

std::optional<bool> optional_bool(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    if (!v->is_bool()) throw ValidationError(key_str(key) + " must be a boolean");
    return v->get_bool();
}

std::optional<std::int64_t> optional_int(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    return number_to_int(*v, key);
}

std::optional<double> optional_double(const json::object& obj, std::string_view key) {
    const json::value* v = obj.if_contains(key);
    if (!v || v->is_null()) return std::nullopt;
    if (v->is_double()) return v->get_double();
    return static_cast<double>(number_to_int(*v, key));
}

template <typename T>
void put_optional(json::object& obj, std::string_view key, const std::optional<T>& v) {
    if (v) obj[key] = *v;
}

} // namespace

const json::object& require_object(const json::value& v, std::string_view what) {
    const json::object* obj = v.if_object();
    if (!obj) throw ValidationError(key_str(what) + " must be an object");
    return *obj;
}

std::string require_string(const json::object& obj, std::string_view key) {
    auto v = optional_string(obj, key);
    if (!v) throw ValidationError("missing " + key_str(key));
    return *v;
}

std::int64_t require_int(const json::object& obj, std::string_view key) {
    auto v = optional_int(obj, key);
    if (!v) throw ValidationError("missing " + key_str(key));
    return *v;
}

collab::Timestamp timestamp_from_json(const json::value& v) {
    if (!v.is_string()) return number_to_int(v, "timestamp");

    const std::string s(v.get_string());
    std::tm tm{};
    int millis = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &consumed) != 6) {
        throw ValidationError("timestamp is not ISO-8601: " + s);
    }
    const char* rest = s.c_str() + consumed;
    if (*rest == '.') {
        ++rest;
        int digits = 0;
        while (*rest >= '0' && *rest <= '9') {
            if (digits < 3) millis = millis * 10 + (*rest - '0');
            ++digits;
            ++rest;
        }
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (*rest != 'Z' && *rest != '\0') {
        throw ValidationError("timestamp must be UTC: " + s);
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    const std::time_t secs = timegm(&tm);
    return static_cast<collab::Timestamp>(secs) * 1000 + millis;
}

// ---- encoders ----

json::object to_json(const collab::TextFormat& format) {
    json::object obj;
    put_optional(obj, "bold", format.bold);
    put_optional(obj, "italic", format.italic);
    put_optional(obj, "underline", format.underline);
    put_optional(obj, "strikethrough", format.strikethrough);
    put_optional(obj, "color", format.color);
    put_optional(obj, "backgroundColor", format.background_color);
    put_optional(obj, "fontSize", format.font_size);
    put_optional(obj, "fontFamily", format.font_family);
    return obj;
}

json::object to_json(const collab::Operation& op) {
    json::object data;
    std::visit(
        [&data](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, collab::InsertData>) {
                data["position"] = d.position;
                data["text"] = d.text;
                if (d.format) data["format"] = to_json(*d.format);
            } else if constexpr (std::is_same_v<T, collab::DeleteData>) {
                data["position"] = d.position;
                data["length"] = d.length;
            } else {
                data["start"] = d.start;
                data["end"] = d.end;
                data["format"] = to_json(d.format);
            }
        },
        op.payload);

    return json::object{
        {"id", op.id},
        {"sessionId", op.session_id},
        {"userId", op.user_id},
        {"type", collab::to_string(op.type())},
        {"timestamp", op.timestamp},
        {"data", std::move(data)}
    };
}

json::object to_json(const collab::AdmittedOperation& entry) {
    json::object obj = to_json(entry.operation);
    obj["admittedAt"] = entry.admitted_at;
    obj["sequence"] = entry.sequence;
    return obj;
}

json::object to_json(const collab::DocumentState& state) {
    json::object obj = state.extra;
    obj["text"] = state.text;
    json::array ranges;
    for (const auto& r : state.formatting) {
        ranges.push_back(json::object{
            {"start", r.start},
            {"end", r.end},
            {"format", to_json(r.format)}
        });
    }
    obj["formatting"] = std::move(ranges);
    return obj;
}

json::object to_json(const collab::CursorPosition& cursor) {
    json::object obj{
        {"userId", cursor.user_id},
        {"position", cursor.position},
        {"timestamp", cursor.timestamp}
    };
    put_optional(obj, "line", cursor.line);
    put_optional(obj, "column", cursor.column);
    return obj;
}

json::object to_json(const collab::TextSelection& selection) {
    return json::object{
        {"userId", selection.user_id},
        {"start", selection.start},
        {"end", selection.end},
        {"timestamp", selection.timestamp}
    };
}

json::object to_json(const collab::SessionSnapshot& session) {
    json::array participants;
    for (const auto& p : session.participants) participants.push_back(json::value(p));
    json::array operations;
    for (const auto& op : session.operations) operations.push_back(to_json(op));

    return json::object{
        {"id", session.id},
        {"resourceId", session.resource_id},
        {"resourceType", collab::to_string(session.resource_type)},
        {"workspaceId", session.workspace_id},
        {"participants", std::move(participants)},
        {"state", to_json(session.state)},
        {"operations", std::move(operations)},
        {"createdAt", session.created_at},
        {"lastActivity", session.last_activity}
    };
}

json::object to_json(const presence::Location& location) {
    json::object obj{
        {"type", presence::to_string(location.type)},
        {"id", location.id}
    };
    put_optional(obj, "name", location.name);
    return obj;
}

json::object to_json(const presence::UserPresence& p) {
    json::object obj{
        {"userId", p.user_id},
        {"status", presence::to_string(p.status)},
        {"lastSeen", p.last_seen}
    };
    if (p.current_location) {
        obj["currentLocation"] = to_json(*p.current_location);
    } else {
        obj["currentLocation"] = nullptr;
    }
    put_optional(obj, "activity", p.activity);
    return obj;
}

// ---- decoders ----

collab::TextFormat text_format_from_json(const json::value& v) {
    const auto& obj = require_object(v, "format");
    collab::TextFormat f;
    f.bold = optional_bool(obj, "bold");
    f.italic = optional_bool(obj, "italic");
    f.underline = optional_bool(obj, "underline");
    f.strikethrough = optional_bool(obj, "strikethrough");
    f.color = optional_string(obj, "color");
    f.background_color = optional_string(obj, "backgroundColor");
    f.font_size = optional_double(obj, "fontSize");
    f.font_family = optional_string(obj, "fontFamily");
    return f;
}

collab::Operation operation_from_json(const json::value& v) {
    const auto& obj = require_object(v, "operation");
    collab::Operation op;
    op.id = optional_string(obj, "id").value_or("");
    op.session_id = optional_string(obj, "sessionId").value_or("");
    op.user_id = optional_string(obj, "userId").value_or("");
    if (const json::value* ts = obj.if_contains("timestamp"); ts && !ts->is_null()) {
        op.timestamp = timestamp_from_json(*ts);
    }

    const std::string type_name = require_string(obj, "type");
    const auto type = collab::parse_operation_type(type_name);
    if (!type) throw ValidationError("unknown operation type: " + type_name);

    const json::value* data_v = obj.if_contains("data");
    if (!data_v) throw ValidationError("missing data");
    const auto& data = require_object(*data_v, "data");

    switch (*type) {
        case collab::OperationType::Insert: {
            collab::InsertData d;
            d.position = require_int(data, "position");
            d.text = require_string(data, "text");
            if (const json::value* f = data.if_contains("format"); f && !f->is_null()) {
                d.format = text_format_from_json(*f);
            }
            op.payload = std::move(d);
            break;
        }
        case collab::OperationType::Delete: {
            collab::DeleteData d;
            d.position = require_int(data, "position");
            d.length = require_int(data, "length");
            op.payload = d;
            break;
        }
        case collab::OperationType::Format: {
            collab::FormatData d;
            d.start = require_int(data, "start");
            d.end = require_int(data, "end");
            if (const json::value* f = data.if_contains("format"); f && !f->is_null()) {
                d.format = text_format_from_json(*f);
            }
            op.payload = std::move(d);
            break;
        }
    }
    return op;
}

collab::DocumentState document_state_from_json(const json::value& v) {
    const auto& obj = require_object(v, "state");
    collab::DocumentState state;
    state.text = optional_string(obj, "text").value_or("");

    if (const json::value* f = obj.if_contains("formatting"); f && !f->is_null()) {
        const json::array* ranges = f->if_array();
        if (!ranges) throw ValidationError("formatting must be an array");
        for (const auto& item : *ranges) {
            const auto& r = require_object(item, "formatting entry");
            collab::FormatRange range;
            range.start = require_int(r, "start");
            range.end = require_int(r, "end");
            if (const json::value* fmt = r.if_contains("format"); fmt && !fmt->is_null()) {
                range.format = text_format_from_json(*fmt);
            }
            state.formatting.push_back(std::move(range));
        }
    }

    for (const auto& kv : obj) {
        if (kv.key() == "text" || kv.key() == "formatting") continue;
        state.extra.emplace(kv.key(), kv.value());
    }
    return state;
}

collab::CursorPosition cursor_from_json(const json::value& v) {
    const auto& obj = require_object(v, "cursor");
    collab::CursorPosition c;
    c.position = require_int(obj, "position");
    c.line = optional_int(obj, "line");
    c.column = optional_int(obj, "column");
    return c;
}

collab::TextSelection selection_from_json(const json::value& v) {
    const auto& obj = require_object(v, "selection");
    collab::TextSelection s;
    s.start = require_int(obj, "start");
    s.end = require_int(obj, "end");
    if (s.start < 0 || s.end < s.start) throw ValidationError("invalid selection range");
    return s;
}

presence::Location location_from_json(const json::value& v) {
    const auto& obj = require_object(v, "currentLocation");
    presence::Location loc;
    const std::string type_name = require_string(obj, "type");
    const auto type = presence::parse_location_type(type_name);
    if (!type) throw ValidationError("unknown location type: " + type_name);
    loc.type = *type;
    loc.id = require_string(obj, "id");
    loc.name = optional_string(obj, "name");
    return loc;
}

presence::PresencePatch presence_patch_from_json(const json::value& v) {
    const auto& obj = require_object(v, "presence");
    presence::PresencePatch patch;
    if (auto status = optional_string(obj, "status")) {
        patch.status = presence::parse_presence_status(*status);
        if (!patch.status) throw ValidationError("unknown presence status: " + *status);
    }
    if (const json::value* loc = obj.if_contains("currentLocation")) {
        if (loc->is_null()) {
            patch.clear_location = true;
        } else {
            patch.location = location_from_json(*loc);
        }
    }
    patch.activity = optional_string(obj, "activity");
    return patch;
}

} // namespace coedit::protocol
