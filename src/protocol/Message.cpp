#include "protocol/Message.h"

#include "collab/Errors.h"
#include "protocol/Codec.h"

#include <boost/json.hpp>

#include <utility>

namespace coedit::protocol {

using collab::ValidationError;

const char* to_string(InboundKind kind) noexcept {
    switch (kind) {
        case InboundKind::Operation:       return "operation";
        case InboundKind::CursorUpdate:    return "cursor_update";
        case InboundKind::SelectionUpdate: return "selection_update";
        case InboundKind::PresenceUpdate:  return "presence_update";
        case InboundKind::OpenSession:     return "open_session";
        case InboundKind::JoinSession:     return "join_session";
        case InboundKind::LeaveSession:    return "leave_session";
    }
    return "unknown";
}

const char* to_string(OutboundKind kind) noexcept {
    switch (kind) {
        case OutboundKind::SessionState:    return "session_state";
        case OutboundKind::Operation:       return "operation";
        case OutboundKind::CursorUpdate:    return "cursor_update";
        case OutboundKind::SelectionUpdate: return "selection_update";
        case OutboundKind::UserJoined:      return "user_joined";
        case OutboundKind::UserLeft:        return "user_left";
        case OutboundKind::PresenceUpdate:  return "presence_update";
        case OutboundKind::Error:           return "error";
    }
    return "error";
}

std::optional<InboundKind> parse_inbound_kind(std::string_view name) noexcept {
    if (name == "operation")        return InboundKind::Operation;
    if (name == "cursor_update")    return InboundKind::CursorUpdate;
    if (name == "selection_update") return InboundKind::SelectionUpdate;
    if (name == "presence_update")  return InboundKind::PresenceUpdate;
    if (name == "open_session")     return InboundKind::OpenSession;
    if (name == "join_session")     return InboundKind::JoinSession;
    if (name == "leave_session")    return InboundKind::LeaveSession;
    return std::nullopt;
}

std::optional<OutboundKind> parse_outbound_kind(std::string_view name) noexcept {
    if (name == "session_state")    return OutboundKind::SessionState;
    if (name == "operation")        return OutboundKind::Operation;
    if (name == "cursor_update")    return OutboundKind::CursorUpdate;
    if (name == "selection_update") return OutboundKind::SelectionUpdate;
    if (name == "user_joined")      return OutboundKind::UserJoined;
    if (name == "user_left")        return OutboundKind::UserLeft;
    if (name == "presence_update")  return OutboundKind::PresenceUpdate;
    if (name == "error")            return OutboundKind::Error;
    return std::nullopt;
}

InboundMessage parse_inbound(std::string_view frame) {
    boost::system::error_code ec;
    json::value v = json::parse(frame, ec);
    if (ec) throw ValidationError("invalid json: " + ec.message());

    const auto& obj = require_object(v, "frame");
    const std::string type = require_string(obj, "type");
    const auto kind = parse_inbound_kind(type);
    if (!kind) throw ValidationError("unknown message type: " + type);

    const json::value* payload_v = obj.if_contains("payload");
    if (!payload_v) throw ValidationError("missing payload");
    const auto& payload = require_object(*payload_v, "payload");

    switch (*kind) {
        case InboundKind::Operation: {
            OperationRequest req;
            req.session_id = require_string(payload, "sessionId");
            if (const json::value* batch = payload.if_contains("operations")) {
                const json::array* items = batch->if_array();
                if (!items || items->empty()) throw ValidationError("operations must be a non-empty array");
                for (const auto& item : *items) req.operations.push_back(operation_from_json(item));
            } else if (const json::value* op = payload.if_contains("operation")) {
                req.operations.push_back(operation_from_json(*op));
            } else {
                throw ValidationError("missing operation");
            }
            return req;
        }
        case InboundKind::CursorUpdate: {
            CursorRequest req;
            req.session_id = require_string(payload, "sessionId");
            const json::value* cursor = payload.if_contains("cursor");
            if (!cursor) throw ValidationError("missing cursor");
            req.cursor = cursor_from_json(*cursor);
            return req;
        }
        case InboundKind::SelectionUpdate: {
            SelectionRequest req;
            req.session_id = require_string(payload, "sessionId");
            const json::value* selection = payload.if_contains("selection");
            if (!selection) throw ValidationError("missing selection");
            req.selection = selection_from_json(*selection);
            return req;
        }
        case InboundKind::PresenceUpdate: {
            PresenceRequest req;
            const json::value* presence = payload.if_contains("presence");
            if (!presence) throw ValidationError("missing presence");
            req.patch = presence_patch_from_json(*presence);
            return req;
        }
        case InboundKind::OpenSession: {
            OpenSessionRequest req;
            req.resource_id = require_string(payload, "resourceId");
            const std::string type_name = require_string(payload, "resourceType");
            const auto rt = collab::parse_resource_type(type_name);
            if (!rt) throw ValidationError("unknown resource type: " + type_name);
            req.resource_type = *rt;
            return req;
        }
        case InboundKind::JoinSession:
            return JoinSessionRequest{require_string(payload, "sessionId")};
        case InboundKind::LeaveSession:
            return LeaveSessionRequest{require_string(payload, "sessionId")};
    }
    throw ValidationError("unhandled message type: " + type);
}

std::string OutboundMessage::serialize() const {
    json::object frame{
        {"type", to_string(kind)},
        {"payload", payload},
        {"timestamp", timestamp}
    };
    return json::serialize(frame);
}

namespace outbound {

OutboundMessage connected(const std::string& client_id,
                          const std::string& user_id,
                          const std::string& workspace_id,
                          collab::Timestamp now) {
    return {OutboundKind::SessionState,
            json::object{
                {"clientId", client_id},
                {"userId", user_id},
                {"workspaceId", workspace_id}
            },
            now};
}

OutboundMessage session_state(const collab::SessionSnapshot& session,
                              const std::vector<collab::AdmittedOperation>& tail,
                              collab::Timestamp now) {
    json::array participants;
    for (const auto& p : session.participants) participants.push_back(json::value(p));
    json::array operations;
    for (const auto& entry : tail) operations.push_back(to_json(entry));

    return {OutboundKind::SessionState,
            json::object{
                {"sessionId", session.id},
                {"resourceId", session.resource_id},
                {"resourceType", collab::to_string(session.resource_type)},
                {"state", to_json(session.state)},
                {"participants", std::move(participants)},
                {"operations", std::move(operations)}
            },
            now};
}

OutboundMessage operation(const collab::AdmittedOperation& entry,
                          const std::string& user_id,
                          collab::Timestamp now) {
    return {OutboundKind::Operation,
            json::object{
                {"operation", to_json(entry)},
                {"userId", user_id},
                {"timestamp", entry.admitted_at}
            },
            now};
}

OutboundMessage cursor_update(const std::string& user_id,
                              const collab::CursorPosition& cursor,
                              collab::Timestamp now) {
    return {OutboundKind::CursorUpdate,
            json::object{{"userId", user_id}, {"cursor", to_json(cursor)}},
            now};
}

OutboundMessage selection_update(const std::string& user_id,
                                 const collab::TextSelection& selection,
                                 collab::Timestamp now) {
    return {OutboundKind::SelectionUpdate,
            json::object{{"userId", user_id}, {"selection", to_json(selection)}},
            now};
}

OutboundMessage session_user_joined(const std::string& user_id, collab::Timestamp now) {
    return {OutboundKind::UserJoined,
            json::object{{"userId", user_id}, {"timestamp", now}},
            now};
}

OutboundMessage session_user_left(const std::string& user_id, collab::Timestamp now) {
    return {OutboundKind::UserLeft,
            json::object{{"userId", user_id}, {"timestamp", now}},
            now};
}

OutboundMessage workspace_user_joined(const std::string& user_id,
                                      const std::string& workspace_id,
                                      collab::Timestamp now) {
    return {OutboundKind::UserJoined,
            json::object{{"userId", user_id}, {"workspaceId", workspace_id}},
            now};
}

OutboundMessage workspace_user_left(const std::string& user_id,
                                    const std::string& workspace_id,
                                    collab::Timestamp now) {
    return {OutboundKind::UserLeft,
            json::object{{"userId", user_id}, {"workspaceId", workspace_id}},
            now};
}

OutboundMessage presence_update(const presence::UserPresence& presence, collab::Timestamp now) {
    return {OutboundKind::PresenceUpdate,
            json::object{{"userId", presence.user_id}, {"presence", to_json(presence)}},
            now};
}

OutboundMessage error(const std::string& message,
                      const std::string& detail,
                      const std::string& code,
                      collab::Timestamp now) {
    return {OutboundKind::Error,
            json::object{{"message", message}, {"error", detail}, {"code", code}},
            now};
}

} // namespace outbound

} // namespace coedit::protocol
