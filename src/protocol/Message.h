#pragma once

#include "collab/Operation.h"
#include "collab/Session.h"
#include "presence/Presence.h"

#include <boost/json/object.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

// Frames are JSON objects: {"type": "...", "payload": {...}, "timestamp": ms}.
namespace coedit::protocol {

enum class InboundKind {
    Operation,
    CursorUpdate,
    SelectionUpdate,
    PresenceUpdate,
    OpenSession,
    JoinSession,
    LeaveSession,
};

enum class OutboundKind {
    SessionState,
    Operation,
    CursorUpdate,
    SelectionUpdate,
    UserJoined,
    UserLeft,
    PresenceUpdate,
    Error,
};

const char* to_string(InboundKind kind) noexcept;
const char* to_string(OutboundKind kind) noexcept;
std::optional<InboundKind> parse_inbound_kind(std::string_view name) noexcept;
std::optional<OutboundKind> parse_outbound_kind(std::string_view name) noexcept;

// ---- inbound ----

struct OperationRequest {
    std::string session_id;
    std::vector<collab::Operation> operations;  // one, or a client-side batch
};

struct CursorRequest {
    std::string session_id;
    collab::CursorPosition cursor;
};

struct SelectionRequest {
    std::string session_id;
    collab::TextSelection selection;
};

struct PresenceRequest {
    presence::PresencePatch patch;
};

struct OpenSessionRequest {
    std::string resource_id;
    collab::ResourceType resource_type = collab::ResourceType::Document;
};

struct JoinSessionRequest {
    std::string session_id;
};

struct LeaveSessionRequest {
    std::string session_id;
};

using InboundMessage = std::variant<OperationRequest,
                                    CursorRequest,
                                    SelectionRequest,
                                    PresenceRequest,
                                    OpenSessionRequest,
                                    JoinSessionRequest,
                                    LeaveSessionRequest>;

// Throws collab::ValidationError on malformed JSON or payloads.
InboundMessage parse_inbound(std::string_view frame);

// ---- outbound ----

struct OutboundMessage {
    OutboundKind kind = OutboundKind::Error;
    boost::json::object payload;
    collab::Timestamp timestamp = 0;

    std::string serialize() const;
};

namespace outbound {

// Acknowledgement sent right after a connection is accepted.
OutboundMessage connected(const std::string& client_id,
                          const std::string& user_id,
                          const std::string& workspace_id,
                          collab::Timestamp now);

// Join snapshot: state, roster and only the tail of the log.
OutboundMessage session_state(const collab::SessionSnapshot& session,
                              const std::vector<collab::AdmittedOperation>& tail,
                              collab::Timestamp now);

OutboundMessage operation(const collab::AdmittedOperation& entry,
                          const std::string& user_id,
                          collab::Timestamp now);

OutboundMessage cursor_update(const std::string& user_id,
                              const collab::CursorPosition& cursor,
                              collab::Timestamp now);

OutboundMessage selection_update(const std::string& user_id,
                                 const collab::TextSelection& selection,
                                 collab::Timestamp now);

OutboundMessage session_user_joined(const std::string& user_id, collab::Timestamp now);
OutboundMessage session_user_left(const std::string& user_id, collab::Timestamp now);

OutboundMessage workspace_user_joined(const std::string& user_id,
                                      const std::string& workspace_id,
                                      collab::Timestamp now);
OutboundMessage workspace_user_left(const std::string& user_id,
                                    const std::string& workspace_id,
                                    collab::Timestamp now);

OutboundMessage presence_update(const presence::UserPresence& presence, collab::Timestamp now);

OutboundMessage error(const std::string& message,
                      const std::string& detail,
                      const std::string& code,
                      collab::Timestamp now);

} // namespace outbound

} // namespace coedit::protocol
