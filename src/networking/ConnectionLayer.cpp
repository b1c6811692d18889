#include "networking/ConnectionLayer.h"

#include "collab/Errors.h"
#include "util/Log.h"

#include <exception>
#include <variant>

namespace coedit::networking {

using util::Log;

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string url_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out.push_back(' ');
        } else if (in[i] == '%' && i + 2 < in.size() &&
                   hex_value(in[i + 1]) >= 0 && hex_value(in[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hex_value(in[i + 1]) * 16 + hex_value(in[i + 2])));
            i += 2;
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

} // namespace

std::unordered_map<std::string, std::string> parse_query(std::string_view target) {
    std::unordered_map<std::string, std::string> out;
    const auto q = target.find('?');
    if (q == std::string_view::npos) return out;

    std::string_view rest = target.substr(q + 1);
    while (!rest.empty()) {
        const auto amp = rest.find('&');
        std::string_view pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) continue;

        const auto eq = pair.find('=');
        std::string key = url_decode(pair.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string{} : url_decode(pair.substr(eq + 1));
        out[std::move(key)] = std::move(value);
    }
    return out;
}

ConnectionLayer::ConnectionLayer(ConnectionRegistry& registry,
                                 collab::SessionManager& sessions,
                                 presence::PresenceTracker& presence)
    : registry_(registry), sessions_(sessions), presence_(presence) {}

void ConnectionLayer::on_connect(ClientId id, const std::string& target) {
    auto query = parse_query(target);
    const std::string user_id = query["userId"];
    std::string workspace_id = query["workspaceId"];
    const std::string session_id = query["sessionId"];

    if (user_id.empty() || (workspace_id.empty() && session_id.empty())) {
        return reject(id, kCloseMissingIdentity, "userId and workspaceId or sessionId required");
    }

    if (!session_id.empty()) {
        auto session = sessions_.get_session(session_id);
        if (!session) return reject(id, kCloseSessionNotFound, "session not found");
        if (workspace_id.empty()) workspace_id = session->workspace_id;
    }

    Connection conn;
    conn.id = id;
    conn.client_id = ids_.clientID();
    conn.user_id = user_id;
    conn.workspace_id = workspace_id;
    const std::string client_id = conn.client_id;
    registry_.add(std::move(conn));

    Log::info("Connection " + std::to_string(id), user_id, " connected to ", workspace_id, " as ", client_id);
    registry_.send(id, protocol::outbound::connected(client_id, user_id, workspace_id, collab::now_ms()));

    presence_.register_broadcast(workspace_id, [this, workspace_id](const protocol::OutboundMessage& m) {
        registry_.broadcast_workspace(workspace_id, m);
    });
    presence_.add_to_workspace(user_id, workspace_id);

    if (!session_id.empty()) join(id, user_id, session_id);
}

void ConnectionLayer::reject(ClientId id, std::uint16_t code, const std::string& reason) {
    Log::warn("Connection " + std::to_string(id), "rejected (", code, "): ", reason);
    registry_.transport().close(id, code, reason);
}

void ConnectionLayer::on_message(ClientId id, const std::string& frame) {
    auto conn = registry_.get(id);
    if (!conn) return;
    registry_.touch(id);
    if (!presence_.touch(conn->user_id)) {
        // Swept offline while still connected.
        for (const auto& workspace_id : registry_.workspaces_of(conn->user_id)) {
            presence_.add_to_workspace(conn->user_id, workspace_id);
        }
    }

    try {
        auto message = protocol::parse_inbound(frame);
        std::visit([&](const auto& req) { handle(*conn, req); }, message);
    } catch (const collab::CollabError& e) {
        Log::debug("Connection " + std::to_string(id), collab::to_string(e.kind()), ": ", e.what());
        reply_error(id, e.what(), collab::to_string(e.kind()));
    } catch (const std::exception& e) {
        Log::error("Connection " + std::to_string(id), "unexpected failure: ", e.what());
        reply_error(id, e.what(), "internal");
    }
}

void ConnectionLayer::reply_error(ClientId id, const std::string& detail, const std::string& code) {
    registry_.send(id, protocol::outbound::error("Failed to process message", detail, code, collab::now_ms()));
}

void ConnectionLayer::handle(const Connection& conn, const protocol::OperationRequest& req) {
    if (req.operations.size() == 1) {
        sessions_.handle_operation(req.session_id, req.operations.front(), conn.user_id);
    } else {
        sessions_.handle_operations(req.session_id, req.operations, conn.user_id);
    }
}

void ConnectionLayer::handle(const Connection& conn, const protocol::CursorRequest& req) {
    sessions_.handle_cursor_update(req.session_id, req.cursor, conn.user_id);
}

void ConnectionLayer::handle(const Connection& conn, const protocol::SelectionRequest& req) {
    sessions_.handle_selection_update(req.session_id, req.selection, conn.user_id);
}

void ConnectionLayer::handle(const Connection& conn, const protocol::PresenceRequest& req) {
    presence_.update_presence(conn.user_id, req.patch);
}

void ConnectionLayer::handle(const Connection& conn, const protocol::OpenSessionRequest& req) {
    auto snapshot = sessions_.open_session(req.resource_id, req.resource_type, conn.user_id, conn.workspace_id);
    registry_.add_session(conn.id, snapshot.id);
}

void ConnectionLayer::handle(const Connection& conn, const protocol::JoinSessionRequest& req) {
    sessions_.join_session(req.session_id, conn.user_id);
    registry_.add_session(conn.id, req.session_id);
}

void ConnectionLayer::handle(const Connection& conn, const protocol::LeaveSessionRequest& req) {
    registry_.remove_session(conn.id, req.session_id);
    if (!registry_.user_holds_session(conn.user_id, req.session_id)) {
        sessions_.leave_session(req.session_id, conn.user_id);
    }
}

void ConnectionLayer::join(ClientId id, const std::string& user_id, const std::string& session_id) {
    try {
        sessions_.join_session(session_id, user_id);
        registry_.add_session(id, session_id);
    } catch (const collab::CollabError& e) {
        Log::warn("Connection " + std::to_string(id), "join ", session_id, " failed: ", e.what());
        reply_error(id, e.what(), collab::to_string(e.kind()));
    }
}

void ConnectionLayer::on_disconnect(ClientId id) {
    auto conn = registry_.remove(id);
    if (!conn) return;

    for (const auto& session_id : conn->sessions) {
        if (!registry_.user_holds_session(conn->user_id, session_id)) {
            sessions_.leave_session(session_id, conn->user_id);
        }
    }
    if (!registry_.user_in_workspace(conn->user_id, conn->workspace_id)) {
        presence_.remove_from_workspace(conn->user_id, conn->workspace_id);
    }
    presence_.unregister_broadcast(conn->workspace_id);
    Log::info("Connection " + std::to_string(id), conn->user_id, " disconnected");
}

void ConnectionLayer::shutdown() {
    const auto ids = registry_.ids();
    for (ClientId id : ids) registry_.transport().close(id, 1001, "server shutdown");
    Log::info("ConnectionLayer", "closing ", ids.size(), " connection(s)");
}

} // namespace coedit::networking
