#pragma once

#include "collab/SessionManager.h"
#include "networking/ConnectionRegistry.h"
#include "networking/Transport.h"
#include "presence/PresenceTracker.h"
#include "protocol/Message.h"
#include "util/IDGenerator.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>

namespace coedit::networking {

// "/path?userId=u1&workspaceId=w%201" -> {userId: u1, workspaceId: "w 1"}.
std::unordered_map<std::string, std::string> parse_query(std::string_view target);

// Glue between sockets and the engine: identifies each connection, turns
// inbound frames into SessionManager/PresenceTracker calls and reports
// failures to the sender only. Holds no lock while calling into the engine.
class ConnectionLayer {
public:
    ConnectionLayer(ConnectionRegistry& registry,
                    collab::SessionManager& sessions,
                    presence::PresenceTracker& presence);

    ConnectionLayer(const ConnectionLayer&) = delete;
    ConnectionLayer& operator=(const ConnectionLayer&) = delete;

    void on_connect(ClientId id, const std::string& target);
    void on_message(ClientId id, const std::string& frame);
    void on_disconnect(ClientId id);

    std::size_t connection_count() const { return registry_.size(); }

    // Closes every connection; the disconnect path runs as the sockets go away.
    void shutdown();

private:
    void handle(const Connection& conn, const protocol::OperationRequest& req);
    void handle(const Connection& conn, const protocol::CursorRequest& req);
    void handle(const Connection& conn, const protocol::SelectionRequest& req);
    void handle(const Connection& conn, const protocol::PresenceRequest& req);
    void handle(const Connection& conn, const protocol::OpenSessionRequest& req);
    void handle(const Connection& conn, const protocol::JoinSessionRequest& req);
    void handle(const Connection& conn, const protocol::LeaveSessionRequest& req);

    void join(ClientId id, const std::string& user_id, const std::string& session_id);
    void reject(ClientId id, std::uint16_t code, const std::string& reason);
    void reply_error(ClientId id, const std::string& detail, const std::string& code);

    ConnectionRegistry& registry_;
    collab::SessionManager& sessions_;
    presence::PresenceTracker& presence_;
    util::IDGenerator ids_;
};

} // namespace coedit::networking
