#pragma once

#include "collab/SessionManager.h"
#include "networking/Connection.hpp"
#include "networking/Transport.h"
#include "protocol/Message.h"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace coedit::networking {

// Live connection records and outbound routing. The session engine talks to
// it through collab::MessageSink; frames are handed to the transport after
// the registry lock is released.
class ConnectionRegistry : public collab::MessageSink {
public:
    explicit ConnectionRegistry(Transport& transport);

    Transport& transport() noexcept { return transport_; }

    void add(Connection connection);
    std::optional<Connection> remove(ClientId id);
    std::optional<Connection> get(ClientId id) const;
    void touch(ClientId id);

    void add_session(ClientId id, const std::string& session_id);
    void remove_session(ClientId id, const std::string& session_id);

    // Whether any connection of `user_id` other than `except` still has the session / workspace.
    bool user_holds_session(const std::string& user_id, const std::string& session_id,
                            std::optional<ClientId> except = std::nullopt) const;
    bool user_in_workspace(const std::string& user_id, const std::string& workspace_id,
                           std::optional<ClientId> except = std::nullopt) const;
    // Workspaces the user has at least one live connection in.
    std::vector<std::string> workspaces_of(const std::string& user_id) const;

    std::size_t size() const;
    std::vector<ClientId> ids() const;

    // Unicast to the user's most recently active connection.
    void deliver(const std::string& user_id, const protocol::OutboundMessage& message) override;
    // Every connection bound to the workspace.
    void broadcast_workspace(const std::string& workspace_id, const protocol::OutboundMessage& message);
    void send(ClientId id, const protocol::OutboundMessage& message);

private:
    void send_frame(ClientId id, const std::string& frame);

    Transport& transport_;

    mutable std::mutex mu_;
    std::unordered_map<ClientId, Connection> connections_;
    std::uint64_t tick_ = 0;
};

} // namespace coedit::networking
