#include "networking/ConnectionRegistry.h"

#include "collab/Errors.h"
#include "util/Log.h"

#include <algorithm>
#include <utility>

namespace coedit::networking {

ConnectionRegistry::ConnectionRegistry(Transport& transport) : transport_(transport) {}

void ConnectionRegistry::add(Connection connection) {
    std::lock_guard<std::mutex> lk(mu_);
    connection.connected_at = Connection::Clock::now();
    connection.touch(++tick_);
    const ClientId id = connection.id;
    connections_[id] = std::move(connection);
}

std::optional<Connection> ConnectionRegistry::remove(ClientId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return std::nullopt;
    Connection gone = std::move(it->second);
    connections_.erase(it);
    return gone;
}

std::optional<Connection> ConnectionRegistry::get(ClientId id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it == connections_.end()) return std::nullopt;
    return it->second;
}

void ConnectionRegistry::touch(ClientId id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it != connections_.end()) it->second.touch(++tick_);
}

void ConnectionRegistry::add_session(ClientId id, const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it != connections_.end()) it->second.sessions.insert(session_id);
}

void ConnectionRegistry::remove_session(ClientId id, const std::string& session_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = connections_.find(id);
    if (it != connections_.end()) it->second.sessions.erase(session_id);
}

bool ConnectionRegistry::user_holds_session(const std::string& user_id,
                                            const std::string& session_id,
                                            std::optional<ClientId> except) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, c] : connections_) {
        if (except && id == *except) continue;
        if (c.user_id == user_id && c.sessions.count(session_id)) return true;
    }
    return false;
}

bool ConnectionRegistry::user_in_workspace(const std::string& user_id,
                                           const std::string& workspace_id,
                                           std::optional<ClientId> except) const {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, c] : connections_) {
        if (except && id == *except) continue;
        if (c.user_id == user_id && c.workspace_id == workspace_id) return true;
    }
    return false;
}

std::vector<std::string> ConnectionRegistry::workspaces_of(const std::string& user_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<std::string> out;
    for (const auto& [id, c] : connections_) {
        if (c.user_id != user_id) continue;
        if (std::find(out.begin(), out.end(), c.workspace_id) == out.end()) out.push_back(c.workspace_id);
    }
    return out;
}

std::size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return connections_.size();
}

std::vector<ClientId> ConnectionRegistry::ids() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<ClientId> out;
    out.reserve(connections_.size());
    for (const auto& [id, c] : connections_) out.push_back(id);
    return out;
}

void ConnectionRegistry::deliver(const std::string& user_id, const protocol::OutboundMessage& message) {
    std::optional<ClientId> target;
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::uint64_t best = 0;
        for (const auto& [id, c] : connections_) {
            if (c.user_id == user_id && (!target || c.activity > best)) {
                target = id;
                best = c.activity;
            }
        }
    }
    if (target) send_frame(*target, message.serialize());
}

void ConnectionRegistry::broadcast_workspace(const std::string& workspace_id,
                                             const protocol::OutboundMessage& message) {
    std::vector<ClientId> targets;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& [id, c] : connections_) {
            if (c.workspace_id == workspace_id) targets.push_back(id);
        }
    }
    if (targets.empty()) return;
    const std::string frame = message.serialize();
    for (ClientId id : targets) send_frame(id, frame);
}

void ConnectionRegistry::send(ClientId id, const protocol::OutboundMessage& message) {
    send_frame(id, message.serialize());
}

// A connection that cannot take a frame is closed; its disconnect runs the
// usual cleanup and the remaining recipients are still served.
void ConnectionRegistry::send_frame(ClientId id, const std::string& frame) {
    try {
        transport_.send(id, frame);
    } catch (const collab::TransportError& e) {
        util::Log::warn("Connection " + std::to_string(id), "send failed: ", e.what());
        transport_.close(id, kCloseSendFailed, "send failed");
    }
}

} // namespace coedit::networking
