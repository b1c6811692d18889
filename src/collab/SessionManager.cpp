#include "collab/SessionManager.h"

#include "collab/Errors.h"
#include "util/Log.h"

#include <boost/asio/post.hpp>

#include <exception>

namespace coedit::collab {

namespace asio = boost::asio;
namespace outbound = protocol::outbound;
using util::Log;

SessionManager::SessionManager(Collaborators collaborators,
                               MessageSink& sink,
                               asio::io_context& persistence,
                               EngineOptions options,
                               Clock clock)
    : collaborators_(std::move(collaborators)),
      sink_(sink),
      persistence_(persistence),
      options_(options),
      clock_(std::move(clock)) {}

// ---- registry ----

std::shared_ptr<Session> SessionManager::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lk(registry_mu_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionManager::require(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) throw NotFoundError("session not found: " + session_id);
    return session;
}

std::shared_ptr<Session> SessionManager::find_by_resource(const ResourceKey& key) const {
    std::lock_guard<std::mutex> lk(registry_mu_);
    auto it = by_resource_.find(key);
    if (it == by_resource_.end()) return nullptr;
    auto s = sessions_.find(it->second);
    return s == sessions_.end() ? nullptr : s->second;
}

DocumentState SessionManager::load_state(const std::string& resource_id, ResourceType type) const {
    if (!collaborators_.get_resource_state) return {};
    try {
        if (auto state = collaborators_.get_resource_state(resource_id, type)) return std::move(*state);
    } catch (const std::exception& e) {
        Log::warn("SessionManager", "loading ", to_string(type), "/", resource_id,
                  " failed, starting empty: ", e.what());
    }
    return {};
}

SessionSnapshot SessionManager::create_session(const std::string& resource_id,
                                               ResourceType type,
                                               const std::string& initiator_id,
                                               const std::string& workspace_id) {
    const ResourceKey key{type, resource_id};
    for (;;) {
        if (auto existing = find_by_resource(key)) {
            Log::debug("SessionManager", to_string(type), "/", resource_id, " is live as ", existing->id());
            try {
                return join_session(existing->id(), initiator_id);
            } catch (const NotFoundError&) {
                continue;
            }
        }

        auto session = std::make_shared<Session>(ids_.sessionID(), resource_id, type, workspace_id,
                                                 load_state(resource_id, type), clock_());
        session->add_participant(initiator_id);

        std::lock_guard<std::mutex> session_lk(session->mutex());
        {
            std::lock_guard<std::mutex> lk(registry_mu_);
            if (by_resource_.count(key)) continue;
            sessions_.emplace(session->id(), session);
            by_resource_[key] = session->id();
        }
        Log::info("SessionManager", "created ", session->id(), " for ", to_string(type), "/", resource_id,
                  " by ", initiator_id);
        return session->snapshot();
    }
}

SessionSnapshot SessionManager::open_session(const std::string& resource_id,
                                             ResourceType type,
                                             const std::string& user_id,
                                             const std::string& workspace_id) {
    const ResourceKey key{type, resource_id};
    for (;;) {
        if (auto existing = find_by_resource(key)) {
            try {
                return join_session(existing->id(), user_id);
            } catch (const NotFoundError&) {
                // Evicted between lookup and join; look again.
                continue;
            }
        }

        auto session = std::make_shared<Session>(ids_.sessionID(), resource_id, type, workspace_id,
                                                 load_state(resource_id, type), clock_());
        session->add_participant(user_id);

        std::lock_guard<std::mutex> session_lk(session->mutex());
        {
            std::lock_guard<std::mutex> lk(registry_mu_);
            if (by_resource_.count(key)) continue;   // lost the race to another opener
            sessions_.emplace(session->id(), session);
            by_resource_[key] = session->id();
        }
        Log::info("SessionManager", "opened ", session->id(), " for ", to_string(type), "/", resource_id,
                  " by ", user_id);

        const Timestamp now = clock_();
        auto snapshot = session->snapshot();
        sink_.deliver(user_id, outbound::session_state(snapshot, session->recent_operations(options_.join_tail), now));
        return snapshot;
    }
}

SessionSnapshot SessionManager::join_session(const std::string& session_id, const std::string& user_id) {
    auto session = require(session_id);
    std::lock_guard<std::mutex> lk(session->mutex());
    if (session->closed()) throw NotFoundError("session not found: " + session_id);

    if (collaborators_.check_permissions && !session->has_participant(user_id) &&
        !collaborators_.check_permissions(session->snapshot(), user_id)) {
        throw PermissionError("user " + user_id + " may not join " + session_id);
    }

    const Timestamp now = clock_();
    if (session->add_participant(user_id)) {
        broadcast(*session, outbound::session_user_joined(user_id, now), user_id);
        Log::info("SessionManager", user_id, " joined ", session_id);
    }
    session->touch(now);

    auto snapshot = session->snapshot();
    sink_.deliver(user_id, outbound::session_state(snapshot, session->recent_operations(options_.join_tail), now));
    return snapshot;
}

void SessionManager::leave_session(const std::string& session_id, const std::string& user_id) {
    auto session = find(session_id);
    if (!session) return;

    std::lock_guard<std::mutex> lk(session->mutex());
    if (session->closed() || !session->remove_participant(user_id)) return;

    const Timestamp now = clock_();
    session->clear_user_marks(user_id);
    session->touch(now);
    broadcast(*session, outbound::session_user_left(user_id, now), user_id);
    Log::info("SessionManager", user_id, " left ", session_id);

    if (session->empty()) evict_locked(*session);
}

void SessionManager::evict_locked(Session& session) {
    session.close();
    {
        std::lock_guard<std::mutex> lk(registry_mu_);
        sessions_.erase(session.id());
        auto it = by_resource_.find(ResourceKey{session.resource_type(), session.resource_id()});
        if (it != by_resource_.end() && it->second == session.id()) by_resource_.erase(it);
    }
    Log::info("SessionManager", "evicted ", session.id());
    schedule_persist(session.snapshot());
}

// ---- operations ----

void SessionManager::stamp(Operation& op, const std::string& session_id, const std::string& user_id) {
    op.user_id = user_id;
    op.session_id = session_id;
    if (op.id.empty()) op.id = ids_.operationID();
    if (op.timestamp == 0) op.timestamp = clock_();
}

AdmittedOperation SessionManager::handle_operation(const std::string& session_id,
                                                   Operation op,
                                                   const std::string& user_id) {
    stamp(op, session_id, user_id);
    if (!resolver_.is_well_formed(op)) {
        throw ValidationError(std::string("malformed ") + to_string(op.type()) + " operation");
    }

    auto session = require(session_id);
    std::lock_guard<std::mutex> lk(session->mutex());
    if (session->closed()) throw NotFoundError("session not found: " + session_id);
    if (!session->has_participant(user_id)) {
        throw PermissionError("user " + user_id + " is not in session " + session_id);
    }

    Operation transformed = resolver_.transform(op, session->operations(), user_id);
    if (!transformed.is_noop() && !resolver_.validate_operation(transformed, session->state())) {
        throw ValidationError(std::string(to_string(op.type())) + " operation out of bounds");
    }

    resolver_.apply(session->state(), transformed);
    const Timestamp now = clock_();
    AdmittedOperation entry = session->append(std::move(transformed), now, options_.log_retention);
    session->touch(now);

    broadcast(*session, outbound::operation(entry, user_id, now), user_id);
    Log::debug("SessionManager", session_id, " #", entry.sequence, " ", to_string(op.type()), " by ", user_id);

    schedule_persist(session->snapshot());
    return entry;
}

std::vector<AdmittedOperation> SessionManager::handle_operations(const std::string& session_id,
                                                                 std::vector<Operation> batch,
                                                                 const std::string& user_id) {
    std::vector<Operation> merged;
    for (auto& op : batch) {
        stamp(op, session_id, user_id);
        if (!merged.empty()) {
            if (auto composed = resolver_.compose(merged.back(), op)) {
                merged.back() = std::move(*composed);
                continue;
            }
        }
        merged.push_back(std::move(op));
    }

    std::vector<AdmittedOperation> admitted;
    admitted.reserve(merged.size());
    for (auto& op : merged) admitted.push_back(handle_operation(session_id, std::move(op), user_id));
    return admitted;
}

void SessionManager::handle_cursor_update(const std::string& session_id,
                                          CursorPosition cursor,
                                          const std::string& user_id) {
    auto session = require(session_id);
    std::lock_guard<std::mutex> lk(session->mutex());
    if (session->closed()) throw NotFoundError("session not found: " + session_id);
    if (!session->has_participant(user_id)) {
        throw PermissionError("user " + user_id + " is not in session " + session_id);
    }

    const Timestamp now = clock_();
    cursor.user_id = user_id;
    cursor.timestamp = now;
    broadcast(*session, outbound::cursor_update(user_id, cursor, now), user_id);
    session->set_cursor(std::move(cursor));
}

void SessionManager::handle_selection_update(const std::string& session_id,
                                             TextSelection selection,
                                             const std::string& user_id) {
    auto session = require(session_id);
    std::lock_guard<std::mutex> lk(session->mutex());
    if (session->closed()) throw NotFoundError("session not found: " + session_id);
    if (!session->has_participant(user_id)) {
        throw PermissionError("user " + user_id + " is not in session " + session_id);
    }

    const Timestamp now = clock_();
    selection.user_id = user_id;
    selection.timestamp = now;
    broadcast(*session, outbound::selection_update(user_id, selection, now), user_id);
    session->set_selection(std::move(selection));
}

void SessionManager::broadcast(const Session& session,
                               const protocol::OutboundMessage& message,
                               const std::string& exclude) {
    for (const auto& participant : session.participants()) {
        if (participant != exclude) sink_.deliver(participant, message);
    }
}

// ---- queries ----

std::optional<SessionSnapshot> SessionManager::get_session(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) return std::nullopt;
    std::lock_guard<std::mutex> lk(session->mutex());
    if (session->closed()) return std::nullopt;
    return session->snapshot();
}

std::optional<std::string> SessionManager::find_session_for_resource(ResourceType type,
                                                                     const std::string& resource_id) const {
    std::lock_guard<std::mutex> lk(registry_mu_);
    auto it = by_resource_.find(ResourceKey{type, resource_id});
    if (it == by_resource_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> SessionManager::active_sessions() const {
    std::lock_guard<std::mutex> lk(registry_mu_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) ids.push_back(id);
    return ids;
}

std::size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lk(registry_mu_);
    return sessions_.size();
}

void SessionManager::shutdown() {
    std::vector<std::shared_ptr<Session>> open;
    {
        std::lock_guard<std::mutex> lk(registry_mu_);
        for (auto& [id, session] : sessions_) open.push_back(session);
        sessions_.clear();
        by_resource_.clear();
    }
    for (auto& session : open) {
        std::lock_guard<std::mutex> lk(session->mutex());
        session->close();
        schedule_persist(session->snapshot());
    }
    Log::info("SessionManager", "shut down, ", open.size(), " session(s) closed");
}

// ---- persistence ----

void SessionManager::schedule_persist(SessionSnapshot snapshot) {
    if (!collaborators_.persist_session) return;
    asio::post(persistence_, [this, snapshot = std::move(snapshot)] { persist_with_retry(snapshot); });
}

void SessionManager::persist_with_retry(const SessionSnapshot& snapshot) {
    for (int attempt = 0; attempt <= options_.persist_retries; ++attempt) {
        try {
            collaborators_.persist_session(snapshot);
            return;
        } catch (const std::exception& e) {
            Log::warn("SessionManager", "persist ", snapshot.id, " attempt ", attempt + 1, " failed: ", e.what());
        }
    }
    ++persistence_failures_;
    Log::error("SessionManager", "giving up on persisting ", snapshot.id);
}

} // namespace coedit::collab
