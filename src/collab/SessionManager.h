#pragma once

#include "collab/ConflictResolver.h"
#include "collab/Operation.h"
#include "collab/Session.h"
#include "protocol/Message.h"
#include "util/IDGenerator.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace coedit::collab {

// Host-provided hooks. Any of them may be left empty.
struct Collaborators {
    std::function<void(const SessionSnapshot&)> persist_session;
    std::function<std::optional<DocumentState>(const std::string& resource_id, ResourceType type)>
        get_resource_state;
    std::function<bool(const SessionSnapshot& session, const std::string& user_id)> check_permissions;
};

// Where session traffic goes. Implemented by the connection layer; called
// with the session lock held, so it must only enqueue.
class MessageSink {
public:
    virtual ~MessageSink() = default;
    virtual void deliver(const std::string& user_id, const protocol::OutboundMessage& message) = 0;
};

struct EngineOptions {
    std::size_t join_tail = 100;
    std::size_t log_retention = 1000;
    int persist_retries = 2;
};

class SessionManager {
public:
    using Clock = std::function<Timestamp()>;

    // Persistence work is posted to `persistence`; it must keep running for
    // as long as this manager is alive.
    SessionManager(Collaborators collaborators,
                   MessageSink& sink,
                   boost::asio::io_context& persistence,
                   EngineOptions options = {},
                   Clock clock = now_ms);

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Creates the session without notifying anyone. A resource never has two
    // live sessions: if one exists the initiator joins it instead.
    SessionSnapshot create_session(const std::string& resource_id,
                                   ResourceType type,
                                   const std::string& initiator_id,
                                   const std::string& workspace_id);

    // Joins the live session for the resource, creating it when there is none.
    SessionSnapshot open_session(const std::string& resource_id,
                                 ResourceType type,
                                 const std::string& user_id,
                                 const std::string& workspace_id);

    SessionSnapshot join_session(const std::string& session_id, const std::string& user_id);
    void leave_session(const std::string& session_id, const std::string& user_id);

    AdmittedOperation handle_operation(const std::string& session_id,
                                       Operation op,
                                       const std::string& user_id);
    std::vector<AdmittedOperation> handle_operations(const std::string& session_id,
                                                     std::vector<Operation> batch,
                                                     const std::string& user_id);

    void handle_cursor_update(const std::string& session_id,
                              CursorPosition cursor,
                              const std::string& user_id);
    void handle_selection_update(const std::string& session_id,
                                 TextSelection selection,
                                 const std::string& user_id);

    std::optional<SessionSnapshot> get_session(const std::string& session_id) const;
    std::optional<std::string> find_session_for_resource(ResourceType type,
                                                         const std::string& resource_id) const;
    std::vector<std::string> active_sessions() const;
    std::size_t session_count() const;
    std::uint64_t persistence_failures() const noexcept { return persistence_failures_; }

    // Closes every session and queues a final snapshot of each.
    void shutdown();

private:
    using ResourceKey = std::pair<ResourceType, std::string>;

    std::shared_ptr<Session> find(const std::string& session_id) const;
    std::shared_ptr<Session> require(const std::string& session_id) const;
    std::shared_ptr<Session> find_by_resource(const ResourceKey& key) const;

    DocumentState load_state(const std::string& resource_id, ResourceType type) const;
    void stamp(Operation& op, const std::string& session_id, const std::string& user_id);

    // Caller holds the session lock.
    void broadcast(const Session& session,
                   const protocol::OutboundMessage& message,
                   const std::string& exclude);
    void evict_locked(Session& session);
    void schedule_persist(SessionSnapshot snapshot);
    void persist_with_retry(const SessionSnapshot& snapshot);

    const Collaborators collaborators_;
    MessageSink& sink_;
    boost::asio::io_context& persistence_;
    const EngineOptions options_;
    const Clock clock_;
    ConflictResolver resolver_;
    util::IDGenerator ids_;

    mutable std::mutex registry_mu_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::map<ResourceKey, std::string> by_resource_;

    std::atomic<std::uint64_t> persistence_failures_{0};
};

} // namespace coedit::collab
