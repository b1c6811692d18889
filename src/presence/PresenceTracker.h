#pragma once

#include "presence/Presence.h"
#include "protocol/Message.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace coedit::presence {

struct PresenceOptions {
    std::chrono::milliseconds idle_timeout{5 * 60 * 1000};
    std::chrono::milliseconds stale_timeout{30 * 60 * 1000};
    std::chrono::milliseconds sweep_interval{60 * 1000};
};

struct WorkspaceStats {
    std::size_t total = 0;
    std::size_t online = 0;
    std::size_t active = 0;   // online with an activity label
    std::size_t away = 0;
};

// Online/away/offline per user and membership per workspace. Knows nothing
// about sockets: every transition is handed to the broadcast callback
// registered for the affected workspace.
class PresenceTracker {
public:
    using Broadcast = std::function<void(const protocol::OutboundMessage&)>;
    using Clock = std::function<Timestamp()>;

    explicit PresenceTracker(PresenceOptions options = {}, Clock clock = collab::now_ms);
    ~PresenceTracker() = default;

    PresenceTracker(const PresenceTracker&) = delete;
    PresenceTracker& operator=(const PresenceTracker&) = delete;

    // Registrations are counted per workspace: the callback stays until every
    // register_broadcast has been matched by an unregister_broadcast.
    void register_broadcast(const std::string& workspace_id, Broadcast cb);
    void unregister_broadcast(const std::string& workspace_id);

    void update_presence(const std::string& user_id, const PresencePatch& patch);
    void update_activity(const std::string& user_id, std::string activity);

    // Refreshes last_seen without an event, unless it brings an away user back.
    // Returns false for an unknown or offline user, who is left unchanged and
    // comes back through add_to_workspace.
    bool touch(const std::string& user_id);

    void add_to_workspace(const std::string& user_id, const std::string& workspace_id);
    void remove_from_workspace(const std::string& user_id, const std::string& workspace_id);
    void set_offline(const std::string& user_id);

    std::optional<UserPresence> presence_of(const std::string& user_id) const;
    std::vector<UserPresence> users_in_workspace(const std::string& workspace_id) const;
    std::vector<std::string> workspaces_of(const std::string& user_id) const;
    WorkspaceStats workspace_stats(const std::string& workspace_id) const;
    std::size_t online_count(const std::string& workspace_id) const;

    // Demotes idle users to away and stale ones to offline.
    void sweep(Timestamp now);

    // Periodic sweep on `ioc`; stop() must be called before the io_context
    // is destroyed.
    void start(boost::asio::io_context& ioc);
    void stop();

    void clear();

private:
    using Event = std::pair<std::string, protocol::OutboundMessage>;   // workspace, message

    UserPresence& entry_locked(const std::string& user_id);
    std::vector<std::string> workspaces_of_locked(const std::string& user_id) const;
    void emit_presence_locked(const UserPresence& p, std::vector<Event>& out) const;
    void set_offline_locked(const std::string& user_id, std::vector<Event>& out);
    void remove_locked(const std::string& user_id, const std::string& workspace_id,
                       std::vector<Event>& out);
    void dispatch(std::vector<Event> events);
    void arm_timer();

    const PresenceOptions options_;
    const Clock clock_;

    mutable std::mutex mu_;
    std::unordered_map<std::string, UserPresence> presence_;
    std::unordered_map<std::string, std::unordered_set<std::string>> workspaces_;
    struct Registration {
        Broadcast cb;
        std::size_t holders = 0;
    };
    std::unordered_map<std::string, Registration> broadcasts_;

    using Strand = boost::asio::strand<boost::asio::io_context::executor_type>;
    std::unique_ptr<Strand> strand_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::atomic<bool> running_{false};
};

} // namespace coedit::presence
