#include "presence/PresenceTracker.h"

#include "util/Log.h"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>

#include <exception>

namespace coedit::presence {

namespace asio = boost::asio;
using util::Log;

PresenceTracker::PresenceTracker(PresenceOptions options, Clock clock)
    : options_(options), clock_(std::move(clock)) {}

void PresenceTracker::register_broadcast(const std::string& workspace_id, Broadcast cb) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& reg = broadcasts_[workspace_id];
    reg.cb = std::move(cb);
    ++reg.holders;
}

void PresenceTracker::unregister_broadcast(const std::string& workspace_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = broadcasts_.find(workspace_id);
    if (it == broadcasts_.end()) return;
    if (--it->second.holders == 0) broadcasts_.erase(it);
}

UserPresence& PresenceTracker::entry_locked(const std::string& user_id) {
    auto it = presence_.find(user_id);
    if (it == presence_.end()) {
        UserPresence fresh;
        fresh.user_id = user_id;
        it = presence_.emplace(user_id, std::move(fresh)).first;
    }
    return it->second;
}

std::vector<std::string> PresenceTracker::workspaces_of_locked(const std::string& user_id) const {
    std::vector<std::string> out;
    for (const auto& [ws, users] : workspaces_) {
        if (users.count(user_id)) out.push_back(ws);
    }
    return out;
}

void PresenceTracker::emit_presence_locked(const UserPresence& p, std::vector<Event>& out) const {
    const Timestamp now = clock_();
    for (const auto& ws : workspaces_of_locked(p.user_id)) {
        out.emplace_back(ws, protocol::outbound::presence_update(p, now));
    }
}

void PresenceTracker::update_presence(const std::string& user_id, const PresencePatch& patch) {
    if (patch.status == PresenceStatus::Offline) {
        set_offline(user_id);
        return;
    }

    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        UserPresence& p = entry_locked(user_id);
        // Any activity brings the user back online unless a status was asked for.
        p.status = patch.status.value_or(PresenceStatus::Online);
        if (patch.location) {
            p.current_location = patch.location;
        } else if (patch.clear_location) {
            p.current_location.reset();
        }
        if (patch.activity) p.activity = patch.activity;
        p.last_seen = clock_();
        emit_presence_locked(p, events);
    }
    dispatch(std::move(events));
}

void PresenceTracker::update_activity(const std::string& user_id, std::string activity) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!presence_.count(user_id)) return;
    }
    PresencePatch patch;
    patch.activity = std::move(activity);
    update_presence(user_id, patch);
}

bool PresenceTracker::touch(const std::string& user_id) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = presence_.find(user_id);
        if (it == presence_.end() || it->second.status == PresenceStatus::Offline) return false;
        UserPresence& p = it->second;
        p.last_seen = clock_();
        if (p.status == PresenceStatus::Away) {
            p.status = PresenceStatus::Online;
            emit_presence_locked(p, events);
        }
    }
    dispatch(std::move(events));
    return true;
}

void PresenceTracker::add_to_workspace(const std::string& user_id, const std::string& workspace_id) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        const bool inserted = workspaces_[workspace_id].insert(user_id).second;

        UserPresence& p = entry_locked(user_id);
        p.status = PresenceStatus::Online;
        p.current_location = Location{LocationType::Workspace, workspace_id, std::nullopt};
        p.last_seen = clock_();
        emit_presence_locked(p, events);

        if (inserted) {
            events.emplace_back(workspace_id,
                                protocol::outbound::workspace_user_joined(user_id, workspace_id, clock_()));
        }
    }
    dispatch(std::move(events));
}

void PresenceTracker::remove_locked(const std::string& user_id,
                                    const std::string& workspace_id,
                                    std::vector<Event>& out) {
    auto ws_it = workspaces_.find(workspace_id);
    if (ws_it == workspaces_.end() || ws_it->second.erase(user_id) == 0) return;
    if (ws_it->second.empty()) workspaces_.erase(ws_it);

    const Timestamp now = clock_();
    auto p_it = presence_.find(user_id);
    if (p_it != presence_.end()) {
        UserPresence& p = p_it->second;
        bool changed = false;
        if (p.current_location && p.current_location->type == LocationType::Workspace &&
            p.current_location->id == workspace_id) {
            p.current_location.reset();
            changed = true;
        }
        auto remaining = workspaces_of_locked(user_id);
        if (remaining.empty() && p.status != PresenceStatus::Offline) {
            p.status = PresenceStatus::Offline;
            changed = true;
        }
        if (changed) {
            remaining.push_back(workspace_id);
            for (const auto& ws : remaining) {
                out.emplace_back(ws, protocol::outbound::presence_update(p, now));
            }
        }
    }
    out.emplace_back(workspace_id, protocol::outbound::workspace_user_left(user_id, workspace_id, now));
}

void PresenceTracker::remove_from_workspace(const std::string& user_id, const std::string& workspace_id) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        remove_locked(user_id, workspace_id, events);
    }
    dispatch(std::move(events));
}

void PresenceTracker::set_offline_locked(const std::string& user_id, std::vector<Event>& out) {
    auto it = presence_.find(user_id);
    if (it == presence_.end()) return;

    const auto memberships = workspaces_of_locked(user_id);
    UserPresence& p = it->second;
    if (p.status == PresenceStatus::Offline && memberships.empty()) return;

    p.status = PresenceStatus::Offline;
    p.current_location.reset();
    p.last_seen = clock_();
    emit_presence_locked(p, out);

    for (const auto& ws : memberships) remove_locked(user_id, ws, out);
}

void PresenceTracker::set_offline(const std::string& user_id) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);
        set_offline_locked(user_id, events);
    }
    dispatch(std::move(events));
}

std::optional<UserPresence> PresenceTracker::presence_of(const std::string& user_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = presence_.find(user_id);
    if (it == presence_.end()) return std::nullopt;
    return it->second;
}

std::vector<UserPresence> PresenceTracker::users_in_workspace(const std::string& workspace_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<UserPresence> out;
    auto ws_it = workspaces_.find(workspace_id);
    if (ws_it == workspaces_.end()) return out;
    for (const auto& user_id : ws_it->second) {
        auto it = presence_.find(user_id);
        if (it != presence_.end() && it->second.status != PresenceStatus::Offline) {
            out.push_back(it->second);
        }
    }
    return out;
}

std::vector<std::string> PresenceTracker::workspaces_of(const std::string& user_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    return workspaces_of_locked(user_id);
}

WorkspaceStats PresenceTracker::workspace_stats(const std::string& workspace_id) const {
    WorkspaceStats stats;
    for (const auto& p : users_in_workspace(workspace_id)) {
        ++stats.total;
        if (p.status == PresenceStatus::Online) {
            ++stats.online;
            if (p.activity && !p.activity->empty()) ++stats.active;
        } else if (p.status == PresenceStatus::Away) {
            ++stats.away;
        }
    }
    return stats;
}

std::size_t PresenceTracker::online_count(const std::string& workspace_id) const {
    return workspace_stats(workspace_id).online;
}

void PresenceTracker::sweep(Timestamp now) {
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mu_);

        std::vector<std::string> to_away;
        std::vector<std::string> to_offline;
        for (const auto& [user_id, p] : presence_) {
            if (p.status == PresenceStatus::Offline) continue;
            const auto idle = std::chrono::milliseconds(now - p.last_seen);
            if (idle > options_.stale_timeout) {
                to_offline.push_back(user_id);
            } else if (idle > options_.idle_timeout && p.status == PresenceStatus::Online) {
                to_away.push_back(user_id);
            }
        }

        for (const auto& user_id : to_away) {
            UserPresence& p = presence_.at(user_id);
            p.status = PresenceStatus::Away;
            emit_presence_locked(p, events);
        }
        for (const auto& user_id : to_offline) set_offline_locked(user_id, events);

        if (!to_away.empty() || !to_offline.empty()) {
            Log::debug("Presence", "sweep: ", to_away.size(), " away, ", to_offline.size(), " offline");
        }
    }
    dispatch(std::move(events));
}

void PresenceTracker::dispatch(std::vector<Event> events) {
    for (auto& [workspace_id, message] : events) {
        Broadcast cb;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = broadcasts_.find(workspace_id);
            if (it == broadcasts_.end()) continue;
            cb = it->second.cb;
        }
        try {
            cb(message);
        } catch (const std::exception& e) {
            Log::warn("Presence", "broadcast to ", workspace_id, " failed: ", e.what());
        }
    }
}

void PresenceTracker::start(asio::io_context& ioc) {
    strand_ = std::make_unique<Strand>(asio::make_strand(ioc));
    timer_ = std::make_unique<asio::steady_timer>(*strand_);
    running_ = true;
    asio::dispatch(*strand_, [this] { arm_timer(); });
}

void PresenceTracker::arm_timer() {
    if (!running_) return;
    timer_->expires_after(options_.sweep_interval);
    timer_->async_wait(asio::bind_executor(*strand_, [this](const boost::system::error_code& ec) {
        if (ec == asio::error::operation_aborted || !running_) return;
        sweep(clock_());
        arm_timer();
    }));
}

void PresenceTracker::stop() {
    if (!running_.exchange(false)) return;
    asio::dispatch(*strand_, [this] { timer_->cancel(); });
}

void PresenceTracker::clear() {
    std::lock_guard<std::mutex> lk(mu_);
    presence_.clear();
    workspaces_.clear();
}

} // namespace coedit::presence
