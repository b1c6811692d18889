#pragma once

#include "collab/Operation.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace coedit::collab {

enum class ResourceType { Conversation, Artifact, Document };

const char* to_string(ResourceType type) noexcept;
std::optional<ResourceType> parse_resource_type(std::string_view name) noexcept;

struct CursorPosition {
    std::string user_id;
    std::int64_t position = 0;
    std::optional<std::int64_t> line;
    std::optional<std::int64_t> column;
    Timestamp timestamp = 0;
};

struct TextSelection {
    std::string user_id;
    std::int64_t start = 0;
    std::int64_t end = 0;
    Timestamp timestamp = 0;
};

// Immutable copy handed to collaborators; they never see the live Session.
struct SessionSnapshot {
    std::string id;
    std::string resource_id;
    ResourceType resource_type = ResourceType::Document;
    std::string workspace_id;
    std::vector<std::string> participants;
    DocumentState state;
    std::vector<AdmittedOperation> operations;
    Timestamp created_at = 0;
    Timestamp last_activity = 0;
};

// Live unit of collaboration for one resource. Not thread-safe by itself:
// the SessionManager serializes every access through mutex().
class Session {
public:
    Session(std::string id,
            std::string resource_id,
            ResourceType resource_type,
            std::string workspace_id,
            DocumentState state,
            Timestamp now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const noexcept { return id_; }
    const std::string& resource_id() const noexcept { return resource_id_; }
    ResourceType resource_type() const noexcept { return resource_type_; }
    const std::string& workspace_id() const noexcept { return workspace_id_; }
    Timestamp created_at() const noexcept { return created_at_; }
    Timestamp last_activity() const noexcept { return last_activity_; }

    std::mutex& mutex() noexcept { return mu_; }

    // Set once the session has been evicted from the registry.
    bool closed() const noexcept { return closed_; }
    void close() noexcept { closed_ = true; }

    const std::vector<std::string>& participants() const noexcept { return participants_; }
    bool has_participant(const std::string& user_id) const;
    bool add_participant(const std::string& user_id);
    bool remove_participant(const std::string& user_id);
    bool empty() const noexcept { return participants_.empty(); }

    const DocumentState& state() const noexcept { return state_; }
    DocumentState& state() noexcept { return state_; }

    const std::deque<AdmittedOperation>& operations() const noexcept { return operations_; }
    std::vector<AdmittedOperation> recent_operations(std::size_t count) const;

    // Stamps `op` with a strictly increasing admission time and sequence
    // number, then trims the log to `retention` entries.
    const AdmittedOperation& append(Operation op, Timestamp now, std::size_t retention);

    void set_cursor(CursorPosition cursor);
    void set_selection(TextSelection selection);
    std::optional<CursorPosition> cursor(const std::string& user_id) const;
    std::optional<TextSelection> selection(const std::string& user_id) const;
    void clear_user_marks(const std::string& user_id);

    void touch(Timestamp now) noexcept { last_activity_ = now; }

    SessionSnapshot snapshot() const;

private:
    const std::string id_;
    const std::string resource_id_;
    const ResourceType resource_type_;
    const std::string workspace_id_;
    const Timestamp created_at_;
    Timestamp last_activity_;

    std::mutex mu_;
    bool closed_ = false;

    std::vector<std::string> participants_;
    DocumentState state_;
    std::deque<AdmittedOperation> operations_;
    std::uint64_t next_sequence_ = 1;
    Timestamp last_admitted_ = 0;

    std::unordered_map<std::string, CursorPosition> cursors_;
    std::unordered_map<std::string, TextSelection> selections_;
};

} // namespace coedit::collab
