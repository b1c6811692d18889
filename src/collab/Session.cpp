#include "collab/Session.h"

#include <algorithm>
#include <utility>

namespace coedit::collab {

const char* to_string(ResourceType type) noexcept {
    switch (type) {
        case ResourceType::Conversation: return "conversation";
        case ResourceType::Artifact:     return "artifact";
        case ResourceType::Document:     return "document";
    }
    return "document";
}

std::optional<ResourceType> parse_resource_type(std::string_view name) noexcept {
    if (name == "conversation") return ResourceType::Conversation;
    if (name == "artifact")     return ResourceType::Artifact;
    if (name == "document")     return ResourceType::Document;
    return std::nullopt;
}

Session::Session(std::string id,
                 std::string resource_id,
                 ResourceType resource_type,
                 std::string workspace_id,
                 DocumentState state,
                 Timestamp now)
    : id_(std::move(id)),
      resource_id_(std::move(resource_id)),
      resource_type_(resource_type),
      workspace_id_(std::move(workspace_id)),
      created_at_(now),
      last_activity_(now),
      state_(std::move(state)) {}

bool Session::has_participant(const std::string& user_id) const {
    return std::find(participants_.begin(), participants_.end(), user_id) != participants_.end();
}

bool Session::add_participant(const std::string& user_id) {
    if (has_participant(user_id)) return false;
    participants_.push_back(user_id);
    return true;
}

bool Session::remove_participant(const std::string& user_id) {
    auto it = std::find(participants_.begin(), participants_.end(), user_id);
    if (it == participants_.end()) return false;
    participants_.erase(it);
    return true;
}

std::vector<AdmittedOperation> Session::recent_operations(std::size_t count) const {
    const std::size_t n = std::min(count, operations_.size());
    return std::vector<AdmittedOperation>(operations_.end() - static_cast<std::ptrdiff_t>(n),
                                          operations_.end());
}

const AdmittedOperation& Session::append(Operation op, Timestamp now, std::size_t retention) {
    AdmittedOperation entry;
    entry.operation = std::move(op);
    entry.admitted_at = std::max(now, last_admitted_ + 1);
    entry.sequence = next_sequence_++;
    last_admitted_ = entry.admitted_at;

    operations_.push_back(std::move(entry));
    while (retention > 0 && operations_.size() > retention) {
        operations_.pop_front();
    }
    return operations_.back();
}

void Session::set_cursor(CursorPosition cursor) {
    auto key = cursor.user_id;
    cursors_[std::move(key)] = std::move(cursor);
}

void Session::set_selection(TextSelection selection) {
    auto key = selection.user_id;
    selections_[std::move(key)] = std::move(selection);
}

std::optional<CursorPosition> Session::cursor(const std::string& user_id) const {
    auto it = cursors_.find(user_id);
    if (it == cursors_.end()) return std::nullopt;
    return it->second;
}

std::optional<TextSelection> Session::selection(const std::string& user_id) const {
    auto it = selections_.find(user_id);
    if (it == selections_.end()) return std::nullopt;
    return it->second;
}

void Session::clear_user_marks(const std::string& user_id) {
    cursors_.erase(user_id);
    selections_.erase(user_id);
}

SessionSnapshot Session::snapshot() const {
    SessionSnapshot snap;
    snap.id = id_;
    snap.resource_id = resource_id_;
    snap.resource_type = resource_type_;
    snap.workspace_id = workspace_id_;
    snap.participants = participants_;
    snap.state = state_;
    snap.operations.assign(operations_.begin(), operations_.end());
    snap.created_at = created_at_;
    snap.last_activity = last_activity_;
    return snap;
}

} // namespace coedit::collab
