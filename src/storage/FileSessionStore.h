#pragma once

#include "collab/Operation.h"
#include "collab/Session.h"
#include "collab/SessionManager.h"

#include <filesystem>
#include <optional>
#include <string>

namespace coedit::storage {

// JSON files under one data directory:
//   sessions/<sessionId>.json           last snapshot of each session
//   resources/<type>/<resourceId>.json  document state, read on session creation
// Ids are percent-encoded into file names.
// Every write goes to a temp file first and is renamed into place.
class FileSessionStore {
public:
    explicit FileSessionStore(std::filesystem::path data_dir);

    // Writes the session snapshot and the resource state it carries.
    // Throws collab::PersistenceError.
    void persist(const collab::SessionSnapshot& snapshot) const;

    // nullopt when nothing is stored for the resource. Throws
    // collab::PersistenceError for unreadable or malformed files.
    std::optional<collab::DocumentState> load_resource(const std::string& resource_id,
                                                       collab::ResourceType type) const;

    std::filesystem::path session_path(const std::string& session_id) const;
    std::filesystem::path resource_path(const std::string& resource_id, collab::ResourceType type) const;

    // persist_session and get_resource_state bound to this store.
    collab::Collaborators collaborators() const;

private:
    void write_atomic(const std::filesystem::path& target, const std::string& data) const;

    std::filesystem::path data_dir_;
};

} // namespace coedit::storage
