#include "storage/FileSessionStore.h"

#include "collab/Errors.h"
#include "protocol/Codec.h"
#include "util/Log.h"

#include <boost/json.hpp>

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace coedit::storage {

namespace fs = std::filesystem;
namespace json = boost::json;
using collab::PersistenceError;

namespace {

// Ids become file names. Bytes outside [A-Za-z0-9_-] are percent-encoded, so
// no id can name a path outside its directory and distinct ids never collide.
std::string file_name(const std::string& id) {
    if (id.empty()) throw PersistenceError("empty id");
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(id.size());
    for (char c : id) {
        const bool plain = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                           c == '-' || c == '_';
        if (plain) {
            out.push_back(c);
        } else {
            const auto byte = static_cast<unsigned char>(c);
            out.push_back('%');
            out.push_back(hex[byte >> 4]);
            out.push_back(hex[byte & 0x0F]);
        }
    }
    return out + ".json";
}

} // namespace

FileSessionStore::FileSessionStore(fs::path data_dir) : data_dir_(std::move(data_dir)) {}

fs::path FileSessionStore::session_path(const std::string& session_id) const {
    return data_dir_ / "sessions" / file_name(session_id);
}

fs::path FileSessionStore::resource_path(const std::string& resource_id, collab::ResourceType type) const {
    return data_dir_ / "resources" / collab::to_string(type) / file_name(resource_id);
}

void FileSessionStore::write_atomic(const fs::path& target, const std::string& data) const {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) throw PersistenceError("cannot create " + target.parent_path().string() + ": " + ec.message());

    fs::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        out << data;
        out.flush();
        if (!out) {
            out.close();
            std::error_code ignore_ec;
            fs::remove(tmp, ignore_ec);
            throw PersistenceError("cannot write " + tmp.string());
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignore_ec;
        fs::remove(tmp, ignore_ec);
        throw PersistenceError("cannot rename " + tmp.string() + ": " + ec.message());
    }
}

void FileSessionStore::persist(const collab::SessionSnapshot& snapshot) const {
    write_atomic(session_path(snapshot.id), json::serialize(protocol::to_json(snapshot)));
    write_atomic(resource_path(snapshot.resource_id, snapshot.resource_type),
                 json::serialize(protocol::to_json(snapshot.state)));
    util::Log::debug("FileSessionStore", "saved ", snapshot.id, " (", snapshot.operations.size(), " ops)");
}

std::optional<collab::DocumentState> FileSessionStore::load_resource(const std::string& resource_id,
                                                                     collab::ResourceType type) const {
    const fs::path path = resource_path(resource_id, type);
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;

    std::ifstream in(path, std::ios::binary);
    if (!in) throw PersistenceError("cannot open " + path.string());
    std::ostringstream buf;
    buf << in.rdbuf();

    boost::system::error_code parse_ec;
    json::value v = json::parse(buf.str(), parse_ec);
    if (parse_ec) throw PersistenceError(path.string() + ": " + parse_ec.message());
    try {
        return protocol::document_state_from_json(v);
    } catch (const collab::ValidationError& e) {
        throw PersistenceError(path.string() + ": " + e.what());
    }
}

collab::Collaborators FileSessionStore::collaborators() const {
    collab::Collaborators out;
    out.persist_session = [this](const collab::SessionSnapshot& snapshot) { persist(snapshot); };
    out.get_resource_state = [this](const std::string& resource_id, collab::ResourceType type) {
        return load_resource(resource_id, type);
    };
    return out;
}

} // namespace coedit::storage
