#pragma once

#include <boost/json/object.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace coedit::collab {

// Milliseconds since the Unix epoch.
using Timestamp = std::int64_t;

Timestamp now_ms();

struct TextFormat {
    std::optional<bool> bold;
    std::optional<bool> italic;
    std::optional<bool> underline;
    std::optional<bool> strikethrough;
    std::optional<std::string> color;
    std::optional<std::string> background_color;
    std::optional<double> font_size;
    std::optional<std::string> font_family;

    bool operator==(const TextFormat& other) const;
    bool operator!=(const TextFormat& other) const { return !(*this == other); }
};

// Largest position, length or range bound a well-formed operation may carry.
constexpr std::int64_t kMaxOffset = std::int64_t{1} << 40;

struct InsertData {
    std::int64_t position = 0;
    std::string text;
    std::optional<TextFormat> format;
};

struct DeleteData {
    std::int64_t position = 0;
    std::int64_t length = 0;
};

struct FormatData {
    std::int64_t start = 0;
    std::int64_t end = 0;
    TextFormat format;
};

using OperationPayload = std::variant<InsertData, DeleteData, FormatData>;

enum class OperationType { Insert, Delete, Format };

const char* to_string(OperationType type) noexcept;

// Accepts both "insert" and the older "text_insert" spelling.
std::optional<OperationType> parse_operation_type(std::string_view name) noexcept;

struct Operation {
    std::string id;
    std::string session_id;
    std::string user_id;
    Timestamp timestamp = 0;     // creation time at the author
    OperationPayload payload;

    OperationType type() const noexcept;

    // Reduced to nothing by a concurrent edit: empty insert, zero-length
    // delete or collapsed format range.
    bool is_noop() const noexcept;

    // Total order used to break position ties between concurrent inserts.
    bool precedes(const Operation& other) const noexcept;

    template <typename T> const T& as() const { return std::get<T>(payload); }
    template <typename T> T& as() { return std::get<T>(payload); }
};

// Log entry: the transformed operation plus when the session admitted it.
struct AdmittedOperation {
    Operation operation;
    Timestamp admitted_at = 0;
    std::uint64_t sequence = 0;
};

struct FormatRange {
    std::int64_t start = 0;
    std::int64_t end = 0;
    TextFormat format;

    bool operator==(const FormatRange& other) const {
        return start == other.start && end == other.end && format == other.format;
    }
};

// Authoritative snapshot of a collaboratively edited resource. `extra` keeps
// whatever else the resource-state provider handed us, untouched.
struct DocumentState {
    std::string text;
    std::vector<FormatRange> formatting;
    boost::json::object extra;
};

Operation make_insert(std::string user_id, std::int64_t position, std::string text,
                      Timestamp timestamp = 0);
Operation make_delete(std::string user_id, std::int64_t position, std::int64_t length,
                      Timestamp timestamp = 0);
Operation make_format(std::string user_id, std::int64_t start, std::int64_t end,
                      TextFormat format, Timestamp timestamp = 0);

} // namespace coedit::collab
