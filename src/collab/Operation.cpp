#include "collab/Operation.h"

#include <chrono>
#include <tuple>
#include <utility>

namespace coedit::collab {

Timestamp now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool TextFormat::operator==(const TextFormat& other) const {
    return std::tie(bold, italic, underline, strikethrough, color, background_color,
                    font_size, font_family) ==
           std::tie(other.bold, other.italic, other.underline, other.strikethrough,
                    other.color, other.background_color, other.font_size, other.font_family);
}

const char* to_string(OperationType type) noexcept {
    switch (type) {
        case OperationType::Insert: return "insert";
        case OperationType::Delete: return "delete";
        case OperationType::Format: return "format";
    }
    return "unknown";
}

std::optional<OperationType> parse_operation_type(std::string_view name) noexcept {
    if (name == "insert" || name == "text_insert") return OperationType::Insert;
    if (name == "delete" || name == "text_delete") return OperationType::Delete;
    if (name == "format" || name == "text_format") return OperationType::Format;
    return std::nullopt;
}

OperationType Operation::type() const noexcept {
    switch (payload.index()) {
        case 0: return OperationType::Insert;
        case 1: return OperationType::Delete;
        default: return OperationType::Format;
    }
}

bool Operation::is_noop() const noexcept {
    if (auto* ins = std::get_if<InsertData>(&payload)) return ins->text.empty();
    if (auto* del = std::get_if<DeleteData>(&payload)) return del->length <= 0;
    const auto& fmt = std::get<FormatData>(payload);
    return fmt.start >= fmt.end;
}

bool Operation::precedes(const Operation& other) const noexcept {
    return std::tie(timestamp, user_id, id) < std::tie(other.timestamp, other.user_id, other.id);
}

Operation make_insert(std::string user_id, std::int64_t position, std::string text,
                      Timestamp timestamp) {
    Operation op;
    op.user_id = std::move(user_id);
    op.timestamp = timestamp;
    op.payload = InsertData{position, std::move(text), std::nullopt};
    return op;
}

Operation make_delete(std::string user_id, std::int64_t position, std::int64_t length,
                      Timestamp timestamp) {
    Operation op;
    op.user_id = std::move(user_id);
    op.timestamp = timestamp;
    op.payload = DeleteData{position, length};
    return op;
}

Operation make_format(std::string user_id, std::int64_t start, std::int64_t end,
                      TextFormat format, Timestamp timestamp) {
    Operation op;
    op.user_id = std::move(user_id);
    op.timestamp = timestamp;
    op.payload = FormatData{start, end, std::move(format)};
    return op;
}

} // namespace coedit::collab
