#include "collab/ConflictResolver.h"

#include "collab/Text.hpp"

#include <algorithm>
#include <type_traits>
#include <variant>

namespace coedit::collab {

namespace {

// Range bounds against an insert of `n` code points at `at`. Inserting at the
// start lands before the range, inserting at the end lands after it.
void shift_range_for_insert(std::int64_t& start, std::int64_t& end, std::int64_t at, std::int64_t n) {
    if (n <= 0) return;
    if (at <= start) {
        start += n;
        end += n;
    } else if (at < end) {
        end += n;
    }
}

void shift_range_for_delete(std::int64_t& start, std::int64_t& end, std::int64_t at, std::int64_t n) {
    if (n <= 0) return;
    const std::int64_t del_end = at + n;
    if (del_end <= start) {
        start = std::max<std::int64_t>(0, start - n);
        end = std::max<std::int64_t>(0, end - n);
    } else if (at < end) {
        const std::int64_t overlap = std::min(end, del_end) - std::max(start, at);
        const std::int64_t remaining = std::max<std::int64_t>(0, (end - start) - overlap);
        start = std::min(start, at);
        end = start + remaining;
    }
}

} // namespace

Operation ConflictResolver::transform(const Operation& op,
                                      const std::deque<AdmittedOperation>& log,
                                      const std::string& user_id) const {
    Operation out = op;
    for (const auto& entry : log) {
        if (entry.admitted_at <= op.timestamp) continue;
        if (entry.operation.user_id == user_id) continue;
        out = transform_against(out, entry.operation);
    }
    return out;
}

Operation ConflictResolver::transform_against(const Operation& op, const Operation& other) const {
    Operation out = op;
    std::visit(
        [&](auto& data) {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, InsertData>) {
                transform_insert(data, op, other);
            } else if constexpr (std::is_same_v<T, DeleteData>) {
                transform_delete(data, other);
            } else {
                transform_format(data.start, data.end, other);
            }
        },
        out.payload);
    return out;
}

void ConflictResolver::transform_insert(InsertData& ins, const Operation& self, const Operation& other) {
    if (const auto* o = std::get_if<InsertData>(&other.payload)) {
        if (o->position < ins.position ||
            (o->position == ins.position && other.precedes(self))) {
            ins.position += text::length(o->text);
        }
    } else if (const auto* o = std::get_if<DeleteData>(&other.payload)) {
        if (o->length <= 0) return;
        const std::int64_t del_end = o->position + o->length;
        if (del_end <= ins.position) {
            ins.position = std::max<std::int64_t>(0, ins.position - o->length);
        } else if (o->position < ins.position) {
            // Landed inside text someone else removed: the delete swallows it.
            ins.position = o->position;
            ins.text.clear();
        }
    }
}

void ConflictResolver::transform_delete(DeleteData& del, const Operation& other) {
    if (const auto* o = std::get_if<InsertData>(&other.payload)) {
        const std::int64_t n = text::length(o->text);
        if (n == 0) return;
        if (o->position <= del.position) {
            del.position += n;
        } else if (o->position < del.position + del.length) {
            del.length += n;
        }
    } else if (const auto* o = std::get_if<DeleteData>(&other.payload)) {
        if (o->length <= 0) return;
        const std::int64_t end = del.position + del.length;
        const std::int64_t other_end = o->position + o->length;
        if (other_end <= del.position) {
            del.position = std::max<std::int64_t>(0, del.position - o->length);
        } else if (o->position < end) {
            const std::int64_t overlap = std::min(end, other_end) - std::max(del.position, o->position);
            del.length = std::max<std::int64_t>(0, del.length - overlap);
            del.position = std::min(del.position, o->position);
        }
    }
}

void ConflictResolver::transform_format(std::int64_t& start, std::int64_t& end, const Operation& other) {
    if (const auto* o = std::get_if<InsertData>(&other.payload)) {
        shift_range_for_insert(start, end, o->position, text::length(o->text));
    } else if (const auto* o = std::get_if<DeleteData>(&other.payload)) {
        shift_range_for_delete(start, end, o->position, o->length);
    }
}

std::optional<Operation> ConflictResolver::compose(const Operation& first, const Operation& second) const {
    if (first.user_id != second.user_id) return std::nullopt;
    if (first.session_id != second.session_id) return std::nullopt;

    const auto* ins1 = std::get_if<InsertData>(&first.payload);
    const auto* ins2 = std::get_if<InsertData>(&second.payload);
    if (ins1 && ins2) {
        if (ins2->position != ins1->position + text::length(ins1->text)) return std::nullopt;
        if (ins1->format != ins2->format) return std::nullopt;
        Operation merged = first;
        merged.as<InsertData>().text += ins2->text;
        merged.timestamp = second.timestamp;
        return merged;
    }

    const auto* del1 = std::get_if<DeleteData>(&first.payload);
    const auto* del2 = std::get_if<DeleteData>(&second.payload);
    if (del1 && del2) {
        if (del2->position != del1->position) return std::nullopt;
        Operation merged = first;
        merged.as<DeleteData>().length += del2->length;
        merged.timestamp = second.timestamp;
        return merged;
    }
    return std::nullopt;
}

bool ConflictResolver::is_well_formed(const Operation& op) const {
    return std::visit(
        [](const auto& data) -> bool {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, InsertData>) {
                return !data.text.empty() && data.position >= 0 && data.position <= kMaxOffset;
            } else if constexpr (std::is_same_v<T, DeleteData>) {
                return data.length > 0 && data.length <= kMaxOffset &&
                       data.position >= 0 && data.position <= kMaxOffset;
            } else {
                return data.start >= 0 && data.start < data.end && data.end <= kMaxOffset;
            }
        },
        op.payload);
}

bool ConflictResolver::validate_operation(const Operation& op, const DocumentState& state) const {
    if (!is_well_formed(op)) return false;
    const std::int64_t len = text::length(state.text);
    return std::visit(
        [len](const auto& data) -> bool {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, InsertData>) {
                return data.position <= len;
            } else if constexpr (std::is_same_v<T, DeleteData>) {
                return data.position <= len && data.length <= len - data.position;
            } else {
                return data.end <= len;
            }
        },
        op.payload);
}

void ConflictResolver::apply(DocumentState& state, const Operation& op) const {
    if (op.is_noop()) return;

    auto& ranges = state.formatting;
    std::visit(
        [&](const auto& data) {
            using T = std::decay_t<decltype(data)>;
            if constexpr (std::is_same_v<T, InsertData>) {
                const std::int64_t n = text::length(data.text);
                text::insert(state.text, data.position, data.text);
                for (auto& r : ranges) shift_range_for_insert(r.start, r.end, data.position, n);
                if (data.format) {
                    ranges.push_back(FormatRange{data.position, data.position + n, *data.format});
                }
            } else if constexpr (std::is_same_v<T, DeleteData>) {
                text::erase(state.text, data.position, data.length);
                for (auto& r : ranges) shift_range_for_delete(r.start, r.end, data.position, data.length);
                ranges.erase(std::remove_if(ranges.begin(), ranges.end(),
                                            [](const FormatRange& r) { return r.start >= r.end; }),
                             ranges.end());
            } else {
                ranges.push_back(FormatRange{data.start, data.end, data.format});
            }
        },
        op.payload);
}

} // namespace coedit::collab
