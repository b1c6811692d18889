#pragma once

#include "collab/Operation.h"

#include <deque>
#include <optional>
#include <string>

namespace coedit::collab {

// Operational transformation over insert/delete/format. Stateless: one
// instance may be shared by every session and thread.
class ConflictResolver {
public:
    // Folds `op` through every logged operation that is concurrent with it:
    // admitted after `op` was created, by someone other than `user_id`.
    Operation transform(const Operation& op,
                        const std::deque<AdmittedOperation>& log,
                        const std::string& user_id) const;

    // Rewrites `op` so that it applies after `other` with the same intent.
    Operation transform_against(const Operation& op, const Operation& other) const;

    // Merges two adjacent edits of one author, or nullopt.
    std::optional<Operation> compose(const Operation& first, const Operation& second) const;

    // Payload shape only: non-empty insert text, positive delete length,
    // non-negative positions, start < end.
    bool is_well_formed(const Operation& op) const;

    // Shape plus bounds against `state`.
    bool validate_operation(const Operation& op, const DocumentState& state) const;

    // Applies an already validated/transformed operation. Stored formatting
    // ranges follow the text they cover.
    void apply(DocumentState& state, const Operation& op) const;

private:
    static void transform_insert(InsertData& ins, const Operation& self, const Operation& other);
    static void transform_delete(DeleteData& del, const Operation& other);
    static void transform_format(std::int64_t& start, std::int64_t& end, const Operation& other);
};

} // namespace coedit::collab
