#include <gtest/gtest.h>

#include "collab/ConflictResolver.h"
#include "collab/Text.hpp"
#include "TestSupport.h"

#include <algorithm>
#include <deque>
#include <random>
#include <string>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

using namespace coedit::collab;

namespace {

std::vector<FormatRange> sorted(std::vector<FormatRange> ranges) {
    std::sort(ranges.begin(), ranges.end(), [](const FormatRange& a, const FormatRange& b) {
        return std::make_tuple(a.start, a.end, a.format.bold.value_or(false), a.format.italic.value_or(false)) <
               std::make_tuple(b.start, b.end, b.format.bold.value_or(false), b.format.italic.value_or(false));
    });
    return ranges;
}

class OperationFactory {
public:
    explicit OperationFactory(unsigned seed) : rng_(seed) {}

    std::string random_text(int max_len) {
        static const char* pieces[] = {"a", "b", "c", "x", "\xC3\xA9", " "};
        std::uniform_int_distribution<int> len(1, max_len);
        std::uniform_int_distribution<int> pick(0, 5);
        std::string out;
        for (int i = len(rng_); i > 0; --i) out += pieces[pick(rng_)];
        return out;
    }

    // Any well-formed operation against a document of `len` code points.
    Operation any(const std::string& user, std::int64_t len, Timestamp ts) {
        std::uniform_int_distribution<int> kind(0, 3);
        switch (kind(rng_)) {
            case 0:
            case 1: {
                auto op = make_insert(user, between(0, len), random_text(3), ts);
                if (coin()) op.as<InsertData>().format = coin() ? coedit::testing::bold() : coedit::testing::italic();
                return op;
            }
            case 2: {
                const auto pos = between(0, len - 1);
                return make_delete(user, pos, between(1, len - pos), ts);
            }
            default: {
                const auto start = between(0, len - 1);
                return make_format(user, start, between(start + 1, len),
                                   coin() ? coedit::testing::bold() : coedit::testing::italic(), ts);
            }
        }
    }

    std::int64_t between(std::int64_t lo, std::int64_t hi) {
        return std::uniform_int_distribution<std::int64_t>(lo, hi)(rng_);
    }

    bool coin() { return std::uniform_int_distribution<int>(0, 1)(rng_) == 1; }

private:
    std::mt19937 rng_;
};

// Admits `ops` (all created against `base`) in the given order, the way a
// session does: each one is transformed against everything admitted before.
DocumentState admit_in_order(const DocumentState& base, const std::vector<Operation>& ops,
                             const std::vector<std::size_t>& order) {
    ConflictResolver resolver;
    DocumentState doc = base;
    std::deque<AdmittedOperation> log;
    Timestamp clock = 1000;
    std::uint64_t seq = 1;
    for (std::size_t i : order) {
        const Operation& op = ops[i];
        Operation t = resolver.transform(op, log, op.user_id);
        if (!t.is_noop()) {
            EXPECT_TRUE(resolver.validate_operation(t, doc)) << "operation " << i << " left the document";
        }
        resolver.apply(doc, t);
        log.push_back({t, ++clock, seq++});
    }
    return doc;
}

} // namespace

TEST(ConvergenceTest, TwoAuthorsRandomOperations) {
    OperationFactory factory(20261019);
    for (int round = 0; round < 2000; ++round) {
        DocumentState base;
        base.text = factory.random_text(12);
        const std::int64_t len = text::length(base.text);

        std::vector<Operation> ops{factory.any("alice", len, 100), factory.any("bob", len, 100)};
        ops[0].id = "op-a";
        ops[1].id = "op-b";

        auto ab = admit_in_order(base, ops, {0, 1});
        auto ba = admit_in_order(base, ops, {1, 0});

        ASSERT_EQ(ab.text, ba.text) << "round " << round << " base '" << base.text << "'";
        ASSERT_EQ(sorted(ab.formatting), sorted(ba.formatting)) << "round " << round;
    }
}

TEST(ConvergenceTest, ConcurrentInsertsAtOnePosition) {
    DocumentState base;
    base.text = "0123456789";
    std::vector<Operation> ops{
        make_insert("u1", 5, "A", 100),
        make_insert("u2", 5, "B", 101),
        make_insert("u3", 5, "C", 102),
    };

    std::vector<std::size_t> order{0, 1, 2};
    const auto expected = admit_in_order(base, ops, order).text;
    EXPECT_EQ(expected, "01234ABC56789");
    while (std::next_permutation(order.begin(), order.end())) {
        EXPECT_EQ(admit_in_order(base, ops, order).text, expected);
    }
}

TEST(ConvergenceTest, FourAuthorsInDisjointRegions) {
    OperationFactory factory(7);
    for (int round = 0; round < 200; ++round) {
        // Four regions separated by fixed markers nobody touches.
        DocumentState base;
        std::vector<std::int64_t> region_start;
        for (int r = 0; r < 4; ++r) {
            region_start.push_back(text::length(base.text));
            base.text += "abcdefgh";
            base.text += "|";
        }

        std::vector<Operation> ops;
        const char* users[] = {"u1", "u2", "u3", "u4"};
        for (int r = 0; r < 4; ++r) {
            Operation local = factory.any(users[r], 8, 100 + r);
            std::visit(
                [&](auto& d) {
                    using T = std::decay_t<decltype(d)>;
                    if constexpr (std::is_same_v<T, FormatData>) {
                        d.start += region_start[r];
                        d.end += region_start[r];
                    } else if constexpr (std::is_same_v<T, InsertData>) {
                        // Keep inserts off the region edges so they never tie with a neighbour.
                        d.position = region_start[r] + std::clamp<std::int64_t>(d.position, 1, 7);
                    } else {
                        d.position += region_start[r];
                    }
                },
                local.payload);
            local.id = "op-" + std::to_string(r);
            ops.push_back(local);
        }

        std::vector<std::size_t> order{0, 1, 2, 3};
        const auto first = admit_in_order(base, ops, order);
        while (std::next_permutation(order.begin(), order.end())) {
            const auto other = admit_in_order(base, ops, order);
            ASSERT_EQ(other.text, first.text) << "round " << round;
            ASSERT_EQ(sorted(other.formatting), sorted(first.formatting)) << "round " << round;
        }
    }
}
