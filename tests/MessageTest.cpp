#include <gtest/gtest.h>

#include "collab/Errors.h"
#include "protocol/Message.h"

#include <boost/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using namespace coedit;
using namespace coedit::protocol;
using collab::ValidationError;
namespace json = boost::json;

// =============================================================================
// INBOUND
// =============================================================================

TEST(MessageTest, ParsesSingleOperation) {
    auto msg = parse_inbound(R"({
        "type": "operation",
        "payload": {"sessionId": "s1", "operation": {"type": "insert", "data": {"position": 0, "text": "a"}}}
    })");
    ASSERT_TRUE(std::holds_alternative<OperationRequest>(msg));
    const auto& req = std::get<OperationRequest>(msg);
    EXPECT_EQ(req.session_id, "s1");
    ASSERT_EQ(req.operations.size(), 1u);
    EXPECT_EQ(req.operations[0].as<collab::InsertData>().text, "a");
}

TEST(MessageTest, ParsesOperationBatch) {
    auto msg = parse_inbound(R"({
        "type": "operation",
        "payload": {"sessionId": "s1", "operations": [
            {"type": "insert", "data": {"position": 0, "text": "a"}},
            {"type": "delete", "data": {"position": 0, "length": 1}}
        ]}
    })");
    const auto& req = std::get<OperationRequest>(msg);
    ASSERT_EQ(req.operations.size(), 2u);
    EXPECT_EQ(req.operations[1].type(), collab::OperationType::Delete);
}

TEST(MessageTest, ParsesSessionRequests) {
    auto open = parse_inbound(R"({"type": "open_session", "payload": {"resourceId": "c-1", "resourceType": "conversation"}})");
    ASSERT_TRUE(std::holds_alternative<OpenSessionRequest>(open));
    EXPECT_EQ(std::get<OpenSessionRequest>(open).resource_id, "c-1");
    EXPECT_EQ(std::get<OpenSessionRequest>(open).resource_type, collab::ResourceType::Conversation);

    auto join = parse_inbound(R"({"type": "join_session", "payload": {"sessionId": "s1"}})");
    EXPECT_EQ(std::get<JoinSessionRequest>(join).session_id, "s1");

    auto leave = parse_inbound(R"({"type": "leave_session", "payload": {"sessionId": "s1"}})");
    EXPECT_EQ(std::get<LeaveSessionRequest>(leave).session_id, "s1");
}

TEST(MessageTest, ParsesCursorSelectionAndPresence) {
    auto cursor = parse_inbound(R"({"type": "cursor_update", "payload": {"sessionId": "s1", "cursor": {"position": 7}}})");
    EXPECT_EQ(std::get<CursorRequest>(cursor).cursor.position, 7);

    auto selection = parse_inbound(
        R"({"type": "selection_update", "payload": {"sessionId": "s1", "selection": {"start": 1, "end": 4}}})");
    EXPECT_EQ(std::get<SelectionRequest>(selection).selection.end, 4);

    auto presence = parse_inbound(R"({"type": "presence_update", "payload": {"presence": {"activity": "typing"}}})");
    EXPECT_EQ(std::get<PresenceRequest>(presence).patch.activity, std::optional<std::string>("typing"));
}

TEST(MessageTest, RejectsBadFrames) {
    EXPECT_THROW(parse_inbound("{"), ValidationError);
    EXPECT_THROW(parse_inbound(R"("operation")"), ValidationError);
    EXPECT_THROW(parse_inbound(R"({"payload": {}})"), ValidationError);
    EXPECT_THROW(parse_inbound(R"({"type": "session_state", "payload": {}})"), ValidationError);
    EXPECT_THROW(parse_inbound(R"({"type": "join_session"})"), ValidationError);
    EXPECT_THROW(parse_inbound(R"({"type": "join_session", "payload": []})"), ValidationError);
    EXPECT_THROW(parse_inbound(R"({"type": "join_session", "payload": {}})"), ValidationError);
    EXPECT_THROW(parse_inbound(R"({"type": "operation", "payload": {"sessionId": "s1", "operations": []}})"),
                 ValidationError);
    EXPECT_THROW(parse_inbound(R"({"type": "open_session", "payload": {"resourceId": "x", "resourceType": "sheet"}})"),
                 ValidationError);
    EXPECT_THROW(parse_inbound(R"({"type": "cursor_update", "payload": {"sessionId": "s1"}})"), ValidationError);
}

TEST(MessageTest, KindNames) {
    EXPECT_EQ(parse_inbound_kind("presence_update"), std::optional<InboundKind>(InboundKind::PresenceUpdate));
    EXPECT_FALSE(parse_inbound_kind("user_joined"));
    EXPECT_EQ(parse_outbound_kind("user_left"), std::optional<OutboundKind>(OutboundKind::UserLeft));
    EXPECT_STREQ(to_string(OutboundKind::SelectionUpdate), "selection_update");
    EXPECT_STREQ(to_string(InboundKind::LeaveSession), "leave_session");
}

// =============================================================================
// OUTBOUND
// =============================================================================

TEST(MessageTest, SerializesEnvelope) {
    auto frame = json::parse(outbound::session_user_joined("bob", 77).serialize()).as_object();
    EXPECT_EQ(frame.at("type").as_string(), "user_joined");
    EXPECT_EQ(frame.at("timestamp").as_int64(), 77);
    EXPECT_EQ(frame.at("payload").as_object().at("userId").as_string(), "bob");
}

TEST(MessageTest, ErrorPayload) {
    auto msg = outbound::error("Failed to process message", "bad thing", "validation", 5);
    EXPECT_EQ(msg.kind, OutboundKind::Error);
    EXPECT_EQ(msg.payload.at("message").as_string(), "Failed to process message");
    EXPECT_EQ(msg.payload.at("error").as_string(), "bad thing");
    EXPECT_EQ(msg.payload.at("code").as_string(), "validation");
}

TEST(MessageTest, SessionStateCarriesOnlyTheGivenTail) {
    collab::SessionSnapshot s;
    s.id = "s1";
    s.resource_id = "doc-1";
    s.participants = {"alice"};
    for (std::uint64_t i = 1; i <= 5; ++i) {
        s.operations.push_back({collab::make_insert("alice", 0, "x", 1), static_cast<collab::Timestamp>(i), i});
    }
    std::vector<collab::AdmittedOperation> tail(s.operations.end() - 2, s.operations.end());

    auto msg = outbound::session_state(s, tail, 9);
    EXPECT_EQ(msg.kind, OutboundKind::SessionState);
    EXPECT_EQ(msg.payload.at("sessionId").as_string(), "s1");
    EXPECT_EQ(msg.payload.at("resourceType").as_string(), "document");
    const auto& ops = msg.payload.at("operations").as_array();
    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0].as_object().at("sequence").as_uint64(), 4u);
}

TEST(MessageTest, OperationCarriesAdmissionTime) {
    collab::AdmittedOperation entry{collab::make_delete("alice", 1, 2, 10), 20, 3};
    auto msg = outbound::operation(entry, "alice", 21);
    EXPECT_EQ(msg.payload.at("timestamp").as_int64(), 20);
    EXPECT_EQ(msg.payload.at("operation").as_object().at("type").as_string(), "delete");
    EXPECT_EQ(msg.timestamp, 21);
}

TEST(MessageTest, WorkspaceEventsNameTheWorkspace) {
    auto joined = outbound::workspace_user_joined("bob", "w1", 1);
    EXPECT_EQ(joined.kind, OutboundKind::UserJoined);
    EXPECT_EQ(joined.payload.at("workspaceId").as_string(), "w1");

    presence::UserPresence p;
    p.user_id = "bob";
    auto update = outbound::presence_update(p, 2);
    EXPECT_EQ(update.payload.at("presence").as_object().at("status").as_string(), "offline");
}
