#include <gtest/gtest.h>

#include "networking/ConnectionLayer.h"
#include "TestSupport.h"

#include <boost/asio/io_context.hpp>
#include <boost/json.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace coedit;
using networking::ClientId;
namespace json = boost::json;

class ConnectionLayerTest : public ::testing::Test {
protected:
    ConnectionLayerTest()
        : registry(transport),
          sessions(collab::Collaborators{}, registry, persistence, collab::EngineOptions{}, clock.fn()),
          presence(presence::PresenceOptions{}, clock.fn()),
          layer(registry, sessions, presence) {}

    static std::string frame(const std::string& type, json::object payload) {
        return json::serialize(json::object{{"type", type}, {"payload", std::move(payload)}});
    }

    void connect(ClientId id, const std::string& user_id, const std::string& workspace_id = "w1") {
        layer.on_connect(id, "/ws?userId=" + user_id + "&workspaceId=" + workspace_id);
    }

    std::string open(ClientId id, const std::string& resource_id = "doc-1") {
        layer.on_message(id, frame("open_session", {{"resourceId", resource_id}, {"resourceType", "document"}}));
        auto states = transport.frames_of(id, "session_state");
        if (states.empty()) return {};
        const json::object& payload = states.back().at("payload").as_object();
        if (!payload.contains("sessionId")) return {};
        return std::string(payload.at("sessionId").as_string());
    }

    void insert(ClientId id, const std::string& session_id, std::int64_t position, const std::string& text) {
        layer.on_message(id, frame("operation",
            {{"sessionId", session_id},
             {"operation", {{"type", "insert"}, {"data", {{"position", position}, {"text", text}}}}}}));
    }

    static std::string code_of(const json::object& error_frame) {
        return std::string(error_frame.at("payload").as_object().at("code").as_string());
    }

    coedit::testing::ManualClock clock;
    coedit::testing::FakeTransport transport;
    boost::asio::io_context persistence;
    networking::ConnectionRegistry registry;
    collab::SessionManager sessions;
    presence::PresenceTracker presence;
    networking::ConnectionLayer layer;
};

// =============================================================================
// QUERY STRINGS
// =============================================================================

TEST(ParseQueryTest, DecodesPairs) {
    auto q = networking::parse_query("/ws?userId=a%20b&workspaceId=w+1&flag&=x&&last=%zz");
    EXPECT_EQ(q["userId"], "a b");
    EXPECT_EQ(q["workspaceId"], "w 1");
    EXPECT_EQ(q["flag"], "");
    EXPECT_EQ(q[""], "x");
    EXPECT_EQ(q["last"], "%zz");
}

TEST(ParseQueryTest, NoQueryIsEmpty) {
    EXPECT_TRUE(networking::parse_query("/ws").empty());
    EXPECT_TRUE(networking::parse_query("/ws?").empty());
}

// =============================================================================
// HANDSHAKE
// =============================================================================

TEST_F(ConnectionLayerTest, RejectsMissingUser) {
    layer.on_connect(1, "/ws?workspaceId=w1");
    ASSERT_EQ(transport.closed().size(), 1u);
    EXPECT_EQ(transport.closed()[0].code, networking::kCloseMissingIdentity);
    EXPECT_EQ(layer.connection_count(), 0u);
    EXPECT_TRUE(transport.frames(1).empty());
}

TEST_F(ConnectionLayerTest, RejectsMissingWorkspaceAndSession) {
    layer.on_connect(1, "/ws?userId=alice");
    ASSERT_EQ(transport.closed().size(), 1u);
    EXPECT_EQ(transport.closed()[0].code, networking::kCloseMissingIdentity);
    EXPECT_FALSE(presence.presence_of("alice"));
}

TEST_F(ConnectionLayerTest, RejectsUnknownSession) {
    layer.on_connect(1, "/ws?userId=alice&sessionId=session-nope");
    ASSERT_EQ(transport.closed().size(), 1u);
    EXPECT_EQ(transport.closed()[0].code, networking::kCloseSessionNotFound);
    EXPECT_EQ(layer.connection_count(), 0u);
}

TEST_F(ConnectionLayerTest, AcceptsAndAcknowledges) {
    connect(1, "alice");

    EXPECT_EQ(layer.connection_count(), 1u);
    EXPECT_TRUE(transport.closed().empty());

    auto frames = transport.frames(1);
    ASSERT_FALSE(frames.empty());
    EXPECT_EQ(frames[0].at("type").as_string(), "session_state");
    const auto& ack = frames[0].at("payload").as_object();
    EXPECT_EQ(std::string(ack.at("clientId").as_string()).rfind("client-", 0), 0u);
    EXPECT_EQ(ack.at("userId").as_string(), "alice");
    EXPECT_EQ(ack.at("workspaceId").as_string(), "w1");

    EXPECT_EQ(presence.presence_of("alice")->status, presence::PresenceStatus::Online);
    EXPECT_EQ(transport.frames_of(1, "user_joined").size(), 1u);
}

TEST_F(ConnectionLayerTest, WorkspaceSeesNewcomers) {
    connect(1, "alice");
    connect(2, "bob");
    connect(3, "carol", "w2");

    auto joined = transport.frames_of(1, "user_joined");
    ASSERT_EQ(joined.size(), 2u);
    EXPECT_EQ(joined.back().at("payload").as_object().at("userId").as_string(), "bob");
    EXPECT_EQ(transport.frames_of(3, "user_joined").size(), 1u);
}

// =============================================================================
// SESSIONS AND OPERATIONS
// =============================================================================

TEST_F(ConnectionLayerTest, OperationsReachTheOtherParticipants) {
    connect(1, "alice");
    connect(2, "bob");
    const auto sid = open(1);
    ASSERT_FALSE(sid.empty());
    EXPECT_EQ(open(2), sid);
    transport.clear();

    insert(1, sid, 0, "hi");

    auto ops = transport.frames_of(2, "operation");
    ASSERT_EQ(ops.size(), 1u);
    const auto& op = ops[0].at("payload").as_object().at("operation").as_object();
    EXPECT_EQ(op.at("data").as_object().at("text").as_string(), "hi");
    EXPECT_EQ(op.at("userId").as_string(), "alice");
    EXPECT_TRUE(transport.frames_of(1, "operation").empty());
    EXPECT_EQ(sessions.get_session(sid)->state.text, "hi");
}

TEST_F(ConnectionLayerTest, BrokenConnectionIsClosedOthersStillReceive) {
    connect(1, "alice");
    connect(2, "bob");
    connect(3, "carol");
    const auto sid = open(1);
    open(2);
    open(3);
    transport.clear();
    transport.break_connection(2);

    insert(1, sid, 0, "hi");

    EXPECT_EQ(transport.frames_of(3, "operation").size(), 1u);
    EXPECT_EQ(sessions.get_session(sid)->state.text, "hi");
    auto closed = transport.closed();
    ASSERT_EQ(closed.size(), 1u);
    EXPECT_EQ(closed[0].client, 2u);
    EXPECT_EQ(closed[0].code, networking::kCloseSendFailed);
    EXPECT_TRUE(transport.frames_of(1, "error").empty());

    layer.on_message(3, frame("presence_update", {{"presence", {{"activity", "typing"}}}}));
    EXPECT_FALSE(transport.frames_of(1, "presence_update").empty());

    layer.on_disconnect(2);
    EXPECT_EQ(sessions.get_session(sid)->participants, (std::vector<std::string>{"alice", "carol"}));
}

TEST_F(ConnectionLayerTest, BatchFrameIsAdmittedAsOne) {
    connect(1, "alice");
    connect(2, "bob");
    const auto sid = open(1);
    open(2);
    transport.clear();

    json::array batch;
    batch.push_back(json::object{{"type", "insert"}, {"data", {{"position", 0}, {"text", "a"}}}});
    batch.push_back(json::object{{"type", "insert"}, {"data", {{"position", 1}, {"text", "b"}}}});
    layer.on_message(1, frame("operation", {{"sessionId", sid}, {"operations", std::move(batch)}}));

    EXPECT_EQ(sessions.get_session(sid)->state.text, "ab");
    EXPECT_EQ(transport.frames_of(2, "operation").size(), 1u);
}

TEST_F(ConnectionLayerTest, JoinAndLeaveByFrame) {
    connect(1, "alice");
    connect(2, "bob");
    const auto sid = open(1);
    transport.clear();

    layer.on_message(2, frame("join_session", {{"sessionId", sid}}));
    auto states = transport.frames_of(2, "session_state");
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].at("payload").as_object().at("sessionId").as_string(), sid.c_str());
    EXPECT_EQ(transport.frames_of(1, "user_joined").size(), 1u);
    EXPECT_EQ(registry.get(2)->sessions.count(sid), 1u);

    layer.on_message(2, frame("leave_session", {{"sessionId", sid}}));
    EXPECT_EQ(transport.frames_of(1, "user_left").size(), 1u);
    EXPECT_EQ(sessions.get_session(sid)->participants, std::vector<std::string>{"alice"});
    EXPECT_EQ(registry.get(2)->sessions.count(sid), 0u);
}

TEST_F(ConnectionLayerTest, ConnectWithSessionIdJoinsIt) {
    connect(1, "alice");
    const auto sid = open(1);

    layer.on_connect(2, "/ws?userId=bob&sessionId=" + sid);

    EXPECT_TRUE(transport.closed().empty());
    auto states = transport.frames_of(2, "session_state");
    ASSERT_EQ(states.size(), 2u);   // handshake ack, then the session
    EXPECT_EQ(states[1].at("payload").as_object().at("sessionId").as_string(), sid.c_str());
    EXPECT_EQ(registry.get(2)->workspace_id, "w1");
    EXPECT_EQ(registry.get(2)->sessions.count(sid), 1u);
    EXPECT_EQ(sessions.get_session(sid)->participants.size(), 2u);
}

TEST_F(ConnectionLayerTest, CursorAndPresenceFrames) {
    connect(1, "alice");
    connect(2, "bob");
    const auto sid = open(1);
    open(2);
    transport.clear();

    layer.on_message(1, frame("cursor_update", {{"sessionId", sid}, {"cursor", {{"position", 0}}}}));
    EXPECT_EQ(transport.frames_of(2, "cursor_update").size(), 1u);
    EXPECT_TRUE(transport.frames_of(1, "cursor_update").empty());

    layer.on_message(1, frame("presence_update", {{"presence", {{"status", "away"}, {"activity", "reading"}}}}));
    auto p = presence.presence_of("alice");
    EXPECT_EQ(p->status, presence::PresenceStatus::Away);
    EXPECT_EQ(p->activity, std::optional<std::string>("reading"));
    EXPECT_EQ(transport.frames_of(2, "presence_update").size(), 1u);
}

// =============================================================================
// ERRORS
// =============================================================================

TEST_F(ConnectionLayerTest, MalformedFramesGetValidationErrors) {
    connect(1, "alice");
    connect(2, "bob");
    transport.clear();

    layer.on_message(1, "not json");
    layer.on_message(1, frame("teleport", {}));
    layer.on_message(1, frame("operation", {{"sessionId", "s"}}));

    auto errors = transport.frames_of(1, "error");
    ASSERT_EQ(errors.size(), 3u);
    for (const auto& e : errors) {
        EXPECT_EQ(code_of(e), "validation");
        EXPECT_EQ(e.at("payload").as_object().at("message").as_string(), "Failed to process message");
    }
    EXPECT_TRUE(transport.frames(2).empty());
    EXPECT_EQ(layer.connection_count(), 2u);
}

TEST_F(ConnectionLayerTest, EngineErrorsAreReportedToTheSender) {
    connect(1, "alice");
    connect(2, "bob");
    const auto sid = open(1);
    transport.clear();

    insert(2, sid, 0, "x");
    insert(1, "session-gone", 0, "x");
    insert(1, sid, 5, "x");

    auto bob_errors = transport.frames_of(2, "error");
    ASSERT_EQ(bob_errors.size(), 1u);
    EXPECT_EQ(code_of(bob_errors[0]), "permission");

    auto alice_errors = transport.frames_of(1, "error");
    ASSERT_EQ(alice_errors.size(), 2u);
    EXPECT_EQ(code_of(alice_errors[0]), "not_found");
    EXPECT_EQ(code_of(alice_errors[1]), "validation");
    EXPECT_EQ(sessions.get_session(sid)->state.text, "");
}

TEST_F(ConnectionLayerTest, FramesFromUnknownConnectionsAreDropped) {
    layer.on_message(99, frame("join_session", {{"sessionId", "s"}}));
    EXPECT_TRUE(transport.frames(99).empty());
}

// =============================================================================
// DISCONNECT AND ROUTING
// =============================================================================

TEST_F(ConnectionLayerTest, DisconnectLeavesSessionsAndWorkspace) {
    connect(1, "alice");
    connect(2, "bob");
    const auto sid = open(1);
    open(2);
    transport.clear();

    layer.on_disconnect(2);

    EXPECT_EQ(layer.connection_count(), 1u);
    EXPECT_EQ(sessions.get_session(sid)->participants, std::vector<std::string>{"alice"});
    EXPECT_EQ(transport.frames_of(1, "user_left").size(), 2u);   // session, then workspace
    EXPECT_EQ(presence.presence_of("bob")->status, presence::PresenceStatus::Offline);

    layer.on_disconnect(1);
    EXPECT_EQ(sessions.session_count(), 0u);
    EXPECT_EQ(presence.presence_of("alice")->status, presence::PresenceStatus::Offline);

    layer.on_disconnect(1);
    EXPECT_EQ(layer.connection_count(), 0u);
}

TEST_F(ConnectionLayerTest, SecondConnectionKeepsTheUserPresent) {
    connect(1, "alice");
    const auto sid = open(1);
    connect(3, "alice");
    layer.on_message(3, frame("join_session", {{"sessionId", sid}}));

    layer.on_disconnect(1);

    EXPECT_EQ(sessions.get_session(sid)->participants, std::vector<std::string>{"alice"});
    EXPECT_EQ(presence.presence_of("alice")->status, presence::PresenceStatus::Online);
    EXPECT_EQ(presence.workspaces_of("alice"), std::vector<std::string>{"w1"});
}

TEST_F(ConnectionLayerTest, StaleUserComesBackOnTheNextFrame) {
    connect(1, "alice");
    connect(2, "bob");
    clock.advance(31 * 60 * 1000);
    presence.touch("bob");
    presence.sweep(clock.now);
    ASSERT_EQ(presence.presence_of("alice")->status, presence::PresenceStatus::Offline);
    ASSERT_EQ(presence.users_in_workspace("w1").size(), 1u);
    transport.clear();

    layer.on_message(1, frame("presence_update", {{"presence", {{"activity", "editing"}}}}));

    auto alice = presence.presence_of("alice");
    EXPECT_EQ(alice->status, presence::PresenceStatus::Online);
    EXPECT_EQ(alice->activity, std::optional<std::string>("editing"));
    EXPECT_EQ(presence.users_in_workspace("w1").size(), 2u);
    EXPECT_EQ(transport.frames_of(2, "user_joined").size(), 1u);
    EXPECT_FALSE(transport.frames_of(2, "presence_update").empty());
}

TEST_F(ConnectionLayerTest, WorkspaceKeepsBroadcastingWhileAnyConnectionRemains) {
    connect(1, "alice");
    connect(2, "bob");
    layer.on_disconnect(1);
    connect(3, "carol");
    layer.on_disconnect(2);
    transport.clear();

    connect(4, "dave");
    layer.on_message(4, frame("presence_update", {{"presence", {{"activity", "reading"}}}}));

    EXPECT_EQ(transport.frames_of(3, "user_joined").size(), 1u);
    EXPECT_FALSE(transport.frames_of(3, "presence_update").empty());

    layer.on_disconnect(3);
    layer.on_disconnect(4);
    transport.clear();
    presence.add_to_workspace("erin", "w1");
    EXPECT_TRUE(transport.frames(3).empty());
    EXPECT_TRUE(transport.frames(4).empty());
}

TEST_F(ConnectionLayerTest, DeliveryFollowsTheMostRecentConnection) {
    connect(1, "alice");
    connect(2, "bob");
    const auto sid = open(1);
    open(2);
    connect(3, "alice");
    layer.on_message(3, frame("join_session", {{"sessionId", sid}}));

    layer.on_message(1, frame("cursor_update", {{"sessionId", sid}, {"cursor", {{"position", 0}}}}));
    transport.clear();
    insert(2, sid, 0, "a");
    EXPECT_EQ(transport.frames_of(1, "operation").size(), 1u);
    EXPECT_TRUE(transport.frames_of(3, "operation").empty());

    layer.on_message(3, frame("presence_update", {{"presence", {{"activity", "typing"}}}}));
    transport.clear();
    insert(2, sid, 1, "b");
    EXPECT_TRUE(transport.frames_of(1, "operation").empty());
    EXPECT_EQ(transport.frames_of(3, "operation").size(), 1u);
}

TEST_F(ConnectionLayerTest, ShutdownClosesEveryConnection) {
    connect(1, "alice");
    connect(2, "bob");

    layer.shutdown();

    auto closed = transport.closed();
    ASSERT_EQ(closed.size(), 2u);
    for (const auto& c : closed) EXPECT_EQ(c.code, 1001);
}
