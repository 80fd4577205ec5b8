#include "fake_transport.hpp"

#include <arcon/session.hpp>

#include <gtest/gtest.h>

#include <set>

namespace {
  arcon::session_options fast_options() {
    arcon::session_options o;
    o.response_timeout = 50;
    return o;
  }
}

class SessionTests : public ::testing::Test {
  protected:
    fake_transport *peer;
    arcon::session *conn;

    void SetUp() override {
      peer = new fake_transport();
      conn = NULL;
    }

    void TearDown() override {
      delete conn;
    }

    void connect(const arcon::session_options &o = arcon::session_options()) {
      conn = new arcon::session(peer, o);
    }

    void connectAndAuth(const arcon::session_options &o = arcon::session_options()) {
      connect(o);
      peer->replies.push_back(fake_transport::auth_reply(arcon::id_auth));
      conn->authenticate("secret");
    }
};

TEST_F(SessionTests, ConstructorOpensTheTransport) {
  connect();
  EXPECT_EQ(1, peer->open_calls);
  EXPECT_TRUE(conn->is_connected());
  EXPECT_FALSE(conn->is_authenticated());
}

TEST(SessionOptionsTest, Defaults) {
  arcon::session_options o;
  EXPECT_EQ("127.0.0.1", o.host);
  EXPECT_EQ(27015, o.port);
  EXPECT_EQ(4096u, o.max_packet_size);
  EXPECT_EQ(arcon::encoding_ascii, o.encoding);
  EXPECT_EQ(1000, o.response_timeout);
  EXPECT_FALSE(o.multi_packet);
}

TEST_F(SessionTests, ConstructorTimesOutIfNeverOpened) {
  peer->auto_open = false;
  EXPECT_THROW(arcon::session(peer, fast_options()), arcon::timeout_error);
}

TEST_F(SessionTests, ConstructorReportsOpenError) {
  peer->auto_open = false;
  peer->events.push_back(fake_transport::event(fake_transport::ev_error, "connection refused"));
  EXPECT_THROW(arcon::session(peer, fast_options()), arcon::connection_error);
}

TEST_F(SessionTests, ConstructorRejectsBadOptions) {
  arcon::session_options o;
  o.port = 0;
  EXPECT_THROW(arcon::session(peer, o), std::invalid_argument);
}

TEST_F(SessionTests, AuthenticateSkipsMirrorPacket) {
  connect();
  peer->replies.push_back(fake_transport::auth_reply(arcon::id_auth));

  conn->authenticate("secret");

  EXPECT_TRUE(conn->is_authenticated());
  ASSERT_EQ(1u, peer->sent.size());
  EXPECT_EQ(arcon::auth_request, peer->sent[0].type);
  EXPECT_EQ(arcon::id_auth, peer->sent[0].id);
  EXPECT_EQ("secret", peer->sent[0].body);
}

TEST_F(SessionTests, AuthenticateDeniedDisconnects) {
  connect();
  peer->replies.push_back(fake_transport::auth_reply(arcon::id_auth_denied));

  EXPECT_THROW(conn->authenticate("wrong"), arcon::bad_password);
  EXPECT_FALSE(conn->is_connected());
  EXPECT_FALSE(conn->is_authenticated());
  EXPECT_EQ(1, peer->close_calls);
}

TEST_F(SessionTests, AuthenticateDeniedEvenIfCloseFails) {
  connect();
  peer->close_error = "close failed";
  peer->replies.push_back(fake_transport::auth_reply(arcon::id_auth_denied));

  EXPECT_THROW(conn->authenticate("wrong"), arcon::bad_password);
  EXPECT_FALSE(conn->is_connected());
}

TEST_F(SessionTests, AuthenticateTwiceSendsNothing) {
  connectAndAuth();
  size_t sent = peer->sent.size();

  EXPECT_THROW(conn->authenticate("secret"), arcon::already_authenticated);
  EXPECT_EQ(sent, peer->sent.size());
  EXPECT_TRUE(conn->is_authenticated());
}

TEST_F(SessionTests, AuthenticateTransportErrorKeepsState) {
  connect();
  fake_transport::batch b;
  b.push_back(fake_transport::event(fake_transport::ev_error, "reset by peer"));
  peer->replies.push_back(b);

  EXPECT_THROW(conn->authenticate("secret"), arcon::network_error);
  EXPECT_TRUE(conn->is_connected());
  EXPECT_FALSE(conn->is_authenticated());
}

TEST_F(SessionTests, ExecuteReturnsReply) {
  connectAndAuth();
  fake_transport::batch b;
  b.push_back(fake_transport::message(arcon::exec_response, 1, "ok\n"));
  peer->replies.push_back(b);

  EXPECT_EQ("ok\n", conn->execute("status"));

  const arcon::packet &p = peer->sent.back();
  EXPECT_EQ(arcon::exec_request, p.type);
  EXPECT_EQ(1, p.id);
  EXPECT_EQ("status", p.body);
}

TEST_F(SessionTests, ExecuteIgnoresOtherIds) {
  connectAndAuth();
  fake_transport::batch b;
  b.push_back(fake_transport::message(arcon::auth_response, arcon::id_auth, ""));
  b.push_back(fake_transport::message(arcon::exec_response, 77, "not ours"));
  b.push_back(fake_transport::message(arcon::exec_response, 1, "ours"));
  peer->replies.push_back(b);

  EXPECT_EQ("ours", conn->execute("status"));
}

TEST_F(SessionTests, ExecuteAcceptsEmptyReply) {
  connectAndAuth();
  fake_transport::batch b;
  b.push_back(fake_transport::message(arcon::exec_response, 1, ""));
  peer->replies.push_back(b);

  EXPECT_EQ("", conn->execute("sv_cheats 0"));
}

TEST_F(SessionTests, ExecuteUnmatchedReplyTimesOut) {
  connectAndAuth(fast_options());
  fake_transport::batch b;
  b.push_back(fake_transport::message(arcon::exec_response, 99, "someone else's"));
  peer->replies.push_back(b);

  EXPECT_THROW(conn->execute("status"), arcon::timeout_error);
  EXPECT_TRUE(conn->is_authenticated());
}

TEST_F(SessionTests, ExecuteBeforeAuthenticate) {
  connect();
  EXPECT_THROW(conn->execute("status"), arcon::not_authorised);
  EXPECT_TRUE(peer->sent.empty());
}

TEST_F(SessionTests, ExecuteAfterDisconnect) {
  connectAndAuth();
  conn->disconnect();
  EXPECT_THROW(conn->execute("status"), arcon::not_connected);
}

TEST_F(SessionTests, ExecuteWhenNotWritable) {
  connectAndAuth();
  peer->can_write = false;
  size_t sent = peer->sent.size();

  EXPECT_THROW(conn->execute("status"), arcon::send_unavailable);
  EXPECT_EQ(sent, peer->sent.size());
}

TEST_F(SessionTests, ExecuteTooLargeSendsNothing) {
  arcon::session_options o;
  o.max_packet_size = 20;
  connectAndAuth(o);
  size_t sent = peer->sent.size();

  // 12 byte header, 7 byte body and two nulls
  EXPECT_THROW(conn->execute("status2"), arcon::packet_too_large);
  EXPECT_EQ(sent, peer->sent.size());
}

TEST_F(SessionTests, ExecuteExactlyMaxSizeIsSent) {
  arcon::session_options o;
  o.max_packet_size = 20;
  connectAndAuth(o);
  fake_transport::batch b;
  b.push_back(fake_transport::message(arcon::exec_response, 1, "ok"));
  peer->replies.push_back(b);

  EXPECT_EQ("ok", conn->execute("status"));
}

TEST_F(SessionTests, ZeroMaxSizeDisablesCheck) {
  arcon::session_options o;
  o.max_packet_size = 0;
  connectAndAuth(o);
  peer->echo = true;

  std::string big(5000, 'x');
  EXPECT_EQ("echo:" + big, conn->execute(big));
}

TEST_F(SessionTests, TimeoutFreesTheSlot) {
  connectAndAuth(fast_options());

  EXPECT_THROW(conn->execute("status"), arcon::timeout_error);

  peer->echo = true;
  EXPECT_EQ("echo:status", conn->execute("status"));
}

TEST_F(SessionTests, RemoteCloseFailsRequest) {
  connectAndAuth();
  fake_transport::batch b;
  b.push_back(fake_transport::event(fake_transport::ev_close));
  peer->replies.push_back(b);

  EXPECT_THROW(conn->execute("quit"), arcon::connection_closed);
  EXPECT_FALSE(conn->is_connected());
  EXPECT_FALSE(conn->is_authenticated());
  EXPECT_THROW(conn->execute("status"), arcon::not_connected);
}

TEST_F(SessionTests, TransportErrorKeepsFlags) {
  connectAndAuth();
  fake_transport::batch b;
  b.push_back(fake_transport::event(fake_transport::ev_error, "recv() failed"));
  peer->replies.push_back(b);

  EXPECT_THROW(conn->execute("status"), arcon::network_error);
  EXPECT_TRUE(conn->is_connected());
  EXPECT_TRUE(conn->is_authenticated());
}

TEST_F(SessionTests, MalformedPacketIsProtocolError) {
  connectAndAuth();
  fake_transport::batch b;
  b.push_back(fake_transport::event(fake_transport::ev_message, std::string("\x02\x00", 2)));
  peer->replies.push_back(b);

  EXPECT_THROW(conn->execute("status"), arcon::proto_error);
}

TEST_F(SessionTests, MultiPacketReplyIsReassembled) {
  arcon::session_options o;
  o.multi_packet = true;
  connectAndAuth(o);

  fake_transport::batch fragments;
  fragments.push_back(fake_transport::message(arcon::exec_response, 1, "hostname: test\n"));
  fragments.push_back(fake_transport::message(arcon::exec_response, 1, "players : 32\n"));
  peer->replies.push_back(fragments);
  fake_transport::batch term;
  term.push_back(fake_transport::message(arcon::exec_response, arcon::id_term + 1, ""));
  peer->replies.push_back(term);

  EXPECT_EQ("hostname: test\nplayers : 32\n", conn->execute("status"));

  const arcon::packet &t = peer->sent.back();
  EXPECT_EQ(arcon::exec_response, t.type);
  EXPECT_EQ(arcon::id_term + 1, t.id);
  EXPECT_EQ("", t.body);
}

TEST_F(SessionTests, MultiPacketIgnoresEarlierTerminators) {
  arcon::session_options o;
  o.multi_packet = true;
  connectAndAuth(o);

  // the server answers a terminator with an empty mirror and then 00 01 00 00
  fake_transport::batch first;
  first.push_back(fake_transport::message(arcon::exec_response, 1, "first\n"));
  peer->replies.push_back(first);
  fake_transport::batch first_term;
  first_term.push_back(fake_transport::message(arcon::exec_response, arcon::id_term + 1, ""));
  first_term.push_back(fake_transport::message(arcon::exec_response, arcon::id_term + 1,
                                               std::string("\x00\x01\x00\x00", 4)));
  peer->replies.push_back(first_term);

  fake_transport::batch second;
  second.push_back(fake_transport::message(arcon::exec_response, 2, "second\n"));
  peer->replies.push_back(second);
  fake_transport::batch second_term;
  second_term.push_back(fake_transport::message(arcon::exec_response, arcon::id_term + 2, ""));
  peer->replies.push_back(second_term);

  EXPECT_EQ("first\n", conn->execute("status"));
  EXPECT_EQ("second\n", conn->execute("status"));
  EXPECT_EQ(arcon::id_term + 2, peer->sent.back().id);
}

TEST_F(SessionTests, MultiPacketFragmentAfterTerminatorIsDropped) {
  arcon::session_options o;
  o.multi_packet = true;
  connectAndAuth(o);

  fake_transport::batch first;
  first.push_back(fake_transport::message(arcon::exec_response, 1, "first\n"));
  peer->replies.push_back(first);
  fake_transport::batch first_term;
  first_term.push_back(fake_transport::message(arcon::exec_response, arcon::id_term + 1, ""));
  first_term.push_back(fake_transport::message(arcon::exec_response, 1, "late\n"));
  peer->replies.push_back(first_term);

  fake_transport::batch second;
  second.push_back(fake_transport::message(arcon::exec_response, 2, "second\n"));
  peer->replies.push_back(second);
  fake_transport::batch second_term;
  second_term.push_back(fake_transport::message(arcon::exec_response, arcon::id_term + 2, ""));
  peer->replies.push_back(second_term);

  EXPECT_EQ("first\n", conn->execute("status"));
  EXPECT_EQ("second\n", conn->execute("status"));
}

TEST_F(SessionTests, RequestIdsCycleWithoutRepeating) {
  connectAndAuth();
  peer->echo = true;

  std::set<int32_t> seen;
  int32_t last = 0;
  for (int i = 0; i < 300; ++i) {
    conn->execute("status");
    int32_t id = peer->sent.back().id;
    EXPECT_GE(id, 1);
    EXPECT_LE(id, 255);
    EXPECT_NE(last, id);
    EXPECT_NE(arcon::id_auth, id);
    last = id;
    seen.insert(id);
  }
  EXPECT_EQ(255u, seen.size());
}

TEST_F(SessionTests, DisconnectWaitsForClose) {
  connectAndAuth();
  conn->disconnect();

  EXPECT_FALSE(conn->is_connected());
  EXPECT_FALSE(conn->is_authenticated());
  EXPECT_EQ(1, peer->close_calls);

  // already closed
  conn->disconnect();
  EXPECT_EQ(1, peer->close_calls);
}

TEST_F(SessionTests, DisconnectReportsTransportError) {
  connectAndAuth();
  peer->close_error = "close() failed: Bad file descriptor";

  EXPECT_THROW(conn->disconnect(), arcon::network_error);
  EXPECT_FALSE(conn->is_connected());
}

TEST_F(SessionTests, AuthenticateAfterDisconnectFails) {
  connectAndAuth();
  conn->disconnect();
  EXPECT_THROW(conn->authenticate("secret"), arcon::send_unavailable);
}

//! Calls back into the session while a request is waiting.
class reentrant_transport : public fake_transport {
  public:
    arcon::session *conn;
    bool rejected;

    reentrant_transport() : conn(NULL), rejected(false) {}

    bool poll(long timeout_msecs) {
      if (conn != NULL && ! events.empty() && events.front().kind == ev_message) {
        try {
          conn->execute("nested");
        }
        catch (arcon::request_pending &) {
          rejected = true;
        }
        conn = NULL;
      }
      return fake_transport::poll(timeout_msecs);
    }
};

TEST(SessionReentryTest, SecondRequestIsRejected) {
  reentrant_transport *peer = new reentrant_transport();
  arcon::session conn(peer);
  peer->replies.push_back(fake_transport::auth_reply(arcon::id_auth));
  conn.authenticate("secret");

  fake_transport::batch b;
  b.push_back(fake_transport::message(arcon::exec_response, 1, "first"));
  peer->replies.push_back(b);
  peer->conn = &conn;

  EXPECT_EQ("first", conn.execute("status"));
  EXPECT_TRUE(peer->rejected);
}
