// =============================================================================
// ipc_server_test.cpp
// =============================================================================
// Unit tests for micro::IpcServer.
//
// Validates:
//   - formatTelemetry(): one envelope per broadcast kind, gate decisions
//     suppressed
//   - REQ/REP round trip through the command handler on loopback TCP
//   - A throwing handler still produces an error reply
//   - start()/stop() are idempotent
// =============================================================================

#include "micro/events/event_types.hpp"
#include "micro/network/ipc_server.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <stdexcept>
#include <string>

namespace {

constexpr const char* kCmdEndpoint = "tcp://127.0.0.1:25556";
constexpr const char* kPubEndpoint = "tcp://127.0.0.1:25557";

// Sends one request on a fresh REQ socket and returns the reply text.
std::string request(const std::string& cmd) {
  zmq::context_t ctx(1);
  zmq::socket_t req(ctx, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2'000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(kCmdEndpoint);

  req.send(zmq::buffer(cmd), zmq::send_flags::none);
  zmq::message_t reply;
  auto result = req.recv(reply, zmq::recv_flags::none);
  if (!result.has_value()) {
    return "";
  }
  return std::string(static_cast<const char*>(reply.data()), reply.size());
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Telemetry envelopes.
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, PositionClosedCarriesTradeAndBalance) {
  micro::PositionClosedEvent e;
  e.trade.position_id = 4;
  e.trade.instrument_id = "XRPUSDT";
  e.trade.realized_pnl = -0.5;
  e.trade.reason = micro::domain::CloseReason::StopLoss;
  e.balance = 99.5;

  auto text = micro::IpcServer::formatTelemetry(e);
  ASSERT_TRUE(text.has_value());

  auto j = nlohmann::json::parse(*text);
  EXPECT_EQ(j["type"], "position_closed");
  EXPECT_EQ(j["positionId"], 4);
  EXPECT_EQ(j["instrument"], "XRPUSDT");
  EXPECT_EQ(j["reason"], "StopLoss");
  EXPECT_DOUBLE_EQ(j["balanceAfter"].get<double>(), 99.5);
}

TEST(IpcServerFormatTest, RiskStateUsesStateNames) {
  micro::RiskStateChangedEvent e;
  e.previous = micro::domain::RiskState::Normal;
  e.current = micro::domain::RiskState::DayLimitReached;
  e.reason = "daily loss limit";

  auto j = nlohmann::json::parse(*micro::IpcServer::formatTelemetry(e));
  EXPECT_EQ(j["type"], "risk_state");
  EXPECT_EQ(j["previous"], "Normal");
  EXPECT_EQ(j["current"], "DayLimitReached");
  EXPECT_EQ(j["reason"], "daily loss limit");
}

TEST(IpcServerFormatTest, OpenedAndSnapshotAreTagged) {
  micro::PositionOpenedEvent opened;
  opened.position.instrument_id = "ADAUSDT";
  opened.position.direction = micro::domain::Direction::Short;
  auto j = nlohmann::json::parse(*micro::IpcServer::formatTelemetry(opened));
  EXPECT_EQ(j["type"], "position_opened");
  EXPECT_EQ(j["direction"], "Short");

  micro::SnapshotEvent snap;
  snap.snapshot.trade_count = 12;
  j = nlohmann::json::parse(*micro::IpcServer::formatTelemetry(snap));
  EXPECT_EQ(j["type"], "snapshot");
  EXPECT_EQ(j["tradeCount"], 12);
}

// -----------------------------------------------------------------------------
// 2. Gate decisions are logged, not broadcast.
// Why: Every scored candidate produces one; broadcasting them would drown
//      the trade events an operator actually watches.
// -----------------------------------------------------------------------------
TEST(IpcServerFormatTest, GateDecisionIsNotBroadcast) {
  EXPECT_FALSE(
      micro::IpcServer::formatTelemetry(micro::GateDecisionEvent{}).has_value());
}

// =============================================================================
// Live sockets
// =============================================================================

TEST(IpcServerTest, CommandRoundTrip) {
  micro::IpcServer server(
      [](const std::string& cmd) {
        nlohmann::json j;
        j["status"] = "ok";
        j["response"] = cmd == "PING" ? "PONG" : cmd;
        return j.dump();
      },
      kCmdEndpoint, kPubEndpoint);
  server.start();

  auto j = nlohmann::json::parse(request("PING"));
  EXPECT_EQ(j["status"], "ok");
  EXPECT_EQ(j["response"], "PONG");

  server.stop();
}

// -----------------------------------------------------------------------------
// 3. A handler exception must still be answered.
// Why: A REP socket that skips a reply is wedged for every later client.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, HandlerExceptionBecomesErrorReply) {
  micro::IpcServer server(
      [](const std::string&) -> std::string {
        throw std::runtime_error("boom");
      },
      kCmdEndpoint, kPubEndpoint);
  server.start();

  auto first = nlohmann::json::parse(request("STATUS"));
  EXPECT_EQ(first["status"], "error");
  EXPECT_EQ(first["response"], "boom");

  // The socket is still usable afterwards.
  auto second = nlohmann::json::parse(request("STATUS"));
  EXPECT_EQ(second["status"], "error");

  server.stop();
}

TEST(IpcServerTest, StartAndStopAreIdempotent) {
  micro::IpcServer server([](const std::string&) { return std::string("{}"); },
                          kCmdEndpoint, kPubEndpoint);
  server.start();
  EXPECT_NO_THROW(server.start());
  server.pushTelemetry(micro::SnapshotEvent{});
  server.stop();
  EXPECT_NO_THROW(server.stop());
}
