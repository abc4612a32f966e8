#include "network/protocol.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace wallet;
using namespace wallet::network::protocol;

TEST(MessageFramerTest, FramesWithHexLengthHeader) {
  std::string framed = MessageFramer::frameMessage("hello");
  EXPECT_EQ(framed, "00000005hello");

  std::string big(300, 'x');
  EXPECT_EQ(MessageFramer::frameMessage(big).substr(0, 8), "0000012c");
}

TEST(MessageFramerTest, PopWaitsForCompleteMessage) {
  std::string buffer = "0000000";
  EXPECT_FALSE(MessageFramer::popMessage(buffer).has_value());

  buffer += "5hel";
  EXPECT_FALSE(MessageFramer::popMessage(buffer).has_value());
  EXPECT_EQ(buffer, "00000005hel");

  buffer += "lo";
  auto message = MessageFramer::popMessage(buffer);
  ASSERT_TRUE(message.has_value());
  EXPECT_EQ(*message, "hello");
  EXPECT_TRUE(buffer.empty());
}

TEST(MessageFramerTest, PopSplitsBackToBackMessages) {
  std::string buffer = MessageFramer::frameMessage("{\"a\":1}") +
                       MessageFramer::frameMessage("") +
                       MessageFramer::frameMessage("tail") + "0000";

  EXPECT_EQ(MessageFramer::popMessage(buffer), std::optional<std::string>("{\"a\":1}"));
  EXPECT_EQ(MessageFramer::popMessage(buffer), std::optional<std::string>(""));
  EXPECT_EQ(MessageFramer::popMessage(buffer), std::optional<std::string>("tail"));
  EXPECT_FALSE(MessageFramer::popMessage(buffer).has_value());
  EXPECT_EQ(buffer, "0000");
}

TEST(MessageFramerTest, CorruptHeaderThrows) {
  std::string buffer = "0000zz05hello";
  EXPECT_THROW(MessageFramer::popMessage(buffer), std::runtime_error);

  std::string oversized = "ffffffff";
  EXPECT_THROW(MessageFramer::popMessage(oversized), std::runtime_error);
}

TEST(ProtocolTest, RequestRoundTripKeepsPayload) {
  Request sent = Request::transfer(7, "session_abc", "bob", "12.50");
  Request parsed = deserializeRequest(serializeRequest(sent));

  EXPECT_EQ(parsed.type, MessageType::TRANSFER);
  EXPECT_EQ(parsed.request_id, 7);
  EXPECT_EQ(parsed.session_token, "session_abc");
  EXPECT_EQ(parsed.payload["recipient"], "bob");
  EXPECT_EQ(parsed.payload["amount"], "12.50");
}

TEST(ProtocolTest, TypesAndStatusesTravelAsNames) {
  auto j = nlohmann::json::parse(serializeRequest(Request::subscribeBalance(1, "t")));
  EXPECT_EQ(j["type"], "SUBSCRIBE_BALANCE");

  auto r = nlohmann::json::parse(
      serializeResponse(Response::error(Status::INSUFFICIENT_FUNDS, "Insufficient funds", 3)));
  EXPECT_EQ(r["status"], "INSUFFICIENT_FUNDS");
  EXPECT_EQ(r["push"], false);

  EXPECT_EQ(statusFromErrorKind(ErrorKind::LOG_WRITE_FAILED), Status::LOG_WRITE_FAILED);
  EXPECT_EQ(statusFromString("TIMEOUT"), Status::TIMEOUT);
  EXPECT_THROW(statusFromString("NOPE"), std::invalid_argument);
  EXPECT_THROW(messageTypeFromString("WITHDRAW"), std::invalid_argument);
}

TEST(ProtocolTest, FromResultMapsErrorKinds) {
  Response ok = Response::fromResult(OperationResult::success("Deposited"), 1);
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ(ok.message, "Deposited");

  Response failed =
      Response::fromResult(OperationResult::failure(ErrorKind::SELF_TRANSFER_NOT_ALLOWED), 2);
  EXPECT_EQ(failed.status, Status::SELF_TRANSFER_NOT_ALLOWED);
  EXPECT_EQ(failed.request_id, 2);
  EXPECT_FALSE(failed.message.empty());
}

TEST(ProtocolTest, PushResponsesAreMarked) {
  AccountBalance balance;
  balance.account_id = "alice";
  balance.amount = 12345;

  Response push = deserializeResponse(serializeResponse(Response::balanceUpdate(9, balance)));
  EXPECT_TRUE(push.push);
  EXPECT_TRUE(push.ok());
  EXPECT_EQ(push.payload["subscription_id"], 9u);
  EXPECT_EQ(push.payload["balance"], "123.45");

  Response error = Response::streamError(9, ErrorKind::TRANSIENT_STORE_ERROR, "store down");
  EXPECT_TRUE(error.push);
  EXPECT_EQ(error.status, Status::TRANSIENT_STORE_ERROR);

  EXPECT_FALSE(Response::subscribed(9, 4).push);
}

TEST(ProtocolTest, RecordAmountsTravelAsDecimalText) {
  TransactionRecord record;
  record.id = "abc";
  record.account_id = "alice";
  record.kind = TransactionKind::TRANSFER_SENT;
  record.amount = 1250;
  record.counterparty = "bob";
  record.description = "Transfer sent to bob";
  record.timestamp = 1700000000000;
  record.sequence = 4;

  nlohmann::json wire = recordToWire(record);
  EXPECT_EQ(wire["amount"], "12.50");

  TransactionRecord back = recordFromWire(wire);
  EXPECT_EQ(back.amount, 1250);
  EXPECT_EQ(back.kind, TransactionKind::TRANSFER_SENT);
  EXPECT_EQ(back.counterparty, std::optional<AccountId>("bob"));
  EXPECT_EQ(back.timestamp, std::optional<Timestamp>(1700000000000));

  wire["amount"] = "twelve";
  EXPECT_THROW(recordFromWire(wire), std::invalid_argument);
}

TEST(ProtocolTest, BalanceResultUsesDecimalText) {
  Response resp = Response::balanceResult("alice", 100, 5);
  EXPECT_EQ(resp.payload["balance"], "1.00");
  EXPECT_EQ(resp.payload["account_id"], "alice");
}

TEST(ProtocolTest, MalformedInputThrowsInvalidArgument) {
  EXPECT_THROW(deserializeRequest("not json"), std::invalid_argument);
  EXPECT_THROW(deserializeRequest("{\"request_id\": 1}"), std::invalid_argument);
  EXPECT_THROW(deserializeRequest("{\"type\": \"PAY\"}"), std::invalid_argument);
  EXPECT_THROW(deserializeResponse("[1,2,3]"), std::invalid_argument);
}
