/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file gsn-test-codec.cpp
 * @brief The unit test for the MessagePb JSON codec (gsn-message-pb-util).
 */

#include <gtest/gtest.h>

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gsn-message-pb-util.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  // a harness init message, with a field the schema does not know
  auto init = gsn::decodeMessagePb(
      R"({"id":4,"src":"c0","dest":"n1","body":{"type":"init","msg_id":1,)"
      R"("node_id":"n1","node_ids":["n1","n2","n3"]}})");
  EXPECT_TRUE(init);
  EXPECT_TRUE("c0" == init->src());
  EXPECT_TRUE("n1" == init->dest());
  EXPECT_TRUE("init" == init->body().type());
  EXPECT_TRUE(init->body().has_msg_id());
  EXPECT_TRUE(1 == init->body().msg_id());
  EXPECT_TRUE(!init->body().has_in_reply_to());
  EXPECT_TRUE("n1" == init->body().node_id());
  EXPECT_TRUE(3 == init->body().node_ids_size());
  EXPECT_TRUE("n3" == init->body().node_ids(2));

  auto topology = gsn::decodeMessagePb(
      R"({"src":"c0","dest":"n1","body":{"type":"topology","msg_id":2,)"
      R"("topology":{"n1":["n2","n3"],"n2":["n1"],"n3":["n1"]}}})");
  EXPECT_TRUE(topology);
  EXPECT_TRUE(3 == topology->body().topology_size());
  EXPECT_TRUE(2 == topology->body().topology().at("n1").values_size());
  EXPECT_TRUE("n3" ==
              topology->body().topology().at("n1").values(1).string_value());

  EXPECT_TRUE(!gsn::decodeMessagePb("not json"));
  EXPECT_TRUE(!gsn::decodeMessagePb(R"({"src":"c0","body":)"));

  // values are compared by their canonical JSON text
  auto five = gsn::decodeMessagePb(
      R"({"src":"c1","dest":"n1","body":{"type":"broadcast","message":5}})");
  auto fivePointZero = gsn::decodeMessagePb(
      R"({"src":"c1","dest":"n1","body":{"type":"broadcast","message":5.0}})");
  EXPECT_TRUE(five);
  EXPECT_TRUE(fivePointZero);

  auto fiveValues = gsn::messageBodyValues(five->body());
  auto fivePointZeroValues = gsn::messageBodyValues(fivePointZero->body());
  EXPECT_TRUE(1 == fiveValues.size());
  EXPECT_TRUE("5" == fiveValues[0]);
  EXPECT_TRUE(fiveValues == fivePointZeroValues);

  auto mixed = gsn::decodeMessagePb(
      R"({"src":"n2","dest":"n1","body":{"type":"gossip","msg_id":9,)"
      R"("messages":["abc",{"k":[1,true]},null,2.5]}})");
  EXPECT_TRUE(mixed);

  auto mixedValues = gsn::messageBodyValues(mixed->body());
  EXPECT_TRUE(4 == mixedValues.size());
  EXPECT_TRUE("\"abc\"" == mixedValues[0]);
  EXPECT_TRUE("null" == mixedValues[2]);
  EXPECT_TRUE("2.5" == mixedValues[3]);

  // canonical text survives the way back
  EXPECT_TRUE(mixedValues[1] ==
              gsn::valuePbToValue(gsn::valueToValuePb(mixedValues[1])));

  bool exceptionCatch{};
  try {
    gsn::valueToValuePb("{not json");
  } catch (const std::runtime_error &e) {
    exceptionCatch = true;
  }

  EXPECT_TRUE(exceptionCatch);

  // a body without message carries no value
  auto read = gsn::decodeMessagePb(
      R"({"src":"c1","dest":"n1","body":{"type":"read","msg_id":3}})");
  EXPECT_TRUE(read);
  EXPECT_TRUE(gsn::messageBodyValues(read->body()).empty());

  // encode a reply
  gsn::MessagePb readOk{};
  GSN_MESSAGE_PB_SET_SRC(readOk, "n1");
  GSN_MESSAGE_PB_SET_DEST(readOk, "c1");
  GSN_MESSAGE_PB_SET_TYPE(readOk, "read_ok");
  GSN_MESSAGE_PB_SET_MSG_ID(readOk, 7);
  GSN_MESSAGE_PB_SET_IN_REPLY_TO(readOk, 3);
  gsn::setMessageBodyValues(readOk.mutable_body(), {}, true);

  auto json = gsn::encodeMessagePb(readOk);
  std::cout << json << "\n";
  EXPECT_TRUE(std::string::npos == json.find('\n'));
  EXPECT_TRUE(std::string::npos != json.find(R"("src":"n1")"));
  EXPECT_TRUE(std::string::npos != json.find(R"("dest":"c1")"));
  EXPECT_TRUE(std::string::npos != json.find(R"("type":"read_ok")"));
  EXPECT_TRUE(std::string::npos != json.find(R"("msg_id":7)"));
  EXPECT_TRUE(std::string::npos != json.find(R"("in_reply_to":3)"));
  EXPECT_TRUE(std::string::npos != json.find(R"("messages":[])"));
  EXPECT_TRUE(std::string::npos == json.find(R"("code")"));

  // one value goes to message, unless a list is asked for
  gsn::MessagePb gossip{};
  GSN_MESSAGE_PB_SET_TYPE(gossip, "gossip");
  gsn::setMessageBodyValues(gossip.mutable_body(), {"5"});
  EXPECT_TRUE(gossip.body().has_message());
  EXPECT_TRUE(!gossip.body().has_messages());

  gsn::MessagePb gossipOk{};
  GSN_MESSAGE_PB_SET_TYPE(gossipOk, "gossip_ok");
  gsn::setMessageBodyValues(gossipOk.mutable_body(), {"5"}, true);
  EXPECT_TRUE(!gossipOk.body().has_message());
  EXPECT_TRUE(1 == gossipOk.body().messages().values_size());

  gsn::MessagePb batch{};
  GSN_MESSAGE_PB_SET_TYPE(batch, "gossip");
  gsn::setMessageBodyValues(batch.mutable_body(), {"1", "\"two\"", "3"});
  EXPECT_TRUE(3 == batch.body().messages().values_size());

  auto batchJson = gsn::encodeMessagePb(batch);
  EXPECT_TRUE(std::string::npos !=
              batchJson.find(R"("messages":[1,"two",3])"));

  // errors print their code as a number
  gsn::MessagePb error{};
  GSN_MESSAGE_PB_SET_ERROR(error, gsn::Gsn_ErrorCode::kNotSupported,
                           "unsupported message type: cas");

  auto errorJson = gsn::encodeMessagePb(error);
  EXPECT_TRUE(std::string::npos != errorJson.find(R"("type":"error")"));
  EXPECT_TRUE(std::string::npos != errorJson.find(R"("code":10)"));

  auto decodedError = gsn::decodeMessagePb(errorJson);
  EXPECT_TRUE(decodedError);
  EXPECT_TRUE(10 == decodedError->body().code());
  EXPECT_TRUE("unsupported message type: cas" == decodedError->body().text());

  // integers a double can not hold exactly
  EXPECT_TRUE(!gsn::hasInexactInteger(R"({"message":9007199254740992})"));
  EXPECT_TRUE(gsn::hasInexactInteger(R"({"message":9007199254740993})"));
  EXPECT_TRUE(gsn::hasInexactInteger(R"({"message":-9007199254740993})"));
  EXPECT_TRUE(gsn::hasInexactInteger(R"({"messages":[1,18446744073709551615]})"));
  EXPECT_TRUE(gsn::hasInexactInteger(R"({"message":123456789012345678901234})"));
  EXPECT_TRUE(!gsn::hasInexactInteger(R"({"message":18014398509481984})"));
  EXPECT_TRUE(!gsn::hasInexactInteger(R"({"message":1.5e300,"msg_id":7})"));
  EXPECT_TRUE(!gsn::hasInexactInteger(R"({"message":"9007199254740993"})"));
  EXPECT_TRUE(!gsn::hasInexactInteger(R"({"text":"a \"9007199254740993\" b"})"));

  // 2^53 and 2^53 + 1 decode to the same double, hence the check above
  auto exact = gsn::decodeMessagePb(
      R"({"src":"c1","dest":"n1","body":{"type":"broadcast","msg_id":1,)"
      R"("message":9007199254740992}})");
  EXPECT_TRUE(exact);
  EXPECT_TRUE("9007199254740992" ==
              gsn::messageBodyValues(exact->body()).front());

  return RUN_ALL_TESTS();
}
