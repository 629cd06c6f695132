/* Copyright 2019 Istio Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "src/pbjson/codec/message_encoder.h"

#include "include/pbjson/codec/errors.h"
#include "src/pbjson/codec/testdata/beacon.pb.h"
#include "src/pbjson/codec/testdata/types.pb.h"

#include <cmath>
#include <limits>

#include "gtest/gtest.h"

namespace pbjson {
namespace codec {
using json::JsonObject;
using testdata::Batch;
using testdata::Beacon;
using testdata::Envelope;
using testdata::Measured;
using testdata::Node;
using testdata::Notes;
using testdata::Placement;
using testdata::Scalars;
using testdata::Tree;

namespace {

JsonObject Encode(const ::google::protobuf::Message& message) {
  auto status_or_tree = EncodeMessage(message);
  EXPECT_TRUE(status_or_tree.ok()) << status_or_tree.status();
  return status_or_tree.ok() ? *status_or_tree : JsonObject();
}

std::string Dump(const ::google::protobuf::Message& message) {
  return Encode(message).dump();
}

TEST(MessageEncoderTest, Node) {
  Node node;
  node.set_state(Node::AVAILABLE);
  node.set_nodeid("host1");
  EXPECT_EQ(R"({"state":"AVAILABLE","nodeid":"host1"})", Dump(node));
}

TEST(MessageEncoderTest, UnsetFieldsUseDefaults) {
  Node node;
  node.set_nodeid("host1");
  EXPECT_EQ(R"({"state":"PLANNED","nodeid":"host1"})", Dump(node));

  EXPECT_EQ(R"({"notes":[]})", Dump(Notes()));
}

TEST(MessageEncoderTest, FieldsFollowDeclarationOrder) {
  Node node;
  node.set_nodeid("host1");
  node.set_state(Node::RETIRED);
  JsonObject tree = Encode(node);
  ASSERT_EQ(2u, tree.size());
  EXPECT_EQ("state", tree.begin().key());
}

TEST(MessageEncoderTest, Repeated) {
  Notes notes;
  notes.add_notes("note1");
  notes.add_notes("note2");
  EXPECT_EQ(R"({"notes":["note1","note2"]})", Dump(notes));

  Placement placement;
  placement.add_history(Placement::TIER_SILVER);
  placement.add_history(Placement::TIER_BRONZE);
  JsonObject tree = Encode(placement);
  EXPECT_EQ(JsonObject::parse(R"(["TIER_SILVER","TIER_BRONZE"])"),
            tree["history"]);
  EXPECT_EQ("ZONE_UNKNOWN", tree["zone"]);
}

TEST(MessageEncoderTest, Scalars) {
  Scalars scalars;
  scalars.set_flag(true);
  scalars.set_ratio(0.5f);
  scalars.set_i32(-12);
  scalars.set_i64(int64_t{1} << 40);
  scalars.set_u32(4000000000u);
  scalars.set_u64(18446744073709551615ull);
  scalars.set_label("x");
  scalars.add_counts(3);
  scalars.add_switches(false);

  JsonObject tree = Encode(scalars);
  EXPECT_EQ(true, tree["flag"]);
  EXPECT_FLOAT_EQ(0.5f, tree["ratio"].get<float>());
  EXPECT_EQ(-12, tree["i32"]);
  EXPECT_EQ(int64_t{1} << 40, tree["i64"]);
  EXPECT_EQ(4000000000u, tree["u32"]);
  EXPECT_EQ(18446744073709551615ull, tree["u64"].get<uint64_t>());
  EXPECT_EQ("x", tree["label"]);
  EXPECT_EQ(JsonObject::parse("[3]"), tree["counts"]);
  EXPECT_EQ(JsonObject::parse("[false]"), tree["switches"]);
}

TEST(MessageEncoderTest, EmbeddedMessage) {
  Envelope envelope;
  EXPECT_EQ(R"({"testmessage":{"test":"test"}})", Dump(envelope));

  envelope.mutable_testmessage()->set_test("other");
  EXPECT_EQ(R"({"testmessage":{"test":"other"}})", Dump(envelope));

  Batch batch;
  batch.add_items()->set_test("a");
  batch.add_items();
  batch.set_owner("ops");
  EXPECT_EQ(R"({"items":[{"test":"a"},{"test":"test"}],"owner":"ops"})",
            Dump(batch));
}

TEST(MessageEncoderTest, StaleEnumNumber) {
  Beacon beacon;
  beacon.set_color(static_cast<Beacon::Color>(20));
  auto status_or_tree = EncodeMessage(beacon);
  ASSERT_FALSE(status_or_tree.ok());
  EXPECT_TRUE(IsEnumValueNotFound(status_or_tree.status()));

  beacon.set_color(Beacon::RED);
  beacon.add_trail(Beacon::GREEN);
  beacon.add_trail(static_cast<Beacon::Color>(-1));
  EXPECT_TRUE(IsEnumValueNotFound(EncodeMessage(beacon).status()));
}

TEST(MessageEncoderTest, Proto3Beacon) {
  Beacon beacon;
  beacon.set_color(Beacon::GREEN);
  beacon.add_trail(Beacon::RED);
  EXPECT_EQ(R"({"color":"GREEN","trail":["RED"],"name":""})", Dump(beacon));
}

TEST(MessageEncoderTest, UnsupportedFieldType) {
  Measured measured;
  auto status_or_tree = EncodeMessage(measured);
  ASSERT_FALSE(status_or_tree.ok());
  EXPECT_TRUE(IsUnsupportedFieldType(status_or_tree.status()));
  EXPECT_NE(std::string::npos,
            std::string(status_or_tree.status().message()).find("weight"));
}

TEST(MessageEncoderTest, RecursiveTypeHitsDepthLimit) {
  Tree tree;
  tree.set_label("root");
  auto status_or_tree = EncodeMessage(tree);
  ASSERT_FALSE(status_or_tree.ok());
  EXPECT_TRUE(IsValueConversionError(status_or_tree.status()));
  EXPECT_EQ(absl::StatusCode::kOutOfRange, status_or_tree.status().code());
  EXPECT_NE(std::string::npos,
            std::string(status_or_tree.status().message())
                .find("pbjson.testdata.Tree"));

  tree.mutable_child()->mutable_child()->set_label("leaf");
  EXPECT_FALSE(EncodeMessage(tree, 3).ok());
}

TEST(MessageEncoderTest, DepthLimitCountsTopLevel) {
  Envelope envelope;
  EXPECT_FALSE(EncodeMessage(envelope, 0).ok());
  EXPECT_FALSE(EncodeMessage(envelope, 1).ok());
  EXPECT_EQ(R"({"testmessage":{"test":"test"}})",
            EncodeMessage(envelope, 2)->dump());
  EXPECT_EQ(R"({"notes":[]})", EncodeMessage(Notes(), 1)->dump());
}

TEST(MessageEncoderTest, NonFiniteFloats) {
  Scalars scalars;
  scalars.set_ratio(std::numeric_limits<float>::infinity());
  scalars.add_counts(1);
  JsonObject tree = Encode(scalars);
  EXPECT_EQ("Infinity", tree["ratio"]);

  scalars.set_ratio(-std::numeric_limits<float>::infinity());
  EXPECT_EQ("-Infinity", Encode(scalars)["ratio"]);

  scalars.set_ratio(std::nanf(""));
  EXPECT_EQ("NaN", Encode(scalars)["ratio"]);
}

}  // namespace
}  // namespace codec
}  // namespace pbjson
