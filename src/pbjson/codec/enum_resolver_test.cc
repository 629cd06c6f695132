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

#include "src/pbjson/codec/enum_resolver.h"

#include "include/pbjson/codec/errors.h"
#include "src/pbjson/codec/testdata/types.pb.h"

#include "gtest/gtest.h"

namespace pbjson {
namespace codec {
using ::google::protobuf::Descriptor;
using ::google::protobuf::FieldDescriptor;
using testdata::Node;
using testdata::Placement;

namespace {

class EnumResolverTest : public ::testing::Test {
 protected:
  const Descriptor* placement_ = Placement::descriptor();
  const FieldDescriptor* tier_ = placement_->FindFieldByName("tier");
  const FieldDescriptor* zone_ = placement_->FindFieldByName("zone");
};

TEST_F(EnumResolverTest, NameInFieldEnum) {
  EnumResolver resolver(EnumScope::kMessageType);
  auto number = resolver.ResolveName("TIER_SILVER", tier_, placement_);
  ASSERT_TRUE(number.ok()) << number.status();
  EXPECT_EQ(Placement::TIER_SILVER, *number);

  const Descriptor* node = Node::descriptor();
  number = resolver.ResolveName("AVAILABLE", node->FindFieldByName("state"),
                                node);
  ASSERT_TRUE(number.ok());
  EXPECT_EQ(Node::AVAILABLE, *number);
}

TEST_F(EnumResolverTest, UnknownName) {
  EnumResolver resolver(EnumScope::kMessageType);
  auto number = resolver.ResolveName("WROONG", tier_, placement_);
  ASSERT_FALSE(number.ok());
  EXPECT_TRUE(IsEnumValueNotFound(number.status()));
  EXPECT_NE(std::string::npos,
            std::string(number.status().message()).find("WROONG"));
}

// Names are looked up across every enum nested in the message type, so a
// sibling enum's symbol is accepted when its number exists in the field's
// enum.
TEST_F(EnumResolverTest, SiblingEnumSymbol) {
  EnumResolver resolver(EnumScope::kMessageType);
  auto number = resolver.ResolveName("PRIORITY_LOW", tier_, placement_);
  ASSERT_TRUE(number.ok()) << number.status();
  EXPECT_EQ(Placement::TIER_BRONZE, *number);

  number = resolver.ResolveName("PRIORITY_HIGH", tier_, placement_);
  ASSERT_FALSE(number.ok());
  EXPECT_TRUE(IsEnumValueNotFound(number.status()));
}

TEST_F(EnumResolverTest, TopLevelEnumNeedsFieldScope) {
  EnumResolver message_scope(EnumScope::kMessageType);
  auto number = message_scope.ResolveName("ZONE_EU", zone_, placement_);
  EXPECT_TRUE(IsEnumValueNotFound(number.status()));

  EnumResolver field_scope(EnumScope::kFieldEnumType);
  number = field_scope.ResolveName("ZONE_EU", zone_, placement_);
  ASSERT_TRUE(number.ok()) << number.status();
  EXPECT_EQ(testdata::ZONE_EU, *number);

  number = field_scope.ResolveName("PRIORITY_LOW", tier_, placement_);
  EXPECT_TRUE(IsEnumValueNotFound(number.status()));
}

TEST_F(EnumResolverTest, NotAnEnumField) {
  EnumResolver resolver(EnumScope::kMessageType);
  const FieldDescriptor* nodeid = Node::descriptor()->FindFieldByName("nodeid");
  EXPECT_TRUE(IsEnumValueNotFound(
      resolver.ResolveName("PLANNED", nodeid, Node::descriptor()).status()));
  EXPECT_TRUE(
      IsEnumValueNotFound(EnumResolver::ResolveNumber(0, nodeid).status()));
}

TEST_F(EnumResolverTest, ResolveNumber) {
  auto name = EnumResolver::ResolveNumber(1, zone_);
  ASSERT_TRUE(name.ok());
  EXPECT_EQ("ZONE_EU", *name);

  name = EnumResolver::ResolveNumber(7, tier_);
  ASSERT_FALSE(name.ok());
  EXPECT_TRUE(IsEnumValueNotFound(name.status()));
  EXPECT_EQ(absl::StatusCode::kNotFound, name.status().code());
}

}  // namespace
}  // namespace codec
}  // namespace pbjson
