// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "gcp_auth/scopes.h"
#include <gmock/gmock.h>
#include <sstream>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ::testing::ElementsAre;

TEST(Scopes, CanonicalOrder) {
  Scopes s{scopes::kPubSub, scopes::kBigQuery, scopes::kPubSub};
  EXPECT_EQ(s.size(), 2U);
  EXPECT_THAT(s.AsVector(), ElementsAre(scopes::kBigQuery, scopes::kPubSub));
  EXPECT_EQ(s.Encode(), std::string(scopes::kBigQuery) + " " +
                            std::string(scopes::kPubSub));
}

TEST(Scopes, EqualityIsCanonical) {
  Scopes a{"b", "a"};
  Scopes b{"a", "b", "a"};
  EXPECT_EQ(a, b);
  EXPECT_NE(a, Scopes{"a"});
}

TEST(Scopes, InsertIgnoresEmpty) {
  Scopes s;
  EXPECT_TRUE(s.empty());
  s.Insert("");
  EXPECT_TRUE(s.empty());
  s.Insert("x");
  s.Insert("x");
  EXPECT_EQ(s.size(), 1U);
  Scopes with_empty{"", "y"};
  EXPECT_EQ(with_empty.size(), 1U);
}

TEST(Scopes, Parse) {
  auto s = Scopes::Parse("  c a  b ");
  EXPECT_THAT(s.AsVector(), ElementsAre("a", "b", "c"));
  EXPECT_TRUE(Scopes::Parse("").empty());
  EXPECT_TRUE(Scopes::Parse("   ").empty());
}

TEST(Scopes, EncodeParseIsStable) {
  for (auto const& s : {Scopes{}, Scopes{scopes::kCloudPlatform},
                        Scopes{"z", "y", "x"}, Scopes{" a", "a", "b\t"},
                        Scopes{"a b", " c  "},
                        Scopes{scopes::kDevstorageReadOnly,
                               scopes::kDevstorageReadWrite,
                               scopes::kDevstorageFullControl}}) {
    auto const encoded = s.Encode();
    EXPECT_EQ(Scopes::Parse(encoded).Encode(), encoded);
    EXPECT_EQ(Scopes::Parse(encoded), s);
  }
}

TEST(Scopes, InsertStripsWhitespace) {
  Scopes s;
  s.Insert(" a");
  s.Insert("a");
  s.Insert("b c\n");
  s.Insert(" \t ");
  EXPECT_THAT(s.AsVector(), ElementsAre("a", "b", "c"));
  EXPECT_EQ(s.Encode(), "a b c");
}

TEST(Scopes, WithScopes) {
  auto s = Scopes::WithScopes(Scopes{"a", "b"}, Scopes{"b", "c"});
  EXPECT_THAT(s.AsVector(), ElementsAre("a", "b", "c"));
}

TEST(Scopes, Streaming) {
  std::ostringstream os;
  os << Scopes{"b", "a"};
  EXPECT_EQ(os.str(), "[a b]");
}

}  // namespace
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
