// Copyright 2023 Google LLC
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

#include "gcp_auth/internal/url_encode.h"
#include <gmock/gmock.h>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

TEST(UrlEncode, Unreserved) {
  EXPECT_EQ(UrlEncode("abcXYZ-019_.~!*()'"), "abcXYZ-019_.~!*()'");
  EXPECT_EQ(UrlEncode(""), "");
}

TEST(UrlEncode, Reserved) {
  EXPECT_EQ(UrlEncode("projects/p/topics/t"), "projects%2Fp%2Ftopics%2Ft");
  EXPECT_EQ(UrlEncode("a b&c=d?e#f"), "a%20b%26c%3Dd%3Fe%23f");
  EXPECT_EQ(UrlEncode("%"), "%25");
  EXPECT_EQ(UrlEncode("user@example.com"), "user%40example.com");
}

TEST(UrlEncode, NonPrintable) {
  EXPECT_EQ(UrlEncode(std::string("a\nb\x7f", 4)), "a%0Ab%7F");
  EXPECT_EQ(UrlEncode("\xc3\xa9"), "%C3%A9");
  EXPECT_EQ(UrlEncode(absl::string_view("\0", 1)), "%00");
}

}  // namespace
}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
