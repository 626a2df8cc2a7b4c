// Copyright 2022 Google LLC
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

#include "gcp_auth/internal/rest_parse_json_error.h"
#include <gmock/gmock.h>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

TEST(ParseJsonErrorDetail, TopLevelMessage) {
  EXPECT_EQ(ParseJsonErrorDetail(
                R"js({"message": "the-message", "error": "the-error"})js"),
            "the-message");
}

TEST(ParseJsonErrorDetail, ErrorString) {
  EXPECT_EQ(ParseJsonErrorDetail(
                R"js({"error": "invalid_grant",
                      "error_description": "a much longer description"})js"),
            "invalid_grant");
}

TEST(ParseJsonErrorDetail, ErrorObject) {
  EXPECT_EQ(ParseJsonErrorDetail(
                R"js({"error": {"code": 403, "message": "denied"}})js"),
            "denied");
}

TEST(ParseJsonErrorDetail, LongestString) {
  EXPECT_EQ(ParseJsonErrorDetail(
                R"js({"a": ["short", {"b": "the longest value"}], "c": 7})js"),
            "the longest value");
}

TEST(ParseJsonErrorDetail, NotJson) {
  EXPECT_EQ(ParseJsonErrorDetail("Service Unavailable"), "Service Unavailable");
  EXPECT_EQ(ParseJsonErrorDetail(""), "");
}

TEST(ParseJsonErrorDetail, JsonWithoutStrings) {
  EXPECT_EQ(ParseJsonErrorDetail(R"js({"code": 503})js"), R"js({"code": 503})js");
}

TEST(FormatHttpError, Format) {
  EXPECT_EQ(FormatHttpError("https://test.invalid/token", 503,
                            R"js({"error": "backend"})js"),
            "https://test.invalid/token - 503: backend");
}

}  // namespace
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
