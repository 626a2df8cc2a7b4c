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
#include "absl/strings/str_cat.h"
#include <nlohmann/json.hpp>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

// Walks objects and arrays, keeping the longest string. Ties keep the first
// value found.
void LongestString(nlohmann::json const& json, std::string const*& longest) {
  if (json.is_string()) {
    auto const& s = json.get_ref<std::string const&>();
    if (longest == nullptr || s.size() > longest->size()) longest = &s;
    return;
  }
  if (!json.is_structured()) return;
  for (auto const& v : json) LongestString(v, longest);
}

}  // namespace

std::string ParseJsonErrorDetail(std::string payload) {
  auto json = nlohmann::json::parse(payload, nullptr, false);
  if (json.is_discarded()) return payload;

  if (json.is_object()) {
    auto m = json.find("message");
    if (m != json.end() && m->is_string()) return m->get<std::string>();
    auto e = json.find("error");
    if (e != json.end() && e->is_string()) return e->get<std::string>();
    if (e != json.end() && e->is_object()) {
      auto em = e->find("message");
      if (em != e->end() && em->is_string()) return em->get<std::string>();
    }
  }
  std::string const* longest = nullptr;
  LongestString(json, longest);
  if (longest == nullptr) return payload;
  return *longest;
}

std::string FormatHttpError(std::string const& uri,
                            std::int32_t http_status_code,
                            std::string payload) {
  return absl::StrCat(uri, " - ", http_status_code, ": ",
                      ParseJsonErrorDetail(std::move(payload)));
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
