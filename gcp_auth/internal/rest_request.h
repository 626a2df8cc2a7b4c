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

#ifndef GCP_AUTH_INTERNAL_REST_REQUEST_H
#define GCP_AUTH_INTERNAL_REST_REQUEST_H

#include "gcp_auth/version.h"
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/**
 * The target and headers of an HTTP request.
 *
 * The path is either an absolute URL or relative to the endpoint of the
 * `RestClient`. Header names are stored in lower case, a header may have
 * several values.
 */
class RestRequest {
 public:
  using HttpHeaders = std::map<std::string, std::vector<std::string>>;

  RestRequest() = default;
  explicit RestRequest(std::string path) : path_(std::move(path)) {}

  std::string const& path() const { return path_; }
  HttpHeaders const& headers() const { return headers_; }

  RestRequest& SetPath(std::string path);

  /// Appends @p value to the values of @p name.
  RestRequest& AddHeader(std::string name, std::string value);
  RestRequest& AddHeader(std::pair<std::string, std::string> header) {
    return AddHeader(std::move(header.first), std::move(header.second));
  }

  /// Replaces all the values of @p name.
  RestRequest& SetHeader(std::string name, std::string value);

  /// Empty if the header is not present. The lookup ignores case.
  std::vector<std::string> GetHeader(std::string name) const;

 private:
  std::string path_;
  HttpHeaders headers_;
};

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_REST_REQUEST_H
