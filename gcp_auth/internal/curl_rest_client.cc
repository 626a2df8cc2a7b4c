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

#include "gcp_auth/internal/curl_rest_client.h"
#include "gcp_auth/auth_options.h"
#include "gcp_auth/log.h"
#include "absl/memory/memory.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

class CurlRestResponse : public RestResponse {
 public:
  CurlRestResponse(HttpStatusCode status_code, std::string payload)
      : status_code_(status_code), payload_(std::move(payload)) {}
  ~CurlRestResponse() override = default;

  HttpStatusCode StatusCode() const override { return status_code_; }
  std::string ExtractPayload() && override { return std::move(payload_); }

 private:
  HttpStatusCode status_code_;
  std::string payload_;
};

extern "C" std::size_t RestWriteCallback(char* ptr, std::size_t size,
                                         std::size_t nmemb, void* userdata) {
  auto* buffer = static_cast<std::string*>(userdata);
  buffer->append(ptr, size * nmemb);
  return size * nmemb;
}

}  // namespace

CurlRestClient::CurlRestClient(std::string endpoint_address, Options options)
    : endpoint_address_(std::move(endpoint_address)),
      options_(std::move(options)) {}

// Relative paths are resolved against the endpoint given to the constructor.
std::string CurlRestClient::BuildUrl(RestRequest const& request) const {
  auto const& path = request.path();
  if (absl::StartsWith(path, "http://") || absl::StartsWith(path, "https://")) {
    return path;
  }
  if (endpoint_address_.empty()) return path;
  auto const endpoint_slash = absl::EndsWith(endpoint_address_, "/");
  auto const path_slash = absl::StartsWith(path, "/");
  if (endpoint_slash && path_slash) {
    return absl::StrCat(endpoint_address_, path.substr(1));
  }
  if (!endpoint_slash && !path_slash) {
    return absl::StrCat(endpoint_address_, "/", path);
  }
  return absl::StrCat(endpoint_address_, path);
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::MakeRequest(
    CurlPtr handle, RestRequest const& request, std::string const* payload) {
  if (!handle) {
    return CurlCodeToStatus(CURLE_FAILED_INIT, __func__);
  }
  auto* h = handle.get();
  auto const url = BuildUrl(request);
  GCP_AUTH_LOG(DEBUG) << __func__ << "() " << (payload ? "POST " : "GET ")
                      << url;

  CurlHeaders headers(nullptr, &curl_slist_free_all);
  for (auto const& kv : request.headers()) {
    for (auto const& v : kv.second) {
      auto line = absl::StrCat(kv.first, ": ", v);
      headers.reset(curl_slist_append(headers.release(), line.c_str()));
    }
  }

  std::string buffer;
  auto e = curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  if (e == CURLE_OK) e = curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  if (e == CURLE_OK) {
    auto const& product = options_.get<UserAgentProductOption>();
    e = curl_easy_setopt(h, CURLOPT_USERAGENT, product.c_str());
  }
  if (e == CURLE_OK) {
    e = curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &RestWriteCallback);
  }
  if (e == CURLE_OK) e = curl_easy_setopt(h, CURLOPT_WRITEDATA, &buffer);
  auto const timeout = options_.get<HttpTimeoutOption>();
  if (e == CURLE_OK && timeout.count() > 0) {
    e = curl_easy_setopt(h, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(timeout.count()));  // NOLINT
  }
  if (e == CURLE_OK && payload != nullptr) {
    e = curl_easy_setopt(h, CURLOPT_POST, 1L);
    if (e == CURLE_OK) {
      e = curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE,
                           static_cast<long>(payload->size()));  // NOLINT
    }
    if (e == CURLE_OK) {
      e = curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload->data());
    }
  }
  if (e != CURLE_OK) return CurlCodeToStatus(e, __func__);

  e = curl_easy_perform(h);
  if (e != CURLE_OK) {
    auto status = CurlCodeToStatus(e, __func__);
    GCP_AUTH_LOG(DEBUG) << __func__ << "() " << url << " failed: " << status;
    return status;
  }
  long code = 0;  // NOLINT(google-runtime-int)
  e = curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &code);
  if (e != CURLE_OK) return CurlCodeToStatus(e, __func__);

  return std::unique_ptr<RestResponse>(absl::make_unique<CurlRestResponse>(
      static_cast<HttpStatusCode>(code), std::move(buffer)));
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Get(
    RestRequest const& request) {
  return MakeRequest(MakeCurlPtr(), request, nullptr);
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Post(
    RestRequest const& request,
    std::vector<absl::Span<char const>> const& payload) {
  std::string body;
  for (auto const& p : payload) body.append(p.begin(), p.end());
  if (request.GetHeader("content-type").empty()) {
    auto with_type = request;
    with_type.AddHeader("content-type", "application/json");
    return MakeRequest(MakeCurlPtr(), with_type, &body);
  }
  return MakeRequest(MakeCurlPtr(), request, &body);
}

StatusOr<std::unique_ptr<RestResponse>> CurlRestClient::Post(
    RestRequest const& request,
    std::vector<std::pair<std::string, std::string>> const& form_data) {
  auto handle = MakeCurlPtr();
  auto* h = handle.get();
  std::string form_payload = absl::StrJoin(
      form_data, "&",
      [h](std::string* out, std::pair<std::string, std::string> const& i) {
        absl::StrAppend(out, i.first, "=", CurlEscape(h, i.second));
      });
  auto with_type = request;
  with_type.SetHeader("content-type", "application/x-www-form-urlencoded");
  return MakeRequest(std::move(handle), with_type, &form_payload);
}

std::unique_ptr<RestClient> MakeDefaultRestClient(std::string endpoint_address,
                                                  Options options) {
  return absl::make_unique<CurlRestClient>(
      std::move(endpoint_address),
      gcp_auth::internal::PopulateAuthOptions(std::move(options)));
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
