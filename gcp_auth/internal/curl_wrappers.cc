// Copyright 2018 Google LLC
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

#include "gcp_auth/internal/curl_wrappers.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/internal/make_status.h"
#include "gcp_auth/log.h"
#include "absl/strings/str_cat.h"
#include <csignal>

namespace gcp_auth {
namespace rest_internal {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

/// Automatically initialize (and cleanup) the libcurl library.
class CurlInitializer {
 public:
  CurlInitializer() { curl_global_init(CURL_GLOBAL_ALL); }
  ~CurlInitializer() { curl_global_cleanup(); }
};

// The remote host was never reached.
bool IsCurlConnectError(CURLcode code) {
  return code == CURLE_COULDNT_RESOLVE_PROXY ||
         code == CURLE_COULDNT_RESOLVE_HOST || code == CURLE_COULDNT_CONNECT;
}

}  // namespace

CurlPtr MakeCurlPtr() {
  CurlInitializeOnce();
  auto handle = CurlPtr(curl_easy_init(), &curl_easy_cleanup);
  // Token responses are small, the default buffer size is fine. Signals are
  // disabled because the handle is used from multiple threads.
  (void)curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
  return handle;
}

std::string CurlEscape(CURL* handle, std::string const& s) {
  auto escaped = CurlString(
      curl_easy_escape(handle, s.data(), static_cast<int>(s.size())),
      &curl_free);
  if (!escaped) return {};
  return std::string(escaped.get());
}

Status CurlCodeToStatus(CURLcode e, char const* where) {
  if (e == CURLE_OK) return Status{};
  auto message = absl::StrCat(where, "() - CURL error [", static_cast<int>(e),
                              "]=", curl_easy_strerror(e));
  auto info =
      GCP_AUTH_ERROR_INFO()
          .WithMetadata("curl_code", std::to_string(static_cast<int>(e)))
          .WithMetadata(internal::kConnectErrorKey,
                        IsCurlConnectError(e) ? "true" : "false");
  switch (e) {
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_CONNECT:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_PARTIAL_FILE:
    case CURLE_GOT_NOTHING:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_OPERATION_TIMEDOUT:
      return internal::UnavailableError(std::move(message), std::move(info));
    case CURLE_ABORTED_BY_CALLBACK:
      return internal::CancelledError(std::move(message), std::move(info));
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
      return internal::InvalidArgumentError(std::move(message),
                                            std::move(info));
    default:
      break;
  }
  return internal::UnknownError(std::move(message), std::move(info));
}

void CurlInitializeOnce() {
  static CurlInitializer curl_initializer;
  static bool const kInitialized = [] {
    // libcurl recommends `CURLOPT_NOSIGNAL` for threaded applications, which
    // leaves SIGPIPE (raised by some SSL backends) to the application.
#if defined(SIGPIPE)
    std::signal(SIGPIPE, SIG_IGN);
#endif  // SIGPIPE
    GCP_AUTH_LOG(DEBUG) << "libcurl initialized, version="
                        << curl_version_info(CURLVERSION_NOW)->version;
    return true;
  }();
  static_cast<void>(kInitialized);
}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace rest_internal
}  // namespace gcp_auth
