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

#include "gcp_auth/internal/credentials_file.h"
#include "gcp_auth/internal/getenv.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "absl/strings/str_cat.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iterator>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

std::string AdcFilePathFromEnvVarOrEmpty() {
  return GetEnv(kAdcEnvVar).value_or("");
}

std::string AdcFilePathFromWellKnownPathOrEmpty() {
  auto constexpr kFilename = "application_default_credentials.json";
  auto config = GetEnv("CLOUDSDK_CONFIG");
  if (config.has_value() && !config->empty()) {
    return absl::StrCat(*config, "/", kFilename);
  }
  auto home = GetEnv("HOME");
  if (!home.has_value() || home->empty()) return {};
  return absl::StrCat(*home, "/.config/gcloud/", kFilename);
}

StatusOr<std::string> ReadCredentialsFile(std::string const& path) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) {
    return CredentialShapeError("Cannot open credentials file " + path,
                                GCP_AUTH_ERROR_INFO());
  }
  return std::string(std::istreambuf_iterator<char>{ifs}, {});
}

StatusOr<std::string> CredentialsFileType(std::string const& contents,
                                          std::string const& source) {
  auto json = nlohmann::json::parse(contents, nullptr, false);
  if (!json.is_object()) {
    return CredentialShapeError(
        "Invalid credentials file " + source +
            ", it does not contain a JSON object",
        GCP_AUTH_ERROR_INFO());
  }
  auto type = json.find("type");
  if (type == json.end() || !type->is_string()) return std::string{};
  return type->get<std::string>();
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
