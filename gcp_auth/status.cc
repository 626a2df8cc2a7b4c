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

#include "gcp_auth/status.h"
#include <array>
#include <sstream>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

auto constexpr kStatusCodeCount =
    static_cast<int>(StatusCode::kUnauthenticated) + 1;

std::array<char const*, kStatusCodeCount> constexpr kStatusCodeNames{{
    "OK",
    "CANCELLED",
    "UNKNOWN",
    "INVALID_ARGUMENT",
    "DEADLINE_EXCEEDED",
    "NOT_FOUND",
    "ALREADY_EXISTS",
    "PERMISSION_DENIED",
    "RESOURCE_EXHAUSTED",
    "FAILED_PRECONDITION",
    "ABORTED",
    "OUT_OF_RANGE",
    "UNIMPLEMENTED",
    "INTERNAL",
    "UNAVAILABLE",
    "DATA_LOSS",
    "UNAUTHENTICATED",
}};

std::string const& EmptyString() {
  static auto const* const kEmpty = new std::string;
  return *kEmpty;
}

ErrorInfo const& EmptyErrorInfo() {
  static auto const* const kEmpty = new ErrorInfo;
  return *kEmpty;
}

}  // namespace

std::string StatusCodeToString(StatusCode code) {
  auto const i = static_cast<int>(code);
  if (i < 0 || i >= kStatusCodeCount) {
    return "UNEXPECTED_STATUS_CODE=" + std::to_string(i);
  }
  return kStatusCodeNames[i];
}

std::ostream& operator<<(std::ostream& os, StatusCode code) {
  return os << StatusCodeToString(code);
}

struct Status::Rep {
  StatusCode code;
  std::string message;
  ErrorInfo info;
};

Status::Status(StatusCode code, std::string message, ErrorInfo info) {
  if (code == StatusCode::kOk) return;
  rep_ = std::make_shared<Rep>(Rep{code, std::move(message), std::move(info)});
}

StatusCode Status::code() const { return rep_ ? rep_->code : StatusCode::kOk; }

std::string const& Status::message() const {
  return rep_ ? rep_->message : EmptyString();
}

ErrorInfo const& Status::error_info() const {
  return rep_ ? rep_->info : EmptyErrorInfo();
}

bool operator==(Status const& a, Status const& b) {
  if (a.rep_ == b.rep_) return true;
  if (!a.rep_ || !b.rep_) return false;
  return a.rep_->code == b.rep_->code && a.rep_->message == b.rep_->message &&
         a.rep_->info == b.rep_->info;
}

std::ostream& operator<<(std::ostream& os, Status const& s) {
  if (s.ok()) return os << StatusCode::kOk;
  os << s.code() << ": " << s.message();
  auto const& info = s.error_info();
  if (info.empty()) return os;
  os << " error_info={reason=" << info.reason() << ", domain=" << info.domain()
     << ", metadata={";
  char const* sep = "";
  for (auto const& kv : info.metadata()) {
    os << sep << kv.first << "=" << kv.second;
    sep = ", ";
  }
  return os << "}}";
}

namespace internal {

void AddMetadata(ErrorInfo& info, std::string const& key, std::string value) {
  info.metadata_[key] = std::move(value);
}

}  // namespace internal

RuntimeStatusError::RuntimeStatusError(Status status)
    : std::runtime_error([&status] {
        std::ostringstream os;
        os << status;
        return std::move(os).str();
      }()),
      status_(std::move(status)) {}

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
