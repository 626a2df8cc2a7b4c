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

#ifndef GCP_AUTH_STATUS_H
#define GCP_AUTH_STATUS_H

#include "gcp_auth/version.h"
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

/// Status codes, the values match `grpc::StatusCode`.
enum class StatusCode {
  kOk = 0,
  kCancelled = 1,
  kUnknown = 2,
  kInvalidArgument = 3,
  kDeadlineExceeded = 4,
  kNotFound = 5,
  kAlreadyExists = 6,
  kPermissionDenied = 7,
  kResourceExhausted = 8,
  kFailedPrecondition = 9,
  kAborted = 10,
  kOutOfRange = 11,
  kUnimplemented = 12,
  kInternal = 13,
  kUnavailable = 14,
  kDataLoss = 15,
  kUnauthenticated = 16,
};

/// The canonical name of @p code, e.g. `UNAVAILABLE`.
std::string StatusCodeToString(StatusCode code);

std::ostream& operator<<(std::ostream& os, StatusCode code);

class ErrorInfo;
namespace internal {
void AddMetadata(ErrorInfo& info, std::string const& key, std::string value);
}  // namespace internal

/**
 * Structured details for an error: a reason, its domain, and metadata.
 *
 * Authentication errors use the `gcp-auth` domain. `gcp_auth/auth_error.h`
 * lists the reasons and the metadata keys.
 */
class ErrorInfo {
 public:
  using Metadata = std::unordered_map<std::string, std::string>;

  ErrorInfo() = default;
  explicit ErrorInfo(std::string reason, std::string domain, Metadata metadata)
      : reason_(std::move(reason)),
        domain_(std::move(domain)),
        metadata_(std::move(metadata)) {}

  std::string const& reason() const { return reason_; }
  std::string const& domain() const { return domain_; }
  Metadata const& metadata() const { return metadata_; }

  bool empty() const {
    return reason_.empty() && domain_.empty() && metadata_.empty();
  }

  friend bool operator==(ErrorInfo const& a, ErrorInfo const& b) {
    return a.reason_ == b.reason_ && a.domain_ == b.domain_ &&
           a.metadata_ == b.metadata_;
  }
  friend bool operator!=(ErrorInfo const& a, ErrorInfo const& b) {
    return !(a == b);
  }

 private:
  friend void internal::AddMetadata(ErrorInfo&, std::string const&,
                                    std::string);

  std::string reason_;
  std::string domain_;
  Metadata metadata_;
};

/**
 * The result of an operation: OK, or an error code with a message and
 * details.
 *
 * OK statuses carry no message or details, and all compare equal. Copies of
 * an error share its (immutable) contents.
 */
class Status {
 public:
  Status() = default;

  /// Creates an error. @p message and @p info are dropped if @p code is OK.
  explicit Status(StatusCode code, std::string message, ErrorInfo info = {});

  bool ok() const { return rep_ == nullptr; }
  StatusCode code() const;
  std::string const& message() const;
  ErrorInfo const& error_info() const;

  friend bool operator==(Status const& a, Status const& b);
  friend bool operator!=(Status const& a, Status const& b) { return !(a == b); }

 private:
  struct Rep;
  std::shared_ptr<Rep const> rep_;
};

/// Formats @p s for logs and error messages. The format is not stable.
std::ostream& operator<<(std::ostream& os, Status const& s);

/// Thrown by `StatusOr<T>::value()` when there is no value.
class RuntimeStatusError : public std::runtime_error {
 public:
  explicit RuntimeStatusError(Status status);

  Status const& status() const { return status_; }

 private:
  Status status_;
};

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_STATUS_H
