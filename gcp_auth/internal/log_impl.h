// Copyright 2021 Google LLC
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

#ifndef GCP_AUTH_INTERNAL_LOG_IMPL_H
#define GCP_AUTH_INTERNAL_LOG_IMPL_H

#include "gcp_auth/log.h"
#include "gcp_auth/version.h"
#include <mutex>
#include <vector>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {

/// Prints the records at or above a minimum severity to `std::clog`.
class StdClogBackend : public LogBackend {
 public:
  explicit StdClogBackend(Severity min_severity)
      : min_severity_(min_severity) {}

  void Process(LogRecord const& lr) override;
  void ProcessWithOwnership(LogRecord lr) override { Process(lr); }
  void Flush() override;

 private:
  std::mutex mu_;
  Severity min_severity_;
};

/**
 * Keeps the last N records, forwarding them to @p backend only when a record
 * at or above @p min_flush_severity arrives.
 */
class CircularBufferBackend : public LogBackend {
 public:
  CircularBufferBackend(std::size_t size, Severity min_flush_severity,
                        std::shared_ptr<LogBackend> backend)
      : buffer_(size),
        min_flush_severity_(min_flush_severity),
        backend_(std::move(backend)) {}

  std::size_t size() const { return buffer_.size(); }
  Severity min_flush_severity() const { return min_flush_severity_; }

  void Process(LogRecord const& lr) override { ProcessWithOwnership(lr); }
  void ProcessWithOwnership(LogRecord lr) override;
  void Flush() override;

 private:
  std::size_t index(std::size_t i) const { return i % buffer_.size(); }

  void FlushImpl(std::unique_lock<std::mutex> lk);

  std::mutex mu_;
  std::vector<LogRecord> buffer_;
  std::size_t begin_ = 0;
  std::size_t end_ = 0;
  Severity min_flush_severity_;
  std::shared_ptr<LogBackend> backend_;
};

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_INTERNAL_LOG_IMPL_H
