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

#include "gcp_auth/log.h"
#include "gcp_auth/internal/getenv.h"
#include "gcp_auth/internal/log_impl.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/time/time.h"
#include <algorithm>
#include <ostream>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

char const* SeverityName(Severity s) {
  switch (s) {
    case Severity::GCP_AUTH_LS_TRACE:
      return "TRACE";
    case Severity::GCP_AUTH_LS_DEBUG:
      return "DEBUG";
    case Severity::GCP_AUTH_LS_INFO:
      return "INFO";
    case Severity::GCP_AUTH_LS_WARNING:
      return "WARNING";
    case Severity::GCP_AUTH_LS_ERROR:
      return "ERROR";
  }
  return "UNKNOWN";
}

}  // namespace

absl::optional<Severity> ParseSeverity(std::string const& name) {
  for (auto s : {Severity::GCP_AUTH_LS_TRACE, Severity::GCP_AUTH_LS_DEBUG,
                 Severity::GCP_AUTH_LS_INFO, Severity::GCP_AUTH_LS_WARNING,
                 Severity::GCP_AUTH_LS_ERROR}) {
    if (name == SeverityName(s)) return s;
  }
  return absl::nullopt;
}

std::ostream& operator<<(std::ostream& os, Severity x) {
  return os << SeverityName(x);
}

std::ostream& operator<<(std::ostream& os, LogRecord const& rhs) {
  os << absl::FormatTime("%E4Y-%m-%dT%H:%M:%E9SZ",
                         absl::FromChrono(rhs.timestamp), absl::UTCTimeZone());
  return os << " [" << rhs.severity << "] <" << rhs.thread_id << "> "
            << rhs.message << " (" << rhs.filename << ':' << rhs.lineno
            << ')';
}

LogSink::LogSink()
    : minimum_severity_(static_cast<int>(Severity::GCP_AUTH_LS_LOWEST_ENABLED)),
      backends_(std::make_shared<BackendList const>()) {}

LogSink& LogSink::Instance() {
  static auto* const kInstance = [] {
    auto* sink = new LogSink;
    auto backend = internal::DefaultLogBackend();
    if (backend) sink->AddBackend(std::move(backend));
    return sink;
  }();
  return *kInstance;
}

LogSink::BackendId LogSink::AddBackend(std::shared_ptr<LogBackend> backend) {
  std::lock_guard<std::mutex> lk(mu_);
  auto list = *backends_;
  auto const id = ++last_id_;
  list.emplace_back(id, std::move(backend));
  Publish(std::move(list));
  return id;
}

void LogSink::RemoveBackend(BackendId id) {
  std::lock_guard<std::mutex> lk(mu_);
  auto list = *backends_;
  list.erase(std::remove_if(list.begin(), list.end(),
                            [id](BackendList::value_type const& b) {
                              return b.first == id;
                            }),
             list.end());
  Publish(std::move(list));
}

void LogSink::Log(LogRecord log_record) {
  auto const backends = Snapshot();
  if (backends->size() == 1) {
    backends->front().second->ProcessWithOwnership(std::move(log_record));
    return;
  }
  for (auto const& b : *backends) b.second->Process(log_record);
}

std::shared_ptr<LogSink::BackendList const> LogSink::Snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);
  return backends_;
}

// Requires `mu_`.
void LogSink::Publish(BackendList list) {
  empty_.store(list.empty());
  backends_ = std::make_shared<BackendList const>(std::move(list));
}

namespace internal {

// GCP_AUTH_LOG_CONFIG is either "clog" or "lastN,<size>,<flush severity>".
// GCP_AUTH_ENABLE_CLOG sets the minimum severity printed to std::clog.
std::shared_ptr<LogBackend> DefaultLogBackend() {
  auto const clog_severity =
      ParseSeverity(GetEnv("GCP_AUTH_ENABLE_CLOG").value_or(""));
  auto const config = GetEnv("GCP_AUTH_LOG_CONFIG").value_or("");
  std::vector<std::string> fields = absl::StrSplit(config, ',');

  auto clog = [&] {
    return std::make_shared<StdClogBackend>(
        clog_severity.value_or(Severity::GCP_AUTH_LS_LOWEST_ENABLED));
  };
  if (fields.size() == 1 && fields[0] == "clog") return clog();
  if (fields.size() == 3 && fields[0] == "lastN") {
    std::size_t size = 0;
    auto const flush_severity = ParseSeverity(fields[2]);
    if (absl::SimpleAtoi(fields[1], &size) && size > 0 && flush_severity) {
      return std::make_shared<CircularBufferBackend>(size, *flush_severity,
                                                     clog());
    }
  }
  if (clog_severity) return clog();
  return nullptr;
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
