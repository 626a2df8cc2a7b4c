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

#ifndef GCP_AUTH_LOG_H
#define GCP_AUTH_LOG_H

/**
 * @file log.h
 *
 * Library logging. Nothing is printed unless a `LogBackend` is registered
 * with `LogSink::Instance()`; `GCP_AUTH_ENABLE_CLOG=<severity>` registers one
 * that writes to `std::clog`.
 *
 * @code
 * GCP_AUTH_LOG(WARNING) << "refresh attempt " << n << " failed: " << status;
 * @endcode
 *
 * The operands of `<<` are not evaluated when the message is discarded.
 * Messages below `GCP_AUTH_LOGGING_MIN_SEVERITY_ENABLED` are discarded at
 * compile time.
 */

#include "gcp_auth/version.h"
#include "absl/types/optional.h"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#define GCP_AUTH_LOG_I(level, sink)                                          \
  if (!::gcp_auth::Logger<::gcp_auth::LogSink::CompileTimeEnabled(           \
          ::gcp_auth::Severity::level)>::Enabled(::gcp_auth::Severity::level, \
                                                 sink)) {                    \
  } else /* NOLINT(readability-else-after-return) */                         \
    ::gcp_auth::Logger<::gcp_auth::LogSink::CompileTimeEnabled(              \
        ::gcp_auth::Severity::level)>(::gcp_auth::Severity::level, __func__, \
                                      __FILE__, __LINE__, sink)              \
        .Stream()

// The prefix keeps `level` safe from macros such as `DEBUG`.
#define GCP_AUTH_LOG(level) \
  GCP_AUTH_LOG_I(GCP_AUTH_LS_##level, ::gcp_auth::LogSink::Instance())

#ifndef GCP_AUTH_LOGGING_MIN_SEVERITY_ENABLED
#define GCP_AUTH_LOGGING_MIN_SEVERITY_ENABLED GCP_AUTH_LS_DEBUG
#endif  // GCP_AUTH_LOGGING_MIN_SEVERITY_ENABLED

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN

// NOLINTBEGIN(readability-identifier-naming)
enum class Severity : int {
  GCP_AUTH_LS_TRACE,
  GCP_AUTH_LS_DEBUG,
  GCP_AUTH_LS_INFO,
  GCP_AUTH_LS_WARNING,
  GCP_AUTH_LS_ERROR,
  GCP_AUTH_LS_LOWEST_ENABLED = GCP_AUTH_LOGGING_MIN_SEVERITY_ENABLED,
};
// NOLINTEND(readability-identifier-naming)

/// Parses the upper-case severity names, e.g. "WARNING".
absl::optional<Severity> ParseSeverity(std::string const& name);
std::ostream& operator<<(std::ostream& os, Severity x);

struct LogRecord {
  Severity severity;
  std::string function;
  std::string filename;
  int lineno;
  std::thread::id thread_id;
  std::chrono::system_clock::time_point timestamp;
  std::string message;
};

/// Formats @p rhs as `<timestamp> [<severity>] <thread> <message> (file:line)`.
std::ostream& operator<<(std::ostream& os, LogRecord const& rhs);

class LogBackend {
 public:
  virtual ~LogBackend() = default;

  virtual void Process(LogRecord const& log_record) = 0;
  /// Called instead of `Process()` when the sink has a single backend.
  virtual void ProcessWithOwnership(LogRecord log_record) = 0;
  virtual void Flush() {}
};

/**
 * Dispatches log records to the registered backends.
 *
 * `Instance()` is the sink used by `GCP_AUTH_LOG()`. Backends are invoked
 * without holding any lock, they may be added or removed concurrently with
 * logging.
 */
class LogSink {
 public:
  using BackendId = std::int64_t;

  LogSink();

  static constexpr bool CompileTimeEnabled(Severity level) {
    return level >= Severity::GCP_AUTH_LS_LOWEST_ENABLED;
  }

  static LogSink& Instance();

  bool empty() const { return empty_.load(std::memory_order_relaxed); }

  bool is_enabled(Severity severity) const {
    return static_cast<int>(severity) >=
           minimum_severity_.load(std::memory_order_relaxed);
  }

  void set_minimum_severity(Severity minimum) {
    minimum_severity_.store(static_cast<int>(minimum));
  }
  Severity minimum_severity() const {
    return static_cast<Severity>(minimum_severity_.load());
  }

  BackendId AddBackend(std::shared_ptr<LogBackend> backend);
  void RemoveBackend(BackendId id);

  void Log(LogRecord log_record);

 private:
  using BackendList =
      std::vector<std::pair<BackendId, std::shared_ptr<LogBackend>>>;

  std::shared_ptr<BackendList const> Snapshot() const;
  void Publish(BackendList list);

  std::atomic<bool> empty_{true};
  std::atomic<int> minimum_severity_;
  mutable std::mutex mu_;
  BackendId last_id_ = 0;
  std::shared_ptr<BackendList const> backends_;
};

/// Collects one message, sending it to the sink when destroyed.
template <bool CompileTimeEnabled>
class Logger {
 public:
  static bool Enabled(Severity severity, LogSink const& sink) {
    return !sink.empty() && sink.is_enabled(severity);
  }

  Logger(Severity severity, char const* function, char const* filename,
         int lineno, LogSink& sink)
      : sink_(sink) {
    record_.severity = severity;
    record_.function = function;
    record_.filename = filename;
    record_.lineno = lineno;
    record_.thread_id = std::this_thread::get_id();
    record_.timestamp = std::chrono::system_clock::now();
  }

  ~Logger() {
    record_.message = stream_.str();
    sink_.Log(std::move(record_));
  }

  Logger(Logger const&) = delete;
  Logger& operator=(Logger const&) = delete;

  std::ostream& Stream() { return stream_; }

 private:
  LogSink& sink_;
  LogRecord record_;
  std::ostringstream stream_;
};

/// Messages below the compile-time minimum: `Enabled()` is always false and
/// the streaming expression is dead code.
template <>
class Logger<false> {
 public:
  struct NullStream {
    template <typename T>
    NullStream& operator<<(T const&) {
      return *this;
    }
  };

  static constexpr bool Enabled(Severity, LogSink const&) { return false; }

  Logger(Severity, char const*, char const*, int, LogSink&) {}

  // NOLINTNEXTLINE(readability-convert-member-functions-to-static)
  NullStream Stream() { return {}; }
};

namespace internal {
/// The backend configured by `GCP_AUTH_LOG_CONFIG` and `GCP_AUTH_ENABLE_CLOG`,
/// or null if logging is disabled.
std::shared_ptr<LogBackend> DefaultLogBackend();
}  // namespace internal

GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth

#endif  // GCP_AUTH_LOG_H
