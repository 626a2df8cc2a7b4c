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

#include "gcp_auth/internal/refresh_driver.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/log.h"
#include "absl/strings/str_cat.h"
#include <mutex>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using TimerResult = StatusOr<std::chrono::system_clock::time_point>;

// One `RetryTokenFetch()` call. Attempts and backoff timers alternate, the
// futures of the latest of each are kept so a cancellation reaches whichever
// one is in flight.
class RetryLoop : public std::enable_shared_from_this<RetryLoop> {
 public:
  RetryLoop(CompletionQueue cq, AsyncTokenSource source, int max_retries,
            std::unique_ptr<BackoffPolicy> backoff, std::string provider)
      : cq_(std::move(cq)),
        source_(std::move(source)),
        max_retries_(max_retries),
        backoff_(std::move(backoff)),
        provider_(std::move(provider)) {}

  future<StatusOr<Token>> Run() {
    std::weak_ptr<RetryLoop> w = shared_from_this();
    done_ = promise<StatusOr<Token>>([w] {
      if (auto self = w.lock()) self->OnCancel();
    });
    auto f = done_.get_future();
    Attempt();
    return f;
  }

 private:
  void Attempt() {
    if (StopIfCancelled()) return;
    ++attempts_;
    auto self = shared_from_this();
    auto f = source_(cq_).then([self](future<StatusOr<Token>> g) {
      self->OnAttempt(g.get());
      return true;
    });
    Track(attempt_, std::move(f));
  }

  void OnAttempt(StatusOr<Token> result) {
    if (result) return Finish(std::move(result));
    last_error_ = WithProvider(std::move(result).status(), provider_);
    if (IsFatal(last_error_) || attempts_ > max_retries_) {
      return Finish(last_error_);
    }
    Backoff();
  }

  void Backoff() {
    if (StopIfCancelled()) return;
    auto const delay = backoff_->OnCompletion();
    GCP_AUTH_LOG(WARNING) << "token refresh attempt " << attempts_ << " for "
                          << provider_ << " failed, retrying in "
                          << delay.count() << "ms: " << last_error_;
    auto self = shared_from_this();
    auto f = cq_.MakeRelativeTimer(delay).then([self](future<TimerResult> g) {
      self->OnTimer(g.get());
      return true;
    });
    Track(timer_, std::move(f));
  }

  void OnTimer(TimerResult const& expired) {
    if (StopIfCancelled()) return;
    // The queue is shutting down, no more attempts will run.
    if (!expired) return Finish(last_error_);
    Attempt();
  }

  void Track(future<bool>& slot, future<bool> f) {
    std::unique_lock<std::mutex> lk(mu_);
    if (!cancelled_) {
      slot = std::move(f);
      return;
    }
    lk.unlock();
    f.cancel();
  }

  void OnCancel() {
    std::unique_lock<std::mutex> lk(mu_);
    cancelled_ = true;
    auto attempt = std::move(attempt_);
    auto timer = std::move(timer_);
    lk.unlock();
    attempt.cancel();
    timer.cancel();
  }

  bool StopIfCancelled() {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (!cancelled_) return false;
    }
    auto msg = absl::StrCat("token refresh for ", provider_, " cancelled");
    if (!last_error_.ok()) {
      absl::StrAppend(&msg, ", last error: ", last_error_.message());
    }
    Finish(CancelledError(
        std::move(msg),
        GCP_AUTH_ERROR_INFO().WithMetadata(kProviderKey, provider_)));
    return true;
  }

  void Finish(StatusOr<Token> value) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (finished_) return;
      finished_ = true;
    }
    done_.set_value(std::move(value));
  }

  CompletionQueue cq_;
  AsyncTokenSource source_;
  int const max_retries_;
  std::unique_ptr<BackoffPolicy> backoff_;
  std::string const provider_;
  int attempts_ = 0;
  Status last_error_;
  promise<StatusOr<Token>> done_;

  std::mutex mu_;
  bool cancelled_ = false;
  bool finished_ = false;
  future<bool> attempt_;
  future<bool> timer_;
};

}  // namespace

future<StatusOr<Token>> RetryTokenFetch(
    CompletionQueue cq, AsyncTokenSource source, int max_retries,
    std::unique_ptr<BackoffPolicy> backoff_policy, std::string provider_name) {
  return std::make_shared<RetryLoop>(std::move(cq), std::move(source),
                                     max_retries, std::move(backoff_policy),
                                     std::move(provider_name))
      ->Run();
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
