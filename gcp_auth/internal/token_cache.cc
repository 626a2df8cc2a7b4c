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

#include "gcp_auth/internal/token_cache.h"
#include "gcp_auth/internal/make_status.h"
#include "gcp_auth/log.h"

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

// Satisfies a waiter. If the completion queue discards the functor without
// running it the waiter is satisfied on destruction.
class SetWaiter {
 public:
  SetWaiter(promise<StatusOr<AuthHeader>> p, StatusOr<AuthHeader> value)
      : p_(std::move(p)), value_(std::move(value)) {}
  SetWaiter(SetWaiter&& rhs) noexcept
      : p_(std::move(rhs.p_)), value_(std::move(rhs.value_)) {
    rhs.p_.reset();
  }
  SetWaiter(SetWaiter const&) = delete;
  SetWaiter& operator=(SetWaiter const&) = delete;
  SetWaiter& operator=(SetWaiter&&) = delete;
  ~SetWaiter() { Run(); }

  void operator()() { Run(); }

 private:
  void Run() {
    if (!p_) return;
    auto p = *std::move(p_);
    p_.reset();
    p.set_value(std::move(value_));
  }

  absl::optional<promise<StatusOr<AuthHeader>>> p_;
  StatusOr<AuthHeader> value_;
};

}  // namespace

std::shared_ptr<TokenCache> TokenCache::Create(CompletionQueue cq,
                                               AsyncTokenSource source,
                                               CurrentTimeFn current_time_fn) {
  return std::shared_ptr<TokenCache>(new TokenCache(
      std::move(cq), std::move(source), std::move(current_time_fn)));
}

TokenCache::TokenCache(CompletionQueue cq, AsyncTokenSource source,
                       CurrentTimeFn current_time_fn)
    : cq_(std::move(cq)),
      source_(std::move(source)),
      current_time_fn_(std::move(current_time_fn)) {}

TokenCache::~TokenCache() {
  // The pending continuation only holds a weak pointer to this object.
  auto pending = std::move(pending_);
  auto waiting = std::move(waiting_);
  pending.cancel();
  for (auto& w : waiting) {
    w.set_value(CancelledError("the token cache was destroyed",
                               GCP_AUTH_ERROR_INFO()));
  }
}

HeaderResult TokenCache::GetValid(std::chrono::system_clock::time_point now) {
  std::unique_lock<std::mutex> lk(mu_);
  if (token_) {
    auto valid_for = token_->ValidFor(now);
    if (valid_for) {
      return AuthHeader{token_->authorization_header(), *valid_for};
    }
  }
  waiting_.emplace_back();
  auto result = waiting_.back().get_future();
  StartRefresh(std::move(lk));
  return HeaderResult(std::move(result));
}

void TokenCache::Revoke(bool start_new) {
  std::unique_lock<std::mutex> lk(mu_);
  GCP_AUTH_LOG(DEBUG) << "revoking cached token, start_new=" << start_new
                      << ", refreshing=" << refreshing_;
  token_.reset();
  if (start_new) StartRefresh(std::move(lk));
}

void TokenCache::AdoptRefresh(future<StatusOr<Token>> token) {
  std::unique_lock<std::mutex> lk(mu_);
  if (refreshing_) {
    lk.unlock();
    token.cancel();
    return;
  }
  refreshing_ = true;
  Watch(std::move(lk), std::move(token));
}

bool TokenCache::refreshing() const {
  std::lock_guard<std::mutex> lk(mu_);
  return refreshing_;
}

void TokenCache::StartRefresh(std::unique_lock<std::mutex> lk) {
  if (refreshing_) return;
  refreshing_ = true;
  lk.unlock();
  auto f = source_(cq_);
  Watch(std::unique_lock<std::mutex>(mu_), std::move(f));
}

void TokenCache::Watch(std::unique_lock<std::mutex> lk,
                       future<StatusOr<Token>> f) {
  auto const generation = ++generation_;
  auto w = WeakFromThis();
  lk.unlock();
  // The continuation may run immediately, in this thread.
  auto pending = f.then([w, generation](future<StatusOr<Token>> r) {
    if (auto self = w.lock()) self->OnRefresh(generation, r.get());
    return true;
  });
  lk.lock();
  if (refreshing_ && generation_ == generation) pending_ = std::move(pending);
}

void TokenCache::OnRefresh(std::uint64_t generation, StatusOr<Token> result) {
  std::unique_lock<std::mutex> lk(mu_);
  if (generation != generation_) return;
  refreshing_ = false;
  pending_ = future<bool>();
  std::vector<WaiterType> waiting;
  waiting.swap(waiting_);
  StatusOr<AuthHeader> value;
  if (result) {
    token_ = *std::move(result);
    auto valid_for = token_->ValidFor(current_time_fn_());
    value = AuthHeader{
        token_->authorization_header(),
        valid_for.value_or(std::chrono::system_clock::duration::zero())};
  } else {
    value = std::move(result).status();
  }
  lk.unlock();
  for (auto& p : waiting) cq_.RunAsync(SetWaiter{std::move(p), value});
}

}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
