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
#include "gcp_auth/auth_error.h"
#include "gcp_auth/internal/make_auth_error.h"
#include "gcp_auth/testing_util/fake_completion_queue_impl.h"
#include "gcp_auth/testing_util/status_matchers.h"
#include <gmock/gmock.h>
#include <deque>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace internal {
namespace {

using ::gcp_auth::testing_util::FakeCompletionQueueImpl;
using ::gcp_auth::testing_util::StatusIs;
using ::testing::HasSubstr;

using TokenPromise = promise<StatusOr<Token>>;

std::chrono::system_clock::time_point FixedTime() {
  return std::chrono::system_clock::from_time_t(1700000000);
}

StatusOr<Token> MakeToken(std::string value) {
  return Token::Create(std::move(value), FixedTime(),
                       FixedTime() + std::chrono::hours(1));
}

bool IsHeader(HeaderResult const& r) {
  return absl::holds_alternative<AuthHeader>(r);
}

future<StatusOr<AuthHeader>> Pending(HeaderResult r) {
  return absl::get<future<StatusOr<AuthHeader>>>(std::move(r));
}

/**
 * Each refresh returns a future controlled by the test.
 *
 * The promises outlive the cache under test, the cache is always created
 * after the fixture members.
 */
class TokenCacheTest : public ::testing::Test {
 protected:
  TokenCacheTest() : fake_(std::make_shared<FakeCompletionQueueImpl>()) {}

  std::shared_ptr<TokenCache> MakeCache() {
    return TokenCache::Create(
        CompletionQueue(fake_),
        [this](CompletionQueue&) {
          refreshes_.emplace_back([this] { ++cancelled_; });
          return refreshes_.back().get_future();
        },
        FixedTime);
  }

  std::shared_ptr<FakeCompletionQueueImpl> fake_;
  std::deque<TokenPromise> refreshes_;
  int cancelled_ = 0;
};

TEST_F(TokenCacheTest, ColdStartCoalescesWaiters) {
  auto cache = MakeCache();
  auto r1 = cache->GetValid();
  auto r2 = cache->GetValid();
  ASSERT_FALSE(IsHeader(r1));
  ASSERT_FALSE(IsHeader(r2));
  EXPECT_TRUE(cache->refreshing());
  ASSERT_EQ(refreshes_.size(), 1U);

  auto f1 = Pending(std::move(r1));
  auto f2 = Pending(std::move(r2));
  refreshes_[0].set_value(MakeToken("t1"));
  EXPECT_FALSE(cache->refreshing());
  // Waiters are notified via the completion queue.
  EXPECT_FALSE(f1.is_ready());
  fake_->SimulateCompletion(true);

  auto h1 = f1.get();
  auto h2 = f2.get();
  ASSERT_STATUS_OK(h1);
  ASSERT_STATUS_OK(h2);
  EXPECT_EQ(h1->value, "Bearer t1");
  EXPECT_EQ(*h1, *h2);
  EXPECT_GT(h1->valid_for, std::chrono::system_clock::duration::zero());

  auto cached = cache->GetValid();
  ASSERT_TRUE(IsHeader(cached));
  EXPECT_EQ(absl::get<AuthHeader>(cached).value, "Bearer t1");
  EXPECT_EQ(refreshes_.size(), 1U);
}

TEST_F(TokenCacheTest, ErrorsAreNotCached) {
  auto cache = MakeCache();
  auto f = Pending(cache->GetValid());
  refreshes_[0].set_value(
      TransportError("cannot connect", GCP_AUTH_ERROR_INFO()));
  fake_->SimulateCompletion(true);
  EXPECT_THAT(f.get(), StatusIs(StatusCode::kUnavailable,
                                HasSubstr("cannot connect")));

  auto r = cache->GetValid();
  ASSERT_FALSE(IsHeader(r));
  ASSERT_EQ(refreshes_.size(), 2U);
  refreshes_[1].set_value(MakeToken("t2"));
  fake_->SimulateCompletion(true);
  auto h = Pending(std::move(r)).get();
  ASSERT_STATUS_OK(h);
  EXPECT_EQ(h->value, "Bearer t2");
}

TEST_F(TokenCacheTest, ExpiredTokenIsRefreshed) {
  auto cache = MakeCache();
  auto f = Pending(cache->GetValid());
  refreshes_[0].set_value(MakeToken("t1"));
  fake_->SimulateCompletion(true);
  ASSERT_STATUS_OK(f.get());

  EXPECT_TRUE(IsHeader(cache->GetValid(FixedTime())));
  auto r = cache->GetValid(FixedTime() + std::chrono::hours(2));
  EXPECT_FALSE(IsHeader(r));
  EXPECT_EQ(refreshes_.size(), 2U);
  refreshes_[1].set_value(MakeToken("t2"));
  fake_->SimulateCompletion(true);
}

TEST_F(TokenCacheTest, RevokeWithoutRefresh) {
  auto cache = MakeCache();
  auto f = Pending(cache->GetValid());
  refreshes_[0].set_value(MakeToken("t1"));
  fake_->SimulateCompletion(true);
  ASSERT_STATUS_OK(f.get());

  cache->Revoke(false);
  EXPECT_FALSE(cache->refreshing());
  EXPECT_EQ(refreshes_.size(), 1U);

  auto r = cache->GetValid();
  EXPECT_FALSE(IsHeader(r));
  EXPECT_TRUE(cache->refreshing());
  refreshes_[1].set_value(MakeToken("t2"));
  fake_->SimulateCompletion(true);
}

TEST_F(TokenCacheTest, RevokeStartsRefresh) {
  auto cache = MakeCache();
  cache->Revoke(true);
  EXPECT_TRUE(cache->refreshing());
  ASSERT_EQ(refreshes_.size(), 1U);

  // Revoking again does not start a second refresh.
  cache->Revoke(true);
  EXPECT_EQ(refreshes_.size(), 1U);

  refreshes_[0].set_value(MakeToken("t1"));
  EXPECT_TRUE(IsHeader(cache->GetValid()));
}

TEST_F(TokenCacheTest, AdoptRefresh) {
  auto cache = MakeCache();
  TokenPromise adopted;
  cache->AdoptRefresh(adopted.get_future());
  EXPECT_TRUE(cache->refreshing());

  auto r = cache->GetValid();
  ASSERT_FALSE(IsHeader(r));
  EXPECT_TRUE(refreshes_.empty());

  adopted.set_value(MakeToken("adopted"));
  fake_->SimulateCompletion(true);
  auto h = Pending(std::move(r)).get();
  ASSERT_STATUS_OK(h);
  EXPECT_EQ(h->value, "Bearer adopted");
}

TEST_F(TokenCacheTest, AdoptRefreshWhileRefreshingCancels) {
  auto cache = MakeCache();
  cache->Revoke(true);
  bool adopted_cancelled = false;
  TokenPromise adopted([&adopted_cancelled] { adopted_cancelled = true; });
  cache->AdoptRefresh(adopted.get_future());
  EXPECT_TRUE(adopted_cancelled);
  adopted.set_value(MakeToken("ignored"));

  refreshes_[0].set_value(MakeToken("t1"));
  auto r = cache->GetValid();
  ASSERT_TRUE(IsHeader(r));
  EXPECT_EQ(absl::get<AuthHeader>(r).value, "Bearer t1");
}

TEST_F(TokenCacheTest, DroppedWaiter) {
  auto cache = MakeCache();
  { auto r = cache->GetValid(); }
  refreshes_[0].set_value(MakeToken("t1"));
  fake_->SimulateCompletion(true);
  EXPECT_TRUE(IsHeader(cache->GetValid()));
}

TEST_F(TokenCacheTest, DroppedWaiterDoesNotAffectOthers) {
  auto cache = MakeCache();
  auto f1 = Pending(cache->GetValid());
  auto f3 = Pending(cache->GetValid());
  {
    auto dropped = Pending(cache->GetValid());
  }
  ASSERT_EQ(refreshes_.size(), 1U);
  EXPECT_EQ(cancelled_, 0);

  refreshes_[0].set_value(MakeToken("t1"));
  fake_->SimulateCompletion(true);
  auto h1 = f1.get();
  auto h3 = f3.get();
  ASSERT_STATUS_OK(h1);
  ASSERT_STATUS_OK(h3);
  EXPECT_EQ(h1->value, "Bearer t1");
  EXPECT_EQ(*h1, *h3);
  EXPECT_EQ(refreshes_.size(), 1U);
}

TEST_F(TokenCacheTest, DestructionCancelsRefresh) {
  auto cache = MakeCache();
  auto f = Pending(cache->GetValid());
  cache.reset();
  EXPECT_EQ(cancelled_, 1);
  ASSERT_TRUE(f.is_ready());
  EXPECT_THAT(f.get(), StatusIs(StatusCode::kCancelled));

  // The late result is discarded.
  refreshes_[0].set_value(MakeToken("t1"));
  EXPECT_TRUE(fake_->empty());
}

}  // namespace
}  // namespace internal
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
