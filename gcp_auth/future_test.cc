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
#include "gcp_auth/future.h"
#include <gmock/gmock.h>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace gcp_auth {
GCP_AUTH_INLINE_NAMESPACE_BEGIN
namespace {

using ::testing::HasSubstr;

std::future_errc ErrorCode(std::function<void()> const& f) {
  try {
    f();
  } catch (std::future_error const& ex) {
    return static_cast<std::future_errc>(ex.code().value());
  }
  ADD_FAILURE() << "expected a std::future_error";
  return std::future_errc::no_state;
}

TEST(FutureTest, SetValueThenGet) {
  promise<int> p;
  auto f = p.get_future();
  EXPECT_TRUE(f.valid());
  EXPECT_FALSE(f.is_ready());
  p.set_value(42);
  EXPECT_TRUE(f.is_ready());
  EXPECT_EQ(f.get(), 42);
  EXPECT_FALSE(f.valid());
}

TEST(FutureTest, GetBlocksUntilSatisfied) {
  promise<std::string> p;
  auto f = p.get_future();
  std::thread t([&p] { p.set_value("done"); });
  EXPECT_EQ(f.get(), "done");
  t.join();
}

TEST(FutureTest, WaitForTimesOut) {
  promise<int> p;
  auto f = p.get_future();
  EXPECT_EQ(f.wait_for(std::chrono::milliseconds(1)),
            std::future_status::timeout);
  p.set_value(1);
  EXPECT_EQ(f.wait_for(std::chrono::milliseconds(1)),
            std::future_status::ready);
}

TEST(FutureTest, SetException) {
  promise<int> p;
  auto f = p.get_future();
  p.set_exception(std::make_exception_ptr(std::runtime_error("test-message")));
  try {
    f.get();
    ADD_FAILURE() << "expected an exception";
  } catch (std::runtime_error const& ex) {
    EXPECT_THAT(ex.what(), HasSubstr("test-message"));
  }
}

TEST(FutureTest, BrokenPromise) {
  future<int> f;
  {
    promise<int> p;
    f = p.get_future();
  }
  EXPECT_TRUE(f.is_ready());
  EXPECT_EQ(ErrorCode([&f] { f.get(); }), std::future_errc::broken_promise);
}

TEST(FutureTest, Misuse) {
  promise<int> p;
  auto f = p.get_future();
  EXPECT_EQ(ErrorCode([&p] { p.get_future(); }),
            std::future_errc::future_already_retrieved);
  p.set_value(1);
  EXPECT_EQ(ErrorCode([&p] { p.set_value(2); }),
            std::future_errc::promise_already_satisfied);

  future<int> invalid;
  EXPECT_FALSE(invalid.valid());
  EXPECT_EQ(ErrorCode([&invalid] { invalid.wait(); }),
            std::future_errc::no_state);
  EXPECT_FALSE(invalid.cancel());
}

TEST(FutureTest, ThenRunsWhenSatisfied) {
  promise<int> p;
  auto f = p.get_future().then([](future<int> g) { return 2 * g.get(); });
  EXPECT_FALSE(f.is_ready());
  p.set_value(21);
  EXPECT_EQ(f.get(), 42);
}

TEST(FutureTest, ThenOnReadyFutureRunsImmediately) {
  bool called = false;
  auto f = make_ready_future(std::string("a")).then([&](future<std::string> g) {
    called = true;
    return g.get() + "b";
  });
  EXPECT_TRUE(called);
  EXPECT_EQ(f.get(), "ab");
}

TEST(FutureTest, ThenMoveOnlyValue) {
  promise<std::unique_ptr<int>> p;
  auto f = p.get_future().then(
      [](future<std::unique_ptr<int>> g) { return *g.get() + 1; });
  p.set_value(std::unique_ptr<int>(new int(41)));
  EXPECT_EQ(f.get(), 42);
}

TEST(FutureTest, ThenPropagatesExceptions) {
  promise<int> p;
  auto f = p.get_future().then([](future<int>) -> int {
    throw std::runtime_error("from-continuation");
  });
  p.set_value(0);
  EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(FutureTest, ThenUnwrapsNestedFutures) {
  promise<int> outer;
  promise<std::string> inner;
  future<std::string> f = outer.get_future().then(
      [&inner](future<int>) { return inner.get_future(); });
  outer.set_value(0);
  EXPECT_FALSE(f.is_ready());
  inner.set_value("inner-value");
  EXPECT_EQ(f.get(), "inner-value");
}

TEST(FutureTest, UnwrappingConstructor) {
  promise<future<int>> p;
  future<int> f(p.get_future());
  EXPECT_FALSE(f.is_ready());
  p.set_value(make_ready_future(7));
  EXPECT_EQ(f.get(), 7);
}

TEST(FutureTest, CancelRunsCallback) {
  int cancel_count = 0;
  promise<int> p([&cancel_count] { ++cancel_count; });
  auto f = p.get_future();
  EXPECT_TRUE(f.cancel());
  EXPECT_FALSE(f.cancel());
  EXPECT_EQ(cancel_count, 1);
  // Cancellation is a request, the producer still satisfies the future.
  p.set_value(3);
  EXPECT_EQ(f.get(), 3);
}

TEST(FutureTest, CancelReachesProducerThroughThen) {
  int cancel_count = 0;
  promise<int> p([&cancel_count] { ++cancel_count; });
  auto f = p.get_future().then([](future<int> g) { return g.get(); });
  EXPECT_TRUE(f.cancel());
  EXPECT_EQ(cancel_count, 1);
  p.set_value(0);
  EXPECT_EQ(f.get(), 0);
}

TEST(FutureTest, CancelAfterReadyFails) {
  int cancel_count = 0;
  promise<int> p([&cancel_count] { ++cancel_count; });
  auto f = p.get_future();
  p.set_value(1);
  EXPECT_FALSE(f.cancel());
  EXPECT_EQ(cancel_count, 0);
}

}  // namespace
GCP_AUTH_INLINE_NAMESPACE_END
}  // namespace gcp_auth
