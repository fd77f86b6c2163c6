#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "Executor/FlightExecutor.hpp"
#include "SingleFlight/SingleFlight.hpp"
#include "TestHelpers.hpp"

namespace {

using namespace std::chrono_literals;
using Group = SingleFlight<std::string>;

TEST(NonblockingTest, ReturnsHandleImmediately) {
  Group group;
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  auto handle = group.doNonblocking("key", [opened] {
    opened.wait();
    return std::string("value");
  });
  EXPECT_EQ(handle.wait_for(10ms), std::future_status::timeout);

  gate.set_value();
  const auto result = handle.get();
  ASSERT_TRUE(result.outcome.ok());
  EXPECT_EQ(result.outcome.value(), "value");
  EXPECT_TRUE(result.executed);
  EXPECT_FALSE(result.shared);
  EXPECT_EQ(group.size(), 0u);
}

TEST(NonblockingTest, DistinctHandlesShareOneExecution) {
  Group group;
  std::atomic<int> calls{0};
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  auto fn = [&calls, opened] {
    calls.fetch_add(1);
    opened.wait();
    return std::string("shared");
  };

  constexpr int n = 20;
  std::vector<std::future<Group::Result>> handles;
  for (int i = 0; i < n; ++i) {
    handles.push_back(group.doNonblocking("key", fn));
  }
  EXPECT_EQ(group.waiterCount("key"), n);

  gate.set_value();
  int executors = 0;
  for (auto& handle : handles) {
    const auto result = handle.get();
    EXPECT_EQ(result.outcome.value(), "shared");
    EXPECT_TRUE(result.shared);
    if (result.executed) {
      ++executors;
    }
  }
  EXPECT_EQ(executors, 1);
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(group.size(), 0u);
}

TEST(NonblockingTest, AttachesToBlockingExecutor) {
  Group group;
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  auto blocking = std::async(std::launch::async, [&group, opened] {
    return group.doCall("key", [opened] {
      opened.wait();
      return std::string("from blocking");
    });
  });
  ASSERT_TRUE(waitUntil([&group] { return group.inFlight("key"); }));

  auto handle = group.doNonblocking("key", [] { return std::string("never runs"); });

  // Giving up on the handle does not cancel the execution.
  EXPECT_EQ(handle.wait_for(10ms), std::future_status::timeout);

  gate.set_value();
  const auto executor_result = blocking.get();
  EXPECT_TRUE(executor_result.executed);
  EXPECT_TRUE(executor_result.shared);

  const auto attached = handle.get();
  EXPECT_EQ(attached.outcome.value(), "from blocking");
  EXPECT_FALSE(attached.executed);
  EXPECT_TRUE(attached.shared);
}

TEST(NonblockingTest, BlockingCallerAttachesToNonblockingExecutor) {
  Group group;
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  auto handle = group.doNonblocking("key", [opened] {
    opened.wait();
    return std::string("async");
  });

  auto blocking = std::async(std::launch::async, [&group] {
    return group.doCall("key", [] { return std::string("never runs"); });
  });
  ASSERT_TRUE(waitUntil([&group] { return group.waiterCount("key") == 2; }));

  gate.set_value();
  EXPECT_EQ(blocking.get().outcome.value(), "async");
  const auto result = handle.get();
  EXPECT_TRUE(result.executed);
  EXPECT_TRUE(result.shared);
}

TEST(NonblockingTest, FaultResolvesEveryHandle) {
  SingleFlight<int> group;
  std::promise<void> gate;
  std::shared_future<void> opened = gate.get_future().share();

  auto fn = [opened]() -> int {
    opened.wait();
    throw std::runtime_error("fetch failed");
  };

  auto first = group.doNonblocking("key", fn);
  auto second = group.doNonblocking("key", fn);
  gate.set_value();

  for (auto* handle : {&first, &second}) {
    const auto result = handle->get();
    EXPECT_TRUE(result.outcome.faulted());
    EXPECT_EQ(result.outcome.errorMessage(), "work procedure faulted: fetch failed");
  }
  EXPECT_EQ(group.size(), 0u);
}

TEST(NonblockingTest, RunsOnCallerSuppliedExecutor) {
  SingleFlight<std::thread::id> group;
  boost::asio::io_context io_context;
  auto work_guard = boost::asio::make_work_guard(io_context);
  std::thread runner([&io_context] { io_context.run(); });

  auto handle = group.doNonblocking(io_context.get_executor(), "key",
                                    [] { return std::this_thread::get_id(); });
  const auto result = handle.get();
  EXPECT_EQ(result.outcome.value(), runner.get_id());
  EXPECT_TRUE(result.executed);

  work_guard.reset();
  runner.join();
}

TEST(NonblockingTest, DiscardedWorkStillReleasesWaiters) {
  SingleFlight<int> group;
  std::future<SingleFlight<int>::Result> handle;
  std::future<SingleFlight<int>::Result> attached;
  {
    boost::asio::io_context io_context;
    handle = group.doNonblocking(io_context.get_executor(), "key", [] { return 1; });
    attached = group.doNonblocking("key", [] { return 2; });
    EXPECT_EQ(group.waiterCount("key"), 2);
  }

  const auto result = handle.get();
  EXPECT_FALSE(result.outcome.ok());
  EXPECT_EQ(result.outcome.errorMessage(), "work was discarded before it ran");
  EXPECT_TRUE(result.executed);

  const auto waiter = attached.get();
  EXPECT_EQ(waiter.outcome.errorMessage(), "work was discarded before it ran");
  EXPECT_FALSE(waiter.executed);
  EXPECT_EQ(group.size(), 0u);
}

TEST(NonblockingTest, SharedExecutorHasConfiguredThreads) {
  EXPECT_GE(FlightExecutor::getInstance().threadCount(), 1u);
}

}  // namespace
