// ============================================================================
// test_writer_pool.cpp -- Test the WriterPool completion synchronizer
// ============================================================================
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

#include "solrdump/writer_pool.hpp"

#define EXPECT_TRUE(x) do{ \
  if(!(x)){ \
    std::fprintf(stderr,"EXPECT_TRUE failed: %s @ %s:%d\n",#x,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

#define EXPECT_EQ(a,b) do{ \
  auto _va=(a); auto _vb=(b); \
  if(!((_va)==(_vb))){ \
    std::fprintf(stderr,"EXPECT_EQ failed: %s=%lld %s=%lld @ %s:%d\n", \
                 #a,(long long)_va,#b,(long long)_vb,__FILE__,__LINE__); \
    std::abort(); \
  } \
}while(0)

using solrdump::WriteSummary;
using solrdump::WriteTask;
using solrdump::WriterPool;
using solrdump::WriterPoolConfig;

// ============================================================================
// Test 1: wait() returns only after every task ran
// ============================================================================
void test_all_tasks_complete() {
  WriterPool pool(WriterPoolConfig{4});
  std::atomic<int> ran{0};
  const int N = 64;
  for (int i = 0; i < N; ++i) {
    WriteTask t;
    t.path = "task" + std::to_string(i);
    t.fn = [&ran, i]() -> std::size_t {
      std::this_thread::sleep_for(std::chrono::milliseconds(i % 5));
      ran.fetch_add(1);
      return 10;
    };
    EXPECT_TRUE(pool.submit(std::move(t)));
  }
  WriteSummary s = pool.wait();
  EXPECT_EQ(ran.load(), N);
  EXPECT_EQ(s.succeeded, (uint64_t)N);
  EXPECT_EQ(s.failed, 0u);
  EXPECT_TRUE(s.ok());
  EXPECT_EQ(pool.stats().bytes.load(), (uint64_t)N * 10);
  EXPECT_EQ(pool.stats().submitted.load(), (uint64_t)N);
  std::puts("test_all_tasks_complete: OK");
}

// ============================================================================
// Test 2: failures are isolated and aggregated with their paths
// ============================================================================
void test_failures_aggregated() {
  WriterPool pool(WriterPoolConfig{3});
  for (int i = 0; i < 10; ++i) {
    WriteTask t;
    t.path = "file" + std::to_string(i);
    t.fn = [i]() -> std::size_t {
      if (i == 7 || i == 2) throw std::runtime_error("disk says no");
      return 1;
    };
    EXPECT_TRUE(pool.submit(std::move(t)));
  }
  WriteSummary s = pool.wait();
  EXPECT_EQ(s.succeeded, 8u);
  EXPECT_EQ(s.failed, 2u);
  EXPECT_TRUE(!s.ok());
  EXPECT_EQ(s.failed_paths.size(), 2u);
  EXPECT_TRUE(s.failed_paths[0] == "file2");
  EXPECT_TRUE(s.failed_paths[1] == "file7");
  std::puts("test_failures_aggregated: OK");
}

// ============================================================================
// Test 3: submit never waits for a running write
// ============================================================================
void test_submit_does_not_block() {
  WriterPool pool(WriterPoolConfig{1});
  std::atomic<bool> release{false};

  WriteTask slow;
  slow.path = "slow";
  slow.fn = [&release]() -> std::size_t {
    while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return 0;
  };
  EXPECT_TRUE(pool.submit(std::move(slow)));

  // the only writer is busy; queueing more must still return immediately
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < 100; ++i) {
    WriteTask t;
    t.path = "fast";
    t.fn = []() -> std::size_t { return 0; };
    EXPECT_TRUE(pool.submit(std::move(t)));
  }
  auto dt = std::chrono::steady_clock::now() - t0;
  EXPECT_TRUE(dt < std::chrono::seconds(1));
  EXPECT_EQ(pool.stats().succeeded.load(), 0u);

  release = true;
  WriteSummary s = pool.wait();
  EXPECT_EQ(s.succeeded, 101u);
  std::puts("test_submit_does_not_block: OK");
}

// ============================================================================
// Test 4: empty pool and submit after wait
// ============================================================================
void test_empty_and_closed() {
  WriterPool pool;
  WriteSummary s = pool.wait();
  EXPECT_EQ(s.succeeded, 0u);
  EXPECT_TRUE(s.ok());

  WriteTask t;
  t.path = "late";
  t.fn = []() -> std::size_t { return 0; };
  EXPECT_TRUE(!pool.submit(std::move(t)));
  std::puts("test_empty_and_closed: OK");
}

// ============================================================================
// Main
// ============================================================================
int main() {
  std::puts("Running writer pool tests...");
  test_all_tasks_complete();
  test_failures_aggregated();
  test_submit_does_not_block();
  test_empty_and_closed();
  std::puts("All writer pool tests PASSED.");
  return 0;
}
