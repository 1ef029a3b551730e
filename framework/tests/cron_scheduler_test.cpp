#include <gtest/gtest.h>
#include <ctime>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <thread>

#include "cron/CronScheduler.hpp"
#include "config/scheduler_config.hpp"

using namespace std::chrono_literals;
using namespace kcrond::framework;

// --- 辅助类：线程安全地计数和等待 ---
class AsyncCounter
{
public:
  void tick()
  {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      run_count_++;
    }
    cv_.notify_all();
  }

  int get_count() const
  {
    return run_count_;
  }

  bool wait_for_at_least(int expected_count, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(mtx_);
    return cv_.wait_for(lock, timeout, [this, expected_count]()
    {
      return run_count_ >= expected_count;
    });
  }

  // 在 duration 内计数没有增加时返回 true
  bool ensure_no_execution_for(std::chrono::milliseconds duration)
  {
    std::unique_lock<std::mutex> lock(mtx_);
    int initial = run_count_;
    bool triggered = cv_.wait_for(lock, duration, [this, initial]()
    {
      return run_count_ > initial;
    });
    return !triggered;
  }

private:
  std::atomic<int> run_count_{0};
  std::mutex mtx_;
  std::condition_variable cv_;
};

class CronSchedulerTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    scheduler_ = std::make_unique<CronScheduler>("UTC", 2);
  }

  void TearDown() override
  {
    scheduler_->stop();
  }

  std::unique_ptr<CronScheduler> scheduler_;
};

TEST_F(CronSchedulerTest, RejectsUnknownTimezone)
{
  EXPECT_THROW(CronScheduler("Mars/Olympus_Mons", 1), ConfigurationError);
  EXPECT_THROW(CronScheduler("", 1), ConfigurationError);
}

TEST_F(CronSchedulerTest, RejectsNonPositiveThreadCount)
{
  EXPECT_THROW(CronScheduler("UTC", 0), ConfigurationError);
  EXPECT_THROW(CronScheduler("UTC", -3), ConfigurationError);
}

TEST_F(CronSchedulerTest, BuildsFromConfig)
{
  SchedulerConfig config;
  config.timezone = "UTC";
  config.worker_threads = 1;

  CronScheduler scheduler(config);
  EXPECT_EQ(scheduler.timezone(), "UTC");
  EXPECT_FALSE(scheduler.started());
}

// 同一时区可以有多个引擎同时存活
TEST_F(CronSchedulerTest, SecondEngineSharesTimezone)
{
  EXPECT_NO_THROW(CronScheduler("UTC", 1));
}

// 存活的引擎已经绑定了 UTC，另一个时区会改掉它的 TZ，必须拒绝
TEST_F(CronSchedulerTest, SecondEngineWithOtherTimezoneIsRejected)
{
  EXPECT_THROW(CronScheduler("Asia/Shanghai", 1), ConfigurationError);

  std::time_t epoch = 0;
  std::tm local{};
  localtime_r(&epoch, &local);
  EXPECT_EQ(local.tm_hour, 0);
}

// 最后一个引擎析构后可以换到新的时区
TEST(CronSchedulerTimezoneTest, RebindsAfterLastEngineIsGone)
{
  {
    CronScheduler utc("UTC", 1);
  }
  CronScheduler shanghai("Asia/Shanghai", 1);

  std::time_t epoch = 0;
  std::tm local{};
  localtime_r(&epoch, &local);
  EXPECT_EQ(local.tm_hour, 8);
}

// start() 之前注册的任务不会触发
TEST_F(CronSchedulerTest, DormantUntilStarted)
{
  auto counter = std::make_shared<AsyncCounter>();
  scheduler_->register_trigger("* * * * * *", [counter]() { counter->tick(); });

  EXPECT_TRUE(counter->ensure_no_execution_for(1500ms)) << "Job ran before start()";

  scheduler_->start();
  EXPECT_TRUE(scheduler_->started());
  ASSERT_TRUE(counter->wait_for_at_least(1, 2500ms)) << "Job failed to run after start()";
}

TEST_F(CronSchedulerTest, RegisterAfterStartFires)
{
  scheduler_->start();

  auto counter = std::make_shared<AsyncCounter>();
  scheduler_->register_trigger("* * * * * *", [counter]() { counter->tick(); });

  ASSERT_TRUE(counter->wait_for_at_least(1, 2500ms));
}

TEST_F(CronSchedulerTest, CancelStopsFiring)
{
  scheduler_->start();

  auto counter = std::make_shared<AsyncCounter>();
  auto handle = scheduler_->register_trigger("* * * * * *", [counter]() { counter->tick(); });

  ASSERT_TRUE(counter->wait_for_at_least(1, 2000ms));

  EXPECT_TRUE(scheduler_->cancel(handle));
  std::this_thread::sleep_for(100ms);
  int count_after_cancel = counter->get_count();

  std::this_thread::sleep_for(2000ms);

  EXPECT_EQ(counter->get_count(), count_after_cancel)
        << "Job continued running after cancel() returned";
  EXPECT_EQ(scheduler_->size(), 0u);
}

// 重复取消、取消未知句柄都是安全的空操作
TEST_F(CronSchedulerTest, CancelIsNoOpSafe)
{
  auto handle = scheduler_->register_trigger("0 0 0 1 1 *", []() {});

  EXPECT_TRUE(scheduler_->cancel(handle));
  EXPECT_FALSE(scheduler_->cancel(handle));
  EXPECT_FALSE(scheduler_->cancel(TriggerHandle{424242}));
}

TEST_F(CronSchedulerTest, HandlesAreUnique)
{
  auto h1 = scheduler_->register_trigger("0 0 0 1 1 *", []() {});
  auto h2 = scheduler_->register_trigger("0 0 0 1 1 *", []() {});
  scheduler_->cancel(h1);
  auto h3 = scheduler_->register_trigger("0 0 0 1 1 *", []() {});

  EXPECT_NE(h1, h2);
  EXPECT_NE(h1, h3);
  EXPECT_NE(h2, h3);
  EXPECT_EQ(scheduler_->size(), 2u);
}

TEST_F(CronSchedulerTest, InvalidExpression)
{
  EXPECT_THROW(scheduler_->validate("invalid cron"), InvalidExpression);
  EXPECT_THROW(scheduler_->register_trigger("invalid cron", []() {}), InvalidExpression);
  EXPECT_EQ(scheduler_->size(), 0u);
}

TEST_F(CronSchedulerTest, MultipleTasks)
{
  scheduler_->start();

  auto counter1 = std::make_shared<AsyncCounter>();
  auto counter2 = std::make_shared<AsyncCounter>();

  scheduler_->register_trigger("* * * * * *", [counter1]() { counter1->tick(); });
  scheduler_->register_trigger("* * * * * *", [counter2]() { counter2->tick(); });

  EXPECT_TRUE(counter1->wait_for_at_least(1, 2000ms));
  EXPECT_TRUE(counter2->wait_for_at_least(1, 2000ms));
}

TEST_F(CronSchedulerTest, StopIsIdempotentAndRejectsNewJobs)
{
  scheduler_->start();
  scheduler_->stop();
  scheduler_->stop();

  EXPECT_FALSE(scheduler_->started());
  EXPECT_THROW(scheduler_->register_trigger("* * * * * *", []() {}), SchedulerError);
}
