#include <gtest/gtest.h>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <chrono>
#include <thread>
#include <set>
#include <vector>

#include "cron/CronJob.hpp"
#include "io_context_pool.hpp"

using namespace std::chrono_literals;
using namespace kcrond::framework;

// --- 测试用的辅助类 ---
class TestableCronJob : public CronJob
{
public:
  TestableCronJob(boost::asio::io_context& ioc, const std::string& expr)
    : CronJob(ioc, expr), run_count_(0)
  {
  }

  void run() override
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      fired_at_.push_back(std::time(nullptr));
      run_count_++;
    }
    cv_.notify_all();
  }

  // 等待任务执行 n 次，超时返回 false
  bool wait_for_runs(int expected_count, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, expected_count]()
    {
      return run_count_ >= expected_count;
    });
  }

  int get_run_count() const
  {
    return run_count_;
  }

  std::vector<std::time_t> fired_at()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_at_;
  }

private:
  std::atomic<int> run_count_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<std::time_t> fired_at_;
};

class ThrowingCronJob : public CronJob
{
public:
  using CronJob::CronJob;

  void run() override
  {
    run_count_++;
    throw std::runtime_error("boom");
  }

  std::atomic<int> run_count_{0};
};

// --- 测试套件 ---

class CronJobTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    pool_ = std::make_unique<IoContextPool>(2);
    pool_->start();
  }

  void TearDown() override
  {
    pool_->stop();
  }

  boost::asio::io_context& ioc()
  {
    return pool_->get_io_context();
  }

  std::unique_ptr<IoContextPool> pool_;
};

// 无效的 Cron 表达式抛出 InvalidExpression
TEST_F(CronJobTest, ThrowsOnInvalidExpression)
{
  EXPECT_THROW({
               auto job = std::make_shared<TestableCronJob>(ioc(), "invalid cron string");
               }, InvalidExpression);

  // 五个字段（缺少秒）也不接受
  EXPECT_THROW(CronJob::parse("* * * * *"), InvalidExpression);
}

TEST_F(CronJobTest, InvalidExpressionKeepsExpressionText)
{
  try
  {
    CronJob::parse("61 * * * * *");
    FAIL() << "expected InvalidExpression";
  }
  catch (const InvalidExpression& e)
  {
    EXPECT_EQ(e.expression(), "61 * * * * *");
  }
}

TEST_F(CronJobTest, AcceptsSixFieldGrammar)
{
  EXPECT_NO_THROW(CronJob::parse("* * * * * *"));
  EXPECT_NO_THROW(CronJob::parse("0 */2 * * * *"));
  EXPECT_NO_THROW(CronJob::parse("0 0 0 * * *"));
  EXPECT_NO_THROW(CronJob::parse("30 15 8 1 6 0"));
}

// 每秒执行一次，2.5 秒内至少执行 1 次
TEST_F(CronJobTest, RunsScheduleCorrectly)
{
  auto job = std::make_shared<TestableCronJob>(ioc(), "* * * * * *");

  job->start();

  bool executed = job->wait_for_runs(1, 2500ms);

  EXPECT_TRUE(executed) << "Job did not run within timeout";
  EXPECT_GE(job->get_run_count(), 1);

  job->stop();
}

// 没有 start() 的任务不会执行
TEST_F(CronJobTest, DoesNotRunBeforeStart)
{
  auto job = std::make_shared<TestableCronJob>(ioc(), "* * * * * *");

  EXPECT_FALSE(job->wait_for_runs(1, 1500ms));
  EXPECT_EQ(job->get_run_count(), 0);
}

TEST_F(CronJobTest, StopPreventsFurtherExecution)
{
  auto job = std::make_shared<TestableCronJob>(ioc(), "* * * * * *");
  job->start();

  ASSERT_TRUE(job->wait_for_runs(1, 2s));

  job->stop();
  // 给已经在途的一次触发留出完成的时间
  std::this_thread::sleep_for(100ms);
  int count_after_stop = job->get_run_count();

  std::this_thread::sleep_for(2s);

  EXPECT_EQ(job->get_run_count(), count_after_stop);
  EXPECT_FALSE(job->running());
}

// 同一秒不会触发两次
TEST_F(CronJobTest, FiresAtMostOncePerMatchingSecond)
{
  auto job = std::make_shared<TestableCronJob>(ioc(), "* * * * * *");
  job->start();

  ASSERT_TRUE(job->wait_for_runs(3, 4500ms));
  job->stop();

  auto fired = job->fired_at();
  std::set<std::time_t> distinct(fired.begin(), fired.end());
  EXPECT_EQ(distinct.size(), fired.size());
}

// 回调抛异常后任务继续按计划执行
TEST_F(CronJobTest, ExceptionInRunDoesNotStopJob)
{
  auto job = std::make_shared<ThrowingCronJob>(ioc(), "* * * * * *");
  job->start();

  std::this_thread::sleep_for(2800ms);
  EXPECT_GE(job->run_count_.load(), 2);
  EXPECT_TRUE(job->running());

  job->stop();
}

TEST_F(CronJobTest, MultipleJobs)
{
  auto job1 = std::make_shared<TestableCronJob>(ioc(), "* * * * * *");
  auto job2 = std::make_shared<TestableCronJob>(ioc(), "* * * * * *");

  job1->start();
  job2->start();

  EXPECT_TRUE(job1->wait_for_runs(1, 2s));
  EXPECT_TRUE(job2->wait_for_runs(1, 2s));

  job1->stop();
  job2->stop();
}
