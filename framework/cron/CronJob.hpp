#ifndef KCROND_FRAMEWORK_CRON_JOB_HPP
#define KCROND_FRAMEWORK_CRON_JOB_HPP

#include <string>
#include <memory>
#include <ctime>
#include <atomic>
#include <algorithm>
#include <boost/asio.hpp>
#include <fmt/core.h>
#include "croncpp.hpp"
#include "exception/scheduler_errors.hpp"

namespace kcrond::framework
{
  /**
   * @brief 一个按 cron 表达式周期触发的定时器
   *
   * 定时器绑定在 strand 上，同一个 job 的回调串行执行，不同 job 之间并发。
   * 必须由 std::shared_ptr 持有（start/stop 需要 shared_from_this）。
   */
  class CronJob : public std::enable_shared_from_this<CronJob>
  {
  public:
    CronJob(boost::asio::io_context& ioc, const std::string& expression)
      : timer_(boost::asio::make_strand(ioc))
        , expression_(expression)
        , cron_expr_(parse(expression))
        , is_running_(false)
    {
    }

    virtual ~CronJob() = default;

    // 解析失败时抛出 InvalidExpression
    static cron::cronexpr parse(const std::string& expression)
    {
      try
      {
        return cron::make_cron(expression);
      }
      catch (const std::exception& e)
      {
        throw InvalidExpression(expression, e.what());
      }
    }

    const std::string& expression() const
    {
      return expression_;
    }

    bool running() const
    {
      return is_running_;
    }

    void start()
    {
      // 防止重复启动
      bool expected = false;
      if (is_running_.compare_exchange_strong(expected, true))
      {
        auto self = shared_from_this();
        boost::asio::post(timer_.get_executor(), [self]()
        {
          self->schedule_next();
        });
      }
    }

    void stop()
    {
      // 先改状态位：即使 cancel 没能拦住已经入队的回调，回调里也会检查这个标志
      is_running_ = false;

      // timer 不是线程安全的，cancel 必须回到 strand 上执行
      auto self = shared_from_this();
      boost::asio::post(timer_.get_executor(), [self]()
      {
        self->timer_.cancel();
      });
    }

  protected:
    virtual void run() = 0;

  private:
    // 只在 strand 上调用
    void schedule_next()
    {
      if (!is_running_) return;

      // 从 max(now, 上次触发) 开始算，定时器提前醒来也不会在同一秒触发两次
      const std::time_t from = std::max(std::time(nullptr), last_fire_);
      const std::time_t next = cron::cron_next(cron_expr_, from);
      if (next == static_cast<std::time_t>(-1))
      {
        fmt::print(stderr, "[CronJob] '{}' has no next occurrence, stopping\n", expression_);
        is_running_ = false;
        return;
      }

      next_fire_ = next;
      timer_.expires_at(std::chrono::system_clock::from_time_t(next));

      auto self = shared_from_this();
      timer_.async_wait([this, self](const boost::system::error_code& ec)
      {
        // 被显式 cancel
        if (ec == boost::asio::error::operation_aborted) return;

        // stop() 在回调入队之后才被调用时 ec 是 success，但标志位已经是 false
        if (!is_running_) return;

        if (ec)
        {
          fmt::print(stderr, "[CronJob] Timer error for '{}': {}\n", expression_, ec.message());
          return;
        }

        last_fire_ = next_fire_;

        try
        {
          this->run();
        }
        catch (const std::exception& e)
        {
          fmt::print(stderr, "[CronJob] Task exception for '{}': {}\n", expression_, e.what());
        }

        // run() 执行期间可能有人调用了 stop()，这里不检查的话任务会再次复活
        if (is_running_)
        {
          schedule_next();
        }
      });
    }

    boost::asio::system_timer timer_;
    std::string expression_;
    cron::cronexpr cron_expr_;
    std::atomic<bool> is_running_;
    std::time_t last_fire_ = 0;
    std::time_t next_fire_ = 0;
  };
}

#endif // KCROND_FRAMEWORK_CRON_JOB_HPP
