#ifndef KCROND_FRAMEWORK_CRON_SCHEDULER_HPP
#define KCROND_FRAMEWORK_CRON_SCHEDULER_HPP

#include "CronJob.hpp"
#include "trigger_engine.hpp"
#include "io_context_pool.hpp"
#include <functional>
#include <memory>
#include <map>
#include <mutex>
#include <string>

namespace kcrond::framework
{
  struct SchedulerConfig;

  /**
   * @brief 基于 CronJob + IoContextPool 的定时引擎
   *
   * 构造时把进程绑定到配置的时区（TZ），之后所有表达式都按这个时区的本地时间计算。
   * TZ 是进程级的：已有引擎存活时只允许同一时区，最后一个引擎析构后才能换时区。
   * 构造后处于休眠状态：可以注册任务，但 start() 之前不会触发。
   */
  class CronScheduler : public TriggerEngine
  {
  private:
    // 内部通用实现类：执行 std::function 的 CronJob
    class LambdaCronJob : public CronJob
    {
    public:
      LambdaCronJob(boost::asio::io_context& ioc, const std::string& expr, std::function<void()> func)
        : CronJob(ioc, expr), func_(std::move(func))
      {
      }

    protected:
      void run() override
      {
        if (func_) func_();
      }

    private:
      std::function<void()> func_;
    };

  public:
    /**
     * @param timezone IANA 时区名，例如 "Asia/Shanghai"
     * @param num_threads 回调线程数
     * @param zoneinfo_dir 时区数据库目录
     * @throws ConfigurationError 时区无法解析、与存活的引擎时区不同，或线程数不合法
     */
    CronScheduler(const std::string& timezone, int num_threads,
                  const std::string& zoneinfo_dir = "/usr/share/zoneinfo");

    explicit CronScheduler(const SchedulerConfig& config);

    ~CronScheduler() override;

    // 禁止拷贝
    CronScheduler(const CronScheduler&) = delete;
    CronScheduler& operator=(const CronScheduler&) = delete;

    void validate(const std::string& expression) const override;

    TriggerHandle register_trigger(const std::string& expression, std::function<void()> callback) override;

    bool cancel(TriggerHandle handle) override;

    void start() override;

    void stop() override;

    bool started() const;

    size_t size() const;

    const std::string& timezone() const
    {
      return timezone_;
    }

  private:
    std::string timezone_;
    IoContextPool pool_;

    mutable std::mutex mutex_;
    std::map<std::uint64_t, std::shared_ptr<CronJob>> jobs_;
    std::uint64_t next_handle_ = 1;
    bool started_ = false;
    bool stopped_ = false;
  };
}

#endif // KCROND_FRAMEWORK_CRON_SCHEDULER_HPP
