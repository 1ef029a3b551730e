// framework/cron/CronScheduler.cpp
#include "CronScheduler.hpp"
#include "config/scheduler_config.hpp"
#include <fmt/core.h>
#include <mutex>
#include <string>
#include <vector>

namespace kcrond::framework
{
  namespace
  {
    unsigned int checked_thread_count(int num_threads)
    {
      if (num_threads <= 0)
      {
        throw ConfigurationError(fmt::format("worker thread count must be positive, got {}", num_threads));
      }
      return static_cast<unsigned int>(num_threads);
    }

    // TZ 是进程级的：所有存活的引擎共用同一个时区文件
    std::mutex timezone_mutex;
    std::string bound_zone_file;
    size_t live_engines = 0;

    void bind_timezone(const std::string& timezone, const std::string& zoneinfo_dir)
    {
      const std::string zone_file = resolve_timezone(timezone, zoneinfo_dir).string();

      std::lock_guard<std::mutex> lock(timezone_mutex);
      if (live_engines == 0)
      {
        apply_timezone(timezone, zoneinfo_dir);
        bound_zone_file = zone_file;
      }
      else if (zone_file != bound_zone_file)
      {
        throw ConfigurationError(fmt::format("timezone '{}' conflicts with {} already bound by a live scheduler",
                                             timezone, bound_zone_file));
      }
      ++live_engines;
    }

    void release_timezone()
    {
      std::lock_guard<std::mutex> lock(timezone_mutex);
      if (live_engines > 0) --live_engines;
    }
  }

  CronScheduler::CronScheduler(const std::string& timezone, int num_threads, const std::string& zoneinfo_dir)
    : timezone_(timezone),
      pool_(checked_thread_count(num_threads))
  {
    // 时区无法解析或与其它存活引擎冲突时抛 ConfigurationError，启动失败
    bind_timezone(timezone_, zoneinfo_dir);
    fmt::print("[CronScheduler] Using timezone {} with {} worker thread(s)\n", timezone_, num_threads);
  }

  CronScheduler::CronScheduler(const SchedulerConfig& config)
    : CronScheduler(config.timezone, config.worker_threads, config.zoneinfo_dir)
  {
  }

  CronScheduler::~CronScheduler()
  {
    stop();
    release_timezone();
  }

  void CronScheduler::validate(const std::string& expression) const
  {
    CronJob::parse(expression);
  }

  TriggerHandle CronScheduler::register_trigger(const std::string& expression, std::function<void()> callback)
  {
    // 在锁外解析，表达式错误时抛 InvalidExpression
    auto job = std::make_shared<LambdaCronJob>(pool_.get_io_context(), expression, std::move(callback));

    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_)
    {
      throw SchedulerError("cron scheduler has been stopped");
    }

    TriggerHandle handle{next_handle_++};
    jobs_.emplace(handle.value, job);

    // 时钟已经在跑就立即挂上，否则等 start()
    if (started_)
    {
      job->start();
    }
    return handle;
  }

  bool CronScheduler::cancel(TriggerHandle handle)
  {
    std::shared_ptr<CronJob> job;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = jobs_.find(handle.value);
      if (it == jobs_.end())
      {
        return false;
      }
      job = std::move(it->second);
      jobs_.erase(it);
    }

    job->stop();
    return true;
  }

  void CronScheduler::start()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_ || stopped_) return;
    started_ = true;

    pool_.start();
    for (auto& [id, job] : jobs_)
    {
      job->start();
    }
    fmt::print("[CronScheduler] Clock started with {} job(s)\n", jobs_.size());
  }

  void CronScheduler::stop()
  {
    std::vector<std::shared_ptr<CronJob>> jobs;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (stopped_) return;
      stopped_ = true;

      jobs.reserve(jobs_.size());
      for (auto& [id, job] : jobs_)
      {
        jobs.push_back(job);
      }
      jobs_.clear();
    }

    for (auto& job : jobs)
    {
      job->stop();
    }
    pool_.stop();
  }

  bool CronScheduler::started() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && !stopped_;
  }

  size_t CronScheduler::size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
  }
} // namespace kcrond::framework
