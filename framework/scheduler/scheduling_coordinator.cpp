// framework/scheduler/scheduling_coordinator.cpp
#include "scheduling_coordinator.hpp"
#include "cron/CronScheduler.hpp"
#include <fmt/core.h>
#include <optional>

namespace kcrond::framework
{
  SchedulingCoordinator::SchedulingCoordinator(std::shared_ptr<TaskStore> store, const SchedulerConfig& config,
                                               TaskAction action)
    : SchedulingCoordinator(std::move(store), std::make_shared<CronScheduler>(config), std::move(action))
  {
  }

  SchedulingCoordinator::SchedulingCoordinator(std::shared_ptr<TaskStore> store,
                                               std::shared_ptr<TriggerEngine> engine,
                                               TaskAction action)
    : store_(std::move(store)),
      engine_(std::move(engine)),
      action_(std::move(action))
  {
    if (!store_ || !engine_)
    {
      throw ConfigurationError("scheduling coordinator needs both a task store and a trigger engine");
    }
    if (!action_)
    {
      action_ = make_logging_action();
    }
  }

  SchedulingCoordinator::~SchedulingCoordinator()
  {
    stop();
  }

  TriggerHandle SchedulingCoordinator::register_task(const Task& task)
  {
    // 每个回调按值持有自己的任务和动作
    auto action = action_;
    return engine_->register_trigger(task.cron, [action, task]()
    {
      action(task);
    });
  }

  bool SchedulingCoordinator::insert_handle(TaskId id, TriggerHandle handle)
  {
    bool inserted = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (removed_.count(id) == 0)
      {
        inserted = handles_.emplace(id, handle).second;
      }
    }

    if (!inserted)
    {
      engine_->cancel(handle);
    }
    return inserted;
  }

  void SchedulingCoordinator::finish_loading()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    loading_ = false;
    removed_.clear();
  }

  StartSummary SchedulingCoordinator::start_all()
  {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true))
    {
      fmt::print(stderr, "[SchedulingCoordinator] start_all() called twice, ignoring\n");
      return {};
    }

    // 从读取存储之前开始记录删除，直到循环结束
    {
      std::lock_guard<std::mutex> lock(mutex_);
      loading_ = true;
    }

    std::vector<Task> tasks;
    try
    {
      tasks = store_->list_all();
    }
    catch (const StoreUnavailable& e)
    {
      finish_loading();
      started_ = false;
      fmt::print(stderr, "[SchedulingCoordinator] Failed to load tasks: {}\n", e.what());
      throw;
    }
    catch (const std::exception& e)
    {
      finish_loading();
      started_ = false;
      fmt::print(stderr, "[SchedulingCoordinator] Failed to load tasks: {}\n", e.what());
      throw StoreUnavailable(fmt::format("failed to load tasks: {}", e.what()));
    }

    StartSummary summary;
    for (const auto& task : tasks)
    {
      TriggerHandle handle;
      try
      {
        handle = register_task(task);
      }
      catch (const std::exception& e)
      {
        // 单个任务失败不能拖垮其余任务
        summary.degraded.push_back({task.id, task.name, PartialRegistrationFailure(task.id, e.what())});
        fmt::print(stderr, "[SchedulingCoordinator] Failed to add task {} ({}): {}\n",
                   task.name, task.id, summary.degraded.back().error.what());
        continue;
      }

      if (insert_handle(task.id, handle))
      {
        ++summary.scheduled;
        fmt::print("[SchedulingCoordinator] Task {} ({}) started, cron: {}\n", task.name, task.id, task.cron);
      }
    }
    finish_loading();

    engine_->start();
    fmt::print("[SchedulingCoordinator] {} task(s) scheduled, {} degraded\n",
               summary.scheduled, summary.degraded.size());
    return summary;
  }

  TaskId SchedulingCoordinator::add_task(const std::string& name, const std::string& program, const std::string& cron)
  {
    // 表达式不合法时在写存储之前就失败
    engine_->validate(cron);

    Task task{0, name, program, cron};
    task.id = store_->create(task);

    TriggerHandle handle;
    try
    {
      handle = register_task(task);
    }
    catch (const std::exception& e)
    {
      // 回滚：不能留下一条没有触发器的记录
      try
      {
        store_->delete_by_id(task.id);
      }
      catch (const std::exception& rollback_error)
      {
        fmt::print(stderr, "[SchedulingCoordinator] Rolling back task {} ({}) failed: {}\n",
                   task.name, task.id, rollback_error.what());
        throw CompensationFailure(task.id, e.what(), rollback_error.what());
      }
      fmt::print(stderr, "[SchedulingCoordinator] Failed to add task {} to scheduler, rolled back: {}\n",
                 task.name, e.what());
      throw;
    }

    insert_handle(task.id, handle);
    fmt::print("[SchedulingCoordinator] Task {} ({}) added, cron: {}\n", task.name, task.id, cron);
    return task.id;
  }

  void SchedulingCoordinator::remove_task(TaskId id)
  {
    // 不存在时抛 NotFound，映射和存储都不动
    Task task = store_->get_by_id(id);

    std::optional<TriggerHandle> handle;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (auto it = handles_.find(id); it != handles_.end())
      {
        handle = it->second;
        handles_.erase(it);
      }
      if (loading_)
      {
        removed_.insert(id);
      }
    }

    // 加载时注册失败的任务没有句柄，直接跳过
    if (handle)
    {
      engine_->cancel(*handle);
    }

    try
    {
      store_->delete_by_id(id);
    }
    catch (const std::exception& e)
    {
      fmt::print(stderr, "[SchedulingCoordinator] Task {} ({}) unscheduled but still persisted: {}\n",
                 task.name, id, e.what());
      throw;
    }

    fmt::print("[SchedulingCoordinator] Task {} ({}) removed\n", task.name, id);
  }

  bool SchedulingCoordinator::is_scheduled(TaskId id) const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.count(id) != 0;
  }

  std::vector<TaskId> SchedulingCoordinator::scheduled_ids() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TaskId> ids;
    ids.reserve(handles_.size());
    for (const auto& [id, handle] : handles_)
    {
      ids.push_back(id);
    }
    return ids;
  }

  size_t SchedulingCoordinator::scheduled_count() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
  }

  size_t SchedulingCoordinator::pending_removals() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return removed_.size();
  }

  void SchedulingCoordinator::stop()
  {
    engine_->stop();
  }
} // namespace kcrond::framework
