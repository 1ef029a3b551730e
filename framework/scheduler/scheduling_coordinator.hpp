// framework/scheduler/scheduling_coordinator.hpp
#ifndef KCROND_FRAMEWORK_SCHEDULER_SCHEDULING_COORDINATOR_HPP
#define KCROND_FRAMEWORK_SCHEDULER_SCHEDULING_COORDINATOR_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "config/scheduler_config.hpp"
#include "cron/trigger_engine.hpp"
#include "store/task_store.hpp"
#include "task_action.hpp"

namespace kcrond::framework
{
  // 加载时注册失败、留在存储里但没有触发器的任务
  struct DegradedTask
  {
    TaskId id;
    std::string name;
    PartialRegistrationFailure error;
  };

  struct StartSummary
  {
    size_t scheduled = 0;
    std::vector<DegradedTask> degraded;
  };

  /**
   * @brief 维护 "任务 id -> 触发器句柄" 的映射，并让它和存储保持一致
   *
   * 映射只在 mutex_ 下读写，锁只覆盖内存里的映射更新，不会跨越存储或引擎调用。
   * 生命周期: 构造 -> start_all() -> add_task()/remove_task() ... -> stop()
   */
  class SchedulingCoordinator
  {
  public:
    /**
     * @brief 按配置创建一个尚未启动的 CronScheduler
     * @throws ConfigurationError 时区无法解析或线程数不合法
     */
    SchedulingCoordinator(std::shared_ptr<TaskStore> store, const SchedulerConfig& config,
                          TaskAction action = make_logging_action());

    SchedulingCoordinator(std::shared_ptr<TaskStore> store, std::shared_ptr<TriggerEngine> engine,
                          TaskAction action = make_logging_action());

    ~SchedulingCoordinator();

    SchedulingCoordinator(const SchedulingCoordinator&) = delete;
    SchedulingCoordinator& operator=(const SchedulingCoordinator&) = delete;

    /**
     * @brief 加载存储里的全部任务并逐个注册，最后启动时钟（只启动一次）
     *
     * 单个任务注册失败只记录日志并写入返回值的 degraded，不会中断加载。
     * @throws StoreUnavailable 无法读取存储
     */
    StartSummary start_all();

    /**
     * @brief 先持久化，再注册触发器；注册失败时删除刚写入的记录
     * @throws InvalidExpression 表达式不合法（此时没有任何修改）
     * @throws CompensationFailure 注册失败且回滚删除也失败
     */
    TaskId add_task(const std::string& name, const std::string& program, const std::string& cron);

    /**
     * @brief 取消触发器（没有句柄也可以）并删除存储记录
     *
     * 存储删除失败时触发器不会恢复，任务处于 "已持久化但未调度" 状态，异常抛给调用方重试。
     * @throws NotFound 任务不存在（此时没有任何修改）
     */
    void remove_task(TaskId id);

    bool is_scheduled(TaskId id) const;

    // 按 id 升序
    std::vector<TaskId> scheduled_ids() const;

    size_t scheduled_count() const;

    // 批量加载期间记录的已删除 id 数，加载结束后总是 0
    size_t pending_removals() const;

    bool started() const
    {
      return started_;
    }

    // 停止时钟并等待回调线程退出，可以重复调用
    void stop();

  private:
    TriggerHandle register_task(const Task& task);

    // 放入映射；已存在条目或任务已被删除时取消新句柄并返回 false
    bool insert_handle(TaskId id, TriggerHandle handle);

    // 结束批量加载：停止记录删除并清空 removed_
    void finish_loading();

    std::shared_ptr<TaskStore> store_;
    std::shared_ptr<TriggerEngine> engine_;
    TaskAction action_;

    mutable std::mutex mutex_;
    std::map<TaskId, TriggerHandle> handles_;
    // start_all 加载期间通过 remove_task 删除的 id。存储不会复用 id，
    // 加载循环据此丢弃过期句柄；加载结束即清空
    std::set<TaskId> removed_;
    bool loading_ = false;

    std::atomic<bool> started_{false};
  };
}

#endif // KCROND_FRAMEWORK_SCHEDULER_SCHEDULING_COORDINATOR_HPP
