#ifndef KCROND_FRAMEWORK_STORE_TASK_STORE_HPP
#define KCROND_FRAMEWORK_STORE_TASK_STORE_HPP

#include <optional>
#include <string>
#include <vector>
#include "task.hpp"

namespace kcrond::framework
{
  /**
   * @brief 任务的持久化存储接口
   *
   * 实现需要自己保证线程安全，协调器会从多个线程并发调用。
   * 读写失败抛 StoreUnavailable，记录不存在抛 NotFound。
   */
  class TaskStore
  {
  public:
    virtual ~TaskStore() = default;

    /**
     * @brief 持久化一条新任务
     * @param task 忽略其中的 id 字段
     * @return 存储分配的新 id，同一个存储内不会复用
     */
    virtual TaskId create(const Task& task) = 0;

    // 按 id 升序返回全部任务
    virtual std::vector<Task> list_all() = 0;

    virtual Task get_by_id(TaskId id) = 0;

    virtual void delete_by_id(TaskId id) = 0;

    virtual std::optional<Task> find_by_name(const std::string& name) = 0;
  };
}

#endif // KCROND_FRAMEWORK_STORE_TASK_STORE_HPP
