#ifndef KCROND_FRAMEWORK_STORE_TASK_SEEDER_HPP
#define KCROND_FRAMEWORK_STORE_TASK_SEEDER_HPP

#include <vector>
#include "task_store.hpp"

namespace kcrond::framework
{
  // 首次启动时写入的示例任务
  std::vector<Task> default_seed_tasks();

  /**
   * @brief 同名任务不存在时才创建，重复执行不会产生重复记录
   *
   * 单条写入失败只记录日志，不影响其余任务。
   * @return 实际新建的任务数
   */
  size_t seed_tasks(TaskStore& store, const std::vector<Task>& tasks);
}

#endif // KCROND_FRAMEWORK_STORE_TASK_SEEDER_HPP
