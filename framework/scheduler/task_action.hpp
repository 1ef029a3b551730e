#ifndef KCROND_FRAMEWORK_SCHEDULER_TASK_ACTION_HPP
#define KCROND_FRAMEWORK_SCHEDULER_TASK_ACTION_HPP

#include <functional>
#include "store/task.hpp"

namespace kcrond::framework
{
  // 每次触发时在引擎线程上调用，参数是该任务的一份拷贝。
  // 可能被并发、重复调用，耗时操作需要自己异步化
  using TaskAction = std::function<void(const Task&)>;

  // 默认动作：只打印一行日志
  TaskAction make_logging_action();
}

#endif // KCROND_FRAMEWORK_SCHEDULER_TASK_ACTION_HPP
