// framework/scheduler/task_action.cpp
#include "task_action.hpp"
#include <fmt/core.h>

namespace kcrond::framework
{
  TaskAction make_logging_action()
  {
    return [](const Task& task)
    {
      fmt::print("Executing task {} ({}): {}\n", task.name, task.id, task.program);
    };
  }
}
