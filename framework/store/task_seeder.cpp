// framework/store/task_seeder.cpp
#include "task_seeder.hpp"
#include <fmt/core.h>

namespace kcrond::framework
{
  std::vector<Task> default_seed_tasks()
  {
    return {
      {0, "DailyBackup", "run database backup script", "0 0 0 * * *"}, // 每天午夜
      {0, "HourlyCheck", "check system status", "0 0 * * * *"}, // 每小时
      {0, "BiMinuteReport", "generate two-minute report", "0 */2 * * * *"}, // 每两分钟
    };
  }

  size_t seed_tasks(TaskStore& store, const std::vector<Task>& tasks)
  {
    size_t created = 0;
    for (const auto& task : tasks)
    {
      try
      {
        if (store.find_by_name(task.name))
        {
          continue;
        }
        TaskId id = store.create(task);
        ++created;
        fmt::print("[TaskSeeder] Seeded task {} ({})\n", task.name, id);
      }
      catch (const SchedulerError& e)
      {
        fmt::print(stderr, "[TaskSeeder] Failed to seed task {}: {}\n", task.name, e.what());
      }
    }
    return created;
  }
}
