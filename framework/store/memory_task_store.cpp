// framework/store/memory_task_store.cpp
#include "memory_task_store.hpp"

namespace kcrond::framework
{
  TaskId MemoryTaskStore::create(const Task& task)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Task stored = task;
    stored.id = next_id_++;
    tasks_.emplace(stored.id, stored);
    return stored.id;
  }

  std::vector<Task> MemoryTaskStore::list_all()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Task> result;
    result.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_)
    {
      result.push_back(task);
    }
    return result;
  }

  Task MemoryTaskStore::get_by_id(TaskId id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end())
    {
      throw NotFound(id);
    }
    return it->second;
  }

  void MemoryTaskStore::delete_by_id(TaskId id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (tasks_.erase(id) == 0)
    {
      throw NotFound(id);
    }
  }

  std::optional<Task> MemoryTaskStore::find_by_name(const std::string& name)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, task] : tasks_)
    {
      if (task.name == name) return task;
    }
    return std::nullopt;
  }

  size_t MemoryTaskStore::size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
  }
}
