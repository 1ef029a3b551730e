#ifndef KCROND_FRAMEWORK_STORE_MEMORY_TASK_STORE_HPP
#define KCROND_FRAMEWORK_STORE_MEMORY_TASK_STORE_HPP

#include <map>
#include <mutex>
#include "task_store.hpp"

namespace kcrond::framework
{
  // 进程内存储，重启即丢失。用于测试和嵌入场景
  class MemoryTaskStore : public TaskStore
  {
  public:
    MemoryTaskStore() = default;

    MemoryTaskStore(const MemoryTaskStore&) = delete;
    MemoryTaskStore& operator=(const MemoryTaskStore&) = delete;

    TaskId create(const Task& task) override;
    std::vector<Task> list_all() override;
    Task get_by_id(TaskId id) override;
    void delete_by_id(TaskId id) override;
    std::optional<Task> find_by_name(const std::string& name) override;

    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::map<TaskId, Task> tasks_;
    TaskId next_id_ = 1;
  };
}

#endif // KCROND_FRAMEWORK_STORE_MEMORY_TASK_STORE_HPP
