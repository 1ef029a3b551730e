#ifndef KCROND_FRAMEWORK_STORE_JSON_FILE_TASK_STORE_HPP
#define KCROND_FRAMEWORK_STORE_JSON_FILE_TASK_STORE_HPP

#include <mutex>
#include <string>
#include "task_store.hpp"

namespace kcrond::framework
{
  struct TaskStoreDocument;

  /**
   * @brief 把全部任务保存在一个 JSON 文件里的持久化存储
   *
   * 文件格式: {"next_id": N, "tasks": [{"id":..,"name":..,"program":..,"cron":..}, ...]}
   *
   * 每次操作都重新读取文件，修改时先写临时文件再 rename 覆盖，进程崩溃不会留下半个文件。
   * 文件不存在视为空存储；文件无法读取或内容损坏时抛 StoreUnavailable。
   */
  class JsonFileTaskStore : public TaskStore
  {
  public:
    explicit JsonFileTaskStore(std::string path);

    JsonFileTaskStore(const JsonFileTaskStore&) = delete;
    JsonFileTaskStore& operator=(const JsonFileTaskStore&) = delete;

    TaskId create(const Task& task) override;
    std::vector<Task> list_all() override;
    Task get_by_id(TaskId id) override;
    void delete_by_id(TaskId id) override;
    std::optional<Task> find_by_name(const std::string& name) override;

  private:
    TaskStoreDocument load() const;
    void save(const TaskStoreDocument& doc) const;

    std::string path_;
    std::mutex mutex_;
  };
}

#endif // KCROND_FRAMEWORK_STORE_JSON_FILE_TASK_STORE_HPP
