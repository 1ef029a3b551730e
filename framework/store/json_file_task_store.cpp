// framework/store/json_file_task_store.cpp
#include "json_file_task_store.hpp"
#include "dto/TagInvoke.hpp"
#include <boost/filesystem.hpp>
#include <fmt/core.h>
#include <algorithm>
#include <fstream>
#include <sstream>

namespace kcrond::framework
{
  // 文件的整体结构。放在 kcrond::framework 下，TagInvoke 才能通过 ADL 找到
  struct TaskStoreDocument
  {
    TaskId next_id = 1;
    std::vector<Task> tasks;
  };

  BOOST_DESCRIBE_STRUCT(TaskStoreDocument, (), (next_id, tasks))

  JsonFileTaskStore::JsonFileTaskStore(std::string path)
    : path_(std::move(path))
  {
  }

  TaskStoreDocument JsonFileTaskStore::load() const
  {
    boost::system::error_code ec;
    if (!boost::filesystem::exists(path_, ec))
    {
      if (ec)
      {
        throw StoreUnavailable(fmt::format("cannot access task store '{}': {}", path_, ec.message()));
      }
      return TaskStoreDocument{};
    }

    std::ifstream in(path_);
    if (!in)
    {
      throw StoreUnavailable(fmt::format("cannot open task store '{}'", path_));
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad())
    {
      throw StoreUnavailable(fmt::format("failed to read task store '{}'", path_));
    }

    auto jv = boost::json::parse(buffer.str(), ec);
    if (ec)
    {
      throw StoreUnavailable(fmt::format("task store '{}' is corrupt: {}", path_, ec.message()));
    }

    TaskStoreDocument doc;
    try
    {
      doc = boost::json::value_to<TaskStoreDocument>(jv);
    }
    catch (const std::exception& e)
    {
      throw StoreUnavailable(fmt::format("task store '{}' is corrupt: {}", path_, e.what()));
    }

    // next_id 被手工改小时不能复用已有 id
    for (const auto& task : doc.tasks)
    {
      doc.next_id = std::max(doc.next_id, task.id + 1);
    }
    std::sort(doc.tasks.begin(), doc.tasks.end(), [](const Task& a, const Task& b)
    {
      return a.id < b.id;
    });
    return doc;
  }

  void JsonFileTaskStore::save(const TaskStoreDocument& doc) const
  {
    const std::string tmp_path = path_ + ".tmp";
    {
      std::ofstream out(tmp_path, std::ios::trunc);
      if (!out)
      {
        throw StoreUnavailable(fmt::format("cannot write task store '{}'", tmp_path));
      }
      out << boost::json::serialize(boost::json::value_from(doc));
      out.flush();
      if (!out)
      {
        throw StoreUnavailable(fmt::format("failed to write task store '{}'", tmp_path));
      }
    }

    boost::system::error_code ec;
    boost::filesystem::rename(tmp_path, path_, ec);
    if (ec)
    {
      throw StoreUnavailable(fmt::format("failed to replace task store '{}': {}", path_, ec.message()));
    }
  }

  TaskId JsonFileTaskStore::create(const Task& task)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = load();

    Task stored = task;
    stored.id = doc.next_id++;
    doc.tasks.push_back(stored);
    save(doc);
    return stored.id;
  }

  std::vector<Task> JsonFileTaskStore::list_all()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return load().tasks;
  }

  Task JsonFileTaskStore::get_by_id(TaskId id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = load();
    auto it = std::find_if(doc.tasks.begin(), doc.tasks.end(), [id](const Task& t) { return t.id == id; });
    if (it == doc.tasks.end())
    {
      throw NotFound(id);
    }
    return *it;
  }

  void JsonFileTaskStore::delete_by_id(TaskId id)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = load();
    auto it = std::find_if(doc.tasks.begin(), doc.tasks.end(), [id](const Task& t) { return t.id == id; });
    if (it == doc.tasks.end())
    {
      throw NotFound(id);
    }
    doc.tasks.erase(it);
    save(doc);
  }

  std::optional<Task> JsonFileTaskStore::find_by_name(const std::string& name)
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto doc = load();
    auto it = std::find_if(doc.tasks.begin(), doc.tasks.end(), [&name](const Task& t) { return t.name == name; });
    if (it == doc.tasks.end())
    {
      return std::nullopt;
    }
    return *it;
  }
}
