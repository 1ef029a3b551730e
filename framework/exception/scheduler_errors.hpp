#ifndef KCROND_FRAMEWORK_EXCEPTION_SCHEDULER_ERRORS_HPP_
#define KCROND_FRAMEWORK_EXCEPTION_SCHEDULER_ERRORS_HPP_

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <fmt/core.h>

namespace kcrond::framework
{
  using TaskId = std::uint64_t;

  // 所有调度相关异常的基类，调用方可以只捕获这一种
  class SchedulerError : public std::runtime_error
  {
  public:
    explicit SchedulerError(const std::string& what)
      : std::runtime_error(what)
    {
    }
  };

  // 启动期的配置错误（比如时区无法解析），不可恢复
  class ConfigurationError : public SchedulerError
  {
  public:
    using SchedulerError::SchedulerError;
  };

  // 持久化存储无法读写
  class StoreUnavailable : public SchedulerError
  {
  public:
    using SchedulerError::SchedulerError;
  };

  class InvalidExpression : public SchedulerError
  {
  public:
    InvalidExpression(std::string expression, const std::string& reason)
      : SchedulerError(fmt::format("invalid cron expression '{}': {}", expression, reason))
        , expression_(std::move(expression))
    {
    }

    const std::string& expression() const noexcept
    {
      return expression_;
    }

  private:
    std::string expression_;
  };

  class NotFound : public SchedulerError
  {
  public:
    explicit NotFound(TaskId id)
      : SchedulerError(fmt::format("task {} does not exist", id))
        , id_(id)
    {
    }

    TaskId id() const noexcept
    {
      return id_;
    }

  private:
    TaskId id_;
  };

  /**
   * @brief A single task could not be armed during a bulk load.
   *
   * Never escapes start_all(); it is caught, logged and reported in the
   * returned StartSummary.
   */
  class PartialRegistrationFailure : public SchedulerError
  {
  public:
    PartialRegistrationFailure(TaskId id, const std::string& reason)
      : SchedulerError(fmt::format("task {} left unscheduled: {}", id, reason))
        , id_(id)
    {
    }

    TaskId id() const noexcept
    {
      return id_;
    }

  private:
    TaskId id_;
  };

  // 注册失败后的回滚删除也失败了：存储里可能残留一条没有触发器的记录
  class CompensationFailure : public SchedulerError
  {
  public:
    CompensationFailure(TaskId orphan_id, const std::string& register_error, const std::string& delete_error)
      : SchedulerError(fmt::format("registering task {} failed ({}) and rolling it back failed ({})",
                                   orphan_id, register_error, delete_error))
        , orphan_id_(orphan_id)
    {
    }

    TaskId orphan_id() const noexcept
    {
      return orphan_id_;
    }

  private:
    TaskId orphan_id_;
  };
}

#endif // KCROND_FRAMEWORK_EXCEPTION_SCHEDULER_ERRORS_HPP_
