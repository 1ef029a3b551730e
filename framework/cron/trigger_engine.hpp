#ifndef KCROND_FRAMEWORK_CRON_TRIGGER_ENGINE_HPP
#define KCROND_FRAMEWORK_CRON_TRIGGER_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace kcrond::framework
{
  // 引擎返回的不透明句柄，同一个引擎实例内不会重复
  struct TriggerHandle
  {
    std::uint64_t value = 0;

    bool operator==(const TriggerHandle& other) const
    {
      return value == other.value;
    }

    bool operator!=(const TriggerHandle& other) const
    {
      return value != other.value;
    }
  };

  /**
   * @brief 协调器所依赖的定时引擎接口
   *
   * 实现必须保证：
   * - start() 之前不会触发任何回调
   * - cancel() 返回之后不会再开始新的触发；对未知或已取消的句柄 cancel() 是安全的空操作
   * - 回调在引擎自己的线程上执行，可能与其他回调以及管理操作并发
   */
  class TriggerEngine
  {
  public:
    virtual ~TriggerEngine() = default;

    // 表达式不合法时抛出 InvalidExpression，不产生任何状态
    virtual void validate(const std::string& expression) const = 0;

    virtual TriggerHandle register_trigger(const std::string& expression, std::function<void()> callback) = 0;

    // 返回 false 表示句柄未知或已经取消
    virtual bool cancel(TriggerHandle handle) = 0;

    virtual void start() = 0;

    virtual void stop() = 0;
  };
}

#endif // KCROND_FRAMEWORK_CRON_TRIGGER_ENGINE_HPP
