#ifndef KCROND_FRAMEWORK_CONFIG_SCHEDULER_CONFIG_HPP
#define KCROND_FRAMEWORK_CONFIG_SCHEDULER_CONFIG_HPP

#include <string>
#include <boost/describe.hpp>
#include <boost/filesystem/path.hpp>

namespace kcrond::framework
{
  struct SchedulerConfig
  {
    std::string timezone = "Asia/Shanghai";
    int worker_threads = 2;
    std::string store_path = "tasks.json";
    bool seed_defaults = true;
    std::string zoneinfo_dir = "/usr/share/zoneinfo";
  };

  BOOST_DESCRIBE_STRUCT(SchedulerConfig, (), (timezone, worker_threads, store_path, seed_defaults, zoneinfo_dir))

  /**
   * @brief 从 JSON 文件读取配置，文件里没有的字段保留默认值
   * @throws ConfigurationError 文件不存在、无法解析或字段类型错误
   */
  SchedulerConfig load_config(const std::string& path);

  // 从 JSON 文本解析，load_config 的内部实现，单独暴露方便测试
  SchedulerConfig parse_config(const std::string& text);

  /**
   * @brief 找到时区对应的 zoneinfo 文件
   * @throws ConfigurationError 名字为空、包含 ".." 或文件不存在
   */
  boost::filesystem::path resolve_timezone(const std::string& timezone,
                                           const std::string& zoneinfo_dir = "/usr/share/zoneinfo");

  // resolve_timezone 成功后设置 TZ 并 tzset()。CronScheduler 存活期间不要直接调用
  void apply_timezone(const std::string& timezone, const std::string& zoneinfo_dir = "/usr/share/zoneinfo");
}

#endif // KCROND_FRAMEWORK_CONFIG_SCHEDULER_CONFIG_HPP
