// framework/config/scheduler_config.cpp
#include "scheduler_config.hpp"
#include "dto/TagInvoke.hpp"
#include "exception/scheduler_errors.hpp"
#include <boost/filesystem.hpp>
#include <fmt/core.h>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>

namespace kcrond::framework
{
  SchedulerConfig parse_config(const std::string& text)
  {
    boost::json::error_code ec;
    auto jv = boost::json::parse(text, ec);
    if (ec)
    {
      throw ConfigurationError(fmt::format("malformed configuration: {}", ec.message()));
    }
    if (!jv.is_object())
    {
      throw ConfigurationError("configuration must be a JSON object");
    }

    try
    {
      return boost::json::value_to<SchedulerConfig>(jv);
    }
    catch (const std::exception& e)
    {
      throw ConfigurationError(fmt::format("invalid configuration value: {}", e.what()));
    }
  }

  SchedulerConfig load_config(const std::string& path)
  {
    std::ifstream in(path);
    if (!in)
    {
      throw ConfigurationError(fmt::format("cannot open configuration file '{}'", path));
    }

    std::stringstream buffer;
    buffer << in.rdbuf();
    return parse_config(buffer.str());
  }

  boost::filesystem::path resolve_timezone(const std::string& timezone, const std::string& zoneinfo_dir)
  {
    if (timezone.empty())
    {
      throw ConfigurationError("timezone must not be empty");
    }
    // 不允许跳出 zoneinfo 目录
    if (timezone.front() == '/' || timezone.find("..") != std::string::npos)
    {
      throw ConfigurationError(fmt::format("invalid timezone name '{}'", timezone));
    }

    boost::filesystem::path zone_file = boost::filesystem::path(zoneinfo_dir) / timezone;
    boost::system::error_code ec;
    if (!boost::filesystem::is_regular_file(zone_file, ec))
    {
      throw ConfigurationError(fmt::format("cannot resolve timezone '{}' (looked for {})",
                                           timezone, zone_file.string()));
    }
    return zone_file;
  }

  void apply_timezone(const std::string& timezone, const std::string& zoneinfo_dir)
  {
    auto zone_file = resolve_timezone(timezone, zoneinfo_dir);

    // glibc 接受 ":<绝对路径>" 形式，非默认目录下的时区也能生效
    const std::string tz_value = ":" + zone_file.string();
    if (::setenv("TZ", tz_value.c_str(), 1) != 0)
    {
      throw ConfigurationError(fmt::format("failed to set TZ to '{}'", tz_value));
    }
    ::tzset();
  }
}
