// example/main.cpp
// 演示进程：加载配置 -> 打开存储 -> 写入示例任务 -> 启动全部任务，
// 运行中添加一个任务再删除一个任务，收到 SIGINT/SIGTERM 后退出
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <csignal>
#include <fmt/core.h>
#include <memory>

#include "config/scheduler_config.hpp"
#include "scheduler/scheduling_coordinator.hpp"
#include "store/json_file_task_store.hpp"
#include "store/task_seeder.hpp"

using namespace kcrond::framework;
namespace net = boost::asio;

int main(int argc, char* argv[])
{
  SchedulerConfig config;
  try
  {
    if (argc > 1)
    {
      config = load_config(argv[1]);
    }
  }
  catch (const ConfigurationError& e)
  {
    fmt::print(stderr, "Failed to load configuration: {}\n", e.what());
    return 1;
  }

  auto store = std::make_shared<JsonFileTaskStore>(config.store_path);
  if (config.seed_defaults)
  {
    seed_tasks(*store, default_seed_tasks());
  }

  std::unique_ptr<SchedulingCoordinator> coordinator;
  try
  {
    coordinator = std::make_unique<SchedulingCoordinator>(store, config);
    coordinator->start_all();
  }
  catch (const SchedulerError& e)
  {
    fmt::print(stderr, "Failed to start tasks: {}\n", e.what());
    return 1;
  }

  // 管理操作跑在主线程的 io_context 上，回调跑在引擎自己的线程上
  net::io_context ioc;
  net::signal_set signals(ioc, SIGINT, SIGTERM);
  net::steady_timer admin_timer(ioc);

  signals.async_wait([&](const boost::system::error_code& ec, int signal_number)
  {
    if (ec) return;
    fmt::print("Received signal {}, shutting down gracefully...\n", signal_number);
    admin_timer.cancel();
    coordinator->stop();
  });

  // 10 秒后添加一个每分钟执行的任务，再过 10 秒删除 id 为 1 的任务
  admin_timer.expires_after(std::chrono::seconds(10));
  admin_timer.async_wait([&](const boost::system::error_code& ec)
  {
    if (ec) return;
    try
    {
      coordinator->add_task("TestTask", "run test program", "0 * * * * *");
    }
    catch (const SchedulerError& e)
    {
      fmt::print(stderr, "Failed to add task: {}\n", e.what());
    }

    admin_timer.expires_after(std::chrono::seconds(10));
    admin_timer.async_wait([&](const boost::system::error_code& ec2)
    {
      if (ec2) return;
      try
      {
        coordinator->remove_task(1);
      }
      catch (const SchedulerError& e)
      {
        fmt::print(stderr, "Failed to remove task: {}\n", e.what());
      }
    });
  });

  ioc.run();
  fmt::print("Scheduler stopped.\n");
  return 0;
}
