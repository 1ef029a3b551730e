#ifndef KCROND_FRAMEWORK_IO_CONTEXT_POOL_HPP
#define KCROND_FRAMEWORK_IO_CONTEXT_POOL_HPP

#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <optional>
#include <thread>
#include <vector>
#include <mutex>

namespace kcrond::framework
{
  // 一个 io_context 加若干工作线程。构造后处于休眠状态，start() 之前不会执行任何 handler
  class IoContextPool
  {
  public:
    explicit IoContextPool(unsigned int num_threads = std::thread::hardware_concurrency())
      : num_threads_(num_threads == 0 ? 1 : num_threads)
    {
    }

    IoContextPool(const IoContextPool&) = delete;
    IoContextPool& operator=(const IoContextPool&) = delete;

    ~IoContextPool()
    {
      stop();
    }

    boost::asio::io_context& get_io_context()
    {
      return ioc_;
    }

    // 启动工作线程，重复调用无效果。stop() 之后不能再次启动
    void start()
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (!threads_.empty() || stopped_) return;

      work_guard_.emplace(boost::asio::make_work_guard(ioc_));

      threads_.reserve(num_threads_);
      for (unsigned int i = 0; i < num_threads_; ++i)
      {
        threads_.emplace_back([this]()
        {
          // 每个线程都运行同一个 io_context，ASIO 会把 handler 分发到空闲线程
          ioc_.run();
        });
      }
    }

    void stop()
    {
      std::vector<std::thread> threads;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;

        work_guard_.reset(); // 允许 run() 退出
        ioc_.stop();
        threads.swap(threads_);
      }

      // 在锁外 join，避免仍在执行的 handler 调用 start()/stop() 时死锁
      for (auto& t : threads)
      {
        if (t.joinable() && t.get_id() != std::this_thread::get_id())
        {
          t.join();
        }
        else if (t.joinable())
        {
          t.detach();
        }
      }
    }

  private:
    const unsigned int num_threads_;
    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> threads_;
    bool stopped_ = false;
    std::mutex mutex_;
  };
}

#endif // KCROND_FRAMEWORK_IO_CONTEXT_POOL_HPP
