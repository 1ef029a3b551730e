#ifndef KCROND_FRAMEWORK_STORE_TASK_HPP
#define KCROND_FRAMEWORK_STORE_TASK_HPP

#include <string>
#include <boost/describe.hpp>
#include "exception/scheduler_errors.hpp"

namespace kcrond::framework
{
  // 持久化的任务记录。id 由存储在创建时分配，之后不可变
  struct Task
  {
    TaskId id = 0;
    std::string name;
    std::string program;
    std::string cron;
  };

  BOOST_DESCRIBE_STRUCT(Task, (), (id, name, program, cron))
}

#endif // KCROND_FRAMEWORK_STORE_TASK_HPP
