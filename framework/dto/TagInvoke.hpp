#ifndef KCROND_FRAMEWORK_DTO_TAGINVOKE_HPP
#define KCROND_FRAMEWORK_DTO_TAGINVOKE_HPP

#include <boost/json.hpp>
#include <boost/describe.hpp>
#include <boost/mp11.hpp>
#include <fmt/core.h>
#include <stdexcept>
#include <type_traits>

// 用 BOOST_DESCRIBE_STRUCT 描述过的结构体自动获得 JSON 转换。
// 定义在 kcrond::framework 里，通过 ADL 对本命名空间下的类型生效
namespace kcrond::framework
{
  namespace desc = boost::describe;
  namespace mp11 = boost::mp11;

  // Struct -> JSON
  template <class T>
  auto tag_invoke(boost::json::value_from_tag, boost::json::value& jv, T const& t)
    -> std::enable_if_t<desc::has_describe_members<T>::value>
  {
    auto& obj = jv.emplace_object();

    using Md = desc::describe_members<T, desc::mod_public>;

    mp11::mp_for_each<Md>([&](auto D)
    {
      obj.emplace(D.name, boost::json::value_from(t.*D.pointer));
    });
  }

  // JSON -> Struct
  // 缺少的 key 保留默认值。成员转换失败时抛 std::invalid_argument，消息带上字段名，
  // 嵌套结构逐层加前缀（例如 "tasks: id: ..."），由调用方转成领域错误
  template <class T>
  auto tag_invoke(boost::json::value_to_tag<T>, boost::json::value const& jv)
    -> std::enable_if_t<desc::has_describe_members<T>::value, T>
  {
    T t{};

    // 不是 object 时 as_object() 抛异常
    auto const& obj = jv.as_object();

    using Md = desc::describe_members<T, desc::mod_public>;

    mp11::mp_for_each<Md>([&](auto D)
    {
      if (auto it = obj.find(D.name); it != obj.end())
      {
        using MemberT = std::remove_reference_t<decltype(t.*D.pointer)>;
        try
        {
          t.*D.pointer = boost::json::value_to<MemberT>(it->value());
        }
        catch (const std::exception& e)
        {
          throw std::invalid_argument(fmt::format("{}: {}", D.name, e.what()));
        }
      }
    });

    return t;
  }
} // namespace kcrond::framework

#endif // KCROND_FRAMEWORK_DTO_TAGINVOKE_HPP
