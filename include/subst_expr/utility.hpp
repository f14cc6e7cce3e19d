#ifndef SUBST_EXPR_UTILITY_HPP
#define SUBST_EXPR_UTILITY_HPP

#include "subst_expr.hpp"

#include <fmt/format.h>

#include <string>

namespace subst_expr {
template<typename> inline constexpr bool is_subst_expr_v = false;

template<std::unsigned_integral SizeType,
  typename CharType,
  std::signed_integral IntegralType,
  std::floating_point FloatType,
  SizeType BuiltInStringsSize,
  SizeType BuiltInValuesSize,
  SizeType MaxDepth,
  SizeType BuiltInScratchSize,
  typename... UserTypes>
inline constexpr bool is_subst_expr_v<engine<SizeType,
  CharType,
  IntegralType,
  FloatType,
  BuiltInStringsSize,
  BuiltInValuesSize,
  MaxDepth,
  BuiltInScratchSize,
  UserTypes...>> = true;

template<typename T>
concept SubstExpr = is_subst_expr_v<T>;


template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::SExpr &input);
template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const bool input);
template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::float_type input);
template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::int_type input);
template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const std::monostate &);
template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::Atom &input);
template<SubstExpr Eval>
std::string to_string(const Eval &, bool annotate, const typename Eval::native_procedure &native);
template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::error_type &error);
template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::list_type &list);
template<SubstExpr Eval>
std::string to_string(const Eval &, bool annotate, const typename Eval::identifier_type &id);
template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::string_type &string);


template<SubstExpr Eval> std::string to_string([[maybe_unused]] const Eval &, bool annotate, const std::monostate &)
{
  if (annotate) { return "[nil]"; }
  return "";
}

template<SubstExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::identifier_type &id)
{
  if (annotate) {
    return fmt::format("[identifier] {{{}, {}}} {}", id.value.start, id.value.size, engine.strings.view(id.value));
  } else {
    return std::string{ engine.strings.view(id.value) };
  }
}


template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const bool input)
{
  std::string result;
  if (annotate) { result = "[bool] "; }
  if (input) {
    return result + "true";
  } else {
    return result + "false";
  }
}

template<SubstExpr Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::Atom &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input);
}

template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::float_type input)
{
  std::string result;
  if (annotate) { result = "[float] "; }

  return result + fmt::format("{}", input);
}

template<SubstExpr Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::int_type input)
{
  std::string result;
  if (annotate) { result = "[int] "; }
  return result + fmt::format("{}", input);
}

template<SubstExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::native_procedure &native)
{
  if (annotate) {
    return fmt::format(
      "[native {} {}]", engine.strings.view(native.name), reinterpret_cast<const void *>(native.ptr));// NOLINT
  }
  return fmt::format("[native {}]", engine.strings.view(native.name));
}

template<SubstExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::error_type &error)
{
  return fmt::format("[error: {}] expected {}, got {}",
    error_kind_name(error.kind),
    engine.strings.view(error.expected),
    to_string(engine, annotate, error.got));
}

template<SubstExpr Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::list_type &list)
{
  std::string result;

  if (annotate) { result += fmt::format("[list] {{{}, {}}} ", list.start, list.size); }

  // (quote x) reads back as 'x
  if (list.size == 2 && engine.is_quote_form(typename Eval::SExpr{ list })) {
    return result + "'" + to_string(engine, false, engine.values[list[1]]);
  }

  result += "(";

  if (!list.empty()) {
    for (const auto &item : engine.values[list.sublist(0, static_cast<typename Eval::size_type>(list.size - 1))]) {
      result += to_string(engine, false, item) + ' ';
    }
    result += to_string(engine, false, engine.values[list.back()]);
  }
  result += ")";
  return result;
}

template<SubstExpr Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::string_type &string)
{
  if (annotate) {
    return fmt::format("[string] {{{}, {}}} \"{}\"", string.start, string.size, engine.strings.view(string));
  } else {
    return fmt::format("\"{}\"", engine.strings.view(string));
  }
}

template<SubstExpr Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::SExpr &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input.value);
}
}// namespace subst_expr

#endif
