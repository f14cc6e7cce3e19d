#ifndef SUBST_EXPR_STANDARD_HOST_HPP
#define SUBST_EXPR_STANDARD_HOST_HPP

#include "subst_expr.hpp"

namespace subst_expr {

template<typename T>
concept not_bool_or_ptr = !std::same_as<std::remove_cvref_t<T>, bool> && !std::is_pointer_v<std::remove_cvref_t<T>>;

// clang-format off
template<typename T> concept addable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs + rhs; };
template<typename T> concept multipliable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs *rhs; };
template<typename T> concept dividable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs / rhs; };
template<typename T> concept subtractable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs - rhs; };
template<typename T> concept lt_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs < rhs; };
template<typename T> concept gt_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs > rhs; };
template<typename T> concept lt_eq_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs <= rhs; };
template<typename T> concept gt_eq_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs >= rhs; };
template<typename T> concept eq_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs == rhs; };
template<typename T> concept not_eq_comparable = not_bool_or_ptr<T> && requires(T lhs, T rhs) { lhs != rhs; };
// clang-format on

inline constexpr auto adds = []<addable T>(const T &lhs, const T &rhs) { return lhs + rhs; };
inline constexpr auto multiplies = []<multipliable T>(const T &lhs, const T &rhs) { return lhs * rhs; };
inline constexpr auto divides = []<dividable T>(const T &lhs, const T &rhs) { return lhs / rhs; };
inline constexpr auto subtracts = []<subtractable T>(const T &lhs, const T &rhs) { return lhs - rhs; };
inline constexpr auto less_than = []<lt_comparable T>(const T &lhs, const T &rhs) { return lhs < rhs; };
inline constexpr auto greater_than = []<gt_comparable T>(const T &lhs, const T &rhs) { return lhs > rhs; };
inline constexpr auto lt_equal = []<lt_eq_comparable T>(const T &lhs, const T &rhs) { return lhs <= rhs; };
inline constexpr auto gt_equal = []<gt_eq_comparable T>(const T &lhs, const T &rhs) { return lhs >= rhs; };
inline constexpr auto equal = []<eq_comparable T>(const T &lhs, const T &rhs) -> bool { return lhs == rhs; };
inline constexpr auto not_equal = []<not_eq_comparable T>(const T &lhs, const T &rhs) -> bool { return lhs != rhs; };
inline constexpr bool logical_not(bool lhs) { return !lhs; }

template<auto Lhs, auto Rhs>
inline constexpr bool same_operator_v =
  std::is_same_v<std::remove_cvref_t<decltype(Lhs)>, std::remove_cvref_t<decltype(Rhs)>>;

// true when `Op(lhs, rhs)` has no representable result
template<auto Op, std::signed_integral Int>
[[nodiscard]] constexpr bool out_of_range(const Int lhs, const Int rhs) noexcept
{
  using limits = std::numeric_limits<Int>;

  if constexpr (same_operator_v<Op, adds>) {
    return rhs > 0 ? lhs > limits::max() - rhs : lhs < limits::min() - rhs;
  } else if constexpr (same_operator_v<Op, subtracts>) {
    return rhs < 0 ? lhs > limits::max() + rhs : lhs < limits::min() + rhs;
  } else if constexpr (same_operator_v<Op, multiplies>) {
    if (lhs == 0 || rhs == 0) { return false; }
    if (lhs > 0) { return rhs > 0 ? lhs > limits::max() / rhs : rhs < limits::min() / lhs; }
    return rhs > 0 ? lhs < limits::min() / rhs : lhs < limits::max() / rhs;
  } else if constexpr (same_operator_v<Op, divides>) {
    return rhs == 0 || (lhs == limits::min() && rhs == -1);
  } else {
    return false;
  }
}


// A fixed symbol table of globals plus the usual native procedures.
// Natives receive their arguments evaluated and report misuse as host_invocation_failure.
template<typename Engine, typename Engine::size_type GlobalsSize = 64> struct standard_host
{
  using engine_type = Engine;
  using size_type = typename Engine::size_type;
  using string_type = typename Engine::string_type;
  using string_view_type = typename Engine::string_view_type;
  using identifier_type = typename Engine::identifier_type;
  using list_type = typename Engine::list_type;
  using native_procedure = typename Engine::native_procedure;
  using native_function = typename Engine::native_function;
  using Atom = typename Engine::Atom;
  using SExpr = typename Engine::SExpr;

  using global_table = SmallVector<size_type, std::pair<string_type, SExpr>, GlobalsSize, list_type>;
  using object_scratch = typename Engine::template Scratch<typename Engine::template scratch_vector<SExpr>>;

  global_table globals{};

  template<std::size_t Size>
  [[nodiscard]] static consteval auto str(char const (&input)[Size]) noexcept// NOLINT(modernize-avoid-c-arrays)
  {
    return Engine::str(input);
  }

  static constexpr size_type builtin_count = 21;
  static_assert(GlobalsSize >= builtin_count, "the globals table must hold the built-in procedures");

  constexpr explicit standard_host(Engine &engine)
  {
    define(engine, str("+"), binary_left_fold<adds>);
    define(engine, str("*"), binary_left_fold<multiplies>);
    define(engine, str("-"), binary_left_fold<subtracts>);
    define(engine, str("/"), binary_left_fold<divides>);
    define(engine, str("<="), binary_boolean_apply_pairwise<lt_equal>);
    define(engine, str(">="), binary_boolean_apply_pairwise<gt_equal>);
    define(engine, str("<"), binary_boolean_apply_pairwise<less_than>);
    define(engine, str(">"), binary_boolean_apply_pairwise<greater_than>);
    define(engine, str("="), binary_boolean_apply_pairwise<equal>);
    define(engine, str("!="), binary_boolean_apply_pairwise<not_equal>);
    define(engine, str("not"), make_native<logical_not>());
    define(engine, str("eq?"), is_equal);
    define(engine, str("car"), car);
    define(engine, str("cdr"), cdr);
    define(engine, str("cons"), cons);
    define(engine, str("list"), list);
    define(engine, str("append"), append);
    define(engine, str("null?"), is_null);
    define(engine, str("number?"), is_number);
    define(engine, str("symbol?"), is_symbol);
    define(engine, str("procedure?"), is_procedure);
  }

  // false when the globals table is full and `name` was not stored
  [[nodiscard]] constexpr bool add(Engine &engine, string_view_type name, SExpr value)
  {
    if (globals.size() >= global_table::small_capacity) { return false; }
    globals.emplace_back(engine.strings.insert_or_find(name), value);
    return true;
  }

  [[nodiscard]] constexpr bool add_native(Engine &engine, string_view_type name, native_function function)
  {
    return add(engine, name, SExpr{ native_procedure{ function, engine.strings.insert_or_find(name) } });
  }

  template<auto Func> [[nodiscard]] constexpr bool add(Engine &engine, string_view_type name)
  {
    return add_native(engine, name, make_native<Func>());
  }

  template<typename Value> [[nodiscard]] constexpr bool add(Engine &engine, string_view_type name, Value value)
  {
    return add(engine, name, SExpr{ Atom{ value } });
  }

  [[nodiscard]] constexpr SExpr resolve_global(Engine &engine, identifier_type id) const
  {
    // later definitions win
    for (const auto &[key, value] : globals | std::views::reverse) {
      if (engine.same_name(key, id.value)) { return value; }
    }

    return engine.make_error(error_kind::host_lookup_failure, str("bound global"), SExpr{ Atom{ id } });
  }

private:
  // the static_assert above leaves room for every built-in
  constexpr void define(Engine &engine, string_view_type name, native_function function)
  {
    globals.emplace_back(
      engine.strings.insert_or_find(name), SExpr{ native_procedure{ function, engine.strings.insert_or_find(name) } });
  }

public:
  [[nodiscard]] constexpr SExpr invoke_native(Engine &engine, native_procedure native, list_type arguments) const
  {
    if (native.ptr == nullptr) {
      return engine.make_error(error_kind::host_invocation_failure, str("callable native"), SExpr{ native });
    }
    return (native.ptr)(engine, arguments);
  }


  template<auto Func, typename Ret, typename... Param> [[nodiscard]] constexpr static native_function make_native()
  {
    return native_function{ [](Engine &engine, list_type arguments) -> SExpr {
      if (arguments.size != sizeof...(Param)) {
        return engine.make_error(
          error_kind::host_invocation_failure, str("matching argument count for function"), SExpr{ arguments });
      }

      auto impl = [&]<size_type... Idx>(std::integer_sequence<size_type, Idx...>) {
        std::tuple converted{ engine.template get_as<std::remove_cvref_t<Param>>(engine.values[arguments[Idx]])... };

        SExpr error;

        // See if any argument has the wrong type
        const bool errored = !([&] {
          if (std::get<Idx>(converted).has_value()) {
            return true;
          } else {
            error = std::get<Idx>(converted).error();
            return false;
          }
        }() && ...);

        if (errored) { return engine.make_error(error_kind::host_invocation_failure, str("argument type"), error); }

        // types have already been verified, so I can just `*` the expected safely to avoid exception checks
        if constexpr (std::is_same_v<void, Ret>) {
          std::invoke(Func, *std::get<Idx>(converted)...);
          return SExpr{ Atom{ std::monostate{} } };
        } else if constexpr (std::is_same_v<SExpr, Ret>) {
          return std::invoke(Func, *std::get<Idx>(converted)...);
        } else {
          return SExpr{ Atom{ std::invoke(Func, *std::get<Idx>(converted)...) } };
        }
      };

      return impl(std::make_integer_sequence<size_type, static_cast<size_type>(sizeof...(Param))>{});
    } };
  }

  template<auto Func, typename Ret, typename... Param>
  [[maybe_unused]] [[nodiscard]] constexpr static native_function make_native(Ret (*)(Param...))
  {
    return make_native<Func, Ret, Param...>();
  }

  template<auto Func, typename Ret, typename Type, typename... Param>
  [[nodiscard]] constexpr static native_function make_native(Ret (Type::*)(Param...) const)
  {
    return make_native<Func, Ret, Type *, Param...>();
  }

  template<auto Func, typename Ret, typename Type, typename... Param>
  [[maybe_unused]] [[nodiscard]] constexpr static native_function make_native(Ret (Type::*)(Param...))
  {
    return make_native<Func, Ret, Type *, Param...>();
  }

  template<auto Func> [[nodiscard]] constexpr static native_function make_native() { return make_native<Func>(Func); }


  //
  // built-ins
  //
  [[nodiscard]] static constexpr SExpr
    invocation_error(Engine &engine, string_view_type expected, list_type arguments)
  {
    return engine.make_error(error_kind::host_invocation_failure, expected, SExpr{ arguments });
  }

  template<typename Type>
  [[nodiscard]] static constexpr std::expected<Type, SExpr>
    single_argument(Engine &engine, list_type arguments, string_view_type expected)
  {
    if (arguments.size != 1) { return std::unexpected(invocation_error(engine, expected, arguments)); }
    auto first = engine.template get_as<Type>(engine.values[arguments[0]]);
    if (!first) { return std::unexpected(invocation_error(engine, expected, arguments)); }
    return *first;
  }

  template<typename ValueType>
  [[nodiscard]] static constexpr SExpr error_or_else(const std::expected<ValueType, SExpr> &obj, auto callable)
  {
    if (obj) {
      return callable(*obj);
    } else {
      return obj.error();
    }
  }

  [[nodiscard]] static constexpr SExpr car(Engine &engine, list_type arguments)
  {
    return error_or_else(single_argument<list_type>(engine, arguments, str("(car non-empty-list)")),
      [&](const list_type list) {
        if (list.empty()) { return invocation_error(engine, str("(car non-empty-list)"), arguments); }
        return engine.values[list.front()];
      });
  }

  [[nodiscard]] static constexpr SExpr cdr(Engine &engine, list_type arguments)
  {
    return error_or_else(single_argument<list_type>(engine, arguments, str("(cdr non-empty-list)")),
      [&](const list_type list) {
        if (list.empty()) { return invocation_error(engine, str("(cdr non-empty-list)"), arguments); }
        return SExpr{ list.sublist(1) };
      });
  }

  [[nodiscard]] static constexpr SExpr cons(Engine &engine, list_type arguments)
  {
    const auto *list = arguments.size == 2 ? engine.template get_if<list_type>(&engine.values[arguments[1]]) : nullptr;
    if (list == nullptr) { return invocation_error(engine, str("(cons expression list)"), arguments); }

    object_scratch result{ engine.object_scratch };
    result.push_back(engine.values[arguments[0]]);
    for (const auto &value : engine.values[*list]) { result.push_back(value); }

    return SExpr{ engine.values.insert_or_find(result) };
  }

  [[nodiscard]] static constexpr SExpr list(Engine &, list_type arguments) { return SExpr{ arguments }; }

  [[nodiscard]] static constexpr SExpr append(Engine &engine, list_type arguments)
  {
    object_scratch result{ engine.object_scratch };

    for (const auto &argument : engine.values[arguments]) {
      const auto *list = engine.template get_if<list_type>(&argument);
      if (list == nullptr) { return invocation_error(engine, str("(append list...)"), arguments); }
      for (const auto &value : engine.values[*list]) { result.push_back(value); }
    }

    return SExpr{ engine.values.insert_or_find(result) };
  }

  [[nodiscard]] static constexpr SExpr is_null(Engine &engine, list_type arguments)
  {
    if (arguments.size != 1) { return invocation_error(engine, str("(null? expression)"), arguments); }
    const auto *list = engine.template get_if<list_type>(&engine.values[arguments[0]]);
    return SExpr{ Atom{ list != nullptr && list->empty() } };
  }

  [[nodiscard]] static constexpr SExpr is_number(Engine &engine, list_type arguments)
  {
    if (arguments.size != 1) { return invocation_error(engine, str("(number? expression)"), arguments); }
    const auto &value = engine.values[arguments[0]];
    return SExpr{ Atom{ engine.template get_if<typename Engine::int_type>(&value) != nullptr
                        || engine.template get_if<typename Engine::float_type>(&value) != nullptr } };
  }

  [[nodiscard]] static constexpr SExpr is_symbol(Engine &engine, list_type arguments)
  {
    if (arguments.size != 1) { return invocation_error(engine, str("(symbol? expression)"), arguments); }
    return SExpr{ Atom{ engine.is_symbol(engine.values[arguments[0]]) } };
  }

  [[nodiscard]] static constexpr SExpr is_procedure(Engine &engine, list_type arguments)
  {
    if (arguments.size != 1) { return invocation_error(engine, str("(procedure? expression)"), arguments); }
    const auto &value = engine.values[arguments[0]];
    return SExpr{ Atom{ engine.template get_if<native_procedure>(&value) != nullptr || engine.is_lambda_form(value) } };
  }

  [[nodiscard]] static constexpr SExpr is_equal(Engine &engine, list_type arguments)
  {
    if (arguments.size != 2) { return invocation_error(engine, str("(eq? expression expression)"), arguments); }
    return SExpr{ Atom{ engine.equal(engine.values[arguments[0]], engine.values[arguments[1]]) } };
  }

  template<auto Op> [[nodiscard]] static constexpr SExpr binary_left_fold(Engine &engine, list_type arguments)
  {
    auto fold = [&engine, arguments]<typename Param>(Param first) -> SExpr {
      if constexpr (requires(Param p1, Param p2) { Op(p1, p2); }) {
        for (const auto &elem : engine.values[arguments.sublist(1)]) {
          const auto next = engine.template get_as<Param>(elem);
          if (!next) {
            return engine.make_error(
              error_kind::host_invocation_failure, str("same types for operator"), SExpr{ Atom{ first } }, next.error());
          }
          if constexpr (std::signed_integral<Param>) {
            if (out_of_range<Op>(first, *next)) {
              return invocation_error(engine, str("integer result in range, non-zero divisor"), arguments);
            }
          }
          first = Op(first, *next);
        }

        return SExpr{ Atom{ first } };
      } else {
        return invocation_error(engine, str("operator not supported for types"), arguments);
      }
    };

    if (arguments.size > 1) {
      if (const auto *atom = std::get_if<Atom>(&engine.values[arguments[0]].value); atom != nullptr) {
        return Engine::visit(fold, *atom);
      } else {
        return invocation_error(engine, str("operator not supported for types"), arguments);
      }
    }

    return invocation_error(engine, str("operator requires at least two parameters"), arguments);
  }

  template<auto Op>
  [[nodiscard]] static constexpr SExpr binary_boolean_apply_pairwise(Engine &engine, list_type arguments)
  {
    auto sum = [&engine, arguments]<typename Param>(Param next) -> SExpr {
      if constexpr (requires(Param p1, Param p2) { Op(p1, p2); }) {
        for (const auto &elem : engine.values[arguments.sublist(1)]) {
          const auto result = engine.template get_as<Param>(elem);
          if (!result) {
            return engine.make_error(
              error_kind::host_invocation_failure, str("same types for operator"), SExpr{ Atom{ next } }, result.error());
          }
          const auto prev = std::exchange(next, *result);
          if (!Op(prev, next)) { return SExpr{ Atom{ false } }; }
        }

        return SExpr{ Atom{ true } };
      } else {
        return invocation_error(engine, str("supported types"), arguments);
      }
    };

    if (arguments.size < 2) { return invocation_error(engine, str("at least 2 parameters"), arguments); }

    if (const auto *atom = std::get_if<Atom>(&engine.values[arguments[0]].value); atom != nullptr) {
      return Engine::visit(sum, *atom);
    }

    return invocation_error(engine, str("supported types"), arguments);
  }
};

}// namespace subst_expr

#endif
