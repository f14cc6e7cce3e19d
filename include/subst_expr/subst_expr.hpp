/*
MIT License

Copyright (c) 2023-2024 Jason Turner

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*/

#ifndef SUBST_EXPR_HPP
#define SUBST_EXPR_HPP

#include <algorithm>
#include <array>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <limits>
#include <ranges>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

/// Goals
// * a Lisp core where applying a procedure is a rewrite of its body, not a lookup in an environment frame
// * constexpr evaluation of script possible
// * all expression data lives in fixed size arenas owned by the engine
// * errors are values, no exceptions or dynamic allocations
// * globals and native procedures belong to a host the caller plugs in

/// Notes
// * `(lambda (params...) body)` evaluates to itself, there are no closures
// * arguments are substituted into the body as expressions, lists and symbols are wrapped in `(quote ...)`
// * a parameter redeclared by a nested lambda shadows the outer one from there down
// * only indices and values are passed, the arenas never move their contents
// Triviality of types is critical to design and structure of this system


namespace subst_expr {

inline constexpr int subst_expr_version_major{ 0 };
inline constexpr int subst_expr_version_minor{ 1 };
inline constexpr int subst_expr_version_patch{ 0 };
inline constexpr int subst_expr_version_tweak{};


template<typename char_type> struct chars
{
  [[nodiscard]] static consteval std::string_view str(const char *input) noexcept
    requires std::is_same_v<char_type, char>
  {
    return input;
  }

  template<std::size_t Size>
  [[nodiscard]] static consteval auto str(const char (&input)[Size]) noexcept// NOLINT c-arrays
    requires(!std::is_same_v<char_type, char>)
  {
    struct Result
    {
      char_type data[Size];// NOLINT c-arrays
      constexpr operator std::basic_string_view<char_type>() { return { data, Size - 1 }; }// NOLINT implicit
    };

    Result result;
    std::copy(std::begin(input), std::end(input), std::begin(result.data));
    return result;
  }

  [[nodiscard]] static consteval char_type ch(const char input) noexcept { return input; }
};


template<std::unsigned_integral SizeType,
  typename Contained,
  SizeType SmallSize,
  typename KeyType,
  typename SpanType = std::span<const Contained>>
struct SmallVector
{
  using size_type = SizeType;
  using span_type = SpanType;

  std::array<Contained, SmallSize> small;
  size_type small_size_used = 0;
  bool error_state = false;

  static constexpr auto small_capacity = SmallSize;

  [[nodiscard]] constexpr Contained &operator[](size_type index) noexcept { return small[index]; }
  [[nodiscard]] constexpr const Contained &operator[](size_type index) const noexcept { return small[index]; }
  [[nodiscard]] constexpr auto size() const noexcept { return small_size_used; }
  [[nodiscard]] constexpr auto begin() const noexcept { return small.begin(); }
  [[nodiscard]] constexpr auto begin() noexcept { return small.begin(); }

  [[nodiscard]] constexpr auto end() const noexcept
  {
    return std::next(small.begin(), static_cast<std::ptrdiff_t>(small_size_used));
  }

  [[nodiscard]] constexpr auto end() noexcept
  {
    return std::next(small.begin(), static_cast<std::ptrdiff_t>(small_size_used));
  }

  [[nodiscard]] constexpr SpanType view(KeyType range) const noexcept
  {
    // a range handed out after the vector filled up may point past the used part
    if (range.start > small_size_used || range.size > small_size_used - range.start) { return SpanType{}; }
    return SpanType{ std::span<const Contained>(small).subspan(range.start, range.size) };
  }
  [[nodiscard]] constexpr auto operator[](KeyType span) const noexcept { return view(span); }

  constexpr void push_back(auto &&param) noexcept { insert(param); }
  constexpr void emplace_back(auto &&...param) noexcept { insert(Contained{ param... }); }

  constexpr void resize(SizeType new_size) noexcept
  {
    small_size_used = std::min(new_size, SmallSize);
    if (new_size > SmallSize) { error_state = true; }
  }

  constexpr size_type insert(Contained obj) noexcept
  {
    if (small_size_used < small_capacity) {
      small[small_size_used] = std::move(obj);
      return small_size_used++;
    } else {
      error_state = true;
      return small_size_used;
    }
  }


  constexpr KeyType insert_or_find(SpanType values) noexcept
  {
    if (const auto small_found = std::search(begin(), end(), values.begin(), values.end()); small_found != end()) {
      return KeyType{ static_cast<size_type>(std::distance(begin(), small_found)),
        static_cast<size_type>(values.size()) };
    } else {
      return insert(values);
    }
  }

  constexpr KeyType insert(SpanType values) noexcept
  {
    const auto first = small_size_used;
    for (const auto &value : values) { insert(value); }
    if (error_state) { return KeyType{ first, 0 }; }
    return KeyType{ first, static_cast<size_type>(values.size()) };
  }
};


template<typename CharType> struct Token
{
  using char_type = CharType;
  using string_view_type = std::basic_string_view<char_type>;
  string_view_type parsed;
  string_view_type remaining;
};

template<typename CharType>
Token(std::basic_string_view<CharType>, std::basic_string_view<CharType>) -> Token<CharType>;

template<typename T, typename CharType>
[[nodiscard]] constexpr std::pair<bool, T> parse_number(std::basic_string_view<CharType> input) noexcept
{
  constexpr std::pair<bool, T> failure{ false, 0 };
  if (input == chars<CharType>::str("-")) { return failure; }

  enum struct State : std::uint8_t {
    Start,
    IntegerPart,
    FractionPart,
    ExponentPart,
    ExponentStart,
  };

  State state = State::Start;
  T value_sign = 1;
  long long value = 0LL;
  long long frac = 0LL;
  long long frac_exp = 0LL;
  long long exp_sign = 1LL;
  long long exp = 0LL;

  constexpr auto pow_10 = [](long long power) noexcept {
    auto result = T{ 1 };
    if (power > 0) {
      for (int iteration = 0; iteration < power; ++iteration) { result *= T{ 10 }; }
    } else if (power < 0) {
      for (int iteration = 0; iteration > power; --iteration) { result /= T{ 10 }; }
    }
    return result;
  };

  const auto parse_digit = [](auto &cur_value, auto ch) {
    if (ch >= chars<CharType>::ch('0') && ch <= chars<CharType>::ch('9')) {
      cur_value = cur_value * 10 + ch - chars<CharType>::ch('0');
      return true;
    } else {
      return false;
    }
  };

  for (const auto ch : input) {
    switch (state) {
    case State::Start:
      if (ch == chars<CharType>::ch('-')) {
        value_sign = -1;
      } else if (!parse_digit(value, ch)) {
        return failure;
      }
      state = State::IntegerPart;
      break;
    case State::IntegerPart:
      if (ch == chars<CharType>::ch('.')) {
        state = State::FractionPart;
      } else if (ch == chars<CharType>::ch('e') || ch == chars<CharType>::ch('E')) {
        state = State::ExponentStart;
      } else if (!parse_digit(value, ch)) {
        return failure;
      }
      break;
    case State::FractionPart:
      if (parse_digit(frac, ch)) {
        frac_exp--;
      } else if (ch == chars<CharType>::ch('e') || ch == chars<CharType>::ch('E')) {
        state = State::ExponentStart;
      } else {
        return failure;
      }
      break;
    case State::ExponentStart:
      if (ch == chars<CharType>::ch('-')) {
        exp_sign = -1;
      } else if (!parse_digit(exp, ch)) {
        return failure;
      }
      state = State::ExponentPart;
      break;
    case State::ExponentPart:
      if (!parse_digit(exp, ch)) { return failure; }
    }
  }

  if constexpr (std::is_integral_v<T>) {
    if (state != State::IntegerPart) { return failure; }
    return { true, value_sign * static_cast<T>(value) };
  } else {
    if (state == State::Start || state == State::ExponentStart) { return { false, 0 }; }

    return { true,
      (static_cast<T>(value_sign) * (static_cast<T>(value) + static_cast<T>(frac) * pow_10(frac_exp))
        * pow_10(exp_sign * exp)) };
  }
}


template<typename CharType> [[nodiscard]] constexpr Token<CharType> next_token(std::basic_string_view<CharType> input)
{
  using chars = subst_expr::chars<CharType>;

  constexpr auto is_eol = [](auto ch) { return ch == chars::ch('\n') || ch == chars::ch('\r'); };
  constexpr auto is_whitespace = [=](auto ch) { return ch == chars::ch(' ') || ch == chars::ch('\t') || is_eol(ch); };

  constexpr auto consume = [=](auto ws_input, auto predicate) {
    auto begin = ws_input.begin();
    while (begin != ws_input.end() && predicate(*begin)) { ++begin; }
    return std::basic_string_view<CharType>{ begin, ws_input.end() };
  };

  constexpr auto make_token = [=](std::basic_string_view<CharType> token_input, std::size_t size) {
    return Token{ token_input.substr(0, size), consume(token_input.substr(size), is_whitespace) };
  };

  input = consume(input, is_whitespace);

  // comments, possibly several lines of them
  while (input.starts_with(chars::ch(';'))) {
    input = consume(input, [=](auto ch) { return not is_eol(ch); });
    input = consume(input, is_whitespace);
  }

  // list
  if (input.starts_with(chars::ch('(')) || input.starts_with(chars::ch(')'))) { return make_token(input, 1); }

  // quoted datum
  if (input.starts_with(chars::ch('\''))) { return make_token(input, 1); }

  // quoted string
  if (input.starts_with(chars::ch('"'))) {
    bool in_escape = false;
    auto location = std::next(input.begin());
    while (location != input.end()) {
      if (*location == chars::ch('\\')) {
        in_escape = true;
      } else if (*location == chars::ch('"') && !in_escape) {
        ++location;
        break;
      } else {
        in_escape = false;
      }
      ++location;
    }

    return make_token(input, static_cast<std::size_t>(std::distance(input.begin(), location)));
  }

  // everything else
  const auto value =
    consume(input, [=](auto ch) { return !is_whitespace(ch) && ch != chars::ch(')') && ch != chars::ch('('); });

  return make_token(input, static_cast<std::size_t>(std::distance(input.begin(), value.begin())));
}

template<std::unsigned_integral SizeType> struct IndexedString
{
  using size_type = SizeType;
  size_type start{ 0 };
  size_type size{ 0 };
  [[nodiscard]] constexpr bool operator==(const IndexedString &) const noexcept = default;
};

template<std::unsigned_integral SizeType> struct IndexedList
{
  using size_type = SizeType;
  size_type start{ 0 };
  size_type size{ 0 };
  [[nodiscard]] constexpr bool operator==(const IndexedList &) const noexcept = default;
  [[nodiscard]] constexpr bool empty() const noexcept { return size == 0; }
  [[nodiscard]] constexpr auto front() const noexcept { return start; }
  [[nodiscard]] constexpr size_type operator[](size_type index) const noexcept { return start + index; }
  [[nodiscard]] constexpr size_type back() const noexcept { return static_cast<size_type>(start + size - 1); }
  [[nodiscard]] constexpr auto sublist(const size_type from) const noexcept
  {
    return IndexedList{ static_cast<size_type>(start + from), static_cast<size_type>(size - from) };
  }

  [[nodiscard]] constexpr auto sublist(const size_type from, const size_type distance) const noexcept
  {
    return IndexedList{ static_cast<size_type>(start + from), distance };
  }
};


template<std::unsigned_integral SizeType> struct Identifier
{
  using size_type = SizeType;
  IndexedString<size_type> value;
  [[nodiscard]] constexpr bool operator==(const Identifier &) const noexcept = default;
};

template<std::unsigned_integral SizeType> Identifier(IndexedString<SizeType>) -> Identifier<SizeType>;


enum struct error_kind : std::uint8_t {
  malformed_expression,
  not_a_procedure,
  host_lookup_failure,
  host_invocation_failure,
  recursion_limit_exceeded,
  arity_mismatch,
  capacity_exceeded,
  parse_error,
};

[[nodiscard]] constexpr std::string_view error_kind_name(const error_kind kind) noexcept
{
  switch (kind) {
  case error_kind::malformed_expression:
    return "malformed expression";
  case error_kind::not_a_procedure:
    return "not a procedure";
  case error_kind::host_lookup_failure:
    return "host lookup failure";
  case error_kind::host_invocation_failure:
    return "host invocation failure";
  case error_kind::recursion_limit_exceeded:
    return "recursion limit exceeded";
  case error_kind::arity_mismatch:
    return "arity mismatch";
  case error_kind::capacity_exceeded:
    return "capacity exceeded";
  case error_kind::parse_error:
    return "parse error";
  }
  return "unknown error";
}

template<std::unsigned_integral SizeType> struct Error
{
  using size_type = SizeType;
  error_kind kind{ error_kind::malformed_expression };
  IndexedString<size_type> expected;
  IndexedList<size_type> got;
  [[nodiscard]] constexpr bool operator==(const Error &) const noexcept = default;
};


// What the engine needs from its surroundings: resolving free symbols and calling native procedures.
// Failures are reported as error values of kind host_lookup_failure / host_invocation_failure.
template<typename Host, typename Engine>
concept host_for = requires(Host &host,
  Engine &engine,
  typename Engine::identifier_type id,
  typename Engine::native_procedure native,
  typename Engine::list_type arguments) {
  { host.resolve_global(engine, id) } -> std::same_as<typename Engine::SExpr>;
  { host.invoke_native(engine, native, arguments) } -> std::same_as<typename Engine::SExpr>;
};


template<std::unsigned_integral SizeType = std::uint16_t,
  typename CharType = char,
  std::signed_integral IntegralType = int,
  std::floating_point FloatType = double,
  SizeType BuiltInStringsSize = 1024,
  SizeType BuiltInValuesSize = 1024,
  SizeType MaxDepth = 1000,
  SizeType BuiltInScratchSize = BuiltInValuesSize,
  typename... UserTypes>
struct engine
{
  using char_type = CharType;
  using size_type = SizeType;
  using int_type = IntegralType;
  using float_type = FloatType;
  using string_type = IndexedString<size_type>;
  using string_view_type = std::basic_string_view<char_type>;
  using identifier_type = Identifier<size_type>;
  using list_type = IndexedList<size_type>;
  using error_type = Error<size_type>;

  static constexpr size_type max_depth = MaxDepth;

  // holds the partially built lists of every nesting level at once
  template<typename Contained>
  using scratch_vector = SmallVector<size_type, Contained, BuiltInScratchSize, list_type>;

  struct SExpr;
  struct native_procedure;

  template<std::size_t Size>
  [[nodiscard]] static consteval auto str(char const (&input)[Size]) noexcept// NOLINT(modernize-avoid-c-arrays)
  {
    return chars<char_type>::str(input);
  }

  template<typename Type>
  [[nodiscard]] static constexpr bool visit_helper(SExpr &result, auto Func, auto &variant) noexcept
  {
    if (auto *value = std::get_if<Type>(&variant); value != nullptr) {
      result = Func(*value);
      return true;
    }
    return false;
  }

  template<typename... Type> static constexpr SExpr visit(auto visitor, const std::variant<Type...> &value) noexcept
  {
    SExpr result{};
    // || will make this short circuit and stop on first matching function
    ((visit_helper<Type>(result, visitor, value) || ...));
    return result;
  }

  // arguments are already evaluated when a native procedure is called
  using native_function = SExpr (*)(engine &, list_type);
  using Atom = std::variant<std::monostate, bool, int_type, float_type, string_type, identifier_type, UserTypes...>;

  struct native_procedure
  {
    native_function ptr{ nullptr };
    string_type name{};

    [[nodiscard]] constexpr bool operator==(const native_procedure &other) const noexcept
    {
      // function pointer comparison is unreliable during constant evaluation, names are unique per host
      if consteval {
        return name == other.name;
      } else {
        return ptr == other.ptr;
      }
    }
  };

  template<typename T>
  inline static constexpr bool is_sexpr_type_v = std::is_same_v<T, list_type> || std::is_same_v<T, native_procedure>
                                                 || std::is_same_v<T, error_type> || std::is_same_v<T, Atom>;


  struct SExpr
  {
    std::variant<Atom, list_type, native_procedure, error_type> value;

    [[nodiscard]] constexpr bool operator==(const SExpr &) const noexcept = default;
  };

  static_assert(std::is_trivially_copyable_v<SExpr> && std::is_trivially_destructible_v<SExpr>,
    "subst_expr does not work with non-trivial types");

  template<typename Result> [[nodiscard]] constexpr const Result *get_if(const SExpr *sexpr) const noexcept
  {
    if (sexpr == nullptr) { return nullptr; }

    if constexpr (is_sexpr_type_v<Result>) {
      return std::get_if<Result>(&sexpr->value);
    } else {
      if (const auto *atom = std::get_if<Atom>(&sexpr->value)) {
        return std::get_if<Result>(atom);
      } else {
        return nullptr;
      }
    }
  }

  SmallVector<size_type, char_type, BuiltInStringsSize, string_type, string_view_type> strings{};
  SmallVector<size_type, SExpr, BuiltInValuesSize, list_type> values{};

  scratch_vector<SExpr> object_scratch{};
  scratch_vector<string_type> string_scratch{};

  // reject applications whose argument count differs from the parameter count,
  // instead of leaving the unmatched parameters free
  bool strict_arity = false;

  template<typename ScratchTo> struct Scratch
  {
    constexpr explicit Scratch(ScratchTo &t_data) noexcept : data(&t_data) {}
    constexpr explicit Scratch(ScratchTo &t_data, auto initial_values) noexcept : Scratch(t_data)
    {
      for (const auto &obj : initial_values) { push_back(obj); }
    }
    Scratch(const Scratch &) = delete;
    Scratch(Scratch &&) = delete;
    auto &operator=(Scratch &&) = delete;
    auto &operator=(const Scratch &) = delete;
    constexpr ~Scratch() noexcept { data->resize(initial_size); }
    [[nodiscard]] constexpr auto begin() const noexcept { return std::next(data->begin(), initial_size); }
    [[nodiscard]] constexpr auto end() const noexcept { return std::next(data->begin(), current_size); }
    constexpr void push_back(auto obj) noexcept
    {
      assert(data->size() == current_size);
      data->push_back(obj);
      current_size = data->size();
    }

  private:
    ScratchTo *data;
    size_type initial_size = data->size();
    size_type current_size = data->size();
  };


  //
  // errors
  //
  [[nodiscard]] constexpr SExpr make_error(error_kind kind, string_view_type description, list_type context)
  {
    return SExpr{ error_type{ kind, strings.insert_or_find(description), context } };
  }

  [[nodiscard]] constexpr SExpr make_error(error_kind kind, string_view_type description, auto... value)
  {
    return make_error(kind, description, values.insert_or_find(std::array{ SExpr{ value }... }));
  }

  [[nodiscard]] constexpr bool exhausted() const noexcept
  {
    return strings.error_state || values.error_state || object_scratch.error_state || string_scratch.error_state;
  }

  // built without touching the arenas, they are full
  [[nodiscard]] static constexpr SExpr capacity_error() noexcept
  {
    return SExpr{ error_type{ error_kind::capacity_exceeded, {}, {} } };
  }

  // drops everything a failed evaluation stored past the given sizes, nothing refers to it anymore
  [[nodiscard]] constexpr SExpr recover(const size_type strings_used, const size_type values_used) noexcept
  {
    strings.resize(strings_used);
    values.resize(values_used);
    strings.error_state = false;
    values.error_state = false;
    object_scratch.error_state = false;
    string_scratch.error_state = false;
    return capacity_error();
  }


  //
  // classification
  //
  enum struct form : std::uint8_t { constant, symbol, quote_form, if_form, lambda_form, call_form, error, malformed };

  struct quote_tag
  {
    [[nodiscard]] static constexpr auto text() noexcept { return str("quote"); }
  };
  struct if_tag
  {
    [[nodiscard]] static constexpr auto text() noexcept { return str("if"); }
  };
  struct lambda_tag
  {
    [[nodiscard]] static constexpr auto text() noexcept { return str("lambda"); }
  };

  [[nodiscard]] constexpr bool is_symbol(const SExpr &expr) const noexcept
  {
    return get_if<identifier_type>(&expr) != nullptr;
  }

  [[nodiscard]] constexpr bool is_sequence(const SExpr &expr) const noexcept
  {
    return get_if<list_type>(&expr) != nullptr;
  }

  [[nodiscard]] constexpr bool is_error(const SExpr &expr) const noexcept { return get_if<error_type>(&expr) != nullptr; }

  [[nodiscard]] constexpr bool is_constant(const SExpr &expr) const noexcept
  {
    if (get_if<native_procedure>(&expr) != nullptr) { return true; }
    return get_if<Atom>(&expr) != nullptr && !is_symbol(expr);
  }

  // a non-empty list whose head is the identifier named by Tag
  template<typename Tag> [[nodiscard]] constexpr bool is_tagged_form(const SExpr &expr) const noexcept
  {
    const auto *list = get_if<list_type>(&expr);
    if (list == nullptr || list->empty()) { return false; }
    const auto *head = get_if<identifier_type>(&values[list->front()]);
    return head != nullptr && strings.view(head->value) == Tag::text();
  }

  [[nodiscard]] constexpr bool is_quote_form(const SExpr &expr) const noexcept { return is_tagged_form<quote_tag>(expr); }
  [[nodiscard]] constexpr bool is_if_form(const SExpr &expr) const noexcept { return is_tagged_form<if_tag>(expr); }
  [[nodiscard]] constexpr bool is_lambda_form(const SExpr &expr) const noexcept
  {
    return is_tagged_form<lambda_tag>(expr);
  }

  [[nodiscard]] constexpr form classify(const SExpr &expr) const noexcept
  {
    if (is_constant(expr)) { return form::constant; }
    if (is_symbol(expr)) { return form::symbol; }
    if (is_quote_form(expr)) { return form::quote_form; }
    if (is_if_form(expr)) { return form::if_form; }
    if (is_lambda_form(expr)) { return form::lambda_form; }
    if (const auto *list = get_if<list_type>(&expr); list != nullptr && !list->empty()) { return form::call_form; }
    if (is_error(expr)) { return form::error; }
    return form::malformed;
  }

  [[nodiscard]] constexpr bool same_name(const string_type lhs, const string_type rhs) const noexcept
  {
    return lhs == rhs || strings.view(lhs) == strings.view(rhs);
  }

  // only `false` is false
  [[nodiscard]] constexpr bool is_true(const SExpr &expr) const noexcept
  {
    const auto *boolean = get_if<bool>(&expr);
    return boolean == nullptr || *boolean;
  }

  // structural equality, lists are compared element by element and names by their text
  [[nodiscard]] constexpr bool equal(const SExpr &lhs, const SExpr &rhs) const noexcept
  {
    if (const auto *lhs_list = get_if<list_type>(&lhs); lhs_list != nullptr) {
      const auto *rhs_list = get_if<list_type>(&rhs);
      if (rhs_list == nullptr || lhs_list->size != rhs_list->size) { return false; }
      for (size_type index = 0; index < lhs_list->size; ++index) {
        if (!equal(values[(*lhs_list)[index]], values[(*rhs_list)[index]])) { return false; }
      }
      return true;
    }

    if (const auto *lhs_id = get_if<identifier_type>(&lhs); lhs_id != nullptr) {
      const auto *rhs_id = get_if<identifier_type>(&rhs);
      return rhs_id != nullptr && same_name(lhs_id->value, rhs_id->value);
    }

    if (const auto *lhs_string = get_if<string_type>(&lhs); lhs_string != nullptr) {
      const auto *rhs_string = get_if<string_type>(&rhs);
      return rhs_string != nullptr && same_name(*lhs_string, *rhs_string);
    }

    return lhs == rhs;
  }


  //
  // reader
  //
  [[nodiscard]] constexpr SExpr make_quote(const SExpr datum)
  {
    const std::array quoted{ SExpr{ Atom{ identifier_type{ strings.insert_or_find(str("quote")) } } }, datum };
    return SExpr{ values.insert_or_find(quoted) };
  }

  // returns the datum starting at `token` and the last token it consumed
  [[nodiscard]] constexpr std::pair<SExpr, Token<CharType>> parse_datum(Token<CharType> token, size_type depth = 0)
  {
    if (depth >= max_depth) {
      return { make_error(
                 error_kind::parse_error, str("nesting within the depth limit"), SExpr{ Atom{ std::monostate{} } }),
        Token<CharType>{} };
    }

    const auto next_depth = static_cast<size_type>(depth + 1);

    if (token.parsed == str("(")) {
      auto [parsed, remaining] = parse(token.remaining, next_depth);
      if (is_error(parsed)) { return { parsed, remaining }; }
      if (remaining.parsed != str(")")) {
        return { make_error(error_kind::parse_error, str("closing parenthesis"), parsed), remaining };
      }
      return { parsed, remaining };
    }

    if (token.parsed == str("'")) {
      const auto next = next_token(token.remaining);
      if (next.parsed.empty() || next.parsed == str(")")) {
        return { make_error(error_kind::parse_error, str("datum after quote"), SExpr{ Atom{ std::monostate{} } }),
          token };
      }
      auto [datum, remaining] = parse_datum(next, next_depth);
      if (is_error(datum)) { return { datum, remaining }; }
      return { make_quote(datum), remaining };
    }

    if (token.parsed == str("true") || token.parsed == str("#t")) { return { SExpr{ Atom{ true } }, token }; }
    if (token.parsed == str("false") || token.parsed == str("#f")) { return { SExpr{ Atom{ false } }, token }; }

    if (token.parsed.starts_with(chars<char_type>::ch('"'))) {
      // note that this doesn't remove escaped characters
      if (token.parsed.size() > 1 && token.parsed.ends_with(chars<char_type>::ch('"'))) {
        const auto string = strings.insert_or_find(token.parsed.substr(1, token.parsed.size() - 2));
        return { SExpr{ Atom(string) }, token };
      }
      return { make_error(
                 error_kind::parse_error, str("terminated string"), SExpr{ Atom(strings.insert_or_find(token.parsed)) }),
        token };
    }

    if (auto [int_did_parse, int_value] = parse_number<int_type>(token.parsed); int_did_parse) {
      return { SExpr{ Atom(int_value) }, token };
    }

    if (auto [float_did_parse, float_value] = parse_number<float_type>(token.parsed); float_did_parse) {
      return { SExpr{ Atom(float_value) }, token };
    }

    return { SExpr{ Atom(Identifier{ strings.insert_or_find(token.parsed) }) }, token };
  }

  // reads data until the input or the current list ends, returns the list of data read,
  // or the first parse error, and the token that stopped the reading
  [[nodiscard]] constexpr std::pair<SExpr, Token<CharType>> parse(string_view_type input, size_type depth = 0)
  {
    Scratch retval{ object_scratch };

    auto token = next_token(input);

    while (!token.parsed.empty() && token.parsed != str(")")) {
      auto [datum, last] = parse_datum(token, depth);
      if (is_error(datum)) { return { datum, Token<CharType>{} }; }
      retval.push_back(datum);
      token = next_token(last.remaining);
    }

    return std::pair<SExpr, Token<CharType>>(SExpr{ values.insert_or_find(retval) }, token);
  }


  //
  // substitution
  //

  // an evaluated argument as something that evaluates back to itself once placed in a body
  [[nodiscard]] constexpr SExpr quote_if_needed(const SExpr value)
  {
    if (is_constant(value) || is_lambda_form(value) || is_error(value)) { return value; }
    return make_quote(value);
  }

  [[nodiscard]] constexpr SExpr lookup(const identifier_type id, list_type parameters, list_type arguments)
  {
    for (size_type index = 0; index < parameters.size && index < arguments.size; ++index) {
      const auto *parameter = get_if<identifier_type>(&values[parameters[index]]);
      if (parameter != nullptr && same_name(parameter->value, id.value)) {
        return quote_if_needed(values[arguments[index]]);
      }
    }

    // not a parameter, left for the host to resolve
    return SExpr{ Atom{ id } };
  }

  [[nodiscard]] constexpr bool is_bound(const identifier_type id, std::span<const string_type> bound) const noexcept
  {
    return std::ranges::any_of(bound, [&](const string_type name) { return same_name(name, id.value); });
  }

  [[nodiscard]] constexpr SExpr substitute_lambda(list_type lambda,
    list_type parameters,
    list_type arguments,
    std::span<const string_type> bound)
  {
    if (lambda.size < 2) {
      return make_error(error_kind::malformed_expression, str("(lambda (parameters...) body)"), SExpr{ lambda });
    }

    Scratch new_bound{ string_scratch, bound };
    if (const auto *inner_parameters = get_if<list_type>(&values[lambda[1]]); inner_parameters != nullptr) {
      for (const auto &parameter : values[*inner_parameters]) {
        if (const auto *id = get_if<identifier_type>(&parameter); id != nullptr) { new_bound.push_back(id->value); }
      }
    }

    Scratch new_lambda{ object_scratch, std::array{ values[lambda[0]], values[lambda[1]] } };

    for (size_type index = 2; index < lambda.size; ++index) {
      const auto body = substitute(values[lambda[index]], parameters, arguments, new_bound);
      if (is_error(body)) { return body; }
      new_lambda.push_back(body);
    }

    return SExpr{ values.insert_or_find(new_lambda) };
  }

  // replaces the free occurrences of `parameters` in `expr` by the matching `arguments`,
  // names in `bound` were redeclared by an enclosing lambda and are left alone
  [[nodiscard]] constexpr SExpr
    substitute(const SExpr expr, list_type parameters, list_type arguments, std::span<const string_type> bound = {})
  {
    if (exhausted()) { return capacity_error(); }

    switch (classify(expr)) {
    case form::constant:
    case form::quote_form:
    case form::error:
      return expr;
    case form::symbol: {
      const auto id = *get_if<identifier_type>(&expr);
      if (is_bound(id, bound)) { return expr; }
      return lookup(id, parameters, arguments);
    }
    case form::lambda_form:
      return substitute_lambda(*get_if<list_type>(&expr), parameters, arguments, bound);
    case form::if_form:
    case form::call_form: {
      Scratch result{ object_scratch };
      for (const auto &value : values[*get_if<list_type>(&expr)]) {
        const auto substituted = substitute(value, parameters, arguments, bound);
        if (is_error(substituted)) { return substituted; }
        result.push_back(substituted);
      }
      return SExpr{ values.insert_or_find(result) };
    }
    case form::malformed:
      break;
    }

    return make_error(error_kind::malformed_expression, str("constant, symbol or non-empty list"), expr);
  }


  //
  // evaluation
  //
  [[nodiscard]] constexpr std::expected<list_type, SExpr> get_lambda_parameters(list_type lambda)
  {
    if (lambda.size != 3) {
      return std::unexpected(
        make_error(error_kind::malformed_expression, str("(lambda (parameters...) body)"), SExpr{ lambda }));
    }

    const auto *parameters = get_if<list_type>(&values[lambda[1]]);
    if (parameters == nullptr
        || !std::ranges::all_of(values[*parameters], [this](const SExpr &param) { return is_symbol(param); })) {
      return std::unexpected(
        make_error(error_kind::malformed_expression, str("(parameter-identifier...)"), values[lambda[1]]));
    }

    return *parameters;
  }

  template<host_for<engine> Host>
  [[nodiscard]] constexpr SExpr apply(Host &host, const SExpr procedure, list_type arguments, size_type depth = 0)
  {
    if (const auto *native = get_if<native_procedure>(&procedure); native != nullptr) {
      return host.invoke_native(*this, *native, arguments);
    }

    if (!is_lambda_form(procedure)) {
      return make_error(error_kind::not_a_procedure, str("native procedure or lambda"), procedure);
    }

    const auto lambda = *get_if<list_type>(&procedure);
    const auto parameters = get_lambda_parameters(lambda);
    if (!parameters) { return parameters.error(); }

    if (strict_arity && parameters->size != arguments.size) {
      return make_error(error_kind::arity_mismatch, str("one argument per parameter"), procedure, SExpr{ arguments });
    }

    return evaluate(host, substitute(values[lambda[2]], *parameters, arguments), static_cast<size_type>(depth + 1));
  }

  template<host_for<engine> Host>
  [[nodiscard]] constexpr SExpr evaluate_call(Host &host, list_type call, size_type depth)
  {
    const auto next_depth = static_cast<size_type>(depth + 1);

    const auto procedure = evaluate(host, values[call[0]], next_depth);
    if (is_error(procedure)) { return procedure; }

    list_type argument_list;
    {
      // released before applying, the arguments are copied into `values`
      Scratch arguments{ object_scratch };
      for (const auto &operand : values[call.sublist(1)]) {
        const auto argument = evaluate(host, operand, next_depth);
        if (is_error(argument)) { return argument; }
        arguments.push_back(argument);
      }
      argument_list = values.insert_or_find(arguments);
    }
    if (exhausted()) { return capacity_error(); }

    return apply(host, procedure, argument_list, next_depth);
  }

  template<host_for<engine> Host>
  [[nodiscard]] constexpr SExpr evaluate(Host &host, const SExpr expr, size_type depth = 0)
  {
    if (exhausted()) { return capacity_error(); }

    if (depth > max_depth) {
      return make_error(error_kind::recursion_limit_exceeded, str("evaluation nested less deeply"), expr);
    }

    switch (classify(expr)) {
    case form::constant:
    case form::lambda_form:
    case form::error:
      return expr;
    case form::symbol:
      return host.resolve_global(*this, *get_if<identifier_type>(&expr));
    case form::quote_form: {
      const auto quote = *get_if<list_type>(&expr);
      if (quote.size != 2) { return make_error(error_kind::malformed_expression, str("(quote datum)"), expr); }
      return values[quote[1]];
    }
    case form::if_form: {
      // need to be careful to not execute unexecuted branches
      const auto branches = *get_if<list_type>(&expr);
      if (branches.size != 4) {
        return make_error(error_kind::malformed_expression, str("(if condition consequent alternative)"), expr);
      }

      const auto next_depth = static_cast<size_type>(depth + 1);
      const auto condition = evaluate(host, values[branches[1]], next_depth);
      if (is_error(condition)) { return condition; }

      if (is_true(condition)) {
        return evaluate(host, values[branches[2]], next_depth);
      } else {
        return evaluate(host, values[branches[3]], next_depth);
      }
    }
    case form::call_form:
      return evaluate_call(host, *get_if<list_type>(&expr), depth);
    case form::malformed:
      break;
    }

    return make_error(error_kind::malformed_expression, str("constant, symbol or non-empty list"), expr);
  }

  // parses `input` and evaluates each expression in it, stopping at the first failure.
  // Running out of storage rolls the arenas back to where they were before `input`.
  template<host_for<engine> Host> [[nodiscard]] constexpr SExpr evaluate(Host &host, string_view_type input)
  {
    const auto strings_used = strings.size();
    const auto values_used = values.size();

    const auto [parsed, remaining] = parse(input);
    if (exhausted()) { return recover(strings_used, values_used); }
    if (is_error(parsed)) { return parsed; }
    if (!remaining.parsed.empty()) {
      return make_error(error_kind::parse_error, str("balanced parentheses"), SExpr{ Atom{ std::monostate{} } });
    }

    auto result = SExpr{ Atom{ std::monostate{} } };
    for (const auto &expr : values[*get_if<list_type>(&parsed)]) {
      result = evaluate(host, expr);
      if (is_error(result)) { break; }
    }
    if (exhausted()) { return recover(strings_used, values_used); }
    return result;
  }

  template<typename Type> [[nodiscard]] constexpr std::expected<Type, SExpr> get_as(const SExpr expr) const
  {
    if constexpr (std::is_same_v<Type, SExpr>) {
      return expr;
    } else if constexpr (is_sexpr_type_v<Type>) {
      if (const auto *obj = std::get_if<Type>(&expr.value); obj != nullptr) { return *obj; }
    } else if constexpr (std::is_same_v<Type, string_view_type>) {
      if (const auto *value = get_if<string_type>(&expr); value != nullptr) { return strings.view(*value); }
    } else {
      if (const auto *value = get_if<Type>(&expr); value != nullptr) { return *value; }
    }
    return std::unexpected(expr);
  }

  template<typename Result, host_for<engine> Host>
  [[nodiscard]] constexpr std::expected<Result, SExpr> evaluate_to(Host &host, string_view_type input)
  {
    const auto result = evaluate(host, input);
    if (is_error(result)) { return std::unexpected(result); }
    return get_as<Result>(result);
  }
};


}// namespace subst_expr

#endif
