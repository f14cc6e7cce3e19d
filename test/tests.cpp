#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

#include <subst_expr/standard_host.hpp>
#include <subst_expr/subst_expr.hpp>
#include <subst_expr/utility.hpp>

using engine_type = subst_expr::engine<std::uint16_t, char, int, double, 4096, 8192>;
using SExpr = engine_type::SExpr;

// the standard symbol table, recording what the engine asked for
struct mock_host
{
  subst_expr::standard_host<engine_type> globals;
  std::vector<std::string> lookups;
  std::vector<std::string> invocations;

  explicit mock_host(engine_type &engine) : globals(engine) {}

  SExpr resolve_global(engine_type &engine, engine_type::identifier_type id)
  {
    lookups.emplace_back(engine.strings.view(id.value));
    return globals.resolve_global(engine, id);
  }

  SExpr invoke_native(engine_type &engine, engine_type::native_procedure native, engine_type::list_type arguments)
  {
    invocations.emplace_back(engine.strings.view(native.name));
    return globals.invoke_native(engine, native, arguments);
  }

  [[nodiscard]] auto count_invocations(std::string_view name) const { return std::ranges::count(invocations, name); }
  [[nodiscard]] bool looked_up(std::string_view name) const { return std::ranges::find(lookups, name) != lookups.end(); }
};

SExpr first_letter(engine_type &engine, engine_type::list_type arguments)
{
  const auto *id =
    arguments.size == 1 ? engine.get_if<engine_type::identifier_type>(&engine.values[arguments[0]]) : nullptr;
  if (id == nullptr || id->value.size == 0) {
    return engine.make_error(subst_expr::error_kind::host_invocation_failure, "(first-letter symbol)", SExpr{ arguments });
  }

  const auto letter = engine.strings.view(id->value).substr(0, 1);
  return SExpr{ engine_type::Atom{ engine_type::identifier_type{ engine.strings.insert_or_find(letter) } } };
}

struct fixture
{
  engine_type engine;
  mock_host host{ engine };

  SExpr evaluate(std::string_view input) { return engine.evaluate(host, input); }
  std::string evaluate_to_string(std::string_view input) { return subst_expr::to_string(engine, false, evaluate(input)); }

  subst_expr::error_kind evaluate_to_error(std::string_view input)
  {
    const auto result = evaluate(input);
    REQUIRE(engine.is_error(result));
    return engine.get_if<engine_type::error_type>(&result)->kind;
  }

  SExpr parse_one(std::string_view input)
  {
    const auto parsed = engine.parse(input).first;
    return engine.values[engine.get_if<engine_type::list_type>(&parsed)->front()];
  }
};


TEST_CASE("atom constants evaluate to themselves", "[evaluator]")
{
  fixture test;

  CHECK(test.engine.evaluate_to<int>(test.host, "42") == 42);
  CHECK(test.engine.evaluate_to<double>(test.host, "1.5") == 1.5);
  CHECK(test.engine.evaluate_to<bool>(test.host, "#f") == false);
  CHECK(test.engine.evaluate_to<std::string_view>(test.host, R"("hello")") == "hello");
  CHECK(test.host.lookups.empty());
}

TEST_CASE("evaluating a reduced constant twice has no side effects", "[evaluator]")
{
  fixture test;
  const auto constant = test.parse_one("12");

  const auto values_used = test.engine.values.size();
  const auto strings_used = test.engine.strings.size();

  CHECK(test.engine.evaluate(test.host, constant) == constant);
  CHECK(test.engine.evaluate(test.host, constant) == constant);

  CHECK(test.engine.values.size() == values_used);
  CHECK(test.engine.strings.size() == strings_used);
  CHECK(test.host.lookups.empty());
  CHECK(test.host.invocations.empty());
}

TEST_CASE("quote returns its datum without evaluating it", "[evaluator]")
{
  fixture test;

  CHECK(test.evaluate_to_string("(quote (undefined-procedure 1 (car 2)))") == "(undefined-procedure 1 (car 2))");
  CHECK(test.evaluate_to_string("'some-symbol") == "some-symbol");
  CHECK(test.evaluate_to_string("'()") == "()");
  CHECK(test.host.lookups.empty());
  CHECK(test.host.invocations.empty());
}

TEST_CASE("if only evaluates the chosen branch", "[evaluator]")
{
  fixture test;

  CHECK(test.engine.evaluate_to<int>(test.host, "(if true 1 (undefined-procedure 2))") == 1);
  CHECK(test.engine.evaluate_to<int>(test.host, "(if false (car 5) 2)") == 2);
  CHECK_FALSE(test.host.looked_up("undefined-procedure"));
  CHECK(test.host.count_invocations("car") == 0);
}

TEST_CASE("if treats everything but false as true", "[evaluator]")
{
  fixture test;

  CHECK(test.engine.evaluate_to<int>(test.host, "(if 0 1 2)") == 1);
  CHECK(test.engine.evaluate_to<int>(test.host, "(if '() 1 2)") == 1);
  CHECK(test.engine.evaluate_to<int>(test.host, R"((if "" 1 2))") == 1);
  CHECK(test.engine.evaluate_to<int>(test.host, "(if (< 2 1) 1 2)") == 2);
}

TEST_CASE("lambda forms evaluate to themselves", "[evaluator]")
{
  fixture test;

  CHECK(test.evaluate_to_string("(lambda (x) (undefined x))") == "(lambda (x) (undefined x))");
  CHECK(test.host.lookups.empty());
}

TEST_CASE("identity returns its argument unchanged", "[applier]")
{
  fixture test;

  CHECK(test.engine.evaluate_to<int>(test.host, "((lambda (x) x) 7)") == 7);
  CHECK(test.evaluate_to_string("((lambda (x) x) (lambda (y) (+ y 1)))") == "(lambda (y) (+ y 1))");

  const auto native = test.evaluate("((lambda (x) x) car)");
  const auto *procedure = test.engine.get_if<engine_type::native_procedure>(&native);
  REQUIRE(procedure != nullptr);
  CHECK(test.engine.strings.view(procedure->name) == "car");
}

TEST_CASE("natives are delegated to the host with evaluated arguments", "[applier]")
{
  fixture test;

  CHECK(test.engine.evaluate_to<int>(test.host, "(+ 1 (* 2 3))") == 7);
  CHECK(test.host.count_invocations("+") == 1);
  CHECK(test.host.count_invocations("*") == 1);
  CHECK(test.host.invocations == std::vector<std::string>{ "*", "+" });
}

TEST_CASE("arguments are evaluated left to right", "[evaluator]")
{
  fixture test;

  CHECK(test.engine.evaluate_to<int>(test.host, "(+ (- 5 1) (* 2 3) (/ 8 2))") == 14);
  CHECK(test.host.invocations == std::vector<std::string>{ "-", "*", "/", "+" });
}

TEST_CASE("inner lambdas shadow outer parameters", "[substitution]")
{
  fixture test;

  CHECK(test.engine.evaluate_to<int>(test.host, "(((lambda (x) (lambda (x) x)) 1) 2)") == 2);
  CHECK(test.evaluate_to_string("((lambda (x) (lambda (x) x)) 1)") == "(lambda (x) x)");
  CHECK(test.evaluate_to_string("((lambda (x) (lambda (y) (+ x y))) 1)") == "(lambda (y) (+ 1 y))");
}

TEST_CASE("shadowing only applies below the redeclaring lambda", "[substitution]")
{
  fixture test;

  CHECK(test.evaluate_to_string("((lambda (x) (list x (lambda (x) x) x)) 5)") == "(5 (lambda (x) x) 5)");
}

TEST_CASE("nested procedures see outer arguments", "[substitution]")
{
  fixture test;

  CHECK(test.engine.evaluate_to<int>(test.host, "((((lambda (x) (lambda (y) (lambda (z) (+ x y z)))) 1) 2) 3)") == 6);
  CHECK(test.engine.evaluate_to<int>(test.host, "((lambda (f) (f 10)) (lambda (n) (* n n)))") == 100);
}

TEST_CASE("symbols that are not parameters pass through substitution", "[substitution]")
{
  fixture test;

  const auto body = test.parse_one("(+ y x)");
  const auto parameter_list = test.parse_one("(x)");
  const auto argument_list = test.parse_one("(1)");
  const auto parameters = *test.engine.get_if<engine_type::list_type>(&parameter_list);
  const auto arguments = *test.engine.get_if<engine_type::list_type>(&argument_list);

  const auto substituted = test.engine.substitute(body, parameters, arguments);
  CHECK(subst_expr::to_string(test.engine, false, substituted) == "(+ y 1)");

  REQUIRE(test.host.globals.add(test.engine, "y", 10));
  CHECK(test.engine.evaluate(test.host, substituted) == SExpr{ engine_type::Atom{ 11 } });
  CHECK(test.host.looked_up("y"));
  CHECK(test.host.looked_up("+"));
}

TEST_CASE("quoted data is never substituted", "[substitution]")
{
  fixture test;

  CHECK(test.evaluate_to_string("((lambda (x) '(x y)) 1)") == "(x y)");
  CHECK(test.evaluate_to_string("((lambda (x) (list x 'x)) 1)") == "(1 x)");
}

TEST_CASE("compound and symbolic arguments are quoted when substituted", "[substitution]")
{
  fixture test;

  CHECK(test.evaluate_to_string("((lambda (x) (lambda () x)) '(1 2 3))") == "(lambda () '(1 2 3))");
  CHECK(test.evaluate_to_string("((lambda (x) (lambda () x)) 'name)") == "(lambda () 'name)");
  CHECK(test.evaluate_to_string("((lambda (x) (lambda () x)) 4)") == "(lambda () 4)");
  CHECK(test.evaluate_to_string("((lambda (x) (lambda () x)) (lambda (y) y))") == "(lambda () (lambda (y) y))");
  CHECK(test.evaluate_to_string("((lambda (x) (lambda () x)) car)") == "(lambda () [native car])");

  // the quoted list comes back as data, not as a call to 1
  CHECK(test.evaluate_to_string("((lambda (x) (cdr x)) '(1 2 3))") == "(2 3)");
  CHECK(test.evaluate_to_string("((lambda (x) (car x)) (list 'a 'b))") == "a");
}

TEST_CASE("quote_if_needed policy", "[substitution]")
{
  fixture test;
  auto &engine = test.engine;

  const auto number = test.parse_one("3");
  const auto lambda = test.parse_one("(lambda (a) a)");
  const auto list = test.parse_one("(1 2)");
  const auto symbol = test.parse_one("a");
  const auto native = test.evaluate("car");

  CHECK(engine.quote_if_needed(number) == number);
  CHECK(engine.quote_if_needed(lambda) == lambda);
  CHECK(engine.quote_if_needed(native) == native);
  CHECK(engine.is_quote_form(engine.quote_if_needed(list)));
  CHECK(engine.is_quote_form(engine.quote_if_needed(symbol)));
}

TEST_CASE("mapping a native over a list through self application", "[integration tests]")
{
  fixture test;
  REQUIRE(test.host.globals.add_native(test.engine, "first-letter", first_letter));

  const auto result = test.evaluate(R"(
; no named definitions, the mapping procedure receives itself
((lambda (map) (map map first-letter '(the rain in spain)))
 (lambda (self f n)
   (if (null? n)
       '()
       (cons (f (car n)) (self self f (cdr n))))))
)");

  CHECK(subst_expr::to_string(test.engine, false, result) == "(t r i s)");
  CHECK(test.host.count_invocations("first-letter") == 4);
}

TEST_CASE("too few arguments leave parameters free by default", "[applier]")
{
  fixture test;

  CHECK(test.evaluate_to_error("((lambda (x y) y) 1)") == subst_expr::error_kind::host_lookup_failure);
  CHECK(test.host.looked_up("y"));

  REQUIRE(test.host.globals.add(test.engine, "y", 3));
  CHECK(test.engine.evaluate_to<int>(test.host, "((lambda (x y) (+ x y)) 1)") == 4);

  // extra arguments are ignored
  CHECK(test.engine.evaluate_to<int>(test.host, "((lambda (x) x) 1 2)") == 1);
}

TEST_CASE("strict arity rejects mismatched calls", "[applier]")
{
  fixture test;
  test.engine.strict_arity = true;

  CHECK(test.evaluate_to_error("((lambda (x y) y) 1)") == subst_expr::error_kind::arity_mismatch);
  CHECK(test.evaluate_to_error("((lambda (x) x) 1 2)") == subst_expr::error_kind::arity_mismatch);
  CHECK(test.engine.evaluate_to<int>(test.host, "((lambda (x y) (- x y)) 5 2)") == 3);
}

TEST_CASE("error kinds", "[errors]")
{
  fixture test;
  using subst_expr::error_kind;

  CHECK(test.evaluate_to_error("()") == error_kind::malformed_expression);
  CHECK(test.evaluate_to_error("(if true 1)") == error_kind::malformed_expression);
  CHECK(test.evaluate_to_error("(quote 1 2)") == error_kind::malformed_expression);
  CHECK(test.evaluate_to_error("((lambda x x) 1)") == error_kind::malformed_expression);
  CHECK(test.evaluate_to_error("((lambda (1) 1) 1)") == error_kind::malformed_expression);
  CHECK(test.evaluate_to_error("((lambda (x) x x) 1)") == error_kind::malformed_expression);
  CHECK(test.evaluate_to_error("(1 2)") == error_kind::not_a_procedure);
  CHECK(test.evaluate_to_error("(undefined-procedure 1)") == error_kind::host_lookup_failure);
  CHECK(test.evaluate_to_error("(car 1)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error("(/ 1 0)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error(R"((+ 1 "two"))") == error_kind::host_invocation_failure);
}

TEST_CASE("quoted lambda forms are procedures once evaluated", "[applier]")
{
  fixture test;

  // the quote-form operator is evaluated first, producing the lambda form
  CHECK(test.engine.evaluate_to<int>(test.host, "((quote (lambda (x) (* x 2))) 21)") == 42);
}

TEST_CASE("the first failure aborts the evaluation", "[errors]")
{
  fixture test;

  const auto result = test.evaluate("(+ (car 1) (undefined-procedure))");
  const auto *error = test.engine.get_if<engine_type::error_type>(&result);
  REQUIRE(error != nullptr);
  CHECK(error->kind == subst_expr::error_kind::host_invocation_failure);
  CHECK_FALSE(test.host.looked_up("undefined-procedure"));
  CHECK(test.host.count_invocations("+") == 0);
}

TEST_CASE("a failing expression stops the rest of the input", "[errors]")
{
  fixture test;

  CHECK(test.evaluate_to_error("1 (car 2) (undefined-procedure)") == subst_expr::error_kind::host_invocation_failure);
  CHECK_FALSE(test.host.looked_up("undefined-procedure"));
}

TEST_CASE("unbounded self application hits the recursion limit", "[errors]")
{
  subst_expr::engine<std::uint16_t, char, int, double, 1024, 1024, 64> engine;
  subst_expr::standard_host host{ engine };

  const auto result = engine.evaluate(host, "((lambda (x) (x x)) (lambda (x) (x x)))");
  const auto *error = engine.get_if<decltype(engine)::error_type>(&result);
  REQUIRE(error != nullptr);
  CHECK(error->kind == subst_expr::error_kind::recursion_limit_exceeded);
}

TEST_CASE("running out of storage is reported", "[errors]")
{
  subst_expr::engine<std::uint16_t, char, int, double, 512, 64> engine;
  subst_expr::standard_host host{ engine };

  const auto result = engine.evaluate(host, "(list 1 2 3 4 5 6 7 8 9 10 11 12 13 14 15 16 17 18 19 20 21 22 23 24 25 26 27 "
                                            "28 29 30 31 32 33 34 35 36 37 38 39 40 41 42 43 44 45 46 47 48 49 50 51 52 "
                                            "53 54 55 56 57 58 59 60 61 62 63 64 65 66 67 68 69 70)");
  const auto *error = engine.get_if<decltype(engine)::error_type>(&result);
  REQUIRE(error != nullptr);
  CHECK(error->kind == subst_expr::error_kind::capacity_exceeded);
}

TEST_CASE("the engine keeps working after running out of storage", "[errors]")
{
  subst_expr::engine<std::uint16_t, char, int, double, 512, 64> engine;
  subst_expr::standard_host host{ engine };

  const auto values_used = engine.values.size();
  const auto strings_used = engine.strings.size();

  const auto result = engine.evaluate(host, "(list 1 2 3 4 5 6 7 8 9 10 11 12 13 14 15 16 17 18 19 20 21 22 23 24 25 26 27 "
                                            "28 29 30 31 32 33 34 35 36 37 38 39 40 41 42 43 44 45 46 47 48 49 50 51 52 "
                                            "53 54 55 56 57 58 59 60 61 62 63 64 65 66 67 68 69 70)");
  REQUIRE(engine.is_error(result));
  CHECK(engine.get_if<decltype(engine)::error_type>(&result)->kind == subst_expr::error_kind::capacity_exceeded);

  CHECK(engine.values.size() == values_used);
  CHECK(engine.strings.size() == strings_used);
  CHECK_FALSE(engine.exhausted());
  CHECK(engine.evaluate_to<int>(host, "(+ 1 2)") == 3);
}

TEST_CASE("the engine keeps working after running out of scratch space", "[errors]")
{
  subst_expr::engine<std::uint16_t, char, int, double, 512, 1024, 1000, 16> engine;
  subst_expr::standard_host host{ engine };

  const auto result = engine.evaluate(host, "(list 1 2 3 4 5 6 7 8 9 10 11 12 13 14 15 16 17 18 19 20)");
  REQUIRE(engine.is_error(result));
  CHECK(engine.get_if<decltype(engine)::error_type>(&result)->kind == subst_expr::error_kind::capacity_exceeded);

  CHECK(engine.evaluate_to<int>(host, "(+ 1 2)") == 3);
  CHECK(subst_expr::to_string(engine, false, engine.evaluate(host, "(list 1 2 3)")) == "(1 2 3)");
}

TEST_CASE("parse errors", "[reader]")
{
  fixture test;
  using subst_expr::error_kind;

  CHECK(test.evaluate_to_error(std::string(100000, '(')) == error_kind::parse_error);
  CHECK(test.evaluate_to_error(std::string(100000, '\'') + "x") == error_kind::parse_error);

  CHECK(test.evaluate_to_error("(+ 1 2") == error_kind::parse_error);
  CHECK(test.evaluate_to_error("(+ 1 2))") == error_kind::parse_error);
  CHECK(test.evaluate_to_error(R"((car "abc))") == error_kind::parse_error);
  CHECK(test.evaluate_to_error("(list ')") == error_kind::parse_error);
}

TEST_CASE("reader", "[reader]")
{
  fixture test;

  CHECK(test.evaluate_to_string("'(1 2.5 \"three\" four #t false)") == R"((1 2.5 "three" four true false))");
  CHECK(test.evaluate_to_string("; a comment\n; and another\n'(a ; trailing\n b)") == "(a b)");
  CHECK(test.evaluate_to_string("''x") == "'x");
  CHECK(test.engine.evaluate_to<int>(test.host, "-12") == -12);
  CHECK(test.engine.evaluate_to<double>(test.host, "1e-1") == 0.1);
}

TEST_CASE("list built-ins", "[builtins]")
{
  fixture test;

  CHECK(test.evaluate_to_string("(cons 1 '(2 3))") == "(1 2 3)");
  CHECK(test.evaluate_to_string("(cons '(1) '())") == "((1))");
  CHECK(test.evaluate_to_string("(append '(1 2) '() '(3))") == "(1 2 3)");
  CHECK(test.evaluate_to_string("(list (+ 1 1) 'b)") == "(2 b)");
  CHECK(test.engine.evaluate_to<bool>(test.host, "(null? (cdr '(1)))") == true);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(null? 0)") == false);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(eq? (list 1 'a) '(1 a))") == true);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(eq? 'a 'b)") == false);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(procedure? (lambda (x) x))") == true);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(procedure? car)") == true);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(procedure? '(1))") == false);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(symbol? 'a)") == true);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(number? 1.5)") == true);
  CHECK(test.engine.evaluate_to<bool>(test.host, "(not (= 1 2))") == true);
}

TEST_CASE("member functions", "[c++ api]")
{
  struct Counter
  {
    void set(int i) { m_i = i; }

    int get() const { return m_i; }

    int m_i{ 0 };
  };

  using counter_engine = subst_expr::engine<std::uint16_t, char, int, double, 1024, 1024, 1000, 1024, Counter *>;
  counter_engine engine;
  subst_expr::standard_host host{ engine };
  REQUIRE(host.add<&Counter::set>(engine, "set"));
  REQUIRE(host.add<&Counter::get>(engine, "get"));

  Counter counter;
  counter.m_i = 42;
  REQUIRE(host.add(engine, "counter", &counter));

  [[maybe_unused]] const auto set_result = engine.evaluate(host, "(set counter 10)");
  CHECK(counter.m_i == 10);
  [[maybe_unused]] const auto update_result = engine.evaluate(host, "((lambda (c) (set c (+ (get c) 12))) counter)");
  CHECK(counter.m_i == 22);
  CHECK(engine.evaluate_to<int>(host, "(get counter)") == 22);
}

TEST_CASE("printing", "[utility]")
{
  fixture test;

  CHECK(test.evaluate_to_string("'(a (b \"c\") 1.5)") == R"((a (b "c") 1.5))");
  CHECK(test.evaluate_to_string("car") == "[native car]");
  CHECK(test.evaluate_to_string("(undefined)").starts_with("[error: host lookup failure]"));
  CHECK(subst_expr::to_string(test.engine, true, test.evaluate("true")) == "[bool] true");
}

TEST_CASE("mapping a native over a long list", "[integration tests]")
{
  fixture test;
  REQUIRE(test.host.globals.add_native(test.engine, "first-letter", first_letter));

  std::string words;
  std::string expected;
  for (int index = 0; index < 48; ++index) {
    const auto letter = static_cast<char>('a' + index % 26);
    words += std::string{ letter } + "word ";
    expected += expected.empty() ? "(" : " ";
    expected += letter;
  }
  expected += ")";

  const auto result = test.evaluate("((lambda (map) (map map first-letter '(" + words + ")))"
                                    + " (lambda (self f n) (if (null? n) '() (cons (f (car n)) (self self f (cdr n))))))");

  CHECK(subst_expr::to_string(test.engine, false, result) == expected);
  CHECK(test.host.count_invocations("first-letter") == 48);
}

using deep_engine_type = subst_expr::engine<std::uint16_t, char, int, double, 4096, 32768>;

TEST_CASE("self application recursing hundreds of levels", "[applier]")
{
  auto engine = std::make_unique<deep_engine_type>();
  subst_expr::standard_host host{ *engine };

  CHECK(engine->evaluate_to<int>(host,
          "((lambda (sum) (sum sum 1 200))"
          " (lambda (self min max) (if (> min max) 0 (+ min (self self (+ min 1) max)))))")
        == 20100);
}

TEST_CASE("unbounded self application stops at the default depth limit", "[errors]")
{
  auto engine = std::make_unique<deep_engine_type>();
  subst_expr::standard_host host{ *engine };

  const auto result = engine->evaluate(host, "((lambda (x) (x x)) (lambda (x) (x x)))");
  const auto *error = engine->get_if<deep_engine_type::error_type>(&result);
  REQUIRE(error != nullptr);
  CHECK(error->kind == subst_expr::error_kind::recursion_limit_exceeded);

  CHECK(engine->evaluate_to<int>(host, "(+ 1 2)") == 3);
}

TEST_CASE("non-char characters", "[c++ api]")
{
  subst_expr::engine<std::uint16_t, wchar_t> engine;
  subst_expr::standard_host host{ engine };

  CHECK(engine.evaluate_to<int>(host, L"(+ 1 2 3 4)") == 10);
  CHECK(engine.evaluate_to<int>(host, L"(((lambda (x) (lambda (y) (* x y))) 6) 7)") == 42);
  CHECK(engine.evaluate_to<bool>(host, L"(eq? (car '(a b)) 'a)") == true);
}

TEST_CASE("a full globals table rejects new entries", "[c++ api]")
{
  engine_type engine;
  subst_expr::standard_host<engine_type, 22> host{ engine };

  CHECK(host.add(engine, "a", 1));
  CHECK_FALSE(host.add(engine, "b", 2));

  CHECK(engine.evaluate_to<int>(host, "(+ a 1)") == 2);
  const auto result = engine.evaluate(host, "b");
  REQUIRE(engine.is_error(result));
  CHECK(engine.get_if<engine_type::error_type>(&result)->kind == subst_expr::error_kind::host_lookup_failure);
}

TEST_CASE("integer results that do not fit are rejected", "[builtins]")
{
  fixture test;
  using subst_expr::error_kind;

  CHECK(test.evaluate_to_error("(+ 2147483647 1)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error("(+ -2147483647 -2)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error("(- -2147483647 2)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error("(- 2147483647 -1)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error("(* 65536 65536)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error("(* -65536 65536)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error("(* -65536 -65536)") == error_kind::host_invocation_failure);
  CHECK(test.evaluate_to_error("(/ (- -2147483647 1) -1)") == error_kind::host_invocation_failure);

  CHECK(test.engine.evaluate_to<int>(test.host, "(+ 2147483646 1)") == 2147483647);
  CHECK(test.engine.evaluate_to<int>(test.host, "(- -2147483647 1)") == -2147483647 - 1);
  CHECK(test.engine.evaluate_to<int>(test.host, "(* -46340 46340)") == -2147395600);
  CHECK(test.engine.evaluate_to<int>(test.host, "(/ (- -2147483647 1) 1)") == -2147483647 - 1);
}
