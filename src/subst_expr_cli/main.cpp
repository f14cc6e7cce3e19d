#include <CLI/CLI.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <subst_expr/standard_host.hpp>
#include <subst_expr/subst_expr.hpp>
#include <subst_expr/utility.hpp>

#include <internal_use_only/config.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

using engine_type = subst_expr::engine<std::uint32_t, char, long long, double, 1U << 16U, 1U << 16U>;
using host_type = subst_expr::standard_host<engine_type>;


// forwards to the standard host, logging everything the engine asks of it
struct tracing_host
{
  host_type &host;

  [[nodiscard]] engine_type::SExpr resolve_global(engine_type &engine, engine_type::identifier_type id) const
  {
    const auto result = host.resolve_global(engine, id);
    spdlog::debug("resolve {} -> {}", engine.strings.view(id.value), subst_expr::to_string(engine, false, result));
    return result;
  }

  [[nodiscard]] engine_type::SExpr
    invoke_native(engine_type &engine, engine_type::native_procedure native, engine_type::list_type arguments) const
  {
    const auto result = host.invoke_native(engine, native, arguments);
    spdlog::debug("invoke {} {} -> {}",
      engine.strings.view(native.name),
      subst_expr::to_string(engine, false, arguments),
      subst_expr::to_string(engine, false, result));
    return result;
  }
};


struct interpreter
{
  bool trace = false;
  bool strict_arity = false;

  // several MB of arena, kept off the stack
  std::unique_ptr<engine_type> engine = std::make_unique<engine_type>();
  host_type host{ *engine };

  // evaluates every expression in `input`, printing the last value or the failure
  bool run(std::string_view input)
  {
    engine->strict_arity = strict_arity;

    engine_type::SExpr result;
    if (trace) {
      tracing_host tracer{ host };
      result = engine->evaluate(tracer, input);
    } else {
      result = engine->evaluate(host, input);
    }

    if (!engine->is_error(result)) {
      fmt::print("{}\n", subst_expr::to_string(*engine, false, result));
      return true;
    }

    spdlog::error("{}", subst_expr::to_string(*engine, false, result));
    return false;
  }
};


std::optional<std::string> read_file(const std::string &path)
{
  std::ifstream input(path);
  if (!input) { return std::nullopt; }
  return std::string{ std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>() };
}


int main(int argc, const char **argv)
{
  try {
    CLI::App app{ fmt::format(
      "{} version {}", subst_expr::cmake::project_name, subst_expr::cmake::project_version) };

    std::optional<std::string> script;
    std::optional<std::string> file;
    bool show_version = false;
    bool trace = false;
    bool strict_arity = false;
    app.add_flag("--version", show_version, "Show version information");
    app.add_option("--exec", script, "Script to execute");
    app.add_option("--file", file, "Script file to execute")->check(CLI::ExistingFile);
    app.add_flag("--trace", trace, "Log every global lookup and native procedure call");
    app.add_flag("--strict-arity", strict_arity, "Reject calls whose argument count differs from the parameter count");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
      std::puts(fmt::format("{}", subst_expr::cmake::project_version).c_str());
      return EXIT_SUCCESS;
    }

    if (trace) { spdlog::set_level(spdlog::level::debug); }

    interpreter session;
    session.trace = trace;
    session.strict_arity = strict_arity;

    if (file) {
      const auto contents = read_file(*file);
      if (!contents) {
        spdlog::error("Unable to read '{}'", *file);
        return EXIT_FAILURE;
      }
      if (!session.run(*contents)) { return EXIT_FAILURE; }
    }

    if (script) {
      if (!session.run(*script)) { return EXIT_FAILURE; }
    }

    if (!file && !script) {
      std::string line;
      while (true) {
        fmt::print("> ");
        std::fflush(stdout);
        if (!std::getline(std::cin, line)) { break; }
        // failures are reported by run, the next line starts a fresh evaluation
        [[maybe_unused]] const bool succeeded = session.run(line);
      }
    }
  } catch (const std::exception &e) {
    spdlog::error("Unhandled exception in main: {}", e.what());
    return EXIT_FAILURE;
  }
}
