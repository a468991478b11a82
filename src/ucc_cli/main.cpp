#include <CLI/CLI.hpp>
#include <cstdio>
#include <cstdlib>
#include <format>
#include <fstream>
#include <iostream>
#include <map>
#include <sstream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

#include <ucc/interp.hpp>
#include <ucc/ucc.hpp>

#include <internal_use_only/config.hpp>


void run_lines(ucc::Interp<> &interp, std::istream &input)
{
  for (std::string line; std::getline(input, line);) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) { continue; }
    interp.run(line, std::cout);
  }
}

void repl(ucc::Interp<> &interp)
{
  std::cout << std::format("{} {}. Type :help for a list of commands.\n", ucc::cmake::project_name, ucc::cmake::project_version);

  std::string line;
  while (std::cout << "> " << std::flush, std::getline(std::cin, line)) { interp.run(line, std::cout); }
  std::cout << '\n';
}


int main(int argc, const char **argv)
{
  try {
    CLI::App app{ std::format("{} version {}", ucc::cmake::project_name, ucc::cmake::project_version) };

    std::optional<std::string> script;
    std::optional<std::string> file;
    std::size_t step_limit = ucc::InterpOptions{}.step_limit.value_or(0);
    ucc::DropPolicy drop_policy = ucc::DropPolicy::last_definition;
    bool show_version = false;
    bool no_prelude = false;
    bool verbose = false;

    const std::map<std::string, ucc::DropPolicy> drop_policies{
      { "last-definition", ucc::DropPolicy::last_definition }, { "named-only", ucc::DropPolicy::named_only }
    };

    app.add_flag("--version", show_version, "Show version information");
    app.add_option("--exec", script, "Script to execute, one command per line");
    app.add_option("--file", file, "File to execute, one command per line")->check(CLI::ExistingFile);
    app.add_option("--step-limit", step_limit, "Maximum number of reduction steps per evaluation, 0 for unlimited")
      ->capture_default_str();
    app.add_option("--drop-policy", drop_policy, "What a bare :drop removes")
      ->transform(CLI::CheckedTransformer(drop_policies, CLI::ignore_case));
    app.add_flag("--no-prelude", no_prelude, "Start without the builtin definitions");
    app.add_flag("--verbose", verbose, "Log debug information");

    CLI11_PARSE(app, argc, argv);

    if (show_version) {
      std::puts(std::format("{}", ucc::cmake::project_version).c_str());
      return EXIT_SUCCESS;
    }

    if (verbose) { spdlog::set_level(spdlog::level::debug); }

    ucc::InterpOptions options;
    options.step_limit = step_limit == 0 ? std::nullopt : std::optional<std::size_t>{ step_limit };
    options.drop_policy = drop_policy;
    options.load_prelude = !no_prelude;

    ucc::Interp<> interp{ options };

    if (script) {
      std::istringstream input{ *script };
      run_lines(interp, input);
    } else if (file) {
      std::ifstream input{ *file };
      if (!input) {
        spdlog::error("Unable to open '{}'", *file);
        return EXIT_FAILURE;
      }
      run_lines(interp, input);
    } else {
      repl(interp);
    }
  } catch (const std::exception &e) {
    spdlog::error("Unhandled exception in main: {}", e.what());
    return EXIT_FAILURE;
  }
}
