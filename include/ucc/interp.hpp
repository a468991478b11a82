#ifndef UCC_INTERP_HPP
#define UCC_INTERP_HPP

#include "ucc.hpp"
#include "utility.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <spdlog/spdlog.h>

namespace ucc {

// What a bare `:drop` removes
enum struct DropPolicy : std::uint8_t { last_definition, named_only };

struct InterpOptions
{
  std::optional<std::size_t> step_limit{ 1'000'000 };
  DropPolicy drop_policy{ DropPolicy::last_definition };
  bool load_prelude{ true };
  // compact the expression arena once it holds this many nodes
  std::size_t compact_threshold{ 1 << 16 };
};

inline constexpr std::array<std::string_view, 18> prelude{
  "{fn true = drop}",
  "{fn false = swap drop}",
  "{fn and = clone apply}",
  "{fn not = [false] [true] rotate3 apply}",
  "{fn quote2 = quote swap quote swap compose}",
  "{fn quote3 = quote2 swap quote swap compose}",
  "{fn rotate3 = quote2 swap quote compose apply}",
  "{fn rotate4 = quote3 swap quote compose apply}",
  "{fn compose2 = compose}",
  "{fn compose3 = compose2 compose}",
  "{fn compose4 = compose3 compose}",
  "{fn compose5 = compose4 compose}",
  "{fn n0 = drop}",
  "{fn n1 = apply}",
  "{fn n2 = clone compose apply}",
  "{fn n3 = [clone] n2 [compose] n2 apply}",
  "{fn n4 = [clone] n3 [compose] n3 apply}",
  "{fn succ = [[clone]] swap clone [[compose]] swap [apply] compose5}",
};

inline constexpr std::string_view help = "\
Commands available:\n\
\n\
   <expr>                   evaluate <expr>\n\
   {fn <sym> = <expr>}      define <sym> as <expr>\n\
   :trace <expr>            trace the evaluation of <expr>\n\
   :assert <assertion>      check a claim such as `⟨[a] [b]⟩ swap ⟶ ⟨[b] [a]⟩` or `⟨⟩ [a] clone ⇓ ⟨[a] [a]⟩`\n\
   :show <sym>              show the definition of <sym>\n\
   :list                    list the defined symbols\n\
   :drop [<sym>]            drop the definition of <sym>, or the last definition\n\
   :clear                   clear all definitions\n\
   :reset                   reset the interpreter\n\
   :help                    display this list of commands\n";


template<Calculus Engine = calculus<>> class Interp
{
public:
  using engine_type = Engine;
  using symbol_type = typename Engine::symbol_type;
  using expr_type = typename Engine::expr_type;
  using item_type = typename Engine::item_type;
  using assertion_type = typename Engine::assertion_type;
  using configuration_type = typename Engine::configuration_type;
  using definition_type = typename Engine::definition_type;

  struct Eval
  {
    std::vector<item_type> items;
  };
  struct Trace
  {
    expr_type expr;
  };
  struct Show
  {
    std::string_view name;
  };
  struct List
  {
  };
  struct Drop
  {
    std::optional<std::string_view> name;
  };
  struct Clear
  {
  };
  struct Reset
  {
  };
  struct Help
  {
  };
  struct Assert
  {
    assertion_type claim;
  };
  struct Unknown
  {
    std::string_view command;
  };

  using Command = std::variant<Eval, Trace, Show, List, Drop, Clear, Reset, Help, Assert, Unknown>;

  explicit Interp(InterpOptions options = {}) : options_{ options } { load_prelude(); }

  [[nodiscard]] const Engine &engine() const noexcept { return engine_; }
  [[nodiscard]] Engine &engine() noexcept { return engine_; }
  [[nodiscard]] const InterpOptions &options() const noexcept { return options_; }

  [[nodiscard]] std::expected<Command, typename Engine::error_type> parse_command(std::string_view input)
  {
    const auto first = next_token(input);
    if (!first.parsed.starts_with(':')) {
      auto items = engine_.parse_items(input);
      if (!items) { return std::unexpected(items.error()); }
      return Eval{ std::move(*items) };
    }

    const auto command = first.parsed;
    const auto argument = first.remaining;

    if (command == ":trace") {
      auto expr = engine_.parse_expr(argument);
      if (!expr) { return std::unexpected(expr.error()); }
      return Trace{ *expr };
    } else if (command == ":assert") {
      auto claim = engine_.parse_assertion(argument);
      if (!claim) { return std::unexpected(claim.error()); }
      return Assert{ std::move(*claim) };
    } else if (command == ":show") {
      return Show{ next_token(argument).parsed };
    } else if (command == ":drop") {
      const auto name = next_token(argument).parsed;
      if (name.empty()) { return Drop{ std::nullopt }; }
      return Drop{ name };
    } else if (command == ":list") {
      return List{};
    } else if (command == ":clear") {
      return Clear{};
    } else if (command == ":reset") {
      return Reset{};
    } else if (command == ":help") {
      return Help{};
    }
    return Unknown{ command };
  }

  // Handles one line of input, writing everything it has to say to `out`
  void run(std::string_view input, std::ostream &out)
  {
    auto command = parse_command(input);
    if (!command) {
      out << to_string(engine_, false, command.error()) << '\n';
      return;
    }

    std::visit([&](auto &cmd) { execute(cmd, out); }, *command);
    out.flush();

    if (engine_.exprs.size() > options_.compact_threshold) {
      const auto before = engine_.exprs.size();
      engine_.compact();
      spdlog::debug("compacted expression arena from {} to {} nodes", before, engine_.exprs.size());
    }
  }

private:
  void load_prelude()
  {
    if (!options_.load_prelude) { return; }

    for (const auto source : prelude) {
      const auto definition = engine_.parse_definition(source);
      if (!definition) {
        spdlog::error("prelude definition `{}` does not parse: {}", source, to_string(engine_, false, definition.error()));
        continue;
      }
      engine_.define(*definition);
    }
    spdlog::debug("loaded {} prelude definitions", engine_.definitions.size());
  }

  void report(const typename Engine::failure_type &failure, std::ostream &out)
  {
    if (failure.error.kind == ErrorKind::step_limit_exceeded) {
      spdlog::warn("evaluation stopped after {} steps", failure.error.required);
    }
    out << "⇓ " << to_string(engine_, false, failure.configuration) << '\n';
    out << to_string(engine_, false, failure.error) << '\n';
  }

  void execute(const Eval &command, std::ostream &out)
  {
    for (const auto &item : command.items) {
      if (const auto *definition = std::get_if<definition_type>(&item); definition != nullptr) {
        const auto name = engine_.symbol_name(definition->name);
        if (engine_.define(*definition)) {
          out << "Redefined `" << name << "`.\n";
        } else {
          out << "Defined `" << name << "`.\n";
        }
        continue;
      }

      const auto &expr = std::get<expr_type>(item);
      const configuration_type start{ {}, expr };
      out << to_string(engine_, false, start) << '\n';

      if (auto result = engine_.big_step(start, options_.step_limit); result) {
        out << "⇓ " << to_string(engine_, false, *result) << '\n';
      } else {
        report(result.error(), out);
        return;
      }
    }
  }

  void execute(const Trace &command, std::ostream &out)
  {
    bool first = true;
    for (const auto &entry : engine_.trace(configuration_type{ {}, command.expr }, options_.step_limit)) {
      if (entry.error) {
        if (entry.error->kind == ErrorKind::step_limit_exceeded) {
          spdlog::warn("trace stopped after {} steps", entry.error->required);
        }
        out << to_string(engine_, false, *entry.error) << '\n';
      } else {
        out << (first ? "" : "⟶ ") << to_string(engine_, false, entry.configuration) << '\n';
      }
      first = false;
    }
  }

  void execute(const Show &command, std::ostream &out)
  {
    const auto symbol = engine_.symbols.find(command.name);
    const auto body = symbol ? engine_.lookup(*symbol) : std::nullopt;
    if (!body) {
      out << "Not defined.\n";
      return;
    }
    out << to_string(engine_, false, definition_type{ *symbol, *body }) << '\n';
  }

  void execute(const List &, std::ostream &out)
  {
    std::vector<std::string_view> names;
    for (const auto &definition : engine_.definitions.all()) { names.push_back(engine_.symbol_name(definition.name)); }
    std::ranges::sort(names);

    for (std::size_t index = 0; index < names.size(); ++index) {
      if (index != 0) { out << ' '; }
      out << names[index];
    }
    out << '\n';
  }

  void execute(const Drop &command, std::ostream &out)
  {
    std::optional<definition_type> dropped;
    if (command.name) {
      if (const auto symbol = engine_.symbols.find(*command.name); symbol) {
        dropped = engine_.definitions.remove(*symbol);
      }
      if (!dropped) {
        out << "Not defined.\n";
        return;
      }
    } else if (options_.drop_policy == DropPolicy::named_only) {
      out << "Usage: :drop <sym>\n";
      return;
    } else {
      dropped = engine_.definitions.remove_last();
      if (!dropped) {
        out << "No definitions to drop.\n";
        return;
      }
    }
    out << "Dropped `" << engine_.symbol_name(dropped->name) << "`.\n";
  }

  void execute(const Clear &, std::ostream &out)
  {
    engine_.definitions.clear();
    engine_.compact();
    out << "Definitions cleared.\n";
  }

  void execute(const Reset &, std::ostream &out)
  {
    engine_.reset();
    load_prelude();
    spdlog::debug("interpreter reset");
    out << "Reset.\n";
  }

  void execute(const Help &, std::ostream &out) { out << help; }

  void execute(const Assert &command, std::ostream &out)
  {
    if (const auto result = engine_.check(command.claim, options_.step_limit); result) {
      out << "Assertion holds.\n";
    } else {
      out << "Assertion failed. " << to_string(engine_, false, result.error().error) << '\n';
      out << "Actual: " << to_string(engine_, false, result.error().configuration) << '\n';
    }
  }

  void execute(const Unknown &command, std::ostream &out)
  {
    out << "Unknown command `" << command.command << "`. Type :help for a list of commands.\n";
  }

  InterpOptions options_;
  Engine engine_{};
};

}// namespace ucc

#endif
