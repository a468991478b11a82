#include <cstdint>
#include <format>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "ftxui/component/captured_mouse.hpp"// for ftxui
#include "ftxui/component/component.hpp"// for Input, Renderer, ResizableSplitLeft
#include "ftxui/component/component_base.hpp"// for ComponentBase, Component
#include "ftxui/component/screen_interactive.hpp"// for ScreenInteractive
#include "ftxui/dom/elements.hpp"// for operator|, separator, text, Element, flex, vbox, border

#include <ucc/interp.hpp>
#include <ucc/ucc.hpp>
#include <ucc/utility.hpp>

#include <internal_use_only/config.hpp>


int main([[maybe_unused]] int argc, [[maybe_unused]] const char *argv[])
{
  ucc::Interp<> interp;
  auto &engine = interp.engine();

  using configuration_type = ucc::calculus<>::configuration_type;

  std::string content_1;
  std::string content_2;

  // the configuration being stepped through, if any
  std::optional<configuration_type> current;
  std::size_t steps = 0;

  std::vector<std::string> entries;
  std::vector<std::string> symbols;
  std::vector<std::string> definitions;

  int selected = 0;
  int definitions_selected = 0;
  int symbol_selected = 0;

  auto update_objects = [&]() {
    entries.clear();
    for (std::size_t index = 0; const auto &item : engine.exprs) {
      entries.push_back(std::format("{}: {}", index, to_string(engine, true, item)));
      ++index;
    }

    symbols.clear();
    for (std::uint32_t index = 0; index < engine.symbols.size(); ++index) {
      symbols.push_back(std::format("{}: '{}'", index, engine.symbol_name(ucc::calculus<>::symbol_type{ index })));
    }

    definitions.clear();
    for (const auto &definition : engine.definitions.all()) {
      definitions.push_back(to_string(engine, false, definition));
    }
  };

  update_objects();

  auto textarea_1 = ftxui::Input(&content_1);
  auto output_1 = ftxui::Input(&content_2);

  auto show_current = [&]() {
    if (current) { content_2 += std::format("{}: {}\n", steps, to_string(engine, false, *current)); }
  };

  auto do_load = [&]() {
    content_2 += "\n> " + content_1 + "\n";

    if (content_1.starts_with(':') || content_1.starts_with('{')) {
      // commands and definitions go straight to the interpreter
      std::ostringstream out;
      interp.run(content_1, out);
      content_2 += out.str();
      current.reset();
    } else if (auto expr = engine.parse_expr(content_1); expr) {
      current = configuration_type{ {}, *expr };
      steps = 0;
      show_current();
    } else {
      content_2 += to_string(engine, false, expr.error()) + "\n";
    }
    update_objects();
  };

  auto do_step = [&]() {
    if (!current || current->terminal()) { return; }

    if (auto stepped = engine.step(*current); stepped) {
      ++steps;
      show_current();
    } else {
      content_2 += to_string(engine, false, stepped.error()) + "\n";
      current.reset();
    }
    update_objects();
  };

  auto do_run = [&]() {
    if (!current) { return; }

    if (auto result = engine.big_step(*current, interp.options().step_limit); result) {
      current = std::move(*result);
      content_2 += std::format("⇓ {}\n", to_string(engine, false, *current));
    } else {
      content_2 += std::format("⇓ {}\n{}\n",
        to_string(engine, false, result.error().configuration),
        to_string(engine, false, result.error().error));
      current.reset();
    }
    update_objects();
  };


  auto load_button = ftxui::Button("Load", do_load);
  auto step_button = ftxui::Button("Step", do_step);
  auto run_button = ftxui::Button("Run", do_run);
  int size = 50;
  auto resizeable_bits = ftxui::ResizableSplitLeft(textarea_1, output_1, &size);

  auto arenabox = ftxui::Menu(&entries, &selected);
  auto definitionsbox = ftxui::Menu(&definitions, &definitions_selected);
  auto symbolbox = ftxui::Menu(&symbols, &symbol_selected);

  auto layout = ftxui::Container::Horizontal(
    { symbolbox, arenabox, definitionsbox, resizeable_bits, load_button, step_button, run_button });

  auto get_stats = [&]() {
    return ftxui::vbox({ ftxui::text(std::format("Data Sizes: Expr {} Value {} Configuration {}",
                           sizeof(ucc::calculus<>::expr_type),
                           sizeof(ucc::calculus<>::value_type),
                           sizeof(ucc::calculus<>::configuration_type))),
      ftxui::text(std::format("expressions: {} symbols: {} definitions: {} stack depth: {}",
        engine.exprs.size(),
        engine.symbols.size(),
        engine.definitions.size(),
        current ? current->stack.size() : 0)),
      ftxui::text(std::format(
        "GIT SHA: {}  version string: {}", ucc::cmake::git_sha, ucc::cmake::project_version)) });
  };

  auto component = ftxui::Renderer(layout, [&] {
    return ftxui::hbox({ symbolbox->Render() | ftxui::vscroll_indicator | ftxui::frame,
             ftxui::separator(),
             ftxui::vbox({ definitionsbox->Render() | ftxui::vscroll_indicator | ftxui::frame
                             | ftxui::size(ftxui::HEIGHT, ftxui::EQUAL, 5),
               ftxui::separator(),
               arenabox->Render() | ftxui::vscroll_indicator | ftxui::frame
                 | ftxui::size(ftxui::HEIGHT, ftxui::EQUAL, 7),
               ftxui::separator(),
               resizeable_bits->Render() | ftxui::flex,
               ftxui::separator(),
               ftxui::hbox({ load_button->Render(), step_button->Render(), run_button->Render(), get_stats() }) })
               | ftxui::flex })
           | ftxui::border;
  });

  auto screen = ftxui::ScreenInteractive::Fullscreen();
  screen.Loop(component);
}
