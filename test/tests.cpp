#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <ucc/interp.hpp>
#include <ucc/ucc.hpp>
#include <ucc/utility.hpp>

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using calculus_type = ucc::calculus<>;

void define_prelude(calculus_type &engine)
{
  for (const auto source : ucc::prelude) {
    const auto definition = engine.parse_definition(source);
    REQUIRE(definition.has_value());
    engine.define(*definition);
  }
}

std::string evaluate(calculus_type &engine, std::string_view program, std::optional<std::size_t> step_limit = 10'000)
{
  const auto expr = engine.parse_expr(program);
  REQUIRE(expr.has_value());

  const auto result = engine.evaluate(*expr, step_limit);
  if (!result) { return ucc::to_string(engine, false, result.error().error); }
  return ucc::to_string(engine, false, *result);
}

std::string evaluate(std::string_view program)
{
  calculus_type engine;
  define_prelude(engine);
  return evaluate(engine, program);
}

std::vector<std::string> collect(const calculus_type &engine, const calculus_type::trace_type &trace)
{
  std::vector<std::string> lines;
  for (const auto &entry : trace) {
    if (entry.error) {
      lines.push_back(ucc::to_string(engine, false, *entry.error));
    } else {
      lines.push_back(ucc::to_string(engine, false, entry.configuration));
    }
  }
  return lines;
}

std::string run(ucc::Interp<> &interp, std::string_view input)
{
  std::ostringstream out;
  interp.run(input, out);
  return out.str();
}


TEST_CASE("interning", "[symbols]")
{
  ucc::SymbolTable<std::uint32_t> table;

  const auto ab = table.intern("ab");
  const auto bb = table.intern("bb");
  CHECK(ab != bb);
  CHECK(table.intern("ab") == ab);
  CHECK(table.name(ab) == "ab");
  CHECK(table.name(bb) == "bb");
  CHECK_FALSE(table.find("cc").has_value());
  CHECK(table.size() == 2);

  // names stay readable while the character storage grows
  for (int count = 0; count < 100; ++count) { table.intern("name" + std::to_string(count)); }
  CHECK(table.name(ab) == "ab");
  CHECK(table.find("name42").has_value());
}

TEST_CASE("intrinsic names are the first symbols", "[symbols]")
{
  calculus_type engine;
  CHECK(engine.symbols.size() == 6);
  CHECK(engine.intrinsic_of(engine.intern("clone")) == ucc::Intrinsic::clone);
  CHECK(engine.intrinsic_of(engine.intern("apply")) == ucc::Intrinsic::apply);
  CHECK_FALSE(engine.intrinsic_of(engine.intern("double")).has_value());

  engine.reset();
  CHECK(engine.symbols.size() == 6);
  CHECK_FALSE(engine.symbols.find("double").has_value());
}

TEST_CASE("definition store", "[definitions]")
{
  calculus_type engine;
  auto &store = engine.definitions;
  const auto a = engine.intern("a");
  const auto b = engine.intern("b");

  CHECK_FALSE(store.define(a, engine.make_call("x")).has_value());
  CHECK_FALSE(store.define(b, engine.make_call("y")).has_value());

  const auto previous = store.define(a, engine.make_call("z"));
  REQUIRE(previous.has_value());
  CHECK(ucc::to_string(engine, false, *previous) == "x");
  CHECK(store.size() == 2);

  // a redefinition counts as the most recent definition
  CHECK(store.all().back().name == a);
  REQUIRE(store.lookup(a).has_value());
  CHECK(ucc::to_string(engine, false, *store.lookup(a)) == "z");

  const auto last = store.remove_last();
  REQUIRE(last.has_value());
  CHECK(last->name == a);
  CHECK_FALSE(store.lookup(a).has_value());

  CHECK(store.remove(b).has_value());
  CHECK_FALSE(store.remove(b).has_value());
  CHECK_FALSE(store.remove_last().has_value());

  store.define(a, engine.make_call("x"));
  store.clear();
  CHECK(store.size() == 0);
  CHECK(store.all().empty());
}

TEST_CASE("a failed step leaves the configuration alone", "[evaluation]")
{
  calculus_type engine;

  for (const auto input : { "⟨x [a]⟩ compose", "⟨[a]⟩ swap", "⟨[a]⟩ undefined" }) {
    const auto config = engine.parse_configuration(input);
    REQUIRE(config.has_value());

    auto stepped = *config;
    REQUIRE_FALSE(engine.step(stepped).has_value());
    CHECK(engine.equal(stepped, *config));
  }
}

TEST_CASE("a terminal configuration does not step", "[evaluation]")
{
  calculus_type engine;
  const auto config = engine.parse_configuration("⟨[a]⟩");
  REQUIRE(config.has_value());

  auto stepped = *config;
  CHECK(engine.step(stepped).has_value());
  CHECK(engine.equal(stepped, *config));
}

TEST_CASE("failures report where reduction stopped", "[evaluation]")
{
  calculus_type engine;
  const auto expr = engine.parse_expr("[a] [b] clone swap x");
  REQUIRE(expr.has_value());

  const auto result = engine.evaluate(*expr);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().error.kind == ucc::ErrorKind::unbound_call);
  CHECK(ucc::to_string(engine, false, result.error().configuration) == "⟨[a] [b] [b]⟩ x");
  CHECK(ucc::to_string(engine, false, result.error().error) == "Unbound call: `x` is not defined.");
}

TEST_CASE("error messages", "[evaluation]")
{
  calculus_type engine;
  CHECK(evaluate(engine, "clone") == "Stack underflow: `clone` needs 1 value, 0 available.");
  CHECK(evaluate(engine, "[a] swap") == "Stack underflow: `swap` needs 2 values, 1 available.");

  const auto config = engine.parse_configuration("⟨x [a]⟩ compose");
  REQUIRE(config.has_value());
  const auto result = engine.big_step(*config);
  REQUIRE_FALSE(result.has_value());
  CHECK(ucc::to_string(engine, false, result.error().error) == "Type mismatch: `compose` expected two quotations.");
}

TEST_CASE("step limit", "[evaluation]")
{
  calculus_type engine;
  const auto loop = engine.parse_definition("{fn loop = clone apply}");
  REQUIRE(loop.has_value());
  engine.define(*loop);

  const auto expr = engine.parse_expr("[loop] loop");
  REQUIRE(expr.has_value());

  const auto result = engine.evaluate(*expr, 1000);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().error.kind == ucc::ErrorKind::step_limit_exceeded);
  CHECK(result.error().error.required == 1000);
  CHECK(ucc::to_string(engine, false, result.error().error) == "Step limit exceeded: no normal form within 1000 steps.");

  // a limit of zero still accepts what is already in normal form
  CHECK(evaluate(engine, "", 0) == "⟨⟩");
  CHECK(evaluate(engine, "[a]", 0) == "Step limit exceeded: no normal form within 0 steps.");
}

TEST_CASE("a growing program costs memory in proportion to the steps taken", "[evaluation][arena]")
{
  calculus_type engine;
  const auto grow = engine.parse_definition("{fn r = [x] r drop}");
  REQUIRE(grow.has_value());
  engine.define(*grow);

  const auto expr = engine.parse_expr("r");
  REQUIRE(expr.has_value());

  for (const std::size_t step_limit : { 1'000, 8'000, 100'000 }) {
    const auto before = engine.exprs.size();
    const auto result = engine.evaluate(*expr, step_limit);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().error.kind == ucc::ErrorKind::step_limit_exceeded);
    CHECK(engine.exprs.size() - before <= step_limit);
  }

  // the linked tail still reads as one flat composition
  const auto result = engine.evaluate(*expr, 5);
  REQUIRE_FALSE(result.has_value());
  auto live = result.error().configuration;
  CHECK(ucc::to_string(engine, false, live) == "⟨[x] [x]⟩ [x] r drop drop drop");

  const auto claimed = engine.parse_configuration("⟨[x] [x]⟩ [x] r drop drop drop");
  REQUIRE(claimed.has_value());
  CHECK(engine.equal(live, *claimed));

  engine.compact(live);
  CHECK(ucc::to_string(engine, false, live) == "⟨[x] [x]⟩ [x] r drop drop drop");
}

TEST_CASE("checking a big-step claim honors the step limit", "[evaluation]")
{
  calculus_type engine;
  const auto loop = engine.parse_definition("{fn loop = clone apply}");
  REQUIRE(loop.has_value());
  engine.define(*loop);

  const auto claim = engine.parse_assertion("⟨⟩ [loop] loop ⇓ ⟨⟩");
  REQUIRE(claim.has_value());

  const auto result = engine.check(*claim, 100);
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().error.kind == ucc::ErrorKind::step_limit_exceeded);
  CHECK(result.error().error.required == 100);
  CHECK(ucc::to_string(engine, false, result.error().configuration) == "⟨[loop]⟩ loop");

  ucc::Interp<> interp{ ucc::InterpOptions{ .step_limit = 100, .load_prelude = false } };
  run(interp, "{fn loop = clone apply}");
  CHECK(run(interp, ":assert ⟨⟩ [loop] loop ⇓ ⟨⟩")
        == "Assertion failed. Step limit exceeded: no normal form within 100 steps.\nActual: ⟨[loop]⟩ loop\n");
}

TEST_CASE("prelude", "[evaluation]")
{
  CHECK(evaluate("[v1] [v2] true") == "⟨[v1]⟩");
  CHECK(evaluate("[v1] [v2] false") == "⟨[v2]⟩");
  CHECK(evaluate("[true] [false] and") == "⟨[false]⟩");
  CHECK(evaluate("[true] not") == "⟨[false]⟩");
  CHECK(evaluate("[false] not") == "⟨[true]⟩");
  CHECK(evaluate("[v1] [v2] quote2") == "⟨[[v1] [v2]]⟩");
  CHECK(evaluate("[v1] [v2] [v3] quote3") == "⟨[[v1] [v2] [v3]]⟩");
  CHECK(evaluate("[v1] [v2] [v3] rotate3") == "⟨[v2] [v3] [v1]⟩");
  CHECK(evaluate("[v1] [v2] [v3] [v4] rotate4") == "⟨[v2] [v3] [v4] [v1]⟩");
  CHECK(evaluate("[a] [b] [c] [d] [e] compose5") == "⟨[a b c d e]⟩");
  CHECK(evaluate("[x] [clone] n0") == "⟨[x]⟩");
  CHECK(evaluate("[x] [clone] n2") == "⟨[x] [x] [x]⟩");
  CHECK(evaluate("[x] [clone] n4") == "⟨[x] [x] [x] [x] [x]⟩");
  CHECK(evaluate("[x] [clone] [n2] succ apply") == "⟨[x] [x] [x] [x]⟩");
}

TEST_CASE("trace", "[trace]")
{
  calculus_type engine;
  const auto expr = engine.parse_expr("[a] [b] swap");
  REQUIRE(expr.has_value());

  const auto trace = engine.trace({ {}, *expr });
  const std::vector<std::string> expected{ "⟨⟩ [a] [b] swap", "⟨[a]⟩ [b] swap", "⟨[a] [b]⟩ swap", "⟨[b] [a]⟩" };
  CHECK(collect(engine, trace) == expected);

  // every pass replays the same reduction
  CHECK(collect(engine, trace) == expected);

  std::size_t steps = 0;
  bool terminal = false;
  for (auto iter = trace.begin(); iter != std::default_sentinel; ++iter) {
    steps = iter.steps();
    terminal = iter->configuration.terminal();
  }
  CHECK(steps == 3);
  CHECK(terminal);
}

TEST_CASE("trace ends with the error", "[trace]")
{
  calculus_type engine;
  const auto expr = engine.parse_expr("[a] clone drop drop drop");
  REQUIRE(expr.has_value());

  const auto trace = engine.trace({ {}, *expr });
  const std::vector<std::string> expected{ "⟨⟩ [a] clone drop drop drop",
    "⟨[a]⟩ clone drop drop drop",
    "⟨[a] [a]⟩ drop drop drop",
    "⟨[a]⟩ drop drop",
    "⟨⟩ drop",
    "Stack underflow: `drop` needs 1 value, 0 available." };
  CHECK(collect(engine, trace) == expected);

  std::optional<calculus_type::trace_type::entry_type> last;
  for (const auto &entry : trace) { last = entry; }
  REQUIRE(last.has_value());
  REQUIRE(last->error.has_value());
  CHECK(last->error->kind == ucc::ErrorKind::stack_underflow);
  CHECK(ucc::to_string(engine, false, last->configuration) == "⟨⟩ drop");
}

TEST_CASE("trace stops at the step limit", "[trace]")
{
  calculus_type engine;
  const auto loop = engine.parse_definition("{fn loop = clone apply}");
  REQUIRE(loop.has_value());
  engine.define(*loop);

  const auto expr = engine.parse_expr("[loop] loop");
  REQUIRE(expr.has_value());

  const auto lines = collect(engine, engine.trace({ {}, *expr }, 3));
  REQUIRE(lines.size() == 5);
  CHECK(lines.back() == "Step limit exceeded: no normal form within 3 steps.");
}

TEST_CASE("trace sees the definitions from when it started", "[trace]")
{
  calculus_type engine;
  const auto original = engine.parse_definition("{fn f = [old]}");
  REQUIRE(original.has_value());
  engine.define(*original);

  const auto expr = engine.parse_expr("f");
  REQUIRE(expr.has_value());
  const auto trace = engine.trace({ {}, *expr });

  auto iter = trace.begin();
  const auto replacement = engine.parse_definition("{fn f = [new]}");
  REQUIRE(replacement.has_value());
  engine.define(*replacement);

  ++iter;
  ++iter;
  CHECK(ucc::to_string(engine, false, iter->configuration) == "⟨[old]⟩");
  ++iter;
  CHECK(iter == std::default_sentinel);

  CHECK(collect(engine, trace).back() == "⟨[new]⟩");
}

TEST_CASE("swap twice is the identity", "[properties]")
{
  const auto values = GENERATE(as<std::string>{}, "[a] [b]", "[a b] [[c]]", "[] [swap]", "[[a] clone] [b apply]");
  CHECK(evaluate(values + " swap swap") == evaluate(values));
}

TEST_CASE("clone then drop is the identity", "[properties]")
{
  const auto value = GENERATE(as<std::string>{}, "[a]", "[a b]", "[]", "[[x] quote]");
  CHECK(evaluate(value + " clone drop") == evaluate(value));
  CHECK(evaluate(value + " quote apply") == evaluate(value));
}

TEST_CASE("applying a quoted program runs the program", "[properties]")
{
  const auto program = GENERATE(as<std::string>{},
    "[a] [b] swap",
    "[x] clone quote",
    "[p] [q] compose",
    "[v1] [v2] [v3] rotate3",
    "[x] [clone] n2");
  CHECK(evaluate("[" + program + "] apply") == evaluate(program));
}

TEST_CASE("composition is associative", "[properties]")
{
  const auto [first, second, third] = GENERATE(table<std::string, std::string, std::string>({
    { "[[a]]", "[[b]]", "[[c]]" },
    { "[[a] clone]", "[swap]", "[quote]" },
    { "[]", "[[b] [c]]", "[compose]" },
  }));

  const auto left = evaluate(first + " " + second + " compose " + third + " compose apply");
  const auto right = evaluate(first + " " + second + " " + third + " compose compose apply");
  CHECK(left == right);
}

TEST_CASE("compaction keeps definitions and live configurations", "[arena]")
{
  calculus_type engine;
  define_prelude(engine);

  const auto expr = engine.parse_expr("[x] [quote] n3 [y]");
  REQUIRE(expr.has_value());
  const auto result = engine.evaluate(*expr);
  REQUIRE(result.has_value());

  auto live = *result;
  const auto live_before = ucc::to_string(engine, false, live);
  CHECK(live_before == "⟨[[[[x]]]] [y]⟩");

  std::vector<std::string> definitions_before;
  for (const auto &definition : engine.definitions.all()) {
    definitions_before.push_back(ucc::to_string(engine, false, definition));
  }

  const auto size_before = engine.exprs.size();
  engine.compact(live);
  CHECK(engine.exprs.size() < size_before);
  CHECK(ucc::to_string(engine, false, live) == live_before);

  std::vector<std::string> definitions_after;
  for (const auto &definition : engine.definitions.all()) {
    definitions_after.push_back(ucc::to_string(engine, false, definition));
  }
  CHECK(definitions_after == definitions_before);

  CHECK(evaluate(engine, "[x] [clone] n2") == "⟨[x] [x] [x]⟩");
}

TEST_CASE("display", "[display]")
{
  calculus_type engine;
  const auto config = engine.parse_configuration("⟨[] [a [b]] c⟩ swap [d]");
  REQUIRE(config.has_value());
  CHECK(ucc::to_string(engine, false, *config) == "⟨[] [a [b]] c⟩ swap [d]");

  const auto definition = engine.parse_definition("{fn double = clone}");
  REQUIRE(definition.has_value());
  CHECK(ucc::to_string(engine, false, *definition) == "{fn double = clone}");

  const auto stack = engine.parse_stack("⟨ [a]  b [[c] d] ⟩");
  REQUIRE(stack.has_value());
  CHECK(ucc::to_string(engine, false, *stack) == "⟨[a] b [[c] d]⟩");
  CHECK_FALSE(engine.parse_stack("⟨[a]").has_value());

  CHECK(ucc::to_string(engine, true, calculus_type::expr_type{ ucc::Intrinsic::swap }) == "[intrinsic] swap");
}


TEST_CASE("defining and evaluating", "[interp]")
{
  ucc::Interp<> interp;
  CHECK(run(interp, "{fn double = clone}") == "Defined `double`.\n");
  CHECK(run(interp, "[a] double") == "⟨⟩ [a] double\n⇓ ⟨[a] [a]⟩\n");
  CHECK(run(interp, "{fn double = clone} [b] double")
        == "Redefined `double`.\n⟨⟩ [b] double\n⇓ ⟨[b] [b]⟩\n");
  CHECK(run(interp, "{fn true = swap drop}") == "Redefined `true`.\n");
}

TEST_CASE("evaluation errors", "[interp]")
{
  ucc::Interp<> interp;
  CHECK(run(interp, "clone") == "⟨⟩ clone\n⇓ ⟨⟩ clone\nStack underflow: `clone` needs 1 value, 0 available.\n");
  CHECK(run(interp, "[a") == "Parse error at offset 2: expected `]`, got end of input.\n");
  CHECK(run(interp, "a ] b") == "Parse error at offset 2: expected an expression or a definition, got `]`.\n");

  // evaluation stops at the first failing expression
  CHECK(run(interp, "drop {fn a = drop}") == "⟨⟩ drop\n⇓ ⟨⟩ drop\nStack underflow: `drop` needs 1 value, 0 available.\n");
  CHECK(run(interp, ":show a") == "Not defined.\n");
}

TEST_CASE("evaluation gives up at the step limit", "[interp]")
{
  ucc::Interp<> interp{ ucc::InterpOptions{ .step_limit = 100, .load_prelude = false } };
  const auto output = run(interp, "{fn loop = clone apply} [loop] loop");
  CHECK(output.starts_with("Defined `loop`.\n⟨⟩ [loop] loop\n⇓ "));
  CHECK(output.ends_with("Step limit exceeded: no normal form within 100 steps.\n"));
}

TEST_CASE(":trace", "[interp]")
{
  ucc::Interp<> interp;
  CHECK(run(interp, ":trace [a] [b] swap") == "⟨⟩ [a] [b] swap\n⟶ ⟨[a]⟩ [b] swap\n⟶ ⟨[a] [b]⟩ swap\n⟶ ⟨[b] [a]⟩\n");
  CHECK(run(interp, ":trace drop") == "⟨⟩ drop\nStack underflow: `drop` needs 1 value, 0 available.\n");
}

TEST_CASE(":assert", "[interp]")
{
  ucc::Interp<> interp;
  CHECK(run(interp, ":assert ⟨[x] [y]⟩ swap ⟶ ⟨[y] [x]⟩") == "Assertion holds.\n");
  CHECK(run(interp, ":assert ⟨⟩ [a] clone ⇓ ⟨[a] [a]⟩") == "Assertion holds.\n");
  CHECK(run(interp, ":assert ⟨[v1] [v2]⟩ false ⇓ ⟨[v2]⟩") == "Assertion holds.\n");
  CHECK(run(interp, ":assert ⟨⟩ [a] [b] swap ⇓ ⟨[a]⟩ [b] swap")
        == "Assertion failed. Malformed assertion: expected a terminal right-hand side.\nActual: ⟨⟩ [a] [b] swap\n");
  CHECK(run(interp, ":assert ⟨[a] [b]⟩ swap ⇓ ⟨[a] [b]⟩")
        == "Assertion failed. Malformed assertion: expected the claimed normal form.\nActual: ⟨[b] [a]⟩\n");
  CHECK(run(interp, ":assert ⟨⟩ clone ⟶ ⟨⟩")
        == "Assertion failed. Stack underflow: `clone` needs 1 value, 0 available.\nActual: ⟨⟩ clone\n");
}

TEST_CASE(":show and :list", "[interp]")
{
  ucc::Interp<> interp{ ucc::InterpOptions{ .load_prelude = false } };
  CHECK(run(interp, ":list") == "\n");

  run(interp, "{fn b = drop} {fn a = [x] b}");
  CHECK(run(interp, ":list") == "a b\n");
  CHECK(run(interp, ":show a") == "{fn a = [x] b}\n");
  CHECK(run(interp, ":show swap") == "Not defined.\n");
  CHECK(run(interp, ":show nothing") == "Not defined.\n");
}

TEST_CASE(":drop", "[interp]")
{
  ucc::Interp<> interp{ ucc::InterpOptions{ .load_prelude = false } };
  run(interp, "{fn a = drop} {fn b = drop} {fn a = swap}");

  CHECK(run(interp, ":drop") == "Dropped `a`.\n");
  CHECK(run(interp, ":drop a") == "Not defined.\n");
  CHECK(run(interp, ":drop b") == "Dropped `b`.\n");
  CHECK(run(interp, ":drop") == "No definitions to drop.\n");

  ucc::Interp<> strict{ ucc::InterpOptions{ .drop_policy = ucc::DropPolicy::named_only, .load_prelude = false } };
  run(strict, "{fn a = drop}");
  CHECK(run(strict, ":drop") == "Usage: :drop <sym>\n");
  CHECK(run(strict, ":drop a") == "Dropped `a`.\n");
}

TEST_CASE(":clear and :reset", "[interp]")
{
  ucc::Interp<> interp;
  run(interp, "{fn double = clone}");

  CHECK(run(interp, ":clear") == "Definitions cleared.\n");
  CHECK(run(interp, ":list") == "\n");
  CHECK(interp.engine().exprs.size() == 0);
  CHECK(run(interp, "[v1] [v2] true").ends_with("Unbound call: `true` is not defined.\n"));

  CHECK(run(interp, ":reset") == "Reset.\n");
  CHECK(run(interp, ":show true") == "{fn true = drop}\n");
  CHECK(run(interp, ":show double") == "Not defined.\n");
  CHECK(interp.engine().definitions.size() == ucc::prelude.size());
}

TEST_CASE("other commands", "[interp]")
{
  ucc::Interp<> interp;
  CHECK(run(interp, ":help") == std::string{ ucc::help });
  CHECK(run(interp, ":frobnicate") == "Unknown command `:frobnicate`. Type :help for a list of commands.\n");
}
