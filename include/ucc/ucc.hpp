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

#ifndef UCC_HPP
#define UCC_HPP

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <limits>
#include <optional>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

/// Goals
// * an untyped concatenative calculus: six intrinsics over quotations, nothing else
// * small-step reduction is the source of truth, big-step is small-step repeated
// * constexpr evaluation of programs and of assertions about them
// * all expressions are immutable once created, sharing is by index into one arena
// * errors are values, no exceptions
// * C++23 as a minimum
// * never thread safe

/// Notes
// * a configuration is a value stack plus the expression that is left to run
// * the stack only ever holds calls and quotations
// * compositions are always flat and never of size 1, the empty composition is the empty program
// * a reduction links the pending tail of a composition through `Compose::rest` instead of copying it
// * symbols 0 through 5 are the intrinsic names, in `Intrinsic` order

/// To do
// * intern symbols through a hash index once sessions get large


namespace ucc {

inline constexpr int ucc_version_major{ 0 };
inline constexpr int ucc_version_minor{ 1 };
inline constexpr int ucc_version_patch{ 0 };


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
  [[nodiscard]] constexpr auto sublist(const size_type from) const noexcept
  {
    return IndexedList{ static_cast<size_type>(start + from), static_cast<size_type>(size - from) };
  }
};


// Append-only storage addressed by index, so handles survive growth
template<std::unsigned_integral SizeType, typename Contained, typename KeyType> struct IndexedVector
{
  using size_type = SizeType;
  using span_type = std::span<const Contained>;

  std::vector<Contained> data;

  [[nodiscard]] constexpr Contained &operator[](size_type index) noexcept { return data[index]; }
  [[nodiscard]] constexpr const Contained &operator[](size_type index) const noexcept { return data[index]; }
  [[nodiscard]] constexpr auto size() const noexcept { return static_cast<size_type>(data.size()); }
  [[nodiscard]] constexpr bool empty() const noexcept { return data.empty(); }
  [[nodiscard]] constexpr auto begin() const noexcept { return data.begin(); }
  [[nodiscard]] constexpr auto end() const noexcept { return data.end(); }

  [[nodiscard]] constexpr span_type view(KeyType range) const noexcept
  {
    return span_type{ data }.subspan(range.start, range.size);
  }
  [[nodiscard]] constexpr auto operator[](KeyType range) const noexcept { return view(range); }

  constexpr size_type insert(Contained obj)
  {
    data.push_back(std::move(obj));
    return static_cast<size_type>(data.size() - 1);
  }

  // `values` must not point into this vector
  constexpr KeyType insert(span_type values)
  {
    const auto start = size();
    data.insert(data.end(), values.begin(), values.end());
    return KeyType{ start, static_cast<size_type>(values.size()) };
  }

  constexpr void clear() noexcept { data.clear(); }
};


template<std::unsigned_integral SizeType> struct Symbol
{
  using size_type = SizeType;
  size_type id{ 0 };
  [[nodiscard]] constexpr auto operator<=>(const Symbol &) const noexcept = default;
};

template<std::unsigned_integral SizeType> struct SymbolTable
{
  using size_type = SizeType;
  using symbol_type = Symbol<size_type>;

  IndexedVector<size_type, char, IndexedString<size_type>> characters{};
  IndexedVector<size_type, IndexedString<size_type>, IndexedList<size_type>> names{};

  [[nodiscard]] constexpr std::string_view name(symbol_type symbol) const noexcept
  {
    const auto text = names[symbol.id];
    return std::string_view{ characters.data.data() + text.start, text.size };
  }

  [[nodiscard]] constexpr std::optional<symbol_type> find(std::string_view text) const noexcept
  {
    for (size_type index = 0; index < names.size(); ++index) {
      if (name(symbol_type{ index }) == text) { return symbol_type{ index }; }
    }
    return std::nullopt;
  }

  constexpr symbol_type intern(std::string_view text)
  {
    if (const auto found = find(text); found) { return *found; }

    const auto start = characters.size();
    for (const auto ch : text) { characters.insert(ch); }
    return symbol_type{ names.insert(IndexedString<size_type>{ start, static_cast<size_type>(text.size()) }) };
  }

  [[nodiscard]] constexpr auto size() const noexcept { return names.size(); }

  constexpr void clear() noexcept
  {
    characters.clear();
    names.clear();
  }
};


enum struct Intrinsic : std::uint8_t { swap, clone, drop, quote, compose, apply };

inline constexpr std::array<std::string_view, 6> intrinsic_names{ "swap", "clone", "drop", "quote", "compose", "apply" };
inline constexpr std::array<std::size_t, 6> intrinsic_arities{ 2, 1, 1, 1, 2, 1 };

[[nodiscard]] constexpr std::string_view name(Intrinsic intrinsic) noexcept
{
  return intrinsic_names[static_cast<std::size_t>(intrinsic)];
}

[[nodiscard]] constexpr std::size_t arity(Intrinsic intrinsic) noexcept
{
  return intrinsic_arities[static_cast<std::size_t>(intrinsic)];
}

[[nodiscard]] constexpr std::optional<Intrinsic> intrinsic_named(std::string_view text) noexcept
{
  for (std::size_t index = 0; index < intrinsic_names.size(); ++index) {
    if (intrinsic_names[index] == text) { return static_cast<Intrinsic>(index); }
  }
  return std::nullopt;
}


template<std::unsigned_integral SizeType> struct Call
{
  Symbol<SizeType> symbol;
  [[nodiscard]] constexpr bool operator==(const Call &) const noexcept = default;
};

// index of the quoted body in the arena
template<std::unsigned_integral SizeType> struct Quote
{
  SizeType body{ 0 };
  [[nodiscard]] constexpr bool operator==(const Quote &) const noexcept = default;
};

// `items`, then whatever the expression at arena index `rest` runs, if there is one
template<std::unsigned_integral SizeType> struct Compose
{
  static constexpr SizeType no_rest = std::numeric_limits<SizeType>::max();

  IndexedList<SizeType> items;
  SizeType rest{ no_rest };
  [[nodiscard]] constexpr bool operator==(const Compose &) const noexcept = default;
};

// Equality of these handles is identity, structural equality lives in `calculus::equal`
template<std::unsigned_integral SizeType> struct Expr
{
  std::variant<Intrinsic, Call<SizeType>, Quote<SizeType>, Compose<SizeType>> value{ Compose<SizeType>{} };

  [[nodiscard]] constexpr bool empty() const noexcept
  {
    const auto *compose = std::get_if<Compose<SizeType>>(&value);
    return compose != nullptr && compose->items.empty() && compose->rest == Compose<SizeType>::no_rest;
  }
};

template<std::unsigned_integral SizeType> struct Value
{
  std::variant<Call<SizeType>, Quote<SizeType>> value;
};

template<std::unsigned_integral SizeType> using ValueStack = std::vector<Value<SizeType>>;

template<std::unsigned_integral SizeType> struct Configuration
{
  ValueStack<SizeType> stack{};
  Expr<SizeType> expr{};

  [[nodiscard]] constexpr bool terminal() const noexcept { return expr.empty(); }
};

template<std::unsigned_integral SizeType> struct Definition
{
  Symbol<SizeType> name;
  Expr<SizeType> body;
};

// Ordered by last write, so the back is always the most recent definition
template<std::unsigned_integral SizeType> struct Definitions
{
  using symbol_type = Symbol<SizeType>;
  using expr_type = Expr<SizeType>;
  using definition_type = Definition<SizeType>;

  std::vector<definition_type> entries{};

  // returns the body it replaced, if any
  constexpr std::optional<expr_type> define(symbol_type name, expr_type body)
  {
    std::optional<expr_type> previous;
    if (const auto found = std::ranges::find(entries, name, &definition_type::name); found != entries.end()) {
      previous = found->body;
      entries.erase(found);
    }
    entries.push_back(definition_type{ name, body });
    return previous;
  }

  [[nodiscard]] constexpr std::optional<expr_type> lookup(symbol_type name) const noexcept
  {
    if (const auto found = std::ranges::find(entries, name, &definition_type::name); found != entries.end()) {
      return found->body;
    }
    return std::nullopt;
  }

  constexpr std::optional<definition_type> remove(symbol_type name)
  {
    if (const auto found = std::ranges::find(entries, name, &definition_type::name); found != entries.end()) {
      const auto removed = *found;
      entries.erase(found);
      return removed;
    }
    return std::nullopt;
  }

  constexpr std::optional<definition_type> remove_last()
  {
    if (entries.empty()) { return std::nullopt; }
    const auto removed = entries.back();
    entries.pop_back();
    return removed;
  }

  [[nodiscard]] constexpr std::span<const definition_type> all() const noexcept { return entries; }
  [[nodiscard]] constexpr std::size_t size() const noexcept { return entries.size(); }
  constexpr void clear() noexcept { entries.clear(); }
};


enum struct ErrorKind : std::uint8_t {
  stack_underflow,
  unbound_call,
  type_mismatch,
  malformed_assertion,
  step_limit_exceeded,
  parse_error
};

// Which fields matter depends on `kind`:
//  stack_underflow      context = intrinsic, required = arity, available = stack depth
//  unbound_call         symbol
//  type_mismatch        context = intrinsic, expected = the shape it needed
//  malformed_assertion  expected
//  step_limit_exceeded  required = the limit
//  parse_error          expected, context = offending token, available = byte offset
template<std::unsigned_integral SizeType> struct Error
{
  ErrorKind kind{ ErrorKind::parse_error };
  std::string_view expected{};
  std::string_view context{};
  Symbol<SizeType> symbol{};
  std::size_t required{ 0 };
  std::size_t available{ 0 };
  [[nodiscard]] constexpr bool operator==(const Error &) const noexcept = default;
};

// An error together with the configuration reduction stopped at
template<std::unsigned_integral SizeType> struct Failure
{
  Error<SizeType> error;
  Configuration<SizeType> configuration;
};

enum struct Discipline : std::uint8_t { small_step, big_step };

template<std::unsigned_integral SizeType> struct Assertion
{
  Configuration<SizeType> before;
  Discipline discipline{ Discipline::small_step };
  Configuration<SizeType> after;
};


struct Token
{
  std::string_view parsed;
  std::string_view remaining;
};

inline constexpr std::array<std::string_view, 9> punctuation{ "[", "]", "{", "}", "=", "⟨", "⟩", "⟶", "⇓" };

[[nodiscard]] constexpr Token next_token(std::string_view input)
{
  constexpr auto is_eol = [](auto ch) { return ch == '\n' || ch == '\r'; };
  constexpr auto is_whitespace = [=](auto ch) { return ch == ' ' || ch == '\t' || is_eol(ch); };
  constexpr auto is_punctuation = [](std::string_view text) {
    return std::ranges::any_of(punctuation, [=](auto mark) { return text.starts_with(mark); });
  };

  constexpr auto consume = [=](auto ws_input, auto predicate) {
    auto begin = ws_input.begin();
    while (begin != ws_input.end() && predicate(*begin)) { ++begin; }
    return std::string_view{ begin, ws_input.end() };
  };

  constexpr auto make_token = [=](std::string_view token_input, std::size_t size) {
    return Token{ token_input.substr(0, size), consume(token_input.substr(size), is_whitespace) };
  };

  input = consume(input, is_whitespace);

  // comments
  while (input.starts_with(';')) {
    input = consume(input, [=](auto ch) { return not is_eol(ch); });
    input = consume(input, is_whitespace);
  }

  for (const auto mark : punctuation) {
    if (input.starts_with(mark)) { return make_token(input, mark.size()); }
  }

  // everything else
  std::size_t length = 0;
  while (length < input.size() && !is_whitespace(input[length]) && input[length] != ';'
         && !is_punctuation(input.substr(length))) {
    ++length;
  }
  return make_token(input, length);
}


template<typename Engine> struct TraceEntry
{
  typename Engine::configuration_type configuration;
  std::optional<typename Engine::error_type> error;
};

// Lazy, restartable sequence of the configurations a reduction visits.
// Each `begin()` snapshots the definitions and replays from the start.
template<typename Engine> class Trace
{
public:
  using configuration_type = typename Engine::configuration_type;
  using definitions_type = typename Engine::definitions_type;
  using entry_type = TraceEntry<Engine>;

  class iterator
  {
  public:
    using value_type = entry_type;
    using difference_type = std::ptrdiff_t;

    constexpr iterator() = default;
    constexpr iterator(Engine &engine, configuration_type start, std::optional<std::size_t> step_limit)
      : engine_{ &engine }, definitions_{ engine.definitions }, current_{ std::move(start), std::nullopt },
        step_limit_{ step_limit }
    {}

    [[nodiscard]] constexpr const entry_type &operator*() const noexcept { return current_; }
    [[nodiscard]] constexpr const entry_type *operator->() const noexcept { return &current_; }

    constexpr iterator &operator++()
    {
      advance();
      return *this;
    }
    constexpr void operator++(int) { ++*this; }

    [[nodiscard]] constexpr bool operator==(std::default_sentinel_t) const noexcept { return done_; }

    [[nodiscard]] constexpr std::size_t steps() const noexcept { return steps_; }

  private:
    constexpr void advance()
    {
      if (current_.error || current_.configuration.terminal()) {
        done_ = true;
        return;
      }

      if (step_limit_ && steps_ >= *step_limit_) {
        current_.error = Engine::step_limit_error(*step_limit_);
        return;
      }

      if (auto stepped = engine_->step(current_.configuration, definitions_); !stepped) {
        current_.error = stepped.error();
        return;
      }
      ++steps_;
    }

    Engine *engine_{ nullptr };
    definitions_type definitions_{};
    entry_type current_{};
    std::optional<std::size_t> step_limit_{};
    std::size_t steps_{ 0 };
    bool done_{ false };
  };

  constexpr Trace(Engine &engine, configuration_type start, std::optional<std::size_t> step_limit)
    : engine_{ &engine }, start_{ std::move(start) }, step_limit_{ step_limit }
  {}

  [[nodiscard]] constexpr iterator begin() const { return iterator{ *engine_, start_, step_limit_ }; }
  [[nodiscard]] constexpr std::default_sentinel_t end() const noexcept { return {}; }

private:
  Engine *engine_;
  configuration_type start_;
  std::optional<std::size_t> step_limit_;
};


template<std::unsigned_integral SizeType = std::uint32_t> struct calculus
{
  using size_type = SizeType;
  using list_type = IndexedList<size_type>;
  using symbol_type = Symbol<size_type>;
  using call_type = Call<size_type>;
  using quote_type = Quote<size_type>;
  using compose_type = Compose<size_type>;
  using expr_type = Expr<size_type>;
  using value_type = Value<size_type>;
  using stack_type = ValueStack<size_type>;
  using configuration_type = Configuration<size_type>;
  using definition_type = Definition<size_type>;
  using definitions_type = Definitions<size_type>;
  using error_type = Error<size_type>;
  using failure_type = Failure<size_type>;
  using assertion_type = Assertion<size_type>;
  using item_type = std::variant<definition_type, expr_type>;
  using arena_type = IndexedVector<size_type, expr_type, list_type>;
  using trace_type = Trace<calculus>;

  template<typename Result> using parse_result = std::expected<Result, error_type>;
  using step_result = std::expected<expr_type, error_type>;
  using reduction = std::expected<configuration_type, failure_type>;

  SymbolTable<size_type> symbols{};
  arena_type exprs{};
  definitions_type definitions{};

  constexpr calculus() { intern_intrinsics(); }

  // Back to a fresh session: no symbols but the intrinsics, no expressions, no definitions
  constexpr void reset()
  {
    definitions.clear();
    exprs.clear();
    symbols.clear();
    intern_intrinsics();
  }

  [[nodiscard]] constexpr std::optional<Intrinsic> intrinsic_of(symbol_type symbol) const noexcept
  {
    if (symbol.id < intrinsic_names.size()) { return static_cast<Intrinsic>(symbol.id); }
    return std::nullopt;
  }

  [[nodiscard]] constexpr std::string_view symbol_name(symbol_type symbol) const noexcept
  {
    return symbols.name(symbol);
  }

  [[nodiscard]] constexpr symbol_type intern(std::string_view text) { return symbols.intern(text); }


  ///
  /// construction
  ///
  [[nodiscard]] constexpr expr_type make_call(std::string_view text) { return expr_type{ call_type{ intern(text) } }; }

  [[nodiscard]] constexpr expr_type make_quote(expr_type body) { return expr_type{ quote_type{ exprs.insert(body) } }; }

  [[nodiscard]] constexpr value_type make_value(expr_type body)
  {
    return value_type{ quote_type{ exprs.insert(body) } };
  }

  // Flattens nested compositions and collapses the degenerate sizes
  [[nodiscard]] constexpr expr_type make_compose(std::span<const expr_type> items)
  {
    std::vector<expr_type> flat;
    for (const auto &item : items) { append_flattened(flat, item); }

    if (flat.empty()) { return expr_type{}; }
    if (flat.size() == 1) { return flat.front(); }
    return expr_type{ compose_type{ exprs.insert(flat) } };
  }

  // All items in running order, following the links a reduction leaves behind
  [[nodiscard]] constexpr std::vector<expr_type> items_of(const compose_type &compose) const
  {
    return items_in(exprs, compose);
  }

  [[nodiscard]] constexpr const expr_type &body_of(const quote_type &quote) const noexcept { return exprs[quote.body]; }

  [[nodiscard]] static constexpr expr_type to_expr(const value_type &value) noexcept
  {
    return canonical(std::visit([](const auto &held) { return expr_type{ held }; }, value.value));
  }

  // A call to an intrinsic's name is that intrinsic
  [[nodiscard]] static constexpr expr_type canonical(expr_type expr) noexcept
  {
    if (const auto *call = std::get_if<call_type>(&expr.value);
        call != nullptr && call->symbol.id < intrinsic_names.size()) {
      return expr_type{ static_cast<Intrinsic>(call->symbol.id) };
    }
    return expr;
  }


  ///
  /// structural equality
  ///
  [[nodiscard]] constexpr bool equal(const expr_type &lhs_input, const expr_type &rhs_input) const
  {
    const auto lhs = canonical(lhs_input);
    const auto rhs = canonical(rhs_input);
    if (lhs.value.index() != rhs.value.index()) { return false; }

    if (const auto *quote = std::get_if<quote_type>(&lhs.value); quote != nullptr) {
      return equal(body_of(*quote), body_of(*std::get_if<quote_type>(&rhs.value)));
    } else if (const auto *compose = std::get_if<compose_type>(&lhs.value); compose != nullptr) {
      return std::ranges::equal(items_of(*compose),
        items_of(*std::get_if<compose_type>(&rhs.value)),
        [this](const auto &left, const auto &right) { return equal(left, right); });
    }

    return lhs.value == rhs.value;
  }

  [[nodiscard]] constexpr bool equal(const value_type &lhs, const value_type &rhs) const
  {
    return equal(to_expr(lhs), to_expr(rhs));
  }

  [[nodiscard]] constexpr bool equal(const stack_type &lhs, const stack_type &rhs) const
  {
    return std::ranges::equal(lhs, rhs, [this](const auto &left, const auto &right) { return equal(left, right); });
  }

  [[nodiscard]] constexpr bool equal(const configuration_type &lhs, const configuration_type &rhs) const
  {
    return equal(lhs.stack, rhs.stack) && equal(lhs.expr, rhs.expr);
  }


  ///
  /// definitions
  ///
  constexpr std::optional<expr_type> define(symbol_type name, expr_type body) { return definitions.define(name, body); }

  constexpr std::optional<expr_type> define(const definition_type &definition)
  {
    return definitions.define(definition.name, definition.body);
  }

  [[nodiscard]] constexpr std::optional<expr_type> lookup(symbol_type name) const noexcept
  {
    return definitions.lookup(name);
  }


  ///
  /// evaluation
  ///

  // One transition, in place. On error the configuration is left exactly as it was.
  // A terminal configuration is left unchanged.
  [[nodiscard]] constexpr std::expected<void, error_type> step(configuration_type &config,
    const definitions_type &scope)
  {
    auto next = step_expr(config.stack, config.expr, scope);
    if (!next) { return std::unexpected(next.error()); }
    config.expr = *next;
    return {};
  }

  [[nodiscard]] constexpr std::expected<void, error_type> step(configuration_type &config)
  {
    return step(config, definitions);
  }

  [[nodiscard]] constexpr std::expected<configuration_type, error_type> small_step(configuration_type config)
  {
    if (auto stepped = step(config); !stepped) { return std::unexpected(stepped.error()); }
    return config;
  }

  [[nodiscard]] constexpr reduction big_step(configuration_type config,
    std::optional<std::size_t> step_limit = std::nullopt)
  {
    for (std::size_t steps = 0; !config.terminal(); ++steps) {
      if (step_limit && steps >= *step_limit) {
        return std::unexpected(failure_type{ step_limit_error(*step_limit), std::move(config) });
      }
      if (auto stepped = step(config); !stepped) {
        return std::unexpected(failure_type{ stepped.error(), std::move(config) });
      }
    }
    return config;
  }

  [[nodiscard]] constexpr reduction evaluate(expr_type expr, std::optional<std::size_t> step_limit = std::nullopt)
  {
    return big_step(configuration_type{ {}, expr }, step_limit);
  }

  [[nodiscard]] constexpr trace_type trace(configuration_type start,
    std::optional<std::size_t> step_limit = std::nullopt)
  {
    return trace_type{ *this, std::move(start), step_limit };
  }

  [[nodiscard]] static constexpr error_type step_limit_error(std::size_t step_limit) noexcept
  {
    return error_type{ .kind = ErrorKind::step_limit_exceeded, .required = step_limit };
  }


  ///
  /// assertions
  ///
  [[nodiscard]] constexpr reduction check(const assertion_type &claim,
    std::optional<std::size_t> step_limit = std::nullopt)
  {
    const auto malformed = [](configuration_type actual, std::string_view expected) {
      return std::unexpected(
        failure_type{ error_type{ .kind = ErrorKind::malformed_assertion, .expected = expected }, std::move(actual) });
    };

    if (claim.discipline == Discipline::small_step) {
      if (claim.before.terminal()) { return malformed(claim.before, "a configuration that can step"); }

      auto actual = small_step(claim.before);
      if (!actual) { return std::unexpected(failure_type{ actual.error(), claim.before }); }
      if (!equal(*actual, claim.after)) { return malformed(std::move(*actual), "the claimed configuration"); }
      return std::move(*actual);
    }

    if (!claim.after.terminal()) { return malformed(claim.before, "a terminal right-hand side"); }

    auto actual = big_step(claim.before, step_limit);
    if (!actual) { return actual; }
    if (!equal(*actual, claim.after)) { return malformed(std::move(*actual), "the claimed normal form"); }
    return actual;
  }


  ///
  /// arena
  ///

  // Copies everything the definitions and `live` reach into a fresh arena and drops the rest.
  // Every other expression handle is invalidated.
  constexpr void compact(std::same_as<configuration_type> auto &...live)
  {
    arena_type fresh;
    for (auto &definition : definitions.entries) { definition.body = relocate(exprs, fresh, definition.body); }

    const auto relocate_configuration = [&](configuration_type &config) {
      for (auto &value : config.stack) { value = relocate(exprs, fresh, value); }
      config.expr = relocate(exprs, fresh, config.expr);
    };
    (relocate_configuration(live), ...);

    exprs = std::move(fresh);
  }


  ///
  /// parsing
  ///
  [[nodiscard]] constexpr parse_result<expr_type> parse_expr(std::string_view input)
  {
    Parser parser{ *this, input };
    return parser.finish(parser.expression());
  }

  [[nodiscard]] constexpr parse_result<stack_type> parse_stack(std::string_view input)
  {
    Parser parser{ *this, input };
    return parser.finish(parser.stack());
  }

  [[nodiscard]] constexpr parse_result<configuration_type> parse_configuration(std::string_view input)
  {
    Parser parser{ *this, input };
    return parser.finish(parser.configuration());
  }

  [[nodiscard]] constexpr parse_result<definition_type> parse_definition(std::string_view input)
  {
    Parser parser{ *this, input };
    return parser.finish(parser.definition());
  }

  [[nodiscard]] constexpr parse_result<assertion_type> parse_assertion(std::string_view input)
  {
    Parser parser{ *this, input };
    return parser.finish(parser.assertion());
  }

  [[nodiscard]] constexpr parse_result<std::vector<item_type>> parse_items(std::string_view input)
  {
    Parser parser{ *this, input };
    return parser.finish(parser.items());
  }

private:
  constexpr void intern_intrinsics()
  {
    for (const auto intrinsic_name : intrinsic_names) { symbols.intern(intrinsic_name); }
  }

  [[nodiscard]] static constexpr std::vector<expr_type> items_in(const arena_type &arena, const compose_type &compose)
  {
    std::vector<expr_type> items;
    for (const compose_type *current = &compose; current != nullptr;) {
      const auto chunk = arena[current->items];
      items.insert(items.end(), chunk.begin(), chunk.end());
      if (current->rest == compose_type::no_rest) { break; }

      const auto &rest = arena[current->rest];
      current = std::get_if<compose_type>(&rest.value);
      if (current == nullptr) { items.push_back(rest); }
    }
    return items;
  }

  constexpr void append_flattened(std::vector<expr_type> &flat, const expr_type &item) const
  {
    if (const auto *compose = std::get_if<compose_type>(&item.value); compose != nullptr) {
      const auto nested = items_of(*compose);
      flat.insert(flat.end(), nested.begin(), nested.end());
    } else {
      flat.push_back(item);
    }
  }

  // Arguments are taken by value: stepping can grow the arena, which would invalidate references into it
  [[nodiscard]] constexpr step_result step_expr(stack_type &stack, expr_type expr, const definitions_type &scope)
  {
    return std::visit(
      [&]<typename Type>(const Type &term) -> step_result {
        if constexpr (std::is_same_v<Type, Intrinsic>) {
          return apply_intrinsic(stack, term);
        } else if constexpr (std::is_same_v<Type, call_type>) {
          return expand(stack, term, scope);
        } else if constexpr (std::is_same_v<Type, quote_type>) {
          stack.push_back(value_type{ term });
          return expr_type{};
        } else {
          static_assert(std::is_same_v<Type, compose_type>);
          return step_compose(stack, term, scope);
        }
      },
      expr.value);
  }

  [[nodiscard]] constexpr step_result expand(stack_type &stack, call_type call, const definitions_type &scope)
  {
    if (const auto intrinsic = intrinsic_of(call.symbol); intrinsic) { return apply_intrinsic(stack, *intrinsic); }
    if (const auto body = scope.lookup(call.symbol); body) { return *body; }
    return std::unexpected(error_type{ .kind = ErrorKind::unbound_call, .symbol = call.symbol });
  }

  [[nodiscard]] constexpr step_result step_compose(stack_type &stack, compose_type compose, const definitions_type &scope)
  {
    if (compose.items.empty()) { return expr_type{ compose }; }

    auto head = step_expr(stack, exprs[compose.items.front()], scope);
    if (!head) { return head; }

    const auto rest = chain(compose.items.sublist(1), compose.rest);
    if (head->empty()) { return rest; }
    if (rest.empty()) { return head; }
    return then(*head, rest);
  }

  [[nodiscard]] constexpr expr_type chain(list_type items, size_type rest) const
  {
    if (items.empty()) { return rest == compose_type::no_rest ? expr_type{} : exprs[rest]; }
    if (items.size == 1 && rest == compose_type::no_rest) { return exprs[items.front()]; }
    return expr_type{ compose_type{ items, rest } };
  }

  // `first` followed by `next`, at a cost of at most two nodes whatever the length of `next`
  [[nodiscard]] constexpr expr_type then(expr_type first, expr_type next)
  {
    const auto link = exprs.insert(next);
    if (const auto *compose = std::get_if<compose_type>(&first.value); compose != nullptr) {
      if (compose->rest == compose_type::no_rest) { return expr_type{ compose_type{ compose->items, link } }; }
      return expr_type{ compose_type{ exprs.insert(items_of(*compose)), link } };
    }

    const std::array single{ first };
    return expr_type{ compose_type{ exprs.insert(single), link } };
  }

  [[nodiscard]] constexpr step_result apply_intrinsic(stack_type &stack, Intrinsic intrinsic)
  {
    if (stack.size() < arity(intrinsic)) {
      return std::unexpected(error_type{ .kind = ErrorKind::stack_underflow,
        .context = name(intrinsic),
        .required = arity(intrinsic),
        .available = stack.size() });
    }

    const auto top = stack.size() - 1;

    switch (intrinsic) {
    case Intrinsic::swap:
      std::swap(stack[top], stack[top - 1]);
      break;
    case Intrinsic::clone: {
      const auto copy = stack[top];
      stack.push_back(copy);
      break;
    }
    case Intrinsic::drop:
      stack.pop_back();
      break;
    case Intrinsic::quote:
      stack[top] = make_value(to_expr(stack[top]));
      break;
    case Intrinsic::compose: {
      const auto *first = std::get_if<quote_type>(&stack[top - 1].value);
      const auto *second = std::get_if<quote_type>(&stack[top].value);
      if (first == nullptr || second == nullptr) {
        return std::unexpected(
          error_type{ .kind = ErrorKind::type_mismatch, .expected = "two quotations", .context = name(intrinsic) });
      }

      const std::array bodies{ body_of(*first), body_of(*second) };
      const auto composed = make_compose(bodies);
      stack.pop_back();
      stack.back() = make_value(composed);
      break;
    }
    case Intrinsic::apply: {
      const auto applied = stack.back();
      stack.pop_back();
      if (const auto *quote = std::get_if<quote_type>(&applied.value); quote != nullptr) { return body_of(*quote); }
      // a bare call runs like any other call
      return to_expr(applied);
    }
    }

    return expr_type{};
  }

  [[nodiscard]] static constexpr expr_type relocate(const arena_type &from, arena_type &to, expr_type expr)
  {
    if (const auto *quote = std::get_if<quote_type>(&expr.value); quote != nullptr) {
      const auto body = relocate(from, to, from[quote->body]);
      return expr_type{ quote_type{ to.insert(body) } };
    } else if (const auto *compose = std::get_if<compose_type>(&expr.value); compose != nullptr) {
      if (expr.empty()) { return expr_type{}; }

      std::vector<expr_type> items;
      for (const auto &item : items_in(from, *compose)) { items.push_back(relocate(from, to, item)); }
      return expr_type{ compose_type{ to.insert(items) } };
    }
    return expr;
  }

  [[nodiscard]] static constexpr value_type relocate(const arena_type &from, arena_type &to, value_type value)
  {
    if (const auto *quote = std::get_if<quote_type>(&value.value); quote != nullptr) {
      const auto body = relocate(from, to, from[quote->body]);
      return value_type{ quote_type{ to.insert(body) } };
    }
    return value;
  }


  class Parser
  {
  public:
    constexpr Parser(calculus &engine, std::string_view source) noexcept
      : engine_{ &engine }, source_{ source }, token_{ next_token(source) }
    {}

    template<typename Result> [[nodiscard]] constexpr parse_result<Result> finish(parse_result<Result> result) const
    {
      if (result && !at_end()) { return std::unexpected(failure("end of input")); }
      return result;
    }

    [[nodiscard]] constexpr parse_result<expr_type> expression()
    {
      std::vector<expr_type> terms;
      while (at_term()) {
        auto parsed = term();
        if (!parsed) { return parsed; }
        terms.push_back(*parsed);
      }
      return engine_->make_compose(terms);
    }

    [[nodiscard]] constexpr parse_result<stack_type> stack()
    {
      if (!accept("⟨")) { return std::unexpected(failure("`⟨`")); }

      stack_type values;
      while (!accept("⟩")) {
        if (accept("[")) {
          auto body = quoted_body();
          if (!body) { return std::unexpected(body.error()); }
          values.push_back(engine_->make_value(*body));
        } else if (at_word()) {
          values.push_back(value_type{ call_type{ engine_->intern(advance()) } });
        } else {
          return std::unexpected(failure("a value or `⟩`"));
        }
      }
      return values;
    }

    [[nodiscard]] constexpr parse_result<configuration_type> configuration()
    {
      auto values = stack();
      if (!values) { return std::unexpected(values.error()); }
      auto expr = expression();
      if (!expr) { return std::unexpected(expr.error()); }
      return configuration_type{ std::move(*values), *expr };
    }

    [[nodiscard]] constexpr parse_result<definition_type> definition()
    {
      if (!accept("{")) { return std::unexpected(failure("`{`")); }
      if (!accept("fn")) { return std::unexpected(failure("`fn`")); }
      if (!at_word() || token_.parsed == "fn" || intrinsic_named(token_.parsed)) {
        return std::unexpected(failure("a definition name"));
      }

      const auto name = engine_->intern(advance());
      if (!accept("=")) { return std::unexpected(failure("`=`")); }

      auto body = expression();
      if (!body) { return std::unexpected(body.error()); }
      if (!accept("}")) { return std::unexpected(failure("`}`")); }
      return definition_type{ name, *body };
    }

    [[nodiscard]] constexpr parse_result<assertion_type> assertion()
    {
      auto before = configuration();
      if (!before) { return std::unexpected(before.error()); }

      Discipline discipline{};
      if (accept("⟶")) {
        discipline = Discipline::small_step;
      } else if (accept("⇓")) {
        discipline = Discipline::big_step;
      } else {
        return std::unexpected(failure("`⟶` or `⇓`"));
      }

      auto after = configuration();
      if (!after) { return std::unexpected(after.error()); }
      return assertion_type{ std::move(*before), discipline, std::move(*after) };
    }

    [[nodiscard]] constexpr parse_result<std::vector<item_type>> items()
    {
      std::vector<item_type> parsed;
      while (!at_end()) {
        if (token_.parsed == "{") {
          auto fn_def = definition();
          if (!fn_def) { return std::unexpected(fn_def.error()); }
          parsed.emplace_back(*fn_def);
        } else if (at_term()) {
          auto expr = expression();
          if (!expr) { return std::unexpected(expr.error()); }
          parsed.emplace_back(*expr);
        } else {
          return std::unexpected(failure("an expression or a definition"));
        }
      }
      return parsed;
    }

  private:
    [[nodiscard]] constexpr bool at_end() const noexcept { return token_.parsed.empty(); }

    [[nodiscard]] constexpr bool at_word() const noexcept
    {
      return !at_end() && std::ranges::find(punctuation, token_.parsed) == punctuation.end();
    }

    [[nodiscard]] constexpr bool at_term() const noexcept
    {
      return token_.parsed == "[" || (at_word() && token_.parsed != "fn");
    }

    constexpr std::string_view advance()
    {
      const auto parsed = token_.parsed;
      token_ = next_token(token_.remaining);
      return parsed;
    }

    constexpr bool accept(std::string_view expected)
    {
      if (token_.parsed != expected) { return false; }
      advance();
      return true;
    }

    [[nodiscard]] constexpr parse_result<expr_type> quoted_body()
    {
      auto body = expression();
      if (!body) { return body; }
      if (!accept("]")) { return std::unexpected(failure("`]`")); }
      return body;
    }

    [[nodiscard]] constexpr parse_result<expr_type> term()
    {
      if (accept("[")) {
        auto body = quoted_body();
        if (!body) { return body; }
        return engine_->make_quote(*body);
      }

      const auto word = advance();
      if (const auto intrinsic = intrinsic_named(word); intrinsic) { return expr_type{ *intrinsic }; }
      return engine_->make_call(word);
    }

    [[nodiscard]] constexpr error_type failure(std::string_view expected) const noexcept
    {
      return error_type{ .kind = ErrorKind::parse_error,
        .expected = expected,
        .context = token_.parsed,
        .available = static_cast<std::size_t>(token_.parsed.data() - source_.data()) };
    }

    calculus *engine_;
    std::string_view source_;
    Token token_;
  };
};

}// namespace ucc

#endif
