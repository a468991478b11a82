#ifndef UCC_UTILITY_HPP
#define UCC_UTILITY_HPP

#include "ucc.hpp"

#include <format>
#include <string>

namespace ucc {
template<typename> inline constexpr bool is_calculus_v = false;

template<std::unsigned_integral SizeType> inline constexpr bool is_calculus_v<ucc::calculus<SizeType>> = true;

template<typename T>
concept Calculus = is_calculus_v<T>;


template<Calculus Eval> std::string to_string(const Eval &, bool annotate, Intrinsic);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::call_type &);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::quote_type &);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::compose_type &);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::expr_type &);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::value_type &);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::stack_type &);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::configuration_type &);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::definition_type &);
template<Calculus Eval> std::string to_string(const Eval &, bool annotate, const typename Eval::error_type &);


template<Calculus Eval> std::string to_string(const Eval &, bool annotate, Intrinsic intrinsic)
{
  std::string result;
  if (annotate) { result = "[intrinsic] "; }
  return result + std::string{ name(intrinsic) };
}

template<Calculus Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::call_type &call)
{
  if (annotate) {
    return std::format("[call] {{{}}} {}", call.symbol.id, engine.symbol_name(call.symbol));
  } else {
    return std::string{ engine.symbol_name(call.symbol) };
  }
}

template<Calculus Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::quote_type &quote)
{
  std::string result;
  if (annotate) { result += std::format("[quote] {{{}}} ", quote.body); }
  return result + "[" + to_string(engine, false, engine.body_of(quote)) + "]";
}

template<Calculus Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::compose_type &compose)
{
  std::string result;
  if (annotate) {
    result += std::format("[compose] {{{}, {}}} ", compose.items.start, compose.items.size);
    if (compose.rest != Eval::compose_type::no_rest) { result += std::format("-> {{{}}} ", compose.rest); }
  }

  const auto items = engine.items_of(compose);
  for (std::size_t index = 0; index < items.size(); ++index) {
    if (index != 0) { result += ' '; }
    result += to_string(engine, false, items[index]);
  }
  return result;
}

template<Calculus Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::expr_type &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input.value);
}

template<Calculus Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::value_type &input)
{
  return std::visit([&](const auto &value) { return to_string(engine, annotate, value); }, input.value);
}

template<Calculus Eval> std::string to_string(const Eval &engine, bool annotate, const typename Eval::stack_type &stack)
{
  std::string result;
  if (annotate) { result += std::format("[stack] {{{}}} ", stack.size()); }
  result += "⟨";

  if (!stack.empty()) {
    for (std::size_t index = 0; index + 1 < stack.size(); ++index) {
      result += to_string(engine, false, stack[index]) + ' ';
    }
    result += to_string(engine, false, stack.back());
  }
  return result + "⟩";
}

template<Calculus Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::configuration_type &config)
{
  auto result = to_string(engine, annotate, config.stack);
  if (!config.terminal()) { result += ' ' + to_string(engine, annotate, config.expr); }
  return result;
}

template<Calculus Eval>
std::string to_string(const Eval &engine, bool annotate, const typename Eval::definition_type &definition)
{
  return std::format(
    "{{fn {} = {}}}", engine.symbol_name(definition.name), to_string(engine, annotate, definition.body));
}

template<Calculus Eval> std::string to_string(const Eval &engine, bool, const typename Eval::error_type &error)
{
  switch (error.kind) {
  case ErrorKind::stack_underflow:
    return std::format("Stack underflow: `{}` needs {} value{}, {} available.",
      error.context,
      error.required,
      error.required == 1 ? "" : "s",
      error.available);
  case ErrorKind::unbound_call:
    return std::format("Unbound call: `{}` is not defined.", engine.symbol_name(error.symbol));
  case ErrorKind::type_mismatch:
    return std::format("Type mismatch: `{}` expected {}.", error.context, error.expected);
  case ErrorKind::malformed_assertion:
    return std::format("Malformed assertion: expected {}.", error.expected);
  case ErrorKind::step_limit_exceeded:
    return std::format("Step limit exceeded: no normal form within {} steps.", error.required);
  case ErrorKind::parse_error:
    if (error.context.empty()) {
      return std::format("Parse error at offset {}: expected {}, got end of input.", error.available, error.expected);
    }
    return std::format(
      "Parse error at offset {}: expected {}, got `{}`.", error.available, error.expected, error.context);
  }
  return "Unknown error.";
}
}// namespace ucc

#endif
