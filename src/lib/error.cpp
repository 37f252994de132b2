#include <ddl/error.hpp>

#include <utility>

namespace ddl {

  namespace {

    // Enough of the unmatched text to locate it in a message.
    std::string
    excerpt(std::string_view text) {
      constexpr std::size_t max_length = 16;
      if (text.size() <= max_length) return std::string(text);
      return std::string(text.substr(0, max_length)) + "...";
    }

  } // namespace

  lexical_error::lexical_error(std::size_t offset, std::string_view remaining)
      : error("tokenize: no pattern matches at offset " +
              std::to_string(offset) + " (\"" + excerpt(remaining) + "\")"),
        offset_(offset) {}

  mapping_error::mapping_error(mapping_error_kind kind, lexical_symbol symbol,
                               const std::string& message)
      : error(message), kind_(kind), symbol_(std::move(symbol)) {}

  mapping_error
  mapping_error::unmapped_keyword(const lexical_symbol& symbol) {
    return mapping_error(mapping_error_kind::unmapped_keyword, symbol,
                         "map_terminals: keyword '" + symbol.text +
                             "' at offset " + std::to_string(symbol.start) +
                             " has no terminal");
  }

  mapping_error
  mapping_error::unsupported_symbol_kind(const lexical_symbol& symbol) {
    std::string msg = "map_terminals: ";
    msg += to_string(symbol.kind);
    msg += " '" + symbol.text + "' at offset " +
           std::to_string(symbol.start) + " is not used by the grammar";
    return mapping_error(mapping_error_kind::unsupported_symbol_kind, symbol,
                         msg);
  }

  parse_error::parse_error(parse_error_kind kind,
                           std::optional<terminal> expected,
                           std::optional<parser_state> state, terminal found,
                           std::vector<stack_symbol> stack,
                           std::vector<terminal> remaining,
                           const std::string& message)
      : error(message), kind_(kind), expected_(expected), state_(state),
        found_(found), stack_(std::move(stack)),
        remaining_(std::move(remaining)) {}

  parse_error
  parse_error::unexpected_terminal(terminal expected, terminal found,
                                   std::vector<stack_symbol> stack,
                                   std::vector<terminal> remaining) {
    std::string msg = "analyze: expected ";
    msg += to_string(expected);
    msg += ", found ";
    msg += to_string(found);
    return parse_error(parse_error_kind::unexpected_terminal, expected,
                       std::nullopt, found, std::move(stack),
                       std::move(remaining), msg);
  }

  parse_error
  parse_error::no_table_entry(parser_state state, terminal lookahead,
                              std::vector<stack_symbol> stack,
                              std::vector<terminal> remaining) {
    std::string msg = "analyze: no table entry for state ";
    msg += to_string(state);
    msg += " with lookahead ";
    msg += to_string(lookahead);
    return parse_error(parse_error_kind::no_table_entry, std::nullopt, state,
                       lookahead, std::move(stack), std::move(remaining), msg);
  }

  parse_error
  parse_error::unconsumed_obligations(std::vector<stack_symbol> stack) {
    auto msg = "analyze: input ended with obligations pending: " +
               to_string(stack);
    return parse_error(parse_error_kind::unconsumed_obligations, std::nullopt,
                       std::nullopt, terminal::end_marker, std::move(stack), {},
                       msg);
  }

  parse_error
  parse_error::unconsumed_input(std::vector<terminal> remaining) {
    auto found =
        remaining.empty() ? terminal::end_marker : remaining.front();
    auto msg = "analyze: statement complete but input remains: " +
               to_string(remaining);
    return parse_error(parse_error_kind::unconsumed_input, std::nullopt,
                       std::nullopt, found, {}, std::move(remaining), msg);
  }

  grammar_error::grammar_error(const std::string& message, std::size_t line)
      : error(line == 0 ? message
                        : "line " + std::to_string(line) + ": " + message),
        line_(line) {}

  std::string_view
  to_string(mapping_error_kind kind) {
    switch (kind) {
    case mapping_error_kind::unmapped_keyword: return "unmapped keyword";
    case mapping_error_kind::unsupported_symbol_kind:
      return "unsupported symbol kind";
    }
    return "?";
  }

  std::string_view
  to_string(parse_error_kind kind) {
    switch (kind) {
    case parse_error_kind::unexpected_terminal: return "unexpected terminal";
    case parse_error_kind::no_table_entry: return "no table entry";
    case parse_error_kind::unconsumed_obligations:
      return "unconsumed obligations";
    case parse_error_kind::unconsumed_input: return "unconsumed input";
    }
    return "?";
  }

} // namespace ddl
