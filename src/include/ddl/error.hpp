#pragma once

#include <ddl/lexical_symbol.hpp>
#include <ddl/symbols.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace ddl {

  // Base of every failure the library reports.
  class error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // No pattern matches the remaining text.
  class lexical_error : public error {
    std::size_t offset_;

  public:
    lexical_error(std::size_t offset, std::string_view remaining);

    std::size_t
    offset() const {
      return offset_;
    }
  };

  enum class mapping_error_kind {
    unmapped_keyword,
    unsupported_symbol_kind,
  };

  // A lexical symbol has no terminal in the grammar's alphabet.
  class mapping_error : public error {
    mapping_error_kind kind_;
    lexical_symbol symbol_;

    mapping_error(mapping_error_kind kind, lexical_symbol symbol,
                  const std::string& message);

  public:
    static mapping_error
    unmapped_keyword(const lexical_symbol& symbol);

    static mapping_error
    unsupported_symbol_kind(const lexical_symbol& symbol);

    mapping_error_kind
    kind() const {
      return kind_;
    }

    symbol_kind
    offending_kind() const {
      return symbol_.kind;
    }

    const std::string&
    text() const {
      return symbol_.text;
    }

    std::size_t
    offset() const {
      return symbol_.start;
    }
  };

  enum class parse_error_kind {
    unexpected_terminal,
    no_table_entry,
    unconsumed_obligations,
    unconsumed_input,
  };

  // The automaton rejected the terminal sequence. The stack and remaining
  // input are captured at the point of failure, the popped symbol excluded.
  class parse_error : public error {
    parse_error_kind kind_;
    std::optional<terminal> expected_;
    std::optional<parser_state> state_;
    terminal found_;
    std::vector<stack_symbol> stack_;
    std::vector<terminal> remaining_;

    parse_error(parse_error_kind kind, std::optional<terminal> expected,
                std::optional<parser_state> state, terminal found,
                std::vector<stack_symbol> stack,
                std::vector<terminal> remaining, const std::string& message);

  public:
    static parse_error
    unexpected_terminal(terminal expected, terminal found,
                        std::vector<stack_symbol> stack,
                        std::vector<terminal> remaining);

    static parse_error
    no_table_entry(parser_state state, terminal lookahead,
                   std::vector<stack_symbol> stack,
                   std::vector<terminal> remaining);

    static parse_error
    unconsumed_obligations(std::vector<stack_symbol> stack);

    static parse_error
    unconsumed_input(std::vector<terminal> remaining);

    parse_error_kind
    kind() const {
      return kind_;
    }

    // Set for unexpected_terminal.
    const std::optional<terminal>&
    expected() const {
      return expected_;
    }

    // Set for no_table_entry.
    const std::optional<parser_state>&
    state() const {
      return state_;
    }

    // Front of the input word when the automaton failed; end_marker once
    // the input is exhausted.
    terminal
    found() const {
      return found_;
    }

    const std::vector<stack_symbol>&
    stack() const {
      return stack_;
    }

    const std::vector<terminal>&
    remaining() const {
      return remaining_;
    }
  };

  // Malformed grammar document.
  class grammar_error : public error {
    std::size_t line_;

  public:
    grammar_error(const std::string& message, std::size_t line);

    // 0 when the document position is unknown.
    std::size_t
    line() const {
      return line_;
    }
  };

  std::string_view
  to_string(mapping_error_kind kind);

  std::string_view
  to_string(parse_error_kind kind);

} // namespace ddl
