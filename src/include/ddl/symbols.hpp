#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ddl {

  // Input alphabet of the stack automaton.
  enum class terminal {
    alter_table_keyword,
    drop_column_keyword,
    identifier,
    end_marker,
  };

  // Non-terminal obligations. alt and emp only appear in auxiliary table
  // cells of the bundled grammar; richer grammars use them for optional
  // clauses.
  enum class parser_state {
    start,
    alt,
    emp,
  };

  // Marker for a production with no right-hand side.
  struct empty_symbol {
    bool
    operator==(const empty_symbol&) const = default;
  };

  class stack_symbol {
  public:
    using variant_type = std::variant<terminal, parser_state, empty_symbol>;

    stack_symbol(terminal t) : data_(t) {}

    stack_symbol(parser_state s) : data_(s) {}

    stack_symbol(empty_symbol e) : data_(e) {}

    static stack_symbol
    empty() {
      return stack_symbol(empty_symbol{});
    }

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    bool
    operator==(const stack_symbol&) const = default;

  private:
    variant_type data_;
  };

  using production = std::vector<stack_symbol>;

  // Display names: "<ALTER TABLE>", "<DROP COLUMN>", "<id>", "$".
  std::string_view
  to_string(terminal t);

  // "<S>", "<ALT>", "<EMP>"
  std::string_view
  to_string(parser_state s);

  // Terminal or state display name; the empty symbol renders as "".
  std::string
  to_string(const stack_symbol& symbol);

  // Concatenation of display names, in sequence order.
  std::string
  to_string(const std::vector<terminal>& word);

  std::string
  to_string(const std::vector<stack_symbol>& symbols);

  // Grammar-file spelling: "alter-table", "drop-column", "identifier", "end".
  std::optional<terminal>
  terminal_from_name(std::string_view name);

  // Grammar-file spelling: "start", "alt", "emp".
  std::optional<parser_state>
  parser_state_from_name(std::string_view name);

  inline std::ostream&
  operator<<(std::ostream& os, terminal t) {
    return os << to_string(t);
  }

  inline std::ostream&
  operator<<(std::ostream& os, parser_state s) {
    return os << to_string(s);
  }

  inline std::ostream&
  operator<<(std::ostream& os, const stack_symbol& symbol) {
    return os << to_string(symbol);
  }

} // namespace ddl
