#include <ddl/symbols.hpp>

namespace ddl {

  std::string_view
  to_string(terminal t) {
    switch (t) {
    case terminal::alter_table_keyword: return "<ALTER TABLE>";
    case terminal::drop_column_keyword: return "<DROP COLUMN>";
    case terminal::identifier: return "<id>";
    case terminal::end_marker: return "$";
    }
    return "?";
  }

  std::string_view
  to_string(parser_state s) {
    switch (s) {
    case parser_state::start: return "<S>";
    case parser_state::alt: return "<ALT>";
    case parser_state::emp: return "<EMP>";
    }
    return "?";
  }

  std::string
  to_string(const stack_symbol& symbol) {
    if (symbol.holds<terminal>())
      return std::string(to_string(symbol.get<terminal>()));
    if (symbol.holds<parser_state>())
      return std::string(to_string(symbol.get<parser_state>()));
    return {};
  }

  std::string
  to_string(const std::vector<terminal>& word) {
    std::string result;
    for (auto t : word)
      result += to_string(t);
    return result;
  }

  std::string
  to_string(const std::vector<stack_symbol>& symbols) {
    std::string result;
    for (const auto& symbol : symbols)
      result += to_string(symbol);
    return result;
  }

  std::optional<terminal>
  terminal_from_name(std::string_view name) {
    if (name == "alter-table") return terminal::alter_table_keyword;
    if (name == "drop-column") return terminal::drop_column_keyword;
    if (name == "identifier") return terminal::identifier;
    if (name == "end") return terminal::end_marker;
    return std::nullopt;
  }

  std::optional<parser_state>
  parser_state_from_name(std::string_view name) {
    if (name == "start") return parser_state::start;
    if (name == "alt") return parser_state::alt;
    if (name == "emp") return parser_state::emp;
    return std::nullopt;
  }

} // namespace ddl
