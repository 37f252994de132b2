#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace ddl {

  enum class symbol_kind {
    keyword,
    identifier,
    number,
    operator_symbol,
    string_literal,
    whitespace,
  };

  // "KEYWORD", "ID", "NUM", "OPERATOR", "STRING", "SPACE"
  std::string_view
  to_string(symbol_kind kind);

  // Grammar-file spelling: "keyword", "identifier", "number", "operator",
  // "string", "whitespace".
  std::optional<symbol_kind>
  symbol_kind_from_name(std::string_view name);

  inline std::ostream&
  operator<<(std::ostream& os, symbol_kind kind) {
    return os << to_string(kind);
  }

  struct lexical_symbol {
    symbol_kind kind = symbol_kind::identifier;
    std::string text;
    std::size_t start = 0;

    std::size_t
    length() const {
      return text.size();
    }

    std::size_t
    end() const {
      return start + text.size();
    }

    bool
    operator==(const lexical_symbol&) const = default;
  };

} // namespace ddl
