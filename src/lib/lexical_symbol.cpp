#include <ddl/lexical_symbol.hpp>

namespace ddl {

  std::string_view
  to_string(symbol_kind kind) {
    switch (kind) {
    case symbol_kind::keyword: return "KEYWORD";
    case symbol_kind::identifier: return "ID";
    case symbol_kind::number: return "NUM";
    case symbol_kind::operator_symbol: return "OPERATOR";
    case symbol_kind::string_literal: return "STRING";
    case symbol_kind::whitespace: return "SPACE";
    }
    return "?";
  }

  std::optional<symbol_kind>
  symbol_kind_from_name(std::string_view name) {
    if (name == "keyword") return symbol_kind::keyword;
    if (name == "identifier") return symbol_kind::identifier;
    if (name == "number") return symbol_kind::number;
    if (name == "operator") return symbol_kind::operator_symbol;
    if (name == "string") return symbol_kind::string_literal;
    if (name == "whitespace") return symbol_kind::whitespace;
    return std::nullopt;
  }

} // namespace ddl
