#include <ddl/terminal_mapper.hpp>

#include <ddl/error.hpp>

#include <stdexcept>
#include <utility>

namespace ddl {

  keyword_map
  keyword_map::defaults() {
    keyword_map map;
    map.set("ALTER TABLE", terminal::alter_table_keyword);
    map.set("DROP COLUMN", terminal::drop_column_keyword);
    return map;
  }

  void
  keyword_map::set(std::string text, terminal t) {
    if (t == terminal::end_marker) {
      throw std::invalid_argument("keyword_map::set: '" + text +
                                  "' cannot map to the end marker");
    }
    entries_.insert_or_assign(std::move(text), t);
  }

  const terminal*
  keyword_map::find(const std::string& text) const {
    auto it = entries_.find(text);
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  bool
  keyword_map::contains(const std::string& text) const {
    return entries_.count(text) != 0;
  }

  std::size_t
  keyword_map::size() const {
    return entries_.size();
  }

  terminal_mapper::terminal_mapper() : keywords_(keyword_map::defaults()) {}

  terminal_mapper::terminal_mapper(keyword_map keywords)
      : keywords_(std::move(keywords)) {}

  terminal
  terminal_mapper::map(const lexical_symbol& symbol) const {
    switch (symbol.kind) {
    case symbol_kind::keyword: {
      const auto* t = keywords_.find(symbol.text);
      if (t == nullptr) throw mapping_error::unmapped_keyword(symbol);
      return *t;
    }
    case symbol_kind::identifier: return terminal::identifier;
    default: throw mapping_error::unsupported_symbol_kind(symbol);
    }
  }

  std::vector<terminal>
  terminal_mapper::map(const std::vector<lexical_symbol>& symbols) const {
    std::vector<terminal> result;
    result.reserve(symbols.size());
    for (const auto& symbol : symbols)
      result.push_back(map(symbol));
    return result;
  }

  std::vector<terminal>
  map_terminals(const std::vector<lexical_symbol>& symbols) {
    return terminal_mapper().map(symbols);
  }

} // namespace ddl
