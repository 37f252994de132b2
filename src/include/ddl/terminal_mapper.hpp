#pragma once

#include <ddl/lexical_symbol.hpp>
#include <ddl/symbols.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace ddl {

  // Exact, case-sensitive keyword text to terminal.
  class keyword_map {
    std::unordered_map<std::string, terminal> entries_;

  public:
    keyword_map() = default;

    static keyword_map
    defaults();

    // Throws std::invalid_argument for the end marker, which no lexeme can
    // produce.
    void
    set(std::string text, terminal t);

    const terminal*
    find(const std::string& text) const;

    bool
    contains(const std::string& text) const;

    std::size_t
    size() const;
  };

  class terminal_mapper {
    keyword_map keywords_;

  public:
    terminal_mapper();

    explicit terminal_mapper(keyword_map keywords);

    const keyword_map&
    keywords() const {
      return keywords_;
    }

    // Throws mapping_error.
    terminal
    map(const lexical_symbol& symbol) const;

    // Order preserving. No end marker is appended.
    std::vector<terminal>
    map(const std::vector<lexical_symbol>& symbols) const;
  };

  // Maps with the default keyword map.
  std::vector<terminal>
  map_terminals(const std::vector<lexical_symbol>& symbols);

} // namespace ddl
