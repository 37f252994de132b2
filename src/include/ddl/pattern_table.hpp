#pragma once

#include <ddl/lexical_symbol.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace re2 {
  class RE2;
} // namespace re2

namespace ddl {

  struct pattern_entry {
    symbol_kind kind;
    std::string source;
    std::shared_ptr<const re2::RE2> regex;
  };

  struct pattern_match {
    symbol_kind kind;
    std::size_t length;
  };

  // Ordered (kind, pattern) pairs. Earlier entries take priority: the
  // first pattern matching at the scan position wins, whatever the length
  // of later matches. Patterns use RE2 syntax and match case-insensitively
  // in time linear in the input.
  class pattern_table {
    std::vector<pattern_entry> entries_;

  public:
    using const_iterator = std::vector<pattern_entry>::const_iterator;

    pattern_table() = default;

    static pattern_table
    defaults();

    // Appends at the lowest priority. Throws std::invalid_argument for an
    // invalid expression or a kind that already owns a pattern.
    void
    add(symbol_kind kind, std::string pattern);

    // Replaces the pattern of an existing kind in place, keeping its
    // priority; appends when the kind has none yet.
    void
    set(symbol_kind kind, std::string pattern);

    const pattern_entry*
    find(symbol_kind kind) const;

    // Anchored match at offset. Empty matches never count.
    std::optional<pattern_match>
    match_at(std::string_view source, std::size_t offset) const;

    std::size_t
    size() const {
      return entries_.size();
    }

    bool
    empty() const {
      return entries_.empty();
    }

    const_iterator
    begin() const {
      return entries_.begin();
    }

    const_iterator
    end() const {
      return entries_.end();
    }
  };

} // namespace ddl
