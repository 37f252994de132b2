#pragma once

#include <ddl/symbols.hpp>

#include <cstddef>
#include <map>
#include <utility>

namespace ddl {

  // (state, lookahead) -> production. A state may also carry a default
  // production, predicted when the lookahead has no cell of its own.
  class parse_table {
    parser_state start_ = parser_state::start;
    std::map<std::pair<parser_state, terminal>, production> entries_;
    std::map<parser_state, production> defaults_;

  public:
    parse_table() = default;

    // The ALTER TABLE ... DROP COLUMN ... grammar.
    static parse_table
    defaults();

    parser_state
    start_state() const {
      return start_;
    }

    void
    set_start_state(parser_state state) {
      start_ = state;
    }

    void
    set(parser_state state, terminal lookahead, production rhs);

    void
    set_default(parser_state state, production rhs);

    const production*
    find(parser_state state, terminal lookahead) const;

    const production*
    find_default(parser_state state) const;

    // find(), falling back to find_default().
    const production*
    predict(parser_state state, terminal lookahead) const;

    bool
    contains(parser_state state, terminal lookahead) const;

    bool
    has_default(parser_state state) const;

    // Number of (state, lookahead) cells; defaults are not counted.
    std::size_t
    size() const {
      return entries_.size();
    }
  };

} // namespace ddl
