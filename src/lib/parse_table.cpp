#include <ddl/parse_table.hpp>

#include <utility>

namespace ddl {

  parse_table
  parse_table::defaults() {
    parse_table table;

    production statement = {
        terminal::alter_table_keyword,
        terminal::identifier,
        terminal::drop_column_keyword,
        terminal::identifier,
    };

    table.set(parser_state::start, terminal::alter_table_keyword, statement);
    // Start has a single production; predicting it for any lookahead turns
    // a missing ALTER TABLE into a terminal mismatch.
    table.set_default(parser_state::start, statement);

    // Not reachable from start in this grammar
    table.set(parser_state::alt, terminal::end_marker, {stack_symbol::empty()});
    table.set(parser_state::emp, terminal::identifier, {stack_symbol::empty()});

    return table;
  }

  void
  parse_table::set(parser_state state, terminal lookahead, production rhs) {
    entries_.insert_or_assign(std::make_pair(state, lookahead),
                              std::move(rhs));
  }

  void
  parse_table::set_default(parser_state state, production rhs) {
    defaults_.insert_or_assign(state, std::move(rhs));
  }

  const production*
  parse_table::find(parser_state state, terminal lookahead) const {
    auto it = entries_.find({state, lookahead});
    if (it == entries_.end()) return nullptr;
    return &it->second;
  }

  const production*
  parse_table::find_default(parser_state state) const {
    auto it = defaults_.find(state);
    if (it == defaults_.end()) return nullptr;
    return &it->second;
  }

  const production*
  parse_table::predict(parser_state state, terminal lookahead) const {
    if (const auto* rhs = find(state, lookahead)) return rhs;
    return find_default(state);
  }

  bool
  parse_table::contains(parser_state state, terminal lookahead) const {
    return entries_.count({state, lookahead}) != 0;
  }

  bool
  parse_table::has_default(parser_state state) const {
    return defaults_.count(state) != 0;
  }

} // namespace ddl
