#pragma once

#include <ddl/lexical_symbol.hpp>
#include <ddl/stack_automaton.hpp>

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ddl {

  // Right-pads with spaces; longer text is returned unchanged.
  std::string
  pad_to_width(std::string_view text, std::size_t width);

  // Token / Lexeme / Start / Length columns, one row per symbol.
  void
  write_symbol_table(std::ostream& os,
                     const std::vector<lexical_symbol>& symbols);

  // Stack (bottom first) then the remaining input, one line.
  void
  write_trace_record(std::ostream& os, const trace_record& record);

} // namespace ddl
