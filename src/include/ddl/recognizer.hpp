#pragma once

#include <ddl/grammar.hpp>
#include <ddl/lexical_symbol.hpp>
#include <ddl/stack_automaton.hpp>
#include <ddl/symbols.hpp>
#include <ddl/terminal_mapper.hpp>
#include <ddl/tokenizer.hpp>

#include <string_view>
#include <vector>

namespace ddl {

  struct recognition {
    std::vector<lexical_symbol> symbols;
    std::vector<terminal> terminals;
    std::vector<trace_record> trace;
  };

  // Tokenizer, mapper and automaton wired to one grammar.
  class recognizer {
    tokenizer tokenizer_;
    terminal_mapper mapper_;
    stack_automaton automaton_;

  public:
    recognizer();

    explicit recognizer(const grammar& g);

    // Throws lexical_error, mapping_error or parse_error on rejection.
    recognition
    recognize(std::string_view source) const;

    bool
    accepts(std::string_view source) const;
  };

} // namespace ddl
