#pragma once

#include <ddl/parse_table.hpp>
#include <ddl/symbols.hpp>

#include <functional>
#include <vector>

namespace ddl {

  // Stack bottom first; remaining input without the end marker.
  struct trace_record {
    std::vector<stack_symbol> stack;
    std::vector<terminal> remaining;

    bool
    operator==(const trace_record&) const = default;
  };

  using trace_fn = std::function<void(const trace_record&)>;

  // Table-driven predictive parser with an explicit symbol stack. The
  // stack starts as [end_marker, start state]; the end marker also follows
  // the last input terminal, so the statement is accepted when both are
  // consumed together. A word may carry that end marker itself as its last
  // terminal.
  class stack_automaton {
    parse_table table_;

  public:
    stack_automaton();

    explicit stack_automaton(parse_table table);

    const parse_table&
    table() const {
      return table_;
    }

    // Returns on acceptance and throws parse_error on rejection. The trace
    // sink, when set, sees the initial stack and the result of every step.
    void
    analyze(const std::vector<terminal>& word,
            const trace_fn& trace = {}) const;
  };

  void
  analyze(const std::vector<terminal>& word, const parse_table& table,
          const trace_fn& trace = {});

} // namespace ddl
