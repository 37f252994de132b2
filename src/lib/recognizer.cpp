#include <ddl/recognizer.hpp>

#include <ddl/error.hpp>

namespace ddl {

  recognizer::recognizer() : recognizer(grammar::defaults()) {}

  recognizer::recognizer(const grammar& g)
      : tokenizer_(g.patterns), mapper_(g.keywords), automaton_(g.table) {}

  recognition
  recognizer::recognize(std::string_view source) const {
    recognition result;
    result.symbols = tokenizer_.tokenize(source);
    result.terminals = mapper_.map(result.symbols);
    automaton_.analyze(result.terminals, [&result](const trace_record& r) {
      result.trace.push_back(r);
    });
    return result;
  }

  bool
  recognizer::accepts(std::string_view source) const {
    try {
      recognize(source);
      return true;
    } catch (const error&) {
      return false;
    }
  }

} // namespace ddl
