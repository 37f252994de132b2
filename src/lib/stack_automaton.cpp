#include <ddl/stack_automaton.hpp>

#include <ddl/error.hpp>

#include <algorithm>
#include <cstddef>
#include <utility>

namespace ddl {

  stack_automaton::stack_automaton() : table_(parse_table::defaults()) {}

  stack_automaton::stack_automaton(parse_table table)
      : table_(std::move(table)) {}

  void
  stack_automaton::analyze(const std::vector<terminal>& word,
                           const trace_fn& trace) const {
    // A trailing end marker in the word is the end of input itself. One
    // anywhere else ends the statement early, leaving what follows unread.
    std::size_t size = word.size();
    if (size > 0 && word.back() == terminal::end_marker) --size;
    auto marker = std::find(word.begin(),
                            word.begin() + static_cast<std::ptrdiff_t>(size),
                            terminal::end_marker);
    if (marker != word.begin() + static_cast<std::ptrdiff_t>(size))
      throw parse_error::unconsumed_input(
          std::vector<terminal>(marker + 1, word.end()));

    std::vector<stack_symbol> stack = {terminal::end_marker,
                                       table_.start_state()};

    // cursor == size: only the end marker is left.
    // cursor > size: the end marker has been consumed too.
    std::size_t cursor = 0;

    auto front = [&]() {
      return cursor < size ? word[cursor] : terminal::end_marker;
    };

    auto remaining = [&]() {
      if (cursor >= size) return std::vector<terminal>{};
      return std::vector<terminal>(
          word.begin() + static_cast<std::ptrdiff_t>(cursor),
          word.begin() + static_cast<std::ptrdiff_t>(size));
    };

    auto emit = [&]() {
      if (trace) trace(trace_record{stack, remaining()});
    };

    emit();

    for (;;) {
      if (cursor > size) {
        bool only_empty =
            std::all_of(stack.begin(), stack.end(), [](const stack_symbol& s) {
              return s.holds<empty_symbol>();
            });
        if (only_empty) return;
        throw parse_error::unconsumed_obligations(std::move(stack));
      }

      if (stack.empty()) throw parse_error::unconsumed_input(remaining());

      stack_symbol top = std::move(stack.back());
      stack.pop_back();
      terminal lookahead = front();

      if (top.holds<empty_symbol>()) {
        emit();
        continue;
      }

      if (top.holds<terminal>()) {
        terminal expected = top.get<terminal>();
        if (expected == lookahead) {
          ++cursor;
          emit();
          continue;
        }
        if (expected == terminal::end_marker)
          throw parse_error::unconsumed_input(remaining());
        if (lookahead == terminal::end_marker) {
          stack.push_back(std::move(top));
          throw parse_error::unconsumed_obligations(std::move(stack));
        }
        throw parse_error::unexpected_terminal(expected, lookahead,
                                               std::move(stack), remaining());
      }

      parser_state state = top.get<parser_state>();
      const production* rhs = table_.predict(state, lookahead);
      if (rhs == nullptr) {
        if (lookahead == terminal::end_marker) {
          stack.push_back(std::move(top));
          throw parse_error::unconsumed_obligations(std::move(stack));
        }
        throw parse_error::no_table_entry(state, lookahead, std::move(stack),
                                          remaining());
      }

      // Reversed, so the leftmost symbol of the production is on top
      stack.insert(stack.end(), rhs->rbegin(), rhs->rend());
      emit();
    }
  }

  void
  analyze(const std::vector<terminal>& word, const parse_table& table,
          const trace_fn& trace) {
    stack_automaton(table).analyze(word, trace);
  }

} // namespace ddl
