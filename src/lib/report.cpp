#include <ddl/report.hpp>

#include <ddl/symbols.hpp>

#include <string>

namespace ddl {

  std::string
  pad_to_width(std::string_view text, std::size_t width) {
    std::string result(text);
    if (result.size() < width) result.append(width - result.size(), ' ');
    return result;
  }

  void
  write_symbol_table(std::ostream& os,
                     const std::vector<lexical_symbol>& symbols) {
    os << pad_to_width("Token", 10) << ' ' << pad_to_width("Lexeme", 20) << ' '
       << pad_to_width("Start", 8) << pad_to_width("Length", 8) << '\n';
    for (const auto& symbol : symbols) {
      os << pad_to_width(to_string(symbol.kind), 10) << ' '
         << pad_to_width(symbol.text, 20) << ' '
         << pad_to_width(std::to_string(symbol.start), 8)
         << pad_to_width(std::to_string(symbol.length()), 8) << '\n';
    }
  }

  void
  write_trace_record(std::ostream& os, const trace_record& record) {
    os << pad_to_width(to_string(record.stack), 20) << " \t "
       << to_string(record.remaining) << '\n';
  }

} // namespace ddl
