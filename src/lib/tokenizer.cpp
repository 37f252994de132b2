#include <ddl/tokenizer.hpp>

#include <ddl/error.hpp>

#include <string>
#include <utility>

namespace ddl {

  tokenizer::tokenizer() : patterns_(pattern_table::defaults()) {}

  tokenizer::tokenizer(pattern_table patterns)
      : patterns_(std::move(patterns)) {}

  std::optional<lexical_symbol>
  tokenizer::next(std::string_view source, std::size_t offset) const {
    if (offset >= source.size()) return std::nullopt;

    auto match = patterns_.match_at(source, offset);
    if (!match) throw lexical_error(offset, source.substr(offset));

    return lexical_symbol{match->kind,
                          std::string(source.substr(offset, match->length)),
                          offset};
  }

  std::vector<lexical_symbol>
  tokenizer::scan(std::string_view source) const {
    std::vector<lexical_symbol> result;
    std::size_t offset = 0;

    // Every match is non-empty, so offset strictly increases
    while (auto symbol = next(source, offset)) {
      offset = symbol->end();
      result.push_back(std::move(*symbol));
    }
    return result;
  }

  std::vector<lexical_symbol>
  tokenizer::tokenize(std::string_view source) const {
    std::vector<lexical_symbol> result;
    std::size_t offset = 0;

    while (auto symbol = next(source, offset)) {
      offset = symbol->end();
      if (symbol->kind == symbol_kind::whitespace) continue;
      result.push_back(std::move(*symbol));
    }
    return result;
  }

  std::vector<lexical_symbol>
  tokenize(std::string_view source) {
    return tokenizer().tokenize(source);
  }

} // namespace ddl
