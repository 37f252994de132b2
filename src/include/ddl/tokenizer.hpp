#pragma once

#include <ddl/lexical_symbol.hpp>
#include <ddl/pattern_table.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace ddl {

  class tokenizer {
    pattern_table patterns_;

  public:
    tokenizer();

    explicit tokenizer(pattern_table patterns);

    const pattern_table&
    patterns() const {
      return patterns_;
    }

    // One scan step at offset, whitespace included. Returns nullopt at the
    // end of the source and throws lexical_error when nothing matches.
    std::optional<lexical_symbol>
    next(std::string_view source, std::size_t offset) const;

    // Every match in order, whitespace included. The texts concatenate back
    // to the source.
    std::vector<lexical_symbol>
    scan(std::string_view source) const;

    // scan() without whitespace.
    std::vector<lexical_symbol>
    tokenize(std::string_view source) const;
  };

  // Tokenizes with the default pattern table.
  std::vector<lexical_symbol>
  tokenize(std::string_view source);

} // namespace ddl
