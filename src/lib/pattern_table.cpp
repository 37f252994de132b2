#include <ddl/pattern_table.hpp>

#include <re2/re2.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace ddl {

  namespace {

    std::shared_ptr<const re2::RE2>
    compile(const std::string& pattern) {
      re2::RE2::Options options;
      options.set_case_sensitive(false);
      options.set_log_errors(false);
      auto regex = std::make_shared<const re2::RE2>(pattern, options);
      if (!regex->ok()) {
        throw std::invalid_argument("pattern_table: invalid pattern '" +
                                    pattern + "': " + regex->error());
      }
      return regex;
    }

  } // namespace

  pattern_table
  pattern_table::defaults() {
    pattern_table table;

    // Keywords before identifiers, or "ALTER" would be read as an identifier
    table.add(symbol_kind::keyword, R"(\b(alter table|drop column)\b)");
    table.add(symbol_kind::identifier, R"([A-Za-z][A-Za-z0-9\._]*)");
    table.add(symbol_kind::number, R"([0-9]+)");
    table.add(symbol_kind::operator_symbol, R"([=\(\)\*,])");
    table.add(symbol_kind::string_literal, R"('[^']*')");
    table.add(symbol_kind::whitespace, R"(\s+)");

    return table;
  }

  void
  pattern_table::add(symbol_kind kind, std::string pattern) {
    if (find(kind) != nullptr) {
      throw std::invalid_argument("pattern_table::add: " +
                                  std::string(to_string(kind)) +
                                  " already has a pattern");
    }
    auto regex = compile(pattern);
    entries_.push_back({kind, std::move(pattern), std::move(regex)});
  }

  void
  pattern_table::set(symbol_kind kind, std::string pattern) {
    auto it =
        std::find_if(entries_.begin(), entries_.end(),
                     [kind](const pattern_entry& e) { return e.kind == kind; });
    if (it == entries_.end()) {
      add(kind, std::move(pattern));
      return;
    }
    it->regex = compile(pattern);
    it->source = std::move(pattern);
  }

  const pattern_entry*
  pattern_table::find(symbol_kind kind) const {
    for (const auto& entry : entries_)
      if (entry.kind == kind) return &entry;
    return nullptr;
  }

  std::optional<pattern_match>
  pattern_table::match_at(std::string_view source, std::size_t offset) const {
    if (offset >= source.size()) return std::nullopt;

    // The whole source is the match context, so \b sees the character
    // before offset.
    re2::StringPiece text(source.data(), source.size());

    for (const auto& entry : entries_) {
      re2::StringPiece m;
      if (!entry.regex->Match(text, offset, text.size(), re2::RE2::ANCHOR_START,
                              &m, 1))
        continue;
      if (m.empty()) continue;
      return pattern_match{entry.kind, static_cast<std::size_t>(m.size())};
    }
    return std::nullopt;
  }

} // namespace ddl
