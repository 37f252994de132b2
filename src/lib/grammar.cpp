#include <ddl/grammar.hpp>

#include <ddl/error.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ddl {

  grammar
  grammar::defaults() {
    return grammar{pattern_table::defaults(), keyword_map::defaults(),
                   parse_table::defaults()};
  }

  namespace {

    bool
    is_whitespace_only(std::string_view sv) {
      return std::all_of(sv.begin(), sv.end(), [](char c) {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
      });
    }

    bool
    read_skip_ws(xml_reader& reader) {
      while (reader.read()) {
        if (reader.node_type() == xml_node_type::characters &&
            is_whitespace_only(reader.text()))
          continue;
        return true;
      }
      return false;
    }

    bool
    at_start(const xml_reader& reader, std::string_view name) {
      return reader.node_type() == xml_node_type::start_element &&
             reader.name() == name;
    }

    bool
    at_end(const xml_reader& reader, std::string_view name) {
      return reader.node_type() == xml_node_type::end_element &&
             reader.name() == name;
    }

    std::string
    tag(std::string_view name) {
      return "<" + std::string(name) + ">";
    }

    grammar_error
    unexpected_content(const xml_reader& reader, std::string_view parent) {
      if (reader.node_type() == xml_node_type::characters)
        return grammar_error("unexpected text inside " + tag(parent),
                             reader.line());
      return grammar_error(
          "unexpected " + tag(reader.name()) + " inside " + tag(parent),
          reader.line());
    }

    std::string
    required_attribute(const xml_reader& reader, std::string_view name) {
      auto value = reader.attribute(name);
      if (!value) {
        throw grammar_error(tag(reader.name()) + " requires attribute '" +
                                std::string(name) + "'",
                            reader.line());
      }
      return std::string(*value);
    }

    // Consumes the end tag of an element that takes no content.
    void
    expect_end(xml_reader& reader, std::string_view name) {
      std::size_t line = reader.line();
      if (!read_skip_ws(reader) || !at_end(reader, name))
        throw grammar_error(tag(name) + " must be empty", line);
    }

    symbol_kind
    read_kind(const xml_reader& reader) {
      auto name = required_attribute(reader, "kind");
      auto kind = symbol_kind_from_name(name);
      if (!kind)
        throw grammar_error("unknown symbol kind '" + name + "'",
                            reader.line());
      return *kind;
    }

    terminal
    read_terminal(const xml_reader& reader, std::string_view attribute) {
      auto name = required_attribute(reader, attribute);
      auto t = terminal_from_name(name);
      if (!t)
        throw grammar_error("unknown terminal '" + name + "'", reader.line());
      return *t;
    }

    parser_state
    state_named(const xml_reader& reader, const std::string& name) {
      auto s = parser_state_from_name(name);
      if (!s)
        throw grammar_error("unknown parser state '" + name + "'",
                            reader.line());
      return *s;
    }

    parser_state
    read_state(const xml_reader& reader, std::string_view attribute) {
      return state_named(reader, required_attribute(reader, attribute));
    }

    // <patterns> children, in priority order.
    pattern_table
    read_patterns(xml_reader& reader) {
      pattern_table table;
      std::size_t line = reader.line();

      while (read_skip_ws(reader)) {
        if (at_end(reader, "patterns")) {
          if (table.empty())
            throw grammar_error("<patterns> declares no pattern", line);
          return table;
        }
        if (!at_start(reader, "pattern"))
          throw unexpected_content(reader, "patterns");

        auto kind = read_kind(reader);
        auto regex = required_attribute(reader, "regex");
        if (regex.empty())
          throw grammar_error("empty pattern for " +
                                  std::string(to_string(kind)),
                              reader.line());
        try {
          table.add(kind, regex);
        } catch (const std::invalid_argument& e) {
          throw grammar_error(e.what(), reader.line());
        }

        expect_end(reader, "pattern");
      }
      throw grammar_error("unterminated <patterns>", line);
    }

    keyword_map
    read_keywords(xml_reader& reader) {
      keyword_map map;
      std::size_t line = reader.line();

      while (read_skip_ws(reader)) {
        if (at_end(reader, "keywords")) return map;
        if (!at_start(reader, "keyword"))
          throw unexpected_content(reader, "keywords");

        auto text = required_attribute(reader, "text");
        auto t = read_terminal(reader, "terminal");
        if (map.contains(text))
          throw grammar_error("duplicate keyword '" + text + "'",
                              reader.line());
        try {
          map.set(text, t);
        } catch (const std::invalid_argument& e) {
          throw grammar_error(e.what(), reader.line());
        }

        expect_end(reader, "keyword");
      }
      throw grammar_error("unterminated <keywords>", line);
    }

    // Right-hand side of a <rule> or <default>.
    production
    read_production(xml_reader& reader, std::string_view owner) {
      production rhs;
      std::size_t line = reader.line();

      while (read_skip_ws(reader)) {
        if (at_end(reader, owner)) {
          if (rhs.empty()) {
            throw grammar_error(tag(owner) +
                                    " has no symbols; use <empty/> for an "
                                    "empty production",
                                line);
          }
          return rhs;
        }

        if (at_start(reader, "terminal")) {
          rhs.push_back(read_terminal(reader, "name"));
          expect_end(reader, "terminal");
        } else if (at_start(reader, "state")) {
          rhs.push_back(read_state(reader, "name"));
          expect_end(reader, "state");
        } else if (at_start(reader, "empty")) {
          rhs.push_back(stack_symbol::empty());
          expect_end(reader, "empty");
        } else {
          throw unexpected_content(reader, owner);
        }
      }
      throw grammar_error("unterminated " + tag(owner), line);
    }

    parse_table
    read_table(xml_reader& reader) {
      parse_table table;
      std::size_t line = reader.line();

      if (auto start = reader.attribute("start"))
        table.set_start_state(state_named(reader, std::string(*start)));

      while (read_skip_ws(reader)) {
        if (at_end(reader, "table")) return table;

        if (at_start(reader, "rule")) {
          std::size_t rule_line = reader.line();
          auto state = read_state(reader, "state");
          auto lookahead = read_terminal(reader, "lookahead");
          if (table.contains(state, lookahead)) {
            throw grammar_error("duplicate rule for " +
                                    std::string(to_string(state)) + " on " +
                                    std::string(to_string(lookahead)),
                                rule_line);
          }
          table.set(state, lookahead, read_production(reader, "rule"));
          continue;
        }

        if (at_start(reader, "default")) {
          std::size_t rule_line = reader.line();
          auto state = read_state(reader, "state");
          if (table.has_default(state)) {
            throw grammar_error("duplicate default for " +
                                    std::string(to_string(state)),
                                rule_line);
          }
          table.set_default(state, read_production(reader, "default"));
          continue;
        }

        throw unexpected_content(reader, "table");
      }
      throw grammar_error("unterminated <table>", line);
    }

  } // namespace

  grammar
  grammar::load(xml_reader& reader) {
    if (!read_skip_ws(reader))
      throw grammar_error("expected <grammar> root element", 0);
    if (!at_start(reader, "grammar"))
      throw grammar_error("expected <grammar> root element", reader.line());

    grammar result = defaults();
    bool seen_patterns = false;
    bool seen_keywords = false;
    bool seen_table = false;

    auto once = [&reader](bool& seen, std::string_view section) {
      if (seen)
        throw grammar_error("duplicate " + tag(section) + " section",
                            reader.line());
      seen = true;
    };

    while (read_skip_ws(reader)) {
      if (at_end(reader, "grammar")) return result;

      if (at_start(reader, "patterns")) {
        once(seen_patterns, "patterns");
        result.patterns = read_patterns(reader);
      } else if (at_start(reader, "keywords")) {
        once(seen_keywords, "keywords");
        result.keywords = read_keywords(reader);
      } else if (at_start(reader, "table")) {
        once(seen_table, "table");
        result.table = read_table(reader);
      } else {
        throw unexpected_content(reader, "grammar");
      }
    }
    throw grammar_error("unterminated <grammar>", 0);
  }

} // namespace ddl
