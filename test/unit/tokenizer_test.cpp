#include <ddl/error.hpp>
#include <ddl/tokenizer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace ddl;

TEST_CASE("tokenize: ALTER TABLE ... DROP COLUMN ...", "[tokenizer]") {
  auto symbols = tokenize("ALTER TABLE Table1 DROP COLUMN Email");

  std::vector<lexical_symbol> expected = {
      {symbol_kind::keyword, "ALTER TABLE", 0},
      {symbol_kind::identifier, "Table1", 12},
      {symbol_kind::keyword, "DROP COLUMN", 19},
      {symbol_kind::identifier, "Email", 31},
  };
  CHECK(symbols == expected);
  CHECK(symbols[3].length() == 5);
}

TEST_CASE("tokenize: ALTER TABLE alone is a keyword", "[tokenizer]") {
  auto symbols = tokenize("ALTER TABLE");
  REQUIRE(symbols.size() == 1);
  CHECK(symbols[0].kind == symbol_kind::keyword);
  CHECK(symbols[0].text == "ALTER TABLE");
}

TEST_CASE("tokenize: leading digit reads as a number", "[tokenizer]") {
  auto symbols = tokenize("ALTER TABLE 1Table");
  REQUIRE(symbols.size() == 3);
  CHECK(symbols[1].kind == symbol_kind::number);
  CHECK(symbols[1].text == "1");
  CHECK(symbols[2].kind == symbol_kind::identifier);
  CHECK(symbols[2].text == "Table");
  CHECK(symbols[2].start == 13);
}

TEST_CASE("tokenize: identifiers may contain dots and underscores",
          "[tokenizer]") {
  auto symbols = tokenize("dbo.Users_2");
  REQUIRE(symbols.size() == 1);
  CHECK(symbols[0].kind == symbol_kind::identifier);
  CHECK(symbols[0].text == "dbo.Users_2");
}

TEST_CASE("tokenize: operators and string literals", "[tokenizer]") {
  auto symbols = tokenize("a = 'x y', (*)");
  std::vector<symbol_kind> kinds;
  for (const auto& s : symbols)
    kinds.push_back(s.kind);

  std::vector<symbol_kind> expected = {
      symbol_kind::identifier,     symbol_kind::operator_symbol,
      symbol_kind::string_literal, symbol_kind::operator_symbol,
      symbol_kind::operator_symbol, symbol_kind::operator_symbol,
      symbol_kind::operator_symbol,
  };
  CHECK(kinds == expected);
  CHECK(symbols[2].text == "'x y'");
}

TEST_CASE("tokenize: whitespace is skipped but advances the offset",
          "[tokenizer]") {
  auto symbols = tokenize("  \tEmail \n  Name  ");
  REQUIRE(symbols.size() == 2);
  CHECK(symbols[0].start == 3);
  CHECK(symbols[1].start == 12);
  for (const auto& s : symbols)
    CHECK(s.kind != symbol_kind::whitespace);
}

TEST_CASE("tokenize: long identifiers and whitespace runs", "[tokenizer]") {
  std::string name(1000000, 'a');
  auto symbols = tokenize("ALTER TABLE " + name + " DROP COLUMN Email");
  REQUIRE(symbols.size() == 4);
  CHECK(symbols[1].kind == symbol_kind::identifier);
  CHECK(symbols[1].text.size() == name.size());
  CHECK(symbols[2].start == 12 + name.size() + 1);

  std::string gap(100000, ' ');
  symbols = tokenize("ALTER TABLE t" + gap + "DROP COLUMN e");
  REQUIRE(symbols.size() == 4);
  CHECK(symbols[2].kind == symbol_kind::keyword);
  CHECK(symbols[2].start == 13 + gap.size());
}

TEST_CASE("tokenize: empty and blank input", "[tokenizer]") {
  CHECK(tokenize("").empty());
  CHECK(tokenize("   ").empty());
}

TEST_CASE("tokenize: unmatched character is a lexical error", "[tokenizer]") {
  try {
    tokenize("ALTER TABLE Table1 DROP COLUMN Email;");
    FAIL("expected lexical_error");
  } catch (const lexical_error& e) {
    CHECK(e.offset() == 36);
    CHECK(std::string(e.what()).find("offset 36") != std::string::npos);
  }
}

TEST_CASE("scan: matches reconstruct the source", "[tokenizer]") {
  tokenizer t;
  for (std::string source :
       {"ALTER TABLE Table1 DROP COLUMN Email", "  a  b\t\tc ",
        "x='y' ,(1)*2", ""}) {
    INFO("source: \"" << source << "\"");
    auto matches = t.scan(source);
    std::string rebuilt;
    std::size_t offset = 0;
    for (const auto& m : matches) {
      CHECK(m.start == offset);
      offset = m.end();
      rebuilt += m.text;
    }
    CHECK(rebuilt == source);
  }
}

TEST_CASE("scan: keeps whitespace that tokenize drops", "[tokenizer]") {
  tokenizer t;
  auto all = t.scan("a b");
  REQUIRE(all.size() == 3);
  CHECK(all[1].kind == symbol_kind::whitespace);
  CHECK(all[1].text == " ");
  CHECK(t.tokenize("a b").size() == 2);
}

TEST_CASE("next: single step at an offset", "[tokenizer]") {
  tokenizer t;
  auto s = t.next("ALTER TABLE Table1", 11);
  REQUIRE(s);
  CHECK(s->kind == symbol_kind::whitespace);
  CHECK(s->start == 11);

  CHECK_FALSE(t.next("abc", 3));
  CHECK_THROWS_AS(t.next("a;", 1), lexical_error);
}

TEST_CASE("tokenizer: custom pattern table", "[tokenizer]") {
  pattern_table patterns;
  patterns.add(symbol_kind::keyword, R"(\b(select|from)\b)");
  patterns.add(symbol_kind::identifier, "[a-z]+");
  patterns.add(symbol_kind::whitespace, " +");

  tokenizer t(patterns);
  auto symbols = t.tokenize("select x from y");
  REQUIRE(symbols.size() == 4);
  CHECK(symbols[0].kind == symbol_kind::keyword);
  CHECK(symbols[2].kind == symbol_kind::keyword);
  CHECK(symbols[3].kind == symbol_kind::identifier);

  // No number pattern in this table
  CHECK_THROWS_AS(t.tokenize("select 1"), lexical_error);
}
