#include <ddl/report.hpp>
#include <ddl/tokenizer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

using namespace ddl;

TEST_CASE("pad_to_width", "[report]") {
  CHECK(pad_to_width("ID", 5) == "ID   ");
  CHECK(pad_to_width("KEYWORD", 3) == "KEYWORD");
  CHECK(pad_to_width("", 2) == "  ");
}

TEST_CASE("write_symbol_table: header and rows", "[report]") {
  std::ostringstream os;
  write_symbol_table(os, tokenize("ALTER TABLE Table1"));

  std::string expected =
      "Token      Lexeme               Start   Length  \n"
      "KEYWORD    ALTER TABLE          0       11      \n"
      "ID         Table1               12      6       \n";
  CHECK(os.str() == expected);
}

TEST_CASE("write_trace_record: stack then remaining input", "[report]") {
  trace_record record{{terminal::end_marker, parser_state::start},
                      {terminal::alter_table_keyword, terminal::identifier}};
  std::ostringstream os;
  write_trace_record(os, record);
  CHECK(os.str() == "$<S>                 \t <ALTER TABLE><id>\n");
}

TEST_CASE("to_string: symbols", "[report]") {
  CHECK(to_string(terminal::drop_column_keyword) == "<DROP COLUMN>");
  CHECK(to_string(parser_state::emp) == "<EMP>");
  CHECK(to_string(stack_symbol::empty()).empty());
  CHECK(to_string(symbol_kind::string_literal) == "STRING");

  std::vector<stack_symbol> stack = {terminal::end_marker,
                                     stack_symbol::empty(), parser_state::alt};
  CHECK(to_string(stack) == "$<ALT>");
}

TEST_CASE("grammar-file names round trip through the parsers", "[report]") {
  CHECK(terminal_from_name("alter-table") == terminal::alter_table_keyword);
  CHECK(terminal_from_name("end") == terminal::end_marker);
  CHECK_FALSE(terminal_from_name("<id>"));
  CHECK(parser_state_from_name("emp") == parser_state::emp);
  CHECK_FALSE(parser_state_from_name("S"));
  CHECK(symbol_kind_from_name("operator") == symbol_kind::operator_symbol);
  CHECK_FALSE(symbol_kind_from_name("KEYWORD"));
}
