#include <ddl/parse_table.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace ddl;

TEST_CASE("parse_table defaults: start production", "[parse_table]") {
  auto table = parse_table::defaults();
  CHECK(table.start_state() == parser_state::start);
  CHECK(table.size() == 3);

  const auto* rhs =
      table.find(parser_state::start, terminal::alter_table_keyword);
  REQUIRE(rhs != nullptr);
  production expected = {
      terminal::alter_table_keyword,
      terminal::identifier,
      terminal::drop_column_keyword,
      terminal::identifier,
  };
  CHECK(*rhs == expected);
}

TEST_CASE("parse_table defaults: auxiliary empty productions",
          "[parse_table]") {
  auto table = parse_table::defaults();

  const auto* alt = table.find(parser_state::alt, terminal::end_marker);
  REQUIRE(alt != nullptr);
  REQUIRE(alt->size() == 1);
  CHECK(alt->front().holds<empty_symbol>());

  const auto* emp = table.find(parser_state::emp, terminal::identifier);
  REQUIRE(emp != nullptr);
  CHECK(*emp == production{stack_symbol::empty()});
}

TEST_CASE("parse_table: predict falls back to the default",
          "[parse_table]") {
  auto table = parse_table::defaults();

  CHECK(table.find(parser_state::start, terminal::drop_column_keyword) ==
        nullptr);
  CHECK(table.has_default(parser_state::start));

  const auto* rhs =
      table.predict(parser_state::start, terminal::drop_column_keyword);
  REQUIRE(rhs != nullptr);
  CHECK(rhs == table.find_default(parser_state::start));

  // An explicit cell wins over the default
  CHECK(table.predict(parser_state::start, terminal::alter_table_keyword) ==
        table.find(parser_state::start, terminal::alter_table_keyword));

  CHECK_FALSE(table.has_default(parser_state::alt));
  CHECK(table.predict(parser_state::alt, terminal::identifier) == nullptr);
}

TEST_CASE("parse_table::set replaces a cell", "[parse_table]") {
  parse_table table;
  table.set(parser_state::start, terminal::identifier,
            {terminal::identifier});
  table.set(parser_state::start, terminal::identifier,
            {terminal::identifier, parser_state::alt});

  CHECK(table.size() == 1);
  CHECK(table.contains(parser_state::start, terminal::identifier));
  const auto* rhs = table.find(parser_state::start, terminal::identifier);
  REQUIRE(rhs != nullptr);
  REQUIRE(rhs->size() == 2);
  CHECK((*rhs)[1] == stack_symbol(parser_state::alt));
}

TEST_CASE("parse_table: start state is configurable", "[parse_table]") {
  parse_table table;
  table.set_start_state(parser_state::alt);
  CHECK(table.start_state() == parser_state::alt);
}
