#include <ddl/error.hpp>
#include <ddl/recognizer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace ddl;

TEST_CASE("recognize: accepted statement carries every stage",
          "[recognizer]") {
  recognizer r;
  auto result = r.recognize("ALTER TABLE Table1 DROP COLUMN Email");

  CHECK(result.symbols.size() == 4);
  CHECK(result.terminals.size() == 4);
  CHECK(result.trace.size() == 7);
  CHECK(result.trace.back().stack.empty());
}

TEST_CASE("recognize: each stage reports its own error", "[recognizer]") {
  recognizer r;
  CHECK_THROWS_AS(r.recognize("ALTER TABLE t;"), lexical_error);
  CHECK_THROWS_AS(r.recognize("ALTER TABLE 'x'"), mapping_error);
  CHECK_THROWS_AS(r.recognize("ALTER TABLE t"), parse_error);
}

TEST_CASE("accepts", "[recognizer]") {
  recognizer r;
  CHECK(r.accepts("ALTER TABLE Table1 DROP COLUMN Email"));
  CHECK(r.accepts("  ALTER TABLE\tt\n DROP COLUMN   c  "));
  CHECK_FALSE(r.accepts("ALTER TABLE Table1 DROP COLUMN Email;"));
  CHECK_FALSE(r.accepts("DROP COLUMN Email"));
  CHECK_FALSE(r.accepts("ALTER TABLE Table1 ALTER TABLE Email"));
  CHECK_FALSE(r.accepts(""));
}

TEST_CASE("recognizer: custom grammar", "[recognizer]") {
  auto g = grammar::defaults();
  g.keywords.set("alter table", terminal::alter_table_keyword);
  g.keywords.set("drop column", terminal::drop_column_keyword);

  recognizer r(g);
  CHECK(r.accepts("alter table t drop column c"));
  CHECK(r.accepts("ALTER TABLE t DROP COLUMN c"));
  CHECK_FALSE(recognizer().accepts("alter table t drop column c"));
}
