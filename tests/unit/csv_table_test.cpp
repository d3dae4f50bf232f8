#include <catch2/catch_all.hpp>
#include <bloomdb/data/table_source.hpp>

#include "temp_dir.hpp"

using namespace bloomdb;
using bloomdb::data::CsvTable;

TEST_CASE("csv header and typed columns", "[csv]") {
  auto t = CsvTable::parse("id,name,score\n1,alice,2.5\n2,bob,3\n", "people.csv");
  REQUIRE(t.has_value());
  REQUIRE(t->source_path() == "people.csv");
  REQUIRE(t->column_names() == std::vector<std::string>{"id", "name", "score"});
  REQUIRE(t->row_count() == 2);
  auto ids = t->column(0);
  REQUIRE(ids.size() == 2);
  REQUIRE(std::get<std::int64_t>(ids[1]) == 2);
  REQUIRE(std::get<std::string>(t->column(1)[0]) == "alice");
  REQUIRE(std::holds_alternative<double>(t->column(2)[0]));
}

TEST_CASE("quoted cells stay text and may hold delimiters", "[csv]") {
  auto t = CsvTable::parse("code,note\n\"007\",\"a, \"\"b\"\"\"\r\n", "q.csv");
  REQUIRE(t.has_value());
  REQUIRE(std::get<std::string>(t->column(0)[0]) == "007");
  REQUIRE(std::get<std::string>(t->column(1)[0]) == "a, \"b\"");
}

TEST_CASE("a column is numeric only when every cell parses", "[csv]") {
  auto t = CsvTable::parse("code,n\n12,1\nA13,2.5\n", "codes.csv");
  REQUIRE(t.has_value());
  auto code = t->column(0);
  REQUIRE(code.size() == 2);
  REQUIRE(std::get<std::string>(code[0]) == "12");
  REQUIRE(std::get<std::string>(code[1]) == "A13");
  REQUIRE(std::get<std::int64_t>(t->column(1)[0]) == 1);
  REQUIRE(std::get<double>(t->column(1)[1]) == 2.5);

  auto quoted = CsvTable::parse("k\n5\n\"6\"\n", "q.csv");
  REQUIRE(quoted.has_value());
  REQUIRE(std::get<std::string>(quoted->column(0)[0]) == "5");
  REQUIRE(std::get<std::string>(quoted->column(0)[1]) == "6");
}

TEST_CASE("empty unquoted cells are missing, blank lines skipped", "[csv]") {
  auto t = CsvTable::parse("a,b\n1,\n\n,x\n", "m.csv");
  REQUIRE(t.has_value());
  REQUIRE(t->row_count() == 2);
  REQUIRE(t->column(0).size() == 1);
  REQUIRE(t->column(1).size() == 1);
}

TEST_CASE("byte order mark is ignored", "[csv]") {
  auto t = CsvTable::parse("\xEF\xBB\xBFstatus\nactive\n", "bom.csv");
  REQUIRE(t.has_value());
  REQUIRE(t->column_names()[0] == "status");
}

TEST_CASE("malformed csv is a data source error", "[csv]") {
  auto ragged = CsvTable::parse("a,b\n1,2,3\n", "r.csv");
  REQUIRE_FALSE(ragged.has_value());
  REQUIRE(ragged.error().code == core::error_code::data_source);

  auto open_quote = CsvTable::parse("a\n\"never closed\n", "u.csv");
  REQUIRE_FALSE(open_quote.has_value());
  REQUIRE(open_quote.error().code == core::error_code::data_source);

  auto empty = CsvTable::parse("", "e.csv");
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.error().code == core::error_code::data_source);
}

TEST_CASE("custom delimiter and load from disk", "[csv]") {
  bloomdb_test::TempDir dir("csv");
  auto path = dir.write("t.tsv", "k\tv\nx\t1\n");
  auto t = CsvTable::load(path, data::CsvOptions{'\t', '"'});
  REQUIRE(t.has_value());
  REQUIRE(t->column_names().size() == 2);
  REQUIRE(t->source_path() == path);

  auto missing = CsvTable::load((dir.path() / "absent.csv").string());
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == core::error_code::data_source);
}
