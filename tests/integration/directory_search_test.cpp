#include <catch2/catch_all.hpp>

#include <bloomdb/indexer/directory_indexer.hpp>
#include <bloomdb/server/search_service.hpp>
#include <bloomdb/storage/backend.hpp>

#include <fstream>
#include <memory>

#include "temp_dir.hpp"

using namespace bloomdb;

namespace {

struct AccountsFixture {
  bloomdb_test::TempDir dir{"accounts"};
  std::string input;
  std::string index_root;
  std::string f1, f2, f3;

  AccountsFixture() {
    f1 = dir.write("csv/account_data_1.csv", "account_id,account_status\n1,Active\n2,Active\n");
    f2 = dir.write("csv/account_data_2.csv", "account_id,account_status\n3,Inactive\n");
    f3 = dir.write("csv/account_data_3.csv", "account_id,account_status\n4,Inactive\n5,Active\n");
    dir.write("csv/notes.txt", "not a table\n");
    input = (dir.path() / "csv").string();
    index_root = (dir.path() / "indexes").string();
  }

  auto index_all() -> indexer::IndexReport {
    auto builder = index::ColumnIndexBuilder::create(index::BuildConfig{0.01, 1000});
    REQUIRE(builder.has_value());
    auto report = indexer::index_directory(input, "*.csv", storage::join_location(index_root, "accounts"),
                                           *builder, storage::IndexStore{});
    REQUIRE(report.has_value());
    return std::move(*report);
  }
};

auto status_query(const std::string& status) -> query::rule {
  return query::make_and({query::make_leaf("account_status", value{status})});
}

} // namespace

TEST_CASE("directory indexer writes one index per matching file", "[integration][indexer]") {
  AccountsFixture fx;
  auto report = fx.index_all();
  REQUIRE(report.files.size() == 3);
  REQUIRE(report.indexed() == 3);
  REQUIRE(report.failed() == 0);
  REQUIRE(report.files[0].source == storage::join_location(fx.input, "account_data_1.csv"));
  REQUIRE(report.files[2].index_location ==
          storage::join_location(storage::join_location(fx.index_root, "accounts"), "account_data_3.bdx"));
  for (const auto& f : report.files) REQUIRE(std::filesystem::exists(f.index_location));
}

TEST_CASE("a broken source does not stop the batch", "[integration][indexer]") {
  AccountsFixture fx;
  fx.dir.write("csv/account_data_4.csv", "account_id,account_status\n6\n");  // ragged
  auto report = fx.index_all();
  REQUIRE(report.files.size() == 4);
  REQUIRE(report.indexed() == 3);
  REQUIRE(report.failed() == 1);
  REQUIRE(report.files[3].error->code == core::error_code::data_source);
  REQUIRE(report.files[3].index_location.empty());
}

TEST_CASE("missing input directory fails the whole run", "[integration][indexer]") {
  AccountsFixture fx;
  auto builder = index::ColumnIndexBuilder::create({});
  REQUIRE(builder.has_value());
  auto report = indexer::index_directory(fx.input + "/nope", "*.csv", fx.index_root, *builder, storage::IndexStore{});
  REQUIRE_FALSE(report.has_value());
  REQUIRE(report.error().code == core::error_code::not_found);
}

TEST_CASE("search returns files that may contain the value", "[integration][search]") {
  AccountsFixture fx;
  fx.index_all();
  server::SearchService service(fx.index_root, std::make_shared<cache::IndexCache>(16));

  auto inactive = service.search({"accounts", "account_data_*", status_query("Inactive")});
  REQUIRE(inactive.has_value());
  REQUIRE(inactive->files == std::vector<std::string>{fx.f2, fx.f3});
  REQUIRE(inactive->failures.empty());

  auto active = service.search({"accounts", "account_data_*", status_query("Active")});
  REQUIRE(active.has_value());
  REQUIRE(active->files == std::vector<std::string>{fx.f1, fx.f3});

  auto narrowed = service.search({"accounts", "account_data_2", status_query("Inactive")});
  REQUIRE(narrowed.has_value());
  REQUIRE(narrowed->files == std::vector<std::string>{fx.f2});
}

TEST_CASE("no matching index files is an empty result", "[integration][search]") {
  AccountsFixture fx;
  fx.index_all();
  server::SearchService service(fx.index_root, nullptr);
  auto r = service.search({"accounts", "payroll_*", status_query("Active")});
  REQUIRE(r.has_value());
  REQUIRE(r->files.empty());
}

TEST_CASE("absent column excludes every file", "[integration][search]") {
  AccountsFixture fx;
  fx.index_all();
  server::SearchService service(fx.index_root, nullptr);
  auto r = service.search({"accounts", "*", query::make_leaf("region", value{std::string("Active")})});
  REQUIRE(r.has_value());
  REQUIRE(r->files.empty());
}

TEST_CASE("corrupt index files are excluded and reported", "[integration][search]") {
  AccountsFixture fx;
  auto report = fx.index_all();
  {
    std::fstream f(report.files[1].index_location, std::ios::in | std::ios::out | std::ios::binary);
    f.seekp(30);
    f.put('\x7f');
  }
  server::SearchService service(fx.index_root, std::make_shared<cache::IndexCache>(16));
  auto r = service.search({"accounts", "account_data_*", status_query("Inactive")});
  REQUIRE(r.has_value());
  REQUIRE(r->files == std::vector<std::string>{fx.f3});
  REQUIRE(r->failures.size() == 1);
  REQUIRE(r->failures[0].location == report.files[1].index_location);
  REQUIRE(r->failures[0].error.code == core::error_code::store_read);
}

TEST_CASE("index sources must stay inside the index root", "[integration][search]") {
  AccountsFixture fx;
  fx.index_all();
  server::SearchService service(fx.index_root, nullptr);
  for (const char* bad : {"../accounts", "/etc", "accounts/../../x", "file:///tmp"}) {
    INFO(bad);
    auto r = service.search({bad, "*", status_query("Active")});
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == core::error_code::invalid_argument);
  }
  auto missing = service.search({"payroll", "*", status_query("Active")});
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == core::error_code::not_found);
}

TEST_CASE("cancellation stops a search between loads", "[integration][search]") {
  AccountsFixture fx;
  fx.index_all();
  server::SearchService service(fx.index_root, nullptr);
  auto r = service.search({"accounts", "*", status_query("Active")}, [] { return true; });
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::cancelled);
}

TEST_CASE("search steps run separately give the same answer", "[integration][search]") {
  AccountsFixture fx;
  fx.index_all();
  server::SearchService service(fx.index_root, std::make_shared<cache::IndexCache>(16));

  auto locations = service.resolve("accounts", "account_data_*");
  REQUIRE(locations.has_value());
  REQUIRE(locations->size() == 3);

  int polls = 0;
  auto loaded = service.load(*locations, [&polls] { ++polls; return false; });
  REQUIRE(loaded.has_value());
  REQUIRE(polls == 3);
  REQUIRE(loaded->indexes.size() == 3);
  REQUIRE(loaded->failures.empty());

  auto files = server::SearchService::evaluate(status_query("Active"), *loaded);
  REQUIRE(files == std::vector<std::string>{fx.f1, fx.f3});
  auto whole = service.search({"accounts", "account_data_*", status_query("Active")});
  REQUIRE(whole.has_value());
  REQUIRE(whole->files == files);

  int calls = 0;
  auto stopped = service.load(*locations, [&calls] { return ++calls == 2; });
  REQUIRE_FALSE(stopped.has_value());
  REQUIRE(stopped.error().code == core::error_code::cancelled);
}
