#include <catch2/catch_all.hpp>
#include <bloomdb/storage/index_store.hpp>

#include <algorithm>
#include <memory>

#include <bloomdb/codec/frame.hpp>

#include "memory_backend.hpp"
#include "temp_dir.hpp"

using namespace bloomdb;
using namespace bloomdb::storage;

namespace {

auto sample_index() -> FileIndex {
  data::MemoryTable t("data/accounts_01.csv");
  std::vector<value> ids;
  for (std::int64_t i = 0; i < 50; ++i) ids.emplace_back(i * 3);
  t.add_column("account_status", {value{std::string("active")}, value{std::string("frozen")}})
      .add_column("id", ids)
      .add_column("flag", {value{true}})
      .add_column("ratio", {value{0.25}, value{0.75}});
  auto builder = index::ColumnIndexBuilder::create(index::BuildConfig{0.05, 20});
  REQUIRE(builder.has_value());
  auto built = build_file_index(t, *builder);
  REQUIRE(built.failures.empty());
  return std::move(built.index);
}

} // namespace

TEST_CASE("encoded index decodes to equivalent answers", "[index_store]") {
  const auto original = sample_index();
  const IndexStore store;
  auto bytes = store.encode(original);
  REQUIRE(bytes.has_value());

  auto decoded = IndexStore::decode(*bytes);
  REQUIRE(decoded.has_value());
  REQUIRE(decoded->source_path() == original.source_path());
  REQUIRE(decoded->build_config().error_rate == original.build_config().error_rate);
  REQUIRE(decoded->build_config().range_filter_threshold == 20);
  REQUIRE(decoded->columns().size() == original.columns().size());

  const auto* status = decoded->find("account_status");
  REQUIRE(status != nullptr);
  REQUIRE(status->kind() == index::ColumnIndexKind::membership);
  REQUIRE(status->contains(value{std::string("active")}));
  const auto* orig_bloom = original.find("account_status")->as_bloom();
  const auto* dec_bloom = status->as_bloom();
  REQUIRE(std::equal(orig_bloom->words().begin(), orig_bloom->words().end(), dec_bloom->words().begin()));

  const auto* ids = decoded->find("id");
  REQUIRE(ids->kind() == index::ColumnIndexKind::range);
  REQUIRE(std::get<std::int64_t>(ids->as_range()->min()) == 0);
  REQUIRE(std::get<std::int64_t>(ids->as_range()->max()) == 147);
  REQUIRE(decoded->find("flag")->contains(value{true}));
  REQUIRE(decoded->find("ratio")->contains(value{0.75}));
}

TEST_CASE("corrupted index bytes are a store read error", "[index_store]") {
  const IndexStore store;
  auto bytes = store.encode(sample_index());
  REQUIRE(bytes.has_value());

  auto flipped = *bytes;
  flipped[codec::FRAME_HEADER_SIZE + 3] ^= 0x40;
  auto bad = IndexStore::decode(flipped);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::store_read);

  std::vector<std::uint8_t> truncated(bytes->begin(), bytes->begin() + 10);
  auto short_read = IndexStore::decode(truncated);
  REQUIRE_FALSE(short_read.has_value());
  REQUIRE(short_read.error().code == core::error_code::store_read);

  auto garbage = IndexStore::decode(std::vector<std::uint8_t>(64, 0xAB));
  REQUIRE_FALSE(garbage.has_value());
  REQUIRE(garbage.error().code == core::error_code::store_read);
}

TEST_CASE("oversized declared payload is rejected before allocation", "[index_store]") {
  std::vector<std::uint8_t> payload(8, 0xFF);  // u64 raw size far beyond any real index
  payload.insert(payload.end(), {0x28, 0xB5, 0x2F, 0xFD, 0x00, 0x00});
  auto frame = codec::encode_frame(INDEX_MAGIC, INDEX_FRAME_TYPE, INDEX_FLAG_ZSTD, INDEX_FORMAT_VERSION, payload);
  REQUIRE(frame.has_value());
  auto dec = IndexStore::decode(*frame);
  REQUIRE_FALSE(dec.has_value());
  REQUIRE(dec.error().code == core::error_code::store_read);
#ifdef BLOOMDB_HAS_ZSTD
  REQUIRE(dec.error().message.find("declared payload size") != std::string::npos);
#endif
}

TEST_CASE("index from another format version is reported as such", "[index_store]") {
  const IndexStore store;
  auto bytes = store.encode(sample_index());
  REQUIRE(bytes.has_value());
  (*bytes)[12] = static_cast<std::uint8_t>(INDEX_FORMAT_VERSION + 1);  // version field, little endian
  auto dec = IndexStore::decode(*bytes);
  REQUIRE_FALSE(dec.has_value());
  REQUIRE(dec.error().code == core::error_code::store_version_mismatch);
}

TEST_CASE("write and read through the local backend", "[index_store]") {
  bloomdb_test::TempDir dir("store");
  const IndexStore store;
  const auto original = sample_index();
  const auto loc = index_location_for(original.source_path(), dir.str());
  REQUIRE(loc == dir.str() + "/accounts_01.bdx");
  REQUIRE(store.write(original, loc).has_value());

  auto back = store.read(loc);
  REQUIRE(back.has_value());
  REQUIRE(back->find("account_status")->contains(value{std::string("frozen")}));

  auto absent = store.read(dir.str() + "/missing.bdx");
  REQUIRE_FALSE(absent.has_value());
  REQUIRE(absent.error().code == core::error_code::store_read);
}

TEST_CASE("registered backends serve their scheme", "[index_store][backend]") {
  auto mem = std::make_shared<bloomdb_test::MemoryBackend>();
  register_backend("memtest", [mem] { return mem; });

  const IndexStore store;
  const auto original = sample_index();
  const std::string loc = "memtest://indexes/accounts_01.bdx";
  REQUIRE(store.write(original, loc).has_value());
  auto back = store.read(loc);
  REQUIRE(back.has_value());
  REQUIRE(back->source_path() == original.source_path());

  mem->corrupt(loc, codec::FRAME_HEADER_SIZE + 1);
  auto bad = store.read(loc);
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == core::error_code::store_read);
}

#ifdef BLOOMDB_HAS_ZSTD
TEST_CASE("compressed indexes decode like plain ones", "[index_store][zstd]") {
  const IndexStore store(IndexStoreOptions{3});
  auto bytes = store.encode(sample_index());
  REQUIRE(bytes.has_value());
  auto dec = IndexStore::decode(*bytes);
  REQUIRE(dec.has_value());
  REQUIRE(dec->find("id")->contains(value{std::int64_t{99}}));
}
#endif
