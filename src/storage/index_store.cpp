#include "bloomdb/storage/index_store.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#ifdef BLOOMDB_HAS_ZSTD
#include <zstd.h>
#endif

#include "bloomdb/codec/byte_io.hpp"
#include "bloomdb/codec/frame.hpp"
#include "bloomdb/core/platform_utils.hpp"
#include "bloomdb/storage/backend.hpp"

namespace bloomdb::storage {

namespace {

using codec::ByteReader;
using codec::ByteWriter;

constexpr std::uint8_t kValueBool = 0;
constexpr std::uint8_t kValueInt = 1;
constexpr std::uint8_t kValueDouble = 2;
constexpr std::uint8_t kValueString = 3;

// Largest decompressed payload a reader will allocate for.
constexpr std::uint64_t kMaxRawPayload = std::uint64_t{1} << 30;

auto corrupt(std::string what) -> core::error {
  return core::error{core::error_code::store_read, "corrupt index: " + std::move(what), "storage.index_store"};
}

void write_value(ByteWriter& w, const value& v) {
  if (std::holds_alternative<bool>(v)) {
    w.put_u8(kValueBool);
    w.put_u8(std::get<bool>(v) ? 1 : 0);
  } else if (std::holds_alternative<std::int64_t>(v)) {
    w.put_u8(kValueInt);
    w.put_i64(std::get<std::int64_t>(v));
  } else if (std::holds_alternative<double>(v)) {
    w.put_u8(kValueDouble);
    w.put_f64(std::get<double>(v));
  } else {
    w.put_u8(kValueString);
    w.put_string(std::get<std::string>(v));
  }
}

auto read_value(ByteReader& r) -> std::expected<value, core::error> {
  std::uint8_t tag{};
  if (!r.get_u8(tag)) return std::unexpected(corrupt("value tag"));
  switch (tag) {
    case kValueBool: {
      std::uint8_t b{};
      if (!r.get_u8(b)) return std::unexpected(corrupt("bool value"));
      return value{b != 0};
    }
    case kValueInt: {
      std::int64_t i{};
      if (!r.get_i64(i)) return std::unexpected(corrupt("int value"));
      return value{i};
    }
    case kValueDouble: {
      double d{};
      if (!r.get_f64(d)) return std::unexpected(corrupt("double value"));
      return value{d};
    }
    case kValueString: {
      std::string s;
      if (!r.get_string(s)) return std::unexpected(corrupt("string value"));
      return value{std::move(s)};
    }
    default:
      return std::unexpected(corrupt("unknown value tag " + std::to_string(tag)));
  }
}

auto encode_payload(const FileIndex& index) -> std::vector<std::uint8_t> {
  ByteWriter w;
  w.put_string(index.source_path());
  w.put_f64(index.build_config().error_rate);
  w.put_u64(index.build_config().range_filter_threshold);
  w.put_u32(static_cast<std::uint32_t>(index.columns().size()));
  for (const auto& [name, col] : index.columns()) {
    w.put_string(name);
    w.put_u8(static_cast<std::uint8_t>(col.kind()));
    if (const auto* bloom = col.as_bloom()) {
      w.put_u64(bloom->num_bits());
      w.put_u32(bloom->num_hashes());
      w.put_u64(bloom->inserted());
      for (auto word : bloom->words()) w.put_u64(word);
    } else if (const auto* range = col.as_range()) {
      write_value(w, range->min());
      write_value(w, range->max());
    }
  }
  return w.take();
}

auto decode_payload(std::span<const std::uint8_t> payload) -> std::expected<FileIndex, core::error> {
  ByteReader r(payload);
  std::string source_path;
  index::BuildConfig config{};
  std::uint32_t n_cols{};
  if (!r.get_string(source_path)) return std::unexpected(corrupt("source path"));
  if (!r.get_f64(config.error_rate)) return std::unexpected(corrupt("error rate"));
  if (!r.get_u64(config.range_filter_threshold)) return std::unexpected(corrupt("threshold"));
  if (!r.get_u32(n_cols)) return std::unexpected(corrupt("column count"));

  FileIndex::column_map columns;
  for (std::uint32_t c = 0; c < n_cols; ++c) {
    std::string name;
    std::uint8_t kind{};
    if (!r.get_string(name)) return std::unexpected(corrupt("column name"));
    if (!r.get_u8(kind)) return std::unexpected(corrupt("column kind"));
    switch (static_cast<index::ColumnIndexKind>(kind)) {
      case index::ColumnIndexKind::membership: {
        std::uint64_t num_bits{}, inserted{};
        std::uint32_t num_hashes{};
        if (!r.get_u64(num_bits) || !r.get_u32(num_hashes) || !r.get_u64(inserted)) {
          return std::unexpected(corrupt("bloom header of column " + name));
        }
        const std::uint64_t n_words = num_bits / 64;
        if (n_words > r.remaining() / 8) return std::unexpected(corrupt("bloom words of column " + name));
        std::vector<std::uint64_t> words(static_cast<std::size_t>(n_words));
        for (auto& word : words) {
          if (!r.get_u64(word)) return std::unexpected(corrupt("bloom words of column " + name));
        }
        auto filter = index::BloomFilter::from_words(num_bits, num_hashes, inserted, std::move(words));
        if (!filter) return std::unexpected(corrupt(filter.error().message + " in column " + name));
        columns.emplace(std::move(name), index::ColumnIndex(std::move(*filter)));
        break;
      }
      case index::ColumnIndexKind::range: {
        auto lo = read_value(r);
        if (!lo) return std::unexpected(lo.error());
        auto hi = read_value(r);
        if (!hi) return std::unexpected(hi.error());
        columns.emplace(std::move(name), index::ColumnIndex(index::RangeIndex(std::move(*lo), std::move(*hi))));
        break;
      }
      default:
        return std::unexpected(corrupt("unknown column kind " + std::to_string(kind)));
    }
  }
  if (!r.exhausted()) return std::unexpected(corrupt("trailing bytes"));
  return FileIndex(std::move(source_path), config, std::move(columns));
}

} // namespace

auto IndexStore::options_from_env(IndexStoreOptions base) -> IndexStoreOptions {
#ifdef BLOOMDB_HAS_ZSTD
  if (auto zl = core::safe_getenv("BLOOMDB_ZSTD_LEVEL")) {
    const int v = std::atoi(zl->c_str());
    if (v >= 0 && v <= 3) base.zstd_level = v;
  }
#endif
  return base;
}

auto IndexStore::encode(const FileIndex& index) const -> std::expected<std::vector<std::uint8_t>, core::error> {
  auto payload = encode_payload(index);
  std::uint16_t flags = 0;
#ifdef BLOOMDB_HAS_ZSTD
  if (options_.zstd_level > 0 && !payload.empty()) {
    ByteWriter w;
    w.put_u64(static_cast<std::uint64_t>(payload.size()));
    auto header = w.take();
    const std::size_t bound = ZSTD_compressBound(payload.size());
    std::vector<std::uint8_t> out(header.size() + bound);
    std::copy(header.begin(), header.end(), out.begin());
    const std::size_t got = ZSTD_compress(out.data() + header.size(), bound, payload.data(), payload.size(),
                                          options_.zstd_level);
    if (ZSTD_isError(got)) {
      return std::unexpected(core::error{core::error_code::store_write,
          std::string("zstd compression failed: ") + ZSTD_getErrorName(got), "storage.index_store"});
    }
    out.resize(header.size() + got);
    payload = std::move(out);
    flags |= INDEX_FLAG_ZSTD;
  }
#endif
  auto frame = codec::encode_frame(INDEX_MAGIC, INDEX_FRAME_TYPE, flags, INDEX_FORMAT_VERSION, payload);
  if (!frame) {
    return std::unexpected(core::error{core::error_code::store_write, frame.error().message, "storage.index_store"});
  }
  return frame;
}

auto IndexStore::decode(std::span<const std::uint8_t> bytes) -> std::expected<FileIndex, core::error> {
  auto frame = codec::decode_frame(bytes, INDEX_MAGIC, INDEX_FORMAT_VERSION,
                                   core::error_code::store_version_mismatch);
  if (!frame) {
    auto e = frame.error();
    if (e.code != core::error_code::store_version_mismatch) e.code = core::error_code::store_read;
    e.component = "storage.index_store";
    return std::unexpected(std::move(e));
  }
  if (frame->header.type != INDEX_FRAME_TYPE) {
    return std::unexpected(corrupt("unexpected frame type " + std::to_string(frame->header.type)));
  }
  if ((frame->header.flags & ~INDEX_FLAG_ZSTD) != 0) {
    return std::unexpected(corrupt("unknown flags"));
  }
  if ((frame->header.flags & INDEX_FLAG_ZSTD) == 0) {
    return decode_payload(frame->payload);
  }
#ifdef BLOOMDB_HAS_ZSTD
  ByteReader r(frame->payload);
  std::uint64_t raw_size{};
  if (!r.get_u64(raw_size)) return std::unexpected(corrupt("compressed size"));
  if (raw_size > kMaxRawPayload) {
    return std::unexpected(corrupt("declared payload size " + std::to_string(raw_size) + " exceeds limit"));
  }
  const auto compressed = frame->payload.subspan(8);
  const unsigned long long content = ZSTD_getFrameContentSize(compressed.data(), compressed.size());
  if (content == ZSTD_CONTENTSIZE_ERROR || content != raw_size) {
    return std::unexpected(corrupt("compressed size mismatch"));
  }
  std::vector<std::uint8_t> raw(static_cast<std::size_t>(raw_size));
  const std::size_t got = ZSTD_decompress(raw.data(), raw.size(), compressed.data(), compressed.size());
  if (ZSTD_isError(got) || got != raw.size()) {
    return std::unexpected(corrupt("zstd decompression failed"));
  }
  return decode_payload(raw);
#else
  return std::unexpected(core::error{core::error_code::store_read,
      "index is zstd-compressed but this build has no zstd support", "storage.index_store"});
#endif
}

auto IndexStore::write(const FileIndex& index, const std::string& destination) const
    -> std::expected<void, core::error> {
  auto bytes = encode(index);
  if (!bytes) return std::unexpected(bytes.error());
  auto backend = open_backend(destination);
  if (!backend) {
    return std::unexpected(core::error{core::error_code::store_write, backend.error().message, "storage.index_store"});
  }
  auto put = (*backend)->put(destination, *bytes);
  if (!put) {
    return std::unexpected(core::error{core::error_code::store_write, put.error().message, "storage.index_store"});
  }
  if (core::debug_enabled()) {
    std::cerr << "[STORE] wrote " << destination << " (" << bytes->size() << " bytes, "
              << index.columns().size() << " columns)" << std::endl;
  }
  return {};
}

auto IndexStore::read(const std::string& location) const -> std::expected<FileIndex, core::error> {
  auto backend = open_backend(location);
  if (!backend) {
    return std::unexpected(core::error{core::error_code::store_read, backend.error().message, "storage.index_store"});
  }
  auto bytes = (*backend)->get(location);
  if (!bytes) {
    return std::unexpected(core::error{core::error_code::store_read, bytes.error().message, "storage.index_store"});
  }
  auto index = decode(*bytes);
  if (!index && index.error().code == core::error_code::store_version_mismatch) {
    std::cerr << "[STORE] " << location << ": " << index.error().message << "; rebuild the index" << std::endl;
  } else if (index && core::debug_enabled()) {
    std::cerr << "[STORE] read " << location << " (" << index->columns().size() << " columns)" << std::endl;
  }
  return index;
}

auto index_location_for(std::string_view source_path, std::string_view index_dir) -> std::string {
  const auto path = split_location(source_path).path;
  auto stem = std::filesystem::path(std::string(path)).stem().string();
  return join_location(index_dir, stem + std::string(INDEX_FILE_EXTENSION));
}

} // namespace bloomdb::storage
