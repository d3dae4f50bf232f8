#pragma once

/** \file index_store.hpp
 *  \brief Persist FileIndex objects to locations on any storage backend.
 *
 * Format: one codec frame with magic "BDXI", type 1 and format version
 * INDEX_FORMAT_VERSION. Flag bit 0 marks a zstd-compressed payload (requires a
 * build with BLOOMDB_HAS_ZSTD to read). Payload fields, little-endian:
 *   source_path str | error_rate f64 | threshold u64 | columns u32 |
 *   per column: name str | kind u8 | body
 *   membership body: num_bits u64 | num_hashes u32 | inserted u64 | words u64[num_bits/64]
 *   range body: min value | max value
 *   value: tag u8 (0 bool, 1 int, 2 double, 3 string) | data
 *
 * Errors: write() reports store_write, read() reports store_read or
 * store_version_mismatch. Neither retries.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "bloomdb/error.hpp"
#include "bloomdb/file_index.hpp"

namespace bloomdb::storage {

constexpr std::uint32_t INDEX_MAGIC = 0x49584442u; // "BDXI"
constexpr std::uint32_t INDEX_FORMAT_VERSION = 1;
constexpr std::uint16_t INDEX_FRAME_TYPE = 1;
constexpr std::uint16_t INDEX_FLAG_ZSTD = 0x1;
constexpr std::string_view INDEX_FILE_EXTENSION = ".bdx";

struct IndexStoreOptions {
    int zstd_level{0}; /**< 0 = uncompressed; 1..3 when built with zstd */
};

class IndexStore {
public:
    IndexStore() = default;
    explicit IndexStore(IndexStoreOptions options) : options_(options) {}

    /** \brief Options with BLOOMDB_ZSTD_LEVEL applied on top of base. */
    static auto options_from_env(IndexStoreOptions base = {}) -> IndexStoreOptions;

    /** \brief Serialize and store, replacing any previous content at destination. */
    auto write(const FileIndex& index, const std::string& destination) const
        -> std::expected<void, core::error>;

    /** \brief Load and deserialize the index stored at location. */
    auto read(const std::string& location) const -> std::expected<FileIndex, core::error>;

    /** \brief In-memory encoding used by write(). */
    auto encode(const FileIndex& index) const -> std::expected<std::vector<std::uint8_t>, core::error>;

    /** \brief In-memory decoding used by read(). */
    static auto decode(std::span<const std::uint8_t> bytes) -> std::expected<FileIndex, core::error>;

    [[nodiscard]] auto options() const noexcept -> const IndexStoreOptions& { return options_; }

private:
    IndexStoreOptions options_{};
};

/** \brief Deterministic index location for a source file: <index_dir>/<stem>.bdx */
auto index_location_for(std::string_view source_path, std::string_view index_dir) -> std::string;

} // namespace bloomdb::storage
