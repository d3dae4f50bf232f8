#pragma once

/** \file frame.hpp
 *  \brief Checksummed frame shared by index files and wire messages.
 *
 * Layout (little-endian): magic u32 | len u32 | type u16 | flags u16 |
 * version u32 | reserved u32 | payload | crc32c u32.
 * len counts the whole frame including header and CRC.
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with bloomdb::core::error.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "bloomdb/error.hpp"

namespace bloomdb::codec {

constexpr std::size_t FRAME_HEADER_SIZE = 4 + 4 + 2 + 2 + 4 + 4; // 20 bytes
constexpr std::size_t FRAME_TRAILER_SIZE = 4;

struct FrameHeader {
  std::uint32_t magic;
  std::uint32_t len;
  std::uint16_t type;
  std::uint16_t flags;
  std::uint32_t version;
};

struct Frame {
  FrameHeader header;
  std::span<const std::uint8_t> payload; // does not own memory
};

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

// Encode a frame; invalid_argument when the payload overflows the 32-bit length
auto encode_frame(std::uint32_t magic, std::uint16_t type, std::uint16_t flags,
                  std::uint32_t version, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

// Parse only the fixed header; used by stream readers to learn the total length
auto decode_header(std::span<const std::uint8_t> bytes, std::uint32_t expected_magic)
    -> std::expected<FrameHeader, core::error>;

// Decode and verify a complete frame. Check order: magic, version, length, CRC,
// so a frame written by another format version reports the version first.
// version_error is the code used for a version mismatch.
auto decode_frame(std::span<const std::uint8_t> bytes, std::uint32_t expected_magic,
                  std::uint32_t expected_version,
                  core::error_code version_error = core::error_code::data_integrity)
    -> std::expected<Frame, core::error>;

} // namespace bloomdb::codec
