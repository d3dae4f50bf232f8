#include "bloomdb/codec/frame.hpp"

#include <array>
#include <cstring>
#include <limits>
#include <string>

namespace bloomdb::codec {

// Reflected CRC-32C (Castagnoli) table using reversed polynomial 0x82F63B78
static constexpr std::array<std::uint32_t, 256> CRC32C_TABLE = []{
  std::array<std::uint32_t, 256> t{};
  const std::uint32_t poly = 0x82F63B78u;
  for (std::uint32_t i = 0; i < 256; ++i) {
    std::uint32_t c = i;
    for (int k = 0; k < 8; ++k) {
      c = (c & 1u) ? (poly ^ (c >> 1)) : (c >> 1);
    }
    t[i] = c;
  }
  return t;
}();

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t c = ~0u;
  for (auto b : bytes) {
    c = CRC32C_TABLE[(c ^ b) & 0xFFu] ^ (c >> 8);
  }
  return ~c;
}

static auto load_le32(const std::uint8_t* p) -> std::uint32_t {
  return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
         (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}
static auto load_le16(const std::uint8_t* p) -> std::uint16_t {
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

auto encode_frame(std::uint32_t magic, std::uint16_t type, std::uint16_t flags,
                  std::uint32_t version, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error; using core::error_code;
  const std::size_t max_payload = std::numeric_limits<std::uint32_t>::max() - FRAME_HEADER_SIZE - FRAME_TRAILER_SIZE;
  if (payload.size() > max_payload) {
    return std::unexpected(error{error_code::invalid_argument, "payload too large", "codec.frame"});
  }
  const auto len = static_cast<std::uint32_t>(FRAME_HEADER_SIZE + payload.size() + FRAME_TRAILER_SIZE);
  std::vector<std::uint8_t> out(len);
  std::uint8_t* p = out.data();
  auto store_le32 = [&](std::uint32_t v){ for (int i = 0; i < 4; ++i) *p++ = static_cast<std::uint8_t>(v >> (8 * i)); };
  auto store_le16 = [&](std::uint16_t v){ *p++ = static_cast<std::uint8_t>(v); *p++ = static_cast<std::uint8_t>(v >> 8); };

  store_le32(magic);
  store_le32(len);
  store_le16(type);
  store_le16(flags);
  store_le32(version);
  store_le32(0);
  if (!payload.empty()) { std::memcpy(p, payload.data(), payload.size()); p += payload.size(); }
  store_le32(crc32c({out.data(), out.size() - FRAME_TRAILER_SIZE}));
  return out;
}

auto decode_header(std::span<const std::uint8_t> bytes, std::uint32_t expected_magic)
    -> std::expected<FrameHeader, core::error> {
  using core::error; using core::error_code;
  if (bytes.size() < FRAME_HEADER_SIZE) {
    return std::unexpected(error{error_code::data_integrity, "frame too short", "codec.frame"});
  }
  const std::uint8_t* p = bytes.data();
  FrameHeader h{};
  h.magic = load_le32(p);
  h.len = load_le32(p + 4);
  h.type = load_le16(p + 8);
  h.flags = load_le16(p + 10);
  h.version = load_le32(p + 12);
  const std::uint32_t reserved = load_le32(p + 16);
  if (h.magic != expected_magic) {
    return std::unexpected(error{error_code::data_integrity, "bad magic", "codec.frame"});
  }
  if (h.len < FRAME_HEADER_SIZE + FRAME_TRAILER_SIZE) {
    return std::unexpected(error{error_code::data_integrity, "len too small", "codec.frame"});
  }
  if (reserved != 0) {
    return std::unexpected(error{error_code::data_integrity, "reserved != 0", "codec.frame"});
  }
  return h;
}

auto decode_frame(std::span<const std::uint8_t> bytes, std::uint32_t expected_magic,
                  std::uint32_t expected_version, core::error_code version_error)
    -> std::expected<Frame, core::error> {
  using core::error; using core::error_code;
  auto h = decode_header(bytes, expected_magic);
  if (!h) return std::unexpected(h.error());
  if (h->version != expected_version) {
    return std::unexpected(error{version_error,
        "format version " + std::to_string(h->version) + ", expected " + std::to_string(expected_version),
        "codec.frame"});
  }
  if (h->len != bytes.size()) {
    return std::unexpected(error{error_code::data_integrity, "len mismatch", "codec.frame"});
  }
  const std::size_t n = bytes.size();
  const std::uint32_t expect = load_le32(bytes.data() + n - FRAME_TRAILER_SIZE);
  if (crc32c(bytes.first(n - FRAME_TRAILER_SIZE)) != expect) {
    return std::unexpected(error{error_code::data_integrity, "crc mismatch", "codec.frame"});
  }
  const std::size_t payload_len = n - FRAME_HEADER_SIZE - FRAME_TRAILER_SIZE;
  return Frame{*h, bytes.subspan(FRAME_HEADER_SIZE, payload_len)};
}

} // namespace bloomdb::codec
