#pragma once

/** \file byte_io.hpp
 *  \brief Little-endian primitive writer/reader for serialized payloads.
 *
 * ByteReader never reads past its span; every get_* returns false once the
 * input is exhausted, leaving the output untouched.
 */

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace bloomdb::codec {

class ByteWriter {
public:
    auto put_u8(std::uint8_t v) -> void { buf_.push_back(v); }
    auto put_u32(std::uint32_t v) -> void { put_le(v, 4); }
    auto put_u64(std::uint64_t v) -> void { put_le(v, 8); }
    auto put_i64(std::int64_t v) -> void { put_le(static_cast<std::uint64_t>(v), 8); }
    auto put_f64(double v) -> void {
        std::uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        put_le(bits, 8);
    }
    auto put_string(const std::string& s) -> void {
        put_u64(static_cast<std::uint64_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }

    [[nodiscard]] auto bytes() const noexcept -> const std::vector<std::uint8_t>& { return buf_; }
    [[nodiscard]] auto take() noexcept -> std::vector<std::uint8_t> { return std::move(buf_); }

private:
    auto put_le(std::uint64_t v, int n) -> void {
        for (int i = 0; i < n; ++i) buf_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
    }

    std::vector<std::uint8_t> buf_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> bytes) noexcept : bytes_(bytes) {}

    auto get_u8(std::uint8_t& out) noexcept -> bool {
        if (remaining() < 1) return false;
        out = bytes_[pos_++];
        return true;
    }
    auto get_u32(std::uint32_t& out) noexcept -> bool {
        std::uint64_t v;
        if (!get_le(v, 4)) return false;
        out = static_cast<std::uint32_t>(v);
        return true;
    }
    auto get_u64(std::uint64_t& out) noexcept -> bool { return get_le(out, 8); }
    auto get_i64(std::int64_t& out) noexcept -> bool {
        std::uint64_t v;
        if (!get_le(v, 8)) return false;
        out = static_cast<std::int64_t>(v);
        return true;
    }
    auto get_f64(double& out) noexcept -> bool {
        std::uint64_t bits;
        if (!get_le(bits, 8)) return false;
        std::memcpy(&out, &bits, sizeof(out));
        return true;
    }
    auto get_string(std::string& out) -> bool {
        std::uint64_t n;
        if (!get_u64(n) || n > remaining()) return false;
        out.assign(reinterpret_cast<const char*>(bytes_.data() + pos_), static_cast<std::size_t>(n));
        pos_ += static_cast<std::size_t>(n);
        return true;
    }

    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return bytes_.size() - pos_; }
    [[nodiscard]] auto exhausted() const noexcept -> bool { return pos_ == bytes_.size(); }

private:
    auto get_le(std::uint64_t& out, int n) noexcept -> bool {
        if (remaining() < static_cast<std::size_t>(n)) return false;
        std::uint64_t v = 0;
        for (int i = 0; i < n; ++i) v |= static_cast<std::uint64_t>(bytes_[pos_ + i]) << (8 * i);
        pos_ += static_cast<std::size_t>(n);
        out = v;
        return true;
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t pos_{0};
};

} // namespace bloomdb::codec
