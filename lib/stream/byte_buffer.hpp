// SPDX-License-Identifier: MIT

// lib/stream/byte_buffer.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace obj_transport {

// Growable byte buffer with big-endian (network order) writers.
class ByteBuffer {
public:
    void put_uint8(uint8_t val);
    void put_uint16_be(uint16_t val);
    void put_uint32_be(uint32_t val);
    void put_int64_be(int64_t val);
    void put_byte(std::byte b);
    void put_bytes(std::span<const std::byte> data);
    void put_string(std::string_view s) {
        put_bytes(std::as_bytes(std::span{s.data(), s.size()}));
    }

    // Overwrite 4 bytes at pos (used to back-patch length prefixes).
    void patch_uint32_be(size_t pos, uint32_t val);

    std::span<const std::byte> view() const { return data_; }
    std::vector<std::byte> release() { return std::move(data_); }
    void clear() { data_.clear(); }
    void reserve(size_t n) { data_.reserve(n); }
    size_t size() const { return data_.size(); }

private:
    std::vector<std::byte> data_;
};

// Bounds-checked big-endian reader over a byte span.
// Every getter returns nullopt once the input is exhausted; the reader
// does not advance on a failed read.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::byte> data) : data_(data) {}

    std::optional<uint8_t> get_uint8();
    std::optional<uint16_t> get_uint16_be();
    std::optional<uint32_t> get_uint32_be();
    std::optional<int64_t> get_int64_be();
    std::optional<std::span<const std::byte>> get_bytes(size_t n);
    std::optional<std::string> get_string(size_t n);

    size_t position() const { return pos_; }
    size_t remaining() const { return data_.size() - pos_; }

private:
    std::span<const std::byte> data_;
    size_t pos_ = 0;
};

// Read a big-endian u32 from the first 4 bytes of p.
inline uint32_t LoadUint32Be(const std::byte* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

}  // namespace obj_transport
