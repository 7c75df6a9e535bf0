// SPDX-License-Identifier: MIT

// lib/stream/byte_buffer.cpp
#include "lib/stream/byte_buffer.hpp"

#include <cassert>

namespace obj_transport {

void ByteBuffer::put_uint8(uint8_t val) {
    data_.push_back(static_cast<std::byte>(val));
}

void ByteBuffer::put_uint16_be(uint16_t val) {
    data_.push_back(static_cast<std::byte>(val >> 8));
    data_.push_back(static_cast<std::byte>(val));
}

void ByteBuffer::put_uint32_be(uint32_t val) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        data_.push_back(static_cast<std::byte>(val >> shift));
    }
}

void ByteBuffer::put_int64_be(int64_t val) {
    auto u = static_cast<uint64_t>(val);
    for (int shift = 56; shift >= 0; shift -= 8) {
        data_.push_back(static_cast<std::byte>(u >> shift));
    }
}

void ByteBuffer::put_byte(std::byte b) {
    data_.push_back(b);
}

void ByteBuffer::put_bytes(std::span<const std::byte> data) {
    data_.insert(data_.end(), data.begin(), data.end());
}

void ByteBuffer::patch_uint32_be(size_t pos, uint32_t val) {
    assert(pos + 4 <= data_.size() && "patch_uint32_be: out of bounds");
    data_[pos] = static_cast<std::byte>(val >> 24);
    data_[pos + 1] = static_cast<std::byte>(val >> 16);
    data_[pos + 2] = static_cast<std::byte>(val >> 8);
    data_[pos + 3] = static_cast<std::byte>(val);
}

std::optional<uint8_t> ByteReader::get_uint8() {
    if (remaining() < 1) return std::nullopt;
    return static_cast<uint8_t>(data_[pos_++]);
}

std::optional<uint16_t> ByteReader::get_uint16_be() {
    if (remaining() < 2) return std::nullopt;
    uint16_t val = static_cast<uint16_t>(
        (static_cast<uint16_t>(data_[pos_]) << 8) |
        static_cast<uint16_t>(data_[pos_ + 1]));
    pos_ += 2;
    return val;
}

std::optional<uint32_t> ByteReader::get_uint32_be() {
    if (remaining() < 4) return std::nullopt;
    uint32_t val = LoadUint32Be(data_.data() + pos_);
    pos_ += 4;
    return val;
}

std::optional<int64_t> ByteReader::get_int64_be() {
    if (remaining() < 8) return std::nullopt;
    uint64_t val = 0;
    for (size_t i = 0; i < 8; ++i) {
        val = (val << 8) | static_cast<uint64_t>(data_[pos_ + i]);
    }
    pos_ += 8;
    return static_cast<int64_t>(val);
}

std::optional<std::span<const std::byte>> ByteReader::get_bytes(size_t n) {
    if (remaining() < n) return std::nullopt;
    auto out = data_.subspan(pos_, n);
    pos_ += n;
    return out;
}

std::optional<std::string> ByteReader::get_string(size_t n) {
    auto bytes = get_bytes(n);
    if (!bytes) return std::nullopt;
    return std::string(reinterpret_cast<const char*>(bytes->data()), bytes->size());
}

}  // namespace obj_transport
