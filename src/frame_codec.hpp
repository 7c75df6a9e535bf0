// SPDX-License-Identifier: MIT

// src/frame_codec.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "lib/stream/error.hpp"
#include "src/header.hpp"

namespace obj_transport {

// Frame layout on the wire:
//
//   [u32 BE header length][header body][payload: attrs.size bytes]
//
// Header body:
//   u8 kind | str bucket | str provider | str ns | str obj_name |
//   i64 size | i64 atime_ns | str cksum_type | str cksum_value | str version |
//   u32 opaque_len | opaque bytes
//
// where str is u16 BE length + bytes. The length prefix alone determines
// where the payload starts; attrs.size determines where the next frame starts.

enum class FrameKind : uint8_t {
    Object = 0,     ///< Header (+ payload when size > 0), delivered to the handler
    StreamEnd = 1,  ///< Sender finished; receiver acknowledges and closes
};

inline constexpr size_t kLengthPrefixSize = 4;
inline constexpr uint32_t kDefaultMaxHeaderSize = 64 * 1024;

struct DecodedFrame {
    FrameKind kind = FrameKind::Object;
    Header header;
    size_t consumed = 0;  ///< Prefix + header body; payload not included
};

/// Encode a length-prefixed object header.
/// Fails with FrameTooLarge if the body exceeds max_header_size or a string
/// field exceeds 64 KiB, and with FramingError on a negative size.
std::expected<std::vector<std::byte>, Error> EncodeFrameHeader(
    const Header& hdr, uint32_t max_header_size = kDefaultMaxHeaderSize);

/// Encode the reserved stream-end control frame.
std::vector<std::byte> EncodeStreamEnd();

/// Decode one length-prefixed header from the front of `data`.
/// A truncated buffer is a framing error: callers that read incrementally
/// use CheckHeaderLength() on the prefix and wait for a complete unit first.
std::expected<DecodedFrame, Error> DecodeFrameHeader(
    std::span<const std::byte> data, uint32_t max_header_size = kDefaultMaxHeaderSize);

/// Validate a 4-byte length prefix and return the header body length.
std::expected<uint32_t, Error> CheckHeaderLength(
    std::span<const std::byte, kLengthPrefixSize> prefix, uint32_t max_header_size);

/// Decode a header body (no prefix). The whole span must be consumed.
std::expected<DecodedFrame, Error> DecodeHeaderBody(std::span<const std::byte> body);

}  // namespace obj_transport
