// SPDX-License-Identifier: MIT

// src/frame_codec.cpp
#include "src/frame_codec.hpp"

#include <limits>
#include <optional>
#include <string>

#include <fmt/format.h>

#include "lib/stream/byte_buffer.hpp"

namespace obj_transport {

namespace {

constexpr size_t kMaxStringSize = std::numeric_limits<uint16_t>::max();

bool PutString(ByteBuffer& buf, const std::string& s) {
    if (s.size() > kMaxStringSize) return false;
    buf.put_uint16_be(static_cast<uint16_t>(s.size()));
    buf.put_string(s);
    return true;
}

std::optional<std::string> GetString(ByteReader& reader) {
    auto len = reader.get_uint16_be();
    if (!len) return std::nullopt;
    return reader.get_string(*len);
}

Error Malformed(std::string_view what) {
    return Error{ErrorCode::FramingError, fmt::format("malformed frame header: {}", what)};
}

}  // namespace

std::expected<std::vector<std::byte>, Error> EncodeFrameHeader(
    const Header& hdr, uint32_t max_header_size) {
    if (hdr.attrs.size < 0) {
        return std::unexpected(Error{ErrorCode::FramingError,
            fmt::format("negative object size {}", hdr.attrs.size)});
    }

    ByteBuffer buf;
    buf.reserve(kLengthPrefixSize + 64 + hdr.obj_name.size() + hdr.opaque.size());
    buf.put_uint32_be(0);  // patched below
    buf.put_uint8(static_cast<uint8_t>(FrameKind::Object));

    bool ok = PutString(buf, hdr.bucket.name) &&
              PutString(buf, hdr.bucket.provider) &&
              PutString(buf, hdr.bucket.ns) &&
              PutString(buf, hdr.obj_name);
    if (ok) {
        buf.put_int64_be(hdr.attrs.size);
        buf.put_int64_be(hdr.attrs.atime_ns);
        ok = PutString(buf, hdr.attrs.cksum_type) &&
             PutString(buf, hdr.attrs.cksum_value) &&
             PutString(buf, hdr.attrs.version);
    }
    if (!ok) {
        return std::unexpected(Error{ErrorCode::FrameTooLarge,
            "header string field exceeds 65535 bytes"});
    }
    if (hdr.opaque.size() > std::numeric_limits<uint32_t>::max()) {
        return std::unexpected(Error{ErrorCode::FrameTooLarge, "opaque too large"});
    }
    buf.put_uint32_be(static_cast<uint32_t>(hdr.opaque.size()));
    buf.put_bytes(hdr.opaque);

    size_t body_len = buf.size() - kLengthPrefixSize;
    if (body_len > max_header_size) {
        return std::unexpected(Error{ErrorCode::FrameTooLarge,
            fmt::format("header of {} bytes exceeds maximum {}", body_len, max_header_size)});
    }
    buf.patch_uint32_be(0, static_cast<uint32_t>(body_len));
    return buf.release();
}

std::vector<std::byte> EncodeStreamEnd() {
    ByteBuffer buf;
    buf.put_uint32_be(1);
    buf.put_uint8(static_cast<uint8_t>(FrameKind::StreamEnd));
    return buf.release();
}

std::expected<uint32_t, Error> CheckHeaderLength(
    std::span<const std::byte, kLengthPrefixSize> prefix, uint32_t max_header_size) {
    uint32_t len = LoadUint32Be(prefix.data());
    if (len == 0) {
        return std::unexpected(Malformed("zero length prefix"));
    }
    if (len > max_header_size) {
        return std::unexpected(Error{ErrorCode::FrameTooLarge,
            fmt::format("length prefix {} exceeds maximum {}", len, max_header_size)});
    }
    return len;
}

std::expected<DecodedFrame, Error> DecodeHeaderBody(std::span<const std::byte> body) {
    ByteReader reader(body);
    DecodedFrame out;

    auto kind = reader.get_uint8();
    if (!kind) return std::unexpected(Malformed("missing kind"));

    if (*kind == static_cast<uint8_t>(FrameKind::StreamEnd)) {
        if (reader.remaining() != 0) {
            return std::unexpected(Malformed("stream-end frame carries a body"));
        }
        out.kind = FrameKind::StreamEnd;
        out.consumed = body.size();
        return out;
    }
    if (*kind != static_cast<uint8_t>(FrameKind::Object)) {
        return std::unexpected(Malformed(fmt::format("unknown kind {}", *kind)));
    }

    Header& h = out.header;
    auto bucket = GetString(reader);
    auto provider = GetString(reader);
    auto ns = GetString(reader);
    auto obj_name = GetString(reader);
    if (!bucket || !provider || !ns || !obj_name) {
        return std::unexpected(Malformed("truncated object identity"));
    }
    h.bucket = Bucket{std::move(*bucket), std::move(*provider), std::move(*ns)};
    h.obj_name = std::move(*obj_name);

    auto size = reader.get_int64_be();
    auto atime = reader.get_int64_be();
    if (!size || !atime) {
        return std::unexpected(Malformed("truncated attributes"));
    }
    if (*size < 0) {
        return std::unexpected(Malformed(fmt::format("negative object size {}", *size)));
    }
    h.attrs.size = *size;
    h.attrs.atime_ns = *atime;

    auto cksum_type = GetString(reader);
    auto cksum_value = GetString(reader);
    auto version = GetString(reader);
    if (!cksum_type || !cksum_value || !version) {
        return std::unexpected(Malformed("truncated attributes"));
    }
    h.attrs.cksum_type = std::move(*cksum_type);
    h.attrs.cksum_value = std::move(*cksum_value);
    h.attrs.version = std::move(*version);

    auto opaque_len = reader.get_uint32_be();
    if (!opaque_len) return std::unexpected(Malformed("missing opaque length"));
    auto opaque = reader.get_bytes(*opaque_len);
    if (!opaque) return std::unexpected(Malformed("truncated opaque"));
    h.opaque.assign(opaque->begin(), opaque->end());

    if (reader.remaining() != 0) {
        return std::unexpected(Malformed(
            fmt::format("{} trailing bytes in header body", reader.remaining())));
    }
    out.consumed = body.size();
    return out;
}

std::expected<DecodedFrame, Error> DecodeFrameHeader(
    std::span<const std::byte> data, uint32_t max_header_size) {
    if (data.size() < kLengthPrefixSize) {
        return std::unexpected(Error{ErrorCode::FramingError, "truncated length prefix"});
    }
    auto len = CheckHeaderLength(data.first<kLengthPrefixSize>(), max_header_size);
    if (!len) return std::unexpected(len.error());

    if (data.size() - kLengthPrefixSize < *len) {
        return std::unexpected(Error{ErrorCode::FramingError,
            fmt::format("truncated header: need {} bytes, have {}", *len,
                        data.size() - kLengthPrefixSize)});
    }
    auto frame = DecodeHeaderBody(data.subspan(kLengthPrefixSize, *len));
    if (!frame) return frame;
    frame->consumed = kLengthPrefixSize + *len;
    return frame;
}

}  // namespace obj_transport
