// SPDX-License-Identifier: MIT

// src/header.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <fmt/format.h>

namespace obj_transport {

/// Bucket identity: name plus the backend provider and namespace it lives in.
struct Bucket {
    std::string name;
    std::string provider;   ///< e.g. "ais", "aws"; empty means default
    std::string ns;         ///< namespace, empty means global

    bool operator==(const Bucket&) const = default;
};

/// Object attributes carried with every frame.
struct ObjAttrs {
    int64_t size = 0;            ///< Payload bytes that follow the header; 0 = header-only
    int64_t atime_ns = 0;        ///< Last access time, nanoseconds since epoch
    std::string cksum_type;      ///< e.g. "xxhash", empty when not computed
    std::string cksum_value;
    std::string version;

    bool operator==(const ObjAttrs&) const = default;
};

/// Per-object metadata header.
///
/// A Header with attrs.size == 0 is a header-only unit used for control and
/// heartbeat signaling. `opaque` is caller-defined and never interpreted by
/// the transport.
struct Header {
    Bucket bucket;
    std::string obj_name;
    ObjAttrs attrs;
    std::vector<std::byte> opaque;

    bool IsHeaderOnly() const { return attrs.size == 0; }

    bool operator==(const Header&) const = default;
};

}  // namespace obj_transport

template <>
struct fmt::formatter<obj_transport::Header> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const obj_transport::Header& h, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}/{}[{}]", h.bucket.name, h.obj_name,
                              h.attrs.size);
    }
};
