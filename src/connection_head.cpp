// SPDX-License-Identifier: MIT

// src/connection_head.cpp
#include "src/connection_head.hpp"

#include <charconv>
#include <iterator>
#include <optional>

#include <fmt/format.h>

#include "lib/stream/http_head_writer.hpp"

namespace obj_transport {

namespace {

template <typename T>
std::optional<T> ParseNumber(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::string_view ReasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

}  // namespace

std::string RoutePath(std::string_view network, std::string_view trname) {
    return fmt::format("/{}/{}/{}", kApiVersion, network, trname);
}

std::string BuildRequestHead(const ConnectionHead& head) {
    std::string out;
    HttpHeadWriter(std::back_inserter(out))
        .RequestLine("PUT", head.path)
        .Field("Host", head.host)
        .Field(kHeaderStreamId, head.stream_id)
        .Field(kHeaderSessionId, head.session_id)
        .Field(kHeaderCompress, head.compress == CompressMode::Zstd ? "zstd" : "none")
        .Field(kHeaderBlockSize, head.block_size)
        .End();
    return out;
}

std::expected<ConnectionHead, Error> ParseRequestHead(const HttpHead& http) {
    auto bad = [](std::string msg) {
        return std::unexpected(Error{ErrorCode::ProtocolError, std::move(msg)});
    };

    if (http.method != "PUT") {
        return bad(fmt::format("unexpected method '{}'", http.method));
    }

    ConnectionHead head;
    head.path = http.url;
    if (auto host = http.Get("host")) {
        head.host = std::string(*host);
    }

    auto stream_id = http.Get(kHeaderStreamId);
    auto session_id = http.Get(kHeaderSessionId);
    if (!stream_id || !session_id) {
        return bad("missing stream or session identifier");
    }
    auto sid = ParseNumber<uint64_t>(*stream_id);
    auto sess = ParseNumber<uint64_t>(*session_id);
    if (!sid || !sess) {
        return bad("non-numeric stream or session identifier");
    }
    head.stream_id = *sid;
    head.session_id = *sess;

    auto compress = http.Get(kHeaderCompress).value_or("none");
    if (compress == "none") {
        head.compress = CompressMode::None;
    } else if (compress == "zstd") {
        head.compress = CompressMode::Zstd;
        auto block = http.Get(kHeaderBlockSize);
        auto size = block ? ParseNumber<uint32_t>(*block) : std::nullopt;
        if (!size || *size == 0) {
            return bad("compressed stream without a valid block size");
        }
        head.block_size = *size;
    } else {
        return bad(fmt::format("unknown compression '{}'", compress));
    }
    return head;
}

std::string BuildResponse(int status) {
    std::string out;
    HttpHeadWriter(std::back_inserter(out))
        .StatusLine(status, ReasonPhrase(status))
        .Field("Content-Length", 0)
        .Field("Connection", "close")
        .End();
    return out;
}

std::expected<void, Error> StatusToResult(int status) {
    if (status == 200) {
        return {};
    }
    if (status == 404) {
        return std::unexpected(Error{ErrorCode::RouteNotFound, "receiver has no such route"});
    }
    return std::unexpected(Error{ErrorCode::ProtocolError,
        fmt::format("receiver answered HTTP {}", status)});
}

}  // namespace obj_transport
