// SPDX-License-Identifier: MIT

// lib/stream/http_head_parser.hpp
#pragma once

#include <llhttp.h>

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"

namespace obj_transport {

/// Parsed HTTP/1.1 request or response head. Header names are lowercased.
struct HttpHead {
    std::string method;   ///< Requests only
    std::string url;      ///< Requests only
    int status = 0;       ///< Responses only
    std::vector<std::pair<std::string, std::string>> headers;

    std::optional<std::string_view> Get(std::string_view name) const;
};

// HttpHeadParser - incremental llhttp parser that stops at the end of the
// head.
//
// Bytes after the blank line belong to the caller (the frame stream on a
// connection, nothing on a response), so the parser pauses in
// on_headers_complete and reports how much of the last chunk it consumed.
//
// Not copyable or movable: llhttp keeps a pointer back to this object.
class HttpHeadParser {
public:
    enum class Kind { Request, Response };

    explicit HttpHeadParser(Kind kind, size_t max_head_size = 8 * 1024);

    HttpHeadParser(const HttpHeadParser&) = delete;
    HttpHeadParser& operator=(const HttpHeadParser&) = delete;
    HttpHeadParser(HttpHeadParser&&) = delete;
    HttpHeadParser& operator=(HttpHeadParser&&) = delete;

    /// Feed the next chunk. Returns the number of bytes consumed: all of
    /// `data` while the head is incomplete, the head's tail once complete.
    std::expected<size_t, Error> Feed(std::span<const std::byte> data);

    bool IsComplete() const { return complete_; }

    const HttpHead& Head() const { return head_; }

private:
    static int OnUrl(llhttp_t* parser, const char* at, size_t len);
    static int OnHeaderField(llhttp_t* parser, const char* at, size_t len);
    static int OnHeaderValue(llhttp_t* parser, const char* at, size_t len);
    static int OnHeadersComplete(llhttp_t* parser);

    // Flush the accumulated field/value pair into head_
    void ProcessHeader();

    llhttp_t parser_;
    llhttp_settings_t settings_;

    // llhttp may split a field or value across callbacks
    enum class HeaderState { None, Field, Value };
    HeaderState header_state_ = HeaderState::None;
    std::string current_header_field_;
    std::string current_header_value_;

    HttpHead head_;
    size_t max_head_size_;
    size_t consumed_ = 0;
    bool complete_ = false;
};

}  // namespace obj_transport
