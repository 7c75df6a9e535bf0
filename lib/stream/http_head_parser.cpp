// SPDX-License-Identifier: MIT

// lib/stream/http_head_parser.cpp
#include "lib/stream/http_head_parser.hpp"

#include <cctype>

#include <fmt/format.h>

namespace obj_transport {

std::optional<std::string_view> HttpHead::Get(std::string_view name) const {
    for (const auto& [field, value] : headers) {
        if (field.size() != name.size()) continue;
        bool match = true;
        for (size_t i = 0; i < name.size(); ++i) {
            if (field[i] != std::tolower(static_cast<unsigned char>(name[i]))) {
                match = false;
                break;
            }
        }
        if (match) return std::string_view(value);
    }
    return std::nullopt;
}

HttpHeadParser::HttpHeadParser(Kind kind, size_t max_head_size)
    : max_head_size_(max_head_size) {
    llhttp_settings_init(&settings_);
    settings_.on_url = OnUrl;
    settings_.on_header_field = OnHeaderField;
    settings_.on_header_value = OnHeaderValue;
    settings_.on_headers_complete = OnHeadersComplete;

    llhttp_init(&parser_, kind == Kind::Request ? HTTP_REQUEST : HTTP_RESPONSE, &settings_);
    parser_.data = this;
}

std::expected<size_t, Error> HttpHeadParser::Feed(std::span<const std::byte> data) {
    if (complete_ || data.empty()) {
        return 0;
    }
    const char* begin = reinterpret_cast<const char*>(data.data());

    llhttp_errno_t err = llhttp_execute(&parser_, begin, data.size());

    size_t used = data.size();
    if (err == HPE_PAUSED) {
        used = static_cast<size_t>(llhttp_get_error_pos(&parser_) - begin);
    } else if (err != HPE_OK) {
        return std::unexpected(Error{ErrorCode::ProtocolError,
            fmt::format("malformed HTTP head: {} ({})", llhttp_errno_name(err),
                        llhttp_get_error_reason(&parser_))});
    }

    consumed_ += used;
    if (consumed_ > max_head_size_) {
        return std::unexpected(Error{ErrorCode::BufferOverflow,
            fmt::format("HTTP head exceeds {} bytes", max_head_size_)});
    }
    return used;
}

void HttpHeadParser::ProcessHeader() {
    if (!current_header_field_.empty()) {
        head_.headers.emplace_back(std::move(current_header_field_),
                                   std::move(current_header_value_));
    }
    current_header_field_.clear();
    current_header_value_.clear();
}

int HttpHeadParser::OnUrl(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpHeadParser*>(parser->data);
    self->head_.url.append(at, len);
    return 0;
}

int HttpHeadParser::OnHeaderField(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpHeadParser*>(parser->data);
    if (self->header_state_ == HeaderState::Value) {
        self->ProcessHeader();
    }
    self->header_state_ = HeaderState::Field;
    for (size_t i = 0; i < len; ++i) {
        self->current_header_field_ +=
            static_cast<char>(std::tolower(static_cast<unsigned char>(at[i])));
    }
    return 0;
}

int HttpHeadParser::OnHeaderValue(llhttp_t* parser, const char* at, size_t len) {
    auto* self = static_cast<HttpHeadParser*>(parser->data);
    self->header_state_ = HeaderState::Value;
    self->current_header_value_.append(at, len);
    return 0;
}

int HttpHeadParser::OnHeadersComplete(llhttp_t* parser) {
    auto* self = static_cast<HttpHeadParser*>(parser->data);
    if (self->header_state_ == HeaderState::Value) {
        self->ProcessHeader();
    }
    self->header_state_ = HeaderState::None;
    if (parser->type == HTTP_REQUEST) {
        self->head_.method = llhttp_method_name(static_cast<llhttp_method_t>(parser->method));
    } else {
        self->head_.status = parser->status_code;
    }
    self->complete_ = true;
    // Stop here: the bytes that follow are not HTTP
    return HPE_PAUSED;
}

}  // namespace obj_transport
