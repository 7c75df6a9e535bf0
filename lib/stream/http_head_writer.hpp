// SPDX-License-Identifier: MIT

// lib/stream/http_head_writer.hpp
#pragma once

#include <concepts>
#include <iterator>
#include <string_view>

#include <fmt/format.h>

namespace obj_transport {

// HttpHeadWriter - formats an HTTP/1.1 request or response head into an
// output iterator of char.
//
//   std::string out;
//   HttpHeadWriter(std::back_inserter(out))
//       .RequestLine("PUT", "/v1/intra/mirror")
//       .Field("Host", "node-2:8081")
//       .Field("X-Obj-Session-Id", 1)
//       .End();
//
// Exactly one start line, then any number of fields, then End().
template<typename OutputIt>
class HttpHeadWriter {
public:
    explicit HttpHeadWriter(OutputIt out) : out_(out) {}

    HttpHeadWriter& RequestLine(std::string_view method, std::string_view target) {
        out_ = fmt::format_to(out_, "{} {} HTTP/1.1\r\n", method, target);
        return *this;
    }

    HttpHeadWriter& StatusLine(int status, std::string_view reason) {
        out_ = fmt::format_to(out_, "HTTP/1.1 {} {}\r\n", status, reason);
        return *this;
    }

    HttpHeadWriter& Field(std::string_view name, std::string_view value) {
        out_ = fmt::format_to(out_, "{}: {}\r\n", name, value);
        return *this;
    }

    template<typename T>
        requires std::integral<T>
    HttpHeadWriter& Field(std::string_view name, T value) {
        out_ = fmt::format_to(out_, "{}: {}\r\n", name, value);
        return *this;
    }

    // Blank line closing the head; returns the advanced iterator
    OutputIt End() {
        out_ = fmt::format_to(out_, "\r\n");
        return out_;
    }

private:
    OutputIt out_;
};

template<typename OutputIt>
HttpHeadWriter(OutputIt) -> HttpHeadWriter<OutputIt>;

}  // namespace obj_transport
