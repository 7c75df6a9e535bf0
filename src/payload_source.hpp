// SPDX-License-Identifier: MIT

// src/payload_source.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "lib/stream/error.hpp"

namespace obj_transport {

/// Readable byte sequence supplying an object's payload to the sender loop.
///
/// Ownership passes to the Stream on Send(); the Stream destroys it after the
/// completion callback has fired.
class PayloadSource {
public:
    virtual ~PayloadSource() = default;

    /// Read up to out.size() bytes. Returns 0 at end of data.
    virtual std::expected<size_t, Error> Read(std::span<std::byte> out) = 0;

    /// Restart from the first byte. Sources that cannot rewind return false;
    /// the reconnect path then reports the request failed instead of resending.
    virtual bool Rewind() { return false; }
};

/// Payload held in memory.
class BytesSource : public PayloadSource {
public:
    explicit BytesSource(std::vector<std::byte> data) : data_(std::move(data)) {}

    std::expected<size_t, Error> Read(std::span<std::byte> out) override;

    bool Rewind() override {
        pos_ = 0;
        return true;
    }

private:
    std::vector<std::byte> data_;
    size_t pos_ = 0;
};

/// Payload read from a file, optionally a section [offset, offset + length).
class FileSource : public PayloadSource {
public:
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    /// Open the whole file.
    static std::expected<std::unique_ptr<FileSource>, Error> Open(const std::string& path);

    /// Open a section of the file.
    static std::expected<std::unique_ptr<FileSource>, Error> Open(const std::string& path,
                                                                  int64_t offset,
                                                                  int64_t length);

    std::expected<size_t, Error> Read(std::span<std::byte> out) override;

    bool Rewind() override;

    int64_t Length() const { return length_; }

private:
    FileSource(int fd, int64_t offset, int64_t length)
        : fd_(fd), offset_(offset), length_(length) {}

    int fd_;
    int64_t offset_;
    int64_t length_;
    int64_t pos_ = 0;
};

}  // namespace obj_transport
