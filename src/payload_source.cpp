// SPDX-License-Identifier: MIT

// src/payload_source.cpp
#include "src/payload_source.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>

namespace obj_transport {

std::expected<size_t, Error> BytesSource::Read(std::span<std::byte> out) {
    size_t n = std::min(out.size(), data_.size() - pos_);
    std::memcpy(out.data(), data_.data() + pos_, n);
    pos_ += n;
    return n;
}

FileSource::~FileSource() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

std::expected<std::unique_ptr<FileSource>, Error> FileSource::Open(const std::string& path) {
    return Open(path, 0, -1);
}

std::expected<std::unique_ptr<FileSource>, Error> FileSource::Open(const std::string& path,
                                                                   int64_t offset,
                                                                   int64_t length) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return std::unexpected(Error{ErrorCode::PayloadReadFailed,
            fmt::format("open '{}' failed", path), errno});
    }

    struct stat st{};
    if (::fstat(fd, &st) < 0) {
        auto err = errno;
        ::close(fd);
        return std::unexpected(Error{ErrorCode::PayloadReadFailed,
            fmt::format("stat '{}' failed", path), err});
    }

    int64_t file_size = static_cast<int64_t>(st.st_size);
    if (offset < 0 || offset > file_size) {
        ::close(fd);
        return std::unexpected(Error{ErrorCode::PayloadReadFailed,
            fmt::format("offset {} outside '{}' ({} bytes)", offset, path, file_size)});
    }
    if (length < 0) {
        length = file_size - offset;
    }
    if (offset + length > file_size) {
        ::close(fd);
        return std::unexpected(Error{ErrorCode::PayloadReadFailed,
            fmt::format("section [{}, +{}) outside '{}' ({} bytes)", offset, length, path,
                        file_size)});
    }

    return std::unique_ptr<FileSource>(new FileSource(fd, offset, length));
}

std::expected<size_t, Error> FileSource::Read(std::span<std::byte> out) {
    int64_t left = length_ - pos_;
    if (left <= 0 || out.empty()) {
        return 0;
    }
    size_t want = std::min(out.size(), static_cast<size_t>(left));
    for (;;) {
        ssize_t n = ::pread(fd_, out.data(), want, offset_ + pos_);
        if (n >= 0) {
            pos_ += n;
            return static_cast<size_t>(n);
        }
        if (errno != EINTR) {
            return std::unexpected(Error{ErrorCode::PayloadReadFailed, "pread() failed", errno});
        }
    }
}

bool FileSource::Rewind() {
    pos_ = 0;
    return true;
}

}  // namespace obj_transport
