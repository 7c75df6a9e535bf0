// SPDX-License-Identifier: MIT

// src/compression.cpp
#include "src/compression.hpp"

#include <array>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "lib/stream/byte_buffer.hpp"

namespace obj_transport {

namespace {

void PutBlockHeader(std::byte* p, uint32_t stored_len, uint32_t raw_len, BlockCodec codec) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<std::byte>(stored_len >> (24 - 8 * i));
        p[4 + i] = static_cast<std::byte>(raw_len >> (24 - 8 * i));
    }
    p[8] = static_cast<std::byte>(codec);
}

}  // namespace

// BlockCompressor

BlockCompressor::BlockCompressor(const CompressionConfig& config)
    : config_(config), cctx_(ZSTD_createCCtx()) {
    if (!cctx_) {
        throw std::runtime_error("Failed to create ZSTD_CCtx");
    }
    size_t r = ZSTD_CCtx_setParameter(cctx_.get(), ZSTD_c_compressionLevel, config_.level);
    if (ZSTD_isError(r)) {
        throw std::runtime_error(
            std::string("Failed to set zstd compression level: ") + ZSTD_getErrorName(r));
    }
    pending_.reserve(config_.max_block_size);
    out_.resize(kBlockHeaderSize + ZSTD_compressBound(config_.max_block_size));
}

std::expected<std::span<const std::byte>, Error> BlockCompressor::EncodeBlock(
    std::span<const std::byte> raw) {
    if (raw.size() > config_.max_block_size) {
        return std::unexpected(Error{ErrorCode::CompressionError,
            fmt::format("block of {} bytes exceeds maximum {}", raw.size(),
                        config_.max_block_size)});
    }

    size_t n = ZSTD_compress2(cctx_.get(),
                              out_.data() + kBlockHeaderSize, out_.size() - kBlockHeaderSize,
                              raw.data(), raw.size());
    if (ZSTD_isError(n)) {
        return std::unexpected(Error{ErrorCode::CompressionError,
            std::string("zstd compression failed: ") + ZSTD_getErrorName(n)});
    }

    auto raw_len = static_cast<uint32_t>(raw.size());
    if (n >= raw.size()) {
        // Incompressible: store as-is so a block never grows past raw + header
        std::copy(raw.begin(), raw.end(), out_.begin() + kBlockHeaderSize);
        PutBlockHeader(out_.data(), raw_len, raw_len, BlockCodec::Stored);
        return std::span<const std::byte>(out_.data(), kBlockHeaderSize + raw.size());
    }
    PutBlockHeader(out_.data(), static_cast<uint32_t>(n), raw_len, BlockCodec::Zstd);
    return std::span<const std::byte>(out_.data(), kBlockHeaderSize + n);
}

// BlockDecompressor

BlockDecompressor::BlockDecompressor(uint32_t max_block_size)
    : max_block_size_(max_block_size), dctx_(ZSTD_createDCtx()) {
    if (!dctx_) {
        throw std::runtime_error("Failed to create ZSTD_DCtx");
    }
}

std::expected<void, Error> BlockDecompressor::DecodeBlock(
    BlockCodec codec, std::span<const std::byte> stored, uint32_t raw_len,
    std::vector<std::byte>& out) {
    if (raw_len > max_block_size_) {
        return std::unexpected(Error{ErrorCode::DecompressionError,
            fmt::format("block raw length {} exceeds maximum {}", raw_len, max_block_size_)});
    }

    switch (codec) {
        case BlockCodec::Stored:
            if (stored.size() != raw_len) {
                return std::unexpected(Error{ErrorCode::DecompressionError,
                    "stored block length mismatch"});
            }
            out.assign(stored.begin(), stored.end());
            return {};
        case BlockCodec::Zstd: {
            out.resize(raw_len);
            size_t n = ZSTD_decompressDCtx(dctx_.get(), out.data(), out.size(),
                                           stored.data(), stored.size());
            if (ZSTD_isError(n)) {
                return std::unexpected(Error{ErrorCode::DecompressionError,
                    std::string("zstd decompression failed: ") + ZSTD_getErrorName(n)});
            }
            if (n != raw_len) {
                return std::unexpected(Error{ErrorCode::DecompressionError,
                    fmt::format("block decompressed to {} bytes, expected {}", n, raw_len)});
            }
            return {};
        }
    }
    return std::unexpected(Error{ErrorCode::DecompressionError,
        fmt::format("unknown block codec {}", static_cast<int>(codec))});
}

std::expected<void, Error> BlockDecompressor::Process(BufferChain& in, BufferChain& out) {
    std::array<std::byte, kBlockHeaderSize> hdr{};
    while (in.Size() >= kBlockHeaderSize) {
        in.CopyTo(0, kBlockHeaderSize, hdr.data());
        uint32_t stored_len = LoadUint32Be(hdr.data());
        uint32_t raw_len = LoadUint32Be(hdr.data() + 4);
        auto codec = static_cast<BlockCodec>(hdr[8]);

        // A stored block may not exceed the zstd bound of its raw length
        if (stored_len > ZSTD_compressBound(max_block_size_)) {
            return std::unexpected(Error{ErrorCode::DecompressionError,
                fmt::format("block stored length {} is out of range", stored_len)});
        }
        if (in.Size() - kBlockHeaderSize < stored_len) {
            return {};  // wait for the rest of the block
        }

        stored_.resize(stored_len);
        in.CopyTo(kBlockHeaderSize, stored_len, stored_.data());
        in.Consume(kBlockHeaderSize + stored_len);

        if (auto r = DecodeBlock(codec, stored_, raw_len, raw_); !r) {
            return r;
        }
        out.AppendBytes(raw_);
    }
    return {};
}

// One-shot helpers

std::expected<std::vector<std::byte>, Error> CompressBlocks(
    std::span<const std::byte> payload, const CompressionConfig& config) {
    BlockCompressor compressor(config);
    std::vector<std::byte> out;
    auto sink = [&out](std::span<const std::byte> block) -> std::expected<void, Error> {
        out.insert(out.end(), block.begin(), block.end());
        return {};
    };
    if (auto r = compressor.Write(payload, sink); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = compressor.Flush(sink); !r) {
        return std::unexpected(r.error());
    }
    return out;
}

std::expected<std::vector<std::byte>, Error> DecompressBlocks(
    std::span<const std::byte> data, uint32_t max_block_size) {
    BlockDecompressor decompressor(max_block_size);
    ByteReader reader(data);
    std::vector<std::byte> out;
    std::vector<std::byte> block;

    while (reader.remaining() > 0) {
        auto stored_len = reader.get_uint32_be();
        auto raw_len = reader.get_uint32_be();
        auto codec = reader.get_uint8();
        if (!stored_len || !raw_len || !codec) {
            return std::unexpected(Error{ErrorCode::DecompressionError, "truncated block header"});
        }
        auto stored = reader.get_bytes(*stored_len);
        if (!stored) {
            return std::unexpected(Error{ErrorCode::DecompressionError, "truncated block"});
        }
        if (auto r = decompressor.DecodeBlock(static_cast<BlockCodec>(*codec), *stored,
                                              *raw_len, block);
            !r) {
            return std::unexpected(r.error());
        }
        out.insert(out.end(), block.begin(), block.end());
    }
    return out;
}

}  // namespace obj_transport
