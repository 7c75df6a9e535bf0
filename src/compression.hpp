// SPDX-License-Identifier: MIT

// src/compression.hpp
#pragma once

#include <zstd.h>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <vector>

#include "lib/stream/buffer_chain.hpp"
#include "lib/stream/error.hpp"

namespace obj_transport {

/// Block compression settings shared by sender and receiver.
struct CompressionConfig {
    bool enabled = false;
    uint32_t max_block_size = 256 * 1024;   ///< Raw bytes per block
    int level = 1;                          ///< zstd level

    static constexpr uint32_t kMinBlockSize = 4 * 1024;
    static constexpr uint32_t kMaxBlockSize = 4 * 1024 * 1024;
};

// Compressed connection bodies are a sequence of blocks:
//
//   [u32 BE stored length][u32 BE raw length][u8 codec][stored bytes]
//
// codec 0 stores the raw bytes unchanged (used when zstd does not shrink the
// block), codec 1 is a single zstd frame decompressing to exactly raw length.
enum class BlockCodec : uint8_t {
    Stored = 0,
    Zstd = 1,
};

inline constexpr size_t kBlockHeaderSize = 9;

template <typename F>
concept BlockSink = requires(F f, std::span<const std::byte> block) {
    { f(block) } -> std::same_as<std::expected<void, Error>>;
};

// BlockCompressor - accumulates outgoing frame bytes and emits compressed
// blocks of at most max_block_size raw bytes.
//
// Owned by one sender loop; not thread-safe.
class BlockCompressor {
public:
    explicit BlockCompressor(const CompressionConfig& config);

    BlockCompressor(const BlockCompressor&) = delete;
    BlockCompressor& operator=(const BlockCompressor&) = delete;

    /// Append raw bytes; every block that fills up is handed to sink.
    template <BlockSink Sink>
    std::expected<void, Error> Write(std::span<const std::byte> raw, Sink&& sink) {
        while (!raw.empty()) {
            size_t room = config_.max_block_size - pending_.size();
            size_t n = std::min(room, raw.size());
            pending_.insert(pending_.end(), raw.begin(), raw.begin() + n);
            raw = raw.subspan(n);
            if (pending_.size() == config_.max_block_size) {
                if (auto r = Flush(sink); !r) return r;
            }
        }
        return {};
    }

    /// Emit the pending partial block, if any.
    template <BlockSink Sink>
    std::expected<void, Error> Flush(Sink&& sink) {
        if (pending_.empty()) return {};
        auto block = EncodeBlock(pending_);
        pending_.clear();
        if (!block) return std::unexpected(block.error());
        return sink(*block);
    }

    /// Drop pending bytes (connection rebuilt, the block will never be sent).
    void Reset() { pending_.clear(); }

    size_t Pending() const { return pending_.size(); }

    const CompressionConfig& config() const { return config_; }

    /// Compress one block (raw.size() <= max_block_size) into header + data.
    /// The returned span aliases an internal buffer valid until the next call.
    std::expected<std::span<const std::byte>, Error> EncodeBlock(
        std::span<const std::byte> raw);

private:
    struct CCtxDeleter {
        void operator()(ZSTD_CCtx* c) const { ZSTD_freeCCtx(c); }
    };

    CompressionConfig config_;
    std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx_;
    std::vector<std::byte> pending_;
    std::vector<std::byte> out_;
};

// BlockDecompressor - incremental decoder for the block layout above.
//
// Consumes whole blocks from an input chain and appends raw bytes to an
// output chain. A partial block stays in the input until more bytes arrive.
// Owned by one connection on the reactor thread; not thread-safe.
class BlockDecompressor {
public:
    explicit BlockDecompressor(uint32_t max_block_size);

    BlockDecompressor(const BlockDecompressor&) = delete;
    BlockDecompressor& operator=(const BlockDecompressor&) = delete;

    /// Decode every complete block in `in`. Errors are fatal to the stream.
    std::expected<void, Error> Process(BufferChain& in, BufferChain& out);

    /// Decode one block body. Exposed for the one-shot helpers.
    std::expected<void, Error> DecodeBlock(BlockCodec codec,
                                           std::span<const std::byte> stored,
                                           uint32_t raw_len,
                                           std::vector<std::byte>& out);

private:
    struct DCtxDeleter {
        void operator()(ZSTD_DCtx* d) const { ZSTD_freeDCtx(d); }
    };

    uint32_t max_block_size_;
    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx_;
    std::vector<std::byte> stored_;
    std::vector<std::byte> raw_;
};

/// Compress a whole payload into a sequence of blocks.
std::expected<std::vector<std::byte>, Error> CompressBlocks(
    std::span<const std::byte> payload, const CompressionConfig& config);

/// Inverse of CompressBlocks. Truncated or malformed input is an error.
std::expected<std::vector<std::byte>, Error> DecompressBlocks(
    std::span<const std::byte> data, uint32_t max_block_size);

}  // namespace obj_transport
