// SPDX-License-Identifier: MIT

// tests/config_test.cpp
#include <gtest/gtest.h>

#include <cstdlib>

#include "src/config.hpp"

using namespace obj_transport;

namespace {

// Sets an environment variable for the lifetime of the guard.
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        setenv(name, value, 1);
    }
    ~EnvGuard() { unsetenv(name_); }

private:
    const char* name_;
};

}  // namespace

TEST(StreamConfigTest, Defaults) {
    auto c = StreamConfig::Defaults();
    EXPECT_EQ(c.burst, StreamConfig::kDefaultBurst);
    EXPECT_FALSE(c.dry_run);
    EXPECT_FALSE(c.compression.enabled);
    EXPECT_FALSE(c.reconnect.enabled);
    EXPECT_EQ(c.reconnect.inflight, InflightPolicy::Fail);
}

TEST(StreamConfigTest, Presets) {
    auto compressed = StreamConfig::Compressed(64 * 1024);
    EXPECT_TRUE(compressed.compression.enabled);
    EXPECT_EQ(compressed.compression.max_block_size, 64u * 1024);

    EXPECT_TRUE(StreamConfig::DryRun().dry_run);
}

TEST(StreamConfigTest, NormalizeZeroBurst) {
    StreamConfig c;
    c.burst = 0;
    c.Normalize();
    EXPECT_EQ(c.burst, 1u);
}

TEST(StreamConfigTest, NormalizeDryRunDisablesCompression) {
    auto c = StreamConfig::Compressed(64 * 1024);
    c.dry_run = true;
    c.Normalize();
    EXPECT_FALSE(c.compression.enabled);
}

TEST(StreamConfigTest, NormalizeClampsBlockSize) {
    auto small = StreamConfig::Compressed(100);
    small.Normalize();
    EXPECT_EQ(small.compression.max_block_size, CompressionConfig::kMinBlockSize);

    auto large = StreamConfig::Compressed(64u * 1024 * 1024);
    large.Normalize();
    EXPECT_EQ(large.compression.max_block_size, CompressionConfig::kMaxBlockSize);
}

TEST(StreamConfigTest, EnvBurstOverride) {
    EnvGuard guard("OBJ_STREAM_BURST_NUM", "128");
    StreamConfig c;
    ApplyEnvOverrides(c);
    EXPECT_EQ(c.burst, 128u);
}

TEST(StreamConfigTest, EnvBurstInvalidIgnored) {
    for (const char* bad : {"0", "-3", "12abc", ""}) {
        EnvGuard guard("OBJ_STREAM_BURST_NUM", bad);
        StreamConfig c;
        ApplyEnvOverrides(c);
        EXPECT_EQ(c.burst, StreamConfig::kDefaultBurst) << "value: '" << bad << "'";
    }
}

TEST(StreamConfigTest, EnvDryRun) {
    {
        EnvGuard guard("OBJ_STREAM_DRY_RUN", "true");
        StreamConfig c;
        ApplyEnvOverrides(c);
        EXPECT_TRUE(c.dry_run);
    }
    {
        EnvGuard guard("OBJ_STREAM_DRY_RUN", "0");
        auto c = StreamConfig::DryRun();
        ApplyEnvOverrides(c);
        EXPECT_FALSE(c.dry_run);
    }
    {
        EnvGuard guard("OBJ_STREAM_DRY_RUN", "maybe");
        StreamConfig c;
        ApplyEnvOverrides(c);
        EXPECT_FALSE(c.dry_run);
    }
}

TEST(ReceiverConfigTest, NormalizeClampsLimits) {
    ReceiverConfig c;
    c.max_header_size = 0;
    c.max_block_size = 1;
    c.max_buffered = 1;
    c.listen_backlog = 0;
    c.Normalize();
    EXPECT_EQ(c.max_header_size, kDefaultMaxHeaderSize);
    EXPECT_EQ(c.max_block_size, CompressionConfig::kMinBlockSize);
    EXPECT_EQ(c.max_buffered, ReceiverConfig::kMinBuffered);
    EXPECT_EQ(c.listen_backlog, 128);
}
