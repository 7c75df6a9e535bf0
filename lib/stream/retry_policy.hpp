// SPDX-License-Identifier: MIT

// lib/stream/retry_policy.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <random>

#include "lib/stream/error.hpp"

namespace obj_transport {

/// Exponential backoff parameters for reconnect attempts.
struct RetryConfig {
    uint32_t max_retries = 3;                          ///< Attempts before giving up
    std::chrono::milliseconds initial_delay{100};      ///< Delay before the first attempt
    std::chrono::milliseconds max_delay{5000};         ///< Delay cap
    double backoff_multiplier = 2.0;                   ///< Growth per attempt
    double jitter_factor = 0.1;                        ///< Uniform +/- fraction of the delay

    /// Preset for intra-cluster reconnects: peers are close, retry fast.
    static RetryConfig ReconnectDefaults() {
        return RetryConfig{
            .max_retries = 5,
            .initial_delay = std::chrono::milliseconds{100},
            .max_delay = std::chrono::milliseconds{5000},
            .backoff_multiplier = 2.0,
            .jitter_factor = 0.1,
        };
    }
};

/// Attempt counter and delay schedule for one reconnect episode.
///
/// Only transient failures are worth another attempt: a missing route or a
/// framing error will fail the same way on a fresh connection.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {})
        : config_(config), rng_(std::random_device{}()) {}

    /// Budget left.
    bool ShouldRetry() const { return attempts_ < config_.max_retries; }

    /// Budget left and `e` is transient.
    bool ShouldRetry(const Error& e) const { return IsRetryable(e.code) && ShouldRetry(); }

    void RecordAttempt() { ++attempts_; }

    void Reset() { attempts_ = 0; }

    uint32_t Attempts() const { return attempts_; }

    /// initial_delay * multiplier^attempts, capped at max_delay, with jitter.
    std::chrono::milliseconds GetNextDelay() {
        double delay = static_cast<double>(config_.initial_delay.count()) *
                       std::pow(config_.backoff_multiplier, static_cast<double>(attempts_));
        delay = std::min(delay, static_cast<double>(config_.max_delay.count()));
        if (config_.jitter_factor > 0.0) {
            std::uniform_real_distribution<double> jitter(1.0 - config_.jitter_factor,
                                                          1.0 + config_.jitter_factor);
            delay *= jitter(rng_);
        }
        return std::chrono::milliseconds(static_cast<int64_t>(delay));
    }

    static bool IsRetryable(ErrorCode code) {
        switch (code) {
            case ErrorCode::ConnectionFailed:
            case ErrorCode::ConnectionClosed:
            case ErrorCode::DnsResolutionFailed:  // resolvers recover
                return true;
            default:
                return false;
        }
    }

private:
    RetryConfig config_;
    uint32_t attempts_ = 0;
    std::mt19937 rng_;
};

}  // namespace obj_transport
