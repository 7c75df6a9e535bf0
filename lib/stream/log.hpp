// SPDX-License-Identifier: MIT

// lib/stream/log.hpp
#pragma once

#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "lib/stream/error.hpp"

namespace obj_transport {

inline constexpr const char* kLoggerName = "obj_transport";

/// Shared logger for the transport. Created on first use with a stderr
/// colour sink; an application may register its own logger under
/// kLoggerName beforehand to redirect output.
inline std::shared_ptr<spdlog::logger> TransportLog() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(kLoggerName)) {
            return existing;
        }
        return spdlog::stderr_color_mt(kLoggerName);
    }();
    return logger;
}

}  // namespace obj_transport
