#pragma once
#include <cstddef>
#include <string>
#include <log.hpp>
#include <tradeid/core/result.hpp>

namespace boundary {

struct LoggingConfig {
    std::string ecu_id{"ECU1"};
    std::string app_id{"TRID"};
    tradeid::log::LogLevel level{tradeid::log::LogLevel::kWarn};
    bool console{false};
    bool dlt{false};
};

struct BoundaryConfig {
    std::size_t max_live_ids{0};  // 0 = unlimited
    bool        validate_utf8{true};
    LoggingConfig logging{};
};

// Parse a boundary manifest. On error `out` is left untouched.
tradeid::core::Result<void> LoadBoundaryConfig(const std::string& path, BoundaryConfig& out) noexcept;
tradeid::core::Result<void> ParseBoundaryConfig(const std::string& text, BoundaryConfig& out) noexcept;

// Push the logging section into LogManager (ids, default level, sinks).
void ApplyLoggingConfig(const LoggingConfig& cfg);

} // namespace boundary
