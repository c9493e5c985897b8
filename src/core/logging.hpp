// File: src/core/logging.hpp
//
// Logger construction helpers
//
// Components receive a std::shared_ptr<spdlog::logger> through their
// constructor. Nothing here registers loggers globally.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>

namespace dpcm {
namespace logging {

/// Logger settings (the `logging` section of EngineConfig)
struct LoggingConfig {
    std::string level{"info"};        ///< trace|debug|info|warn|error|critical|off
    bool console{true};               ///< colored stdout sink
    std::string file_path;            ///< empty = no file sink
    bool truncate_file{false};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};

    bool IsValid() const;
};

/// Parse a level name; nullopt for unknown names
std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name);

/// Build a logger with the configured sinks
///
/// @param name Logger name (shows up in the %n field)
/// @param config Sink and level settings
/// @throws std::invalid_argument if config is invalid
/// @throws spdlog::spdlog_ex if the log file cannot be opened
std::shared_ptr<spdlog::logger> CreateLogger(const std::string& name,
                                             const LoggingConfig& config);

/// Logger that discards everything. Default for components built without one.
std::shared_ptr<spdlog::logger> NullLogger(const std::string& name = "null");

/// `logger` if non-null, otherwise a NullLogger
std::shared_ptr<spdlog::logger> OrNull(std::shared_ptr<spdlog::logger> logger,
                                       const std::string& name);

} // namespace logging
} // namespace dpcm
