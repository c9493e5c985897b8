// File: src/core/logging.cpp
#include "core/logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <stdexcept>
#include <vector>

namespace dpcm {
namespace logging {

bool LoggingConfig::IsValid() const {
    return ParseLevel(level).has_value() && !pattern.empty();
}

std::optional<spdlog::level::level_enum> ParseLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

std::shared_ptr<spdlog::logger> CreateLogger(const std::string& name,
                                             const LoggingConfig& config) {
    if (!config.IsValid()) {
        throw std::invalid_argument("Invalid logging configuration (level '" +
                                    config.level + "')");
    }

    std::vector<spdlog::sink_ptr> sinks;
    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }
    if (!config.file_path.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            config.file_path, config.truncate_file));
    }
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(*ParseLevel(config.level));
    logger->set_pattern(config.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

std::shared_ptr<spdlog::logger> NullLogger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::null_sink_mt>());
    logger->set_level(spdlog::level::off);
    return logger;
}

std::shared_ptr<spdlog::logger> OrNull(std::shared_ptr<spdlog::logger> logger,
                                       const std::string& name) {
    if (logger) {
        return logger;
    }
    return NullLogger(name);
}

} // namespace logging
} // namespace dpcm
