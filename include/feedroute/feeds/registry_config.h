// FEEDROUTE - Registry Configuration
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#ifndef FEEDROUTE_FEEDS_REGISTRY_CONFIG_H
#define FEEDROUTE_FEEDS_REGISTRY_CONFIG_H

#include <feedroute/feeds/proof.h>
#include <feedroute/util/config.h>
#include <feedroute/util/logging.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace feedroute {
namespace feeds {

/// Configuration keys
namespace ConfigKey {
    constexpr const char* PROTOCOL_ID = "protocolid";
    constexpr const char* LOG_LEVEL = "loglevel";
    constexpr const char* DEBUG = "debug";
    constexpr const char* LOG_COLORS = "logcolors";
}

struct RegistryConfig {
    /// Protocol id passed to the root publisher during proof verification
    uint8_t protocolId{FTSO_PROTOCOL_ID};

    util::LogLevel logLevel{util::LogLevel::Info};

    /// Enabled log categories; empty enables all
    std::vector<std::string> debugCategories;

    bool logColors{true};
};

/**
 * Read registry settings from a ConfigManager. Missing keys keep the
 * defaults already in `config`.
 *
 * @return Error naming the offending key on invalid values; `config` may
 *         be partially updated in that case
 */
util::ConfigParseResult LoadRegistryConfig(const util::ConfigManager& manager,
                                           RegistryConfig& config);

/// Apply level and category filters to the global logger
void ApplyLoggingConfig(const RegistryConfig& config);

/// Console sink matching the configured level and colors
std::shared_ptr<util::ConsoleSink> MakeConsoleSink(const RegistryConfig& config);

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_REGISTRY_CONFIG_H
