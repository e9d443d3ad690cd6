// FEEDROUTE - Registry Configuration Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include <feedroute/feeds/registry_config.h>

#include <algorithm>

namespace feedroute {
namespace feeds {

namespace {

const char* const KNOWN_CATEGORIES[] = {
    util::LogCategory::DEFAULT,
    util::LogCategory::REGISTRY,
    util::LogCategory::ALIAS,
    util::LogCategory::RESOLVER,
    util::LogCategory::FEES,
    util::LogCategory::PROOF,
    util::LogCategory::CONFIG,
};

bool IsKnownCategory(const std::string& name) {
    return std::any_of(std::begin(KNOWN_CATEGORIES), std::end(KNOWN_CATEGORIES),
                       [&](const char* known) { return name == known; });
}

util::ConfigParseResult KeyError(const util::ConfigManager& manager,
                                 const char* key, const std::string& message) {
    auto entry = manager.GetEntry(key);
    if (entry) {
        return util::ConfigParseResult::Error(message, entry->source, entry->lineNumber);
    }
    return util::ConfigParseResult::Error(message);
}

} // namespace

util::ConfigParseResult LoadRegistryConfig(const util::ConfigManager& manager,
                                           RegistryConfig& config) {
    if (manager.HasKey(ConfigKey::PROTOCOL_ID)) {
        auto id = manager.TryGetInt(ConfigKey::PROTOCOL_ID);
        if (!id || *id < 0 || *id > 255) {
            return KeyError(manager, ConfigKey::PROTOCOL_ID,
                            "protocolid must be an integer in 0..255, got '" +
                            manager.GetString(ConfigKey::PROTOCOL_ID, "") + "'");
        }
        config.protocolId = static_cast<uint8_t>(*id);
    }

    if (manager.HasKey(ConfigKey::LOG_LEVEL)) {
        std::string value = manager.GetString(ConfigKey::LOG_LEVEL, "");
        if (!util::TryParseLogLevel(value, config.logLevel)) {
            return KeyError(manager, ConfigKey::LOG_LEVEL, "Unknown log level '" + value + "'");
        }
    }

    if (manager.HasKey(ConfigKey::DEBUG)) {
        std::vector<std::string> categories = manager.GetList(ConfigKey::DEBUG);
        config.debugCategories.clear();
        for (const auto& category : categories) {
            if (category == "all" || category == "1" || category == "true") {
                config.debugCategories.clear();
                break;
            }
            if (!IsKnownCategory(category)) {
                return KeyError(manager, ConfigKey::DEBUG,
                                "Unknown log category '" + category + "'");
            }
            config.debugCategories.push_back(category);
        }
    }

    if (manager.HasKey(ConfigKey::LOG_COLORS)) {
        auto colors = manager.TryGetBool(ConfigKey::LOG_COLORS);
        if (!colors) {
            return KeyError(manager, ConfigKey::LOG_COLORS,
                            "logcolors must be a boolean, got '" +
                            manager.GetString(ConfigKey::LOG_COLORS, "") + "'");
        }
        config.logColors = *colors;
    }

    return util::ConfigParseResult::Success();
}

void ApplyLoggingConfig(const RegistryConfig& config) {
    util::Logger& logger = util::Logger::Instance();
    logger.SetLevel(config.logLevel);

    if (config.debugCategories.empty()) {
        logger.EnableAllCategories();
        return;
    }

    logger.DisableAllCategories();
    for (const auto& category : config.debugCategories) {
        logger.EnableCategory(category);
    }
}

std::shared_ptr<util::ConsoleSink> MakeConsoleSink(const RegistryConfig& config) {
    util::ConsoleSink::Config sinkConfig;
    sinkConfig.useColors = config.logColors;
    sinkConfig.level = config.logLevel;
    return std::make_shared<util::ConsoleSink>(sinkConfig);
}

} // namespace feeds
} // namespace feedroute
