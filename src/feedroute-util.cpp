// FEEDROUTE Util - Command Line Interface
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License
//
// The feedroute-util tool provides offline helpers for feed identifiers,
// decimal normalization and feed data proofs.

#include <feedroute/core/types.h>
#include <feedroute/core/uint256.h>
#include <feedroute/feeds/decimals.h>
#include <feedroute/feeds/errors.h>
#include <feedroute/feeds/feed_id.h>
#include <feedroute/feeds/proof.h>
#include <feedroute/feeds/registry_config.h>
#include <feedroute/util/config.h>
#include <feedroute/util/logging.h>

#include <cstdint>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace feedroute {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "FEEDROUTE Util";

// ============================================================================
// Help
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: feedroute-util [options] <command> [params]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -help                      Show this help message\n";
    std::cout << "  -version                   Show version information\n";
    std::cout << "  -conf=FILE                 Config file path (default: "
              << util::DEFAULT_CONFIG_FILENAME << ")\n";
    std::cout << "  -loglevel=LEVEL            trace, debug, info, warn, error, off\n";
    std::cout << "  -debug=CATEGORIES          Comma-separated log categories\n";
    std::cout << "  -protocolid=N              Protocol id for proof roots (default: "
              << static_cast<int>(feeds::FTSO_PROTOCOL_ID) << ")\n";
    std::cout << "\nCommands:\n";
    std::cout << "  feedid <category> <name>\n";
    std::cout << "  decodefeedid <idhex>\n";
    std::cout << "  towei <value> <decimals>\n";
    std::cout << "  leafhash <round> <idhex> <value> <turnout> <decimals>\n";
    std::cout << "  verifyproof <roothex> <round> <idhex> <value> <turnout> <decimals> [sibling...]\n";
    std::cout << "\nExamples:\n";
    std::cout << "  feedroute-util feedid 1 BTC/USD\n";
    std::cout << "  feedroute-util towei 12345678 -2\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 FEEDROUTE Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

int64_t ParseIntArg(const std::string& str, int64_t min, int64_t max, const char* name) {
    size_t pos = 0;
    int64_t value = 0;
    try {
        value = std::stoll(str, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid ") + name + ": '" + str + "'");
    }
    if (pos != str.size() || value < min || value > max) {
        throw std::invalid_argument(std::string("Invalid ") + name + ": '" + str + "'");
    }
    return value;
}

feeds::FeedData ParseFeedData(const std::vector<std::string>& args, size_t first) {
    feeds::FeedData data;
    data.votingRoundId = static_cast<uint32_t>(
        ParseIntArg(args[first], 0, std::numeric_limits<uint32_t>::max(), "round"));
    data.id = FeedId::FromHex(args[first + 1]);
    data.value = static_cast<int32_t>(
        ParseIntArg(args[first + 2], std::numeric_limits<int32_t>::min(),
                    std::numeric_limits<int32_t>::max(), "value"));
    data.turnoutBIPS = static_cast<uint16_t>(
        ParseIntArg(args[first + 3], 0, std::numeric_limits<uint16_t>::max(), "turnout"));
    data.decimals = static_cast<int8_t>(
        ParseIntArg(args[first + 4], -128, 127, "decimals"));
    return data;
}

void RequireArgs(const std::vector<std::string>& args, size_t count, const char* usage) {
    if (args.size() < count) {
        throw std::invalid_argument(std::string("Usage: feedroute-util ") + usage);
    }
}

// ============================================================================
// Commands
// ============================================================================

/// Root publisher answering every round with one fixed root
class FixedRootPublisher : public feeds::IRootPublisher {
public:
    FixedRootPublisher(uint8_t protocolId, const Hash256& root)
        : protocolId_(protocolId), root_(root) {}

    Hash256 RootFor(uint8_t protocolId, uint32_t) const override {
        return protocolId == protocolId_ ? root_ : Hash256();
    }

private:
    uint8_t protocolId_;
    Hash256 root_;
};

using CommandArgs = std::vector<std::string>;
using CommandHandler = std::function<int(const CommandArgs&, const feeds::RegistryConfig&)>;

int CmdFeedId(const CommandArgs& args, const feeds::RegistryConfig&) {
    RequireArgs(args, 3, "feedid <category> <name>");
    Byte category = static_cast<Byte>(ParseIntArg(args[1], 0, 255, "category"));
    FeedId id = feeds::EncodeFeedId(category, args[2]);
    std::cout << "0x" << id.ToHex() << "\n";
    return 0;
}

int CmdDecodeFeedId(const CommandArgs& args, const feeds::RegistryConfig&) {
    RequireArgs(args, 2, "decodefeedid <idhex>");
    FeedId id = FeedId::FromHex(args[1]);
    auto decoded = feeds::DecodeFeedId(id);
    std::cout << "category: " << static_cast<int>(decoded.first) << "\n";
    std::cout << "name: " << decoded.second << "\n";
    std::cout << "calculated: " << (feeds::IsCalculatedFeedId(id) ? "true" : "false") << "\n";
    return 0;
}

int CmdToWei(const CommandArgs& args, const feeds::RegistryConfig&) {
    RequireArgs(args, 3, "towei <value> <decimals>");
    Uint256 value = Uint256::FromDecimal(args[1]);
    int8_t decimals = static_cast<int8_t>(ParseIntArg(args[2], -128, 127, "decimals"));
    std::cout << feeds::ToWei(value, decimals).ToString() << "\n";
    return 0;
}

int CmdLeafHash(const CommandArgs& args, const feeds::RegistryConfig&) {
    RequireArgs(args, 6, "leafhash <round> <idhex> <value> <turnout> <decimals>");
    feeds::FeedData data = ParseFeedData(args, 1);
    std::cout << "0x" << data.GetHash().ToHex() << "\n";
    return 0;
}

int CmdVerifyProof(const CommandArgs& args, const feeds::RegistryConfig& config) {
    RequireArgs(args, 7,
                "verifyproof <roothex> <round> <idhex> <value> <turnout> <decimals> [sibling...]");
    Hash256 root = Hash256::FromHex(args[1]);

    feeds::FeedDataWithProof data;
    data.body = ParseFeedData(args, 2);
    for (size_t i = 7; i < args.size(); ++i) {
        data.proof.push_back(Hash256::FromHex(args[i]));
    }

    FixedRootPublisher publisher(config.protocolId, root);
    feeds::ProofVerifier verifier(publisher, config.protocolId);
    verifier.Verify(data);
    std::cout << "valid\n";
    return 0;
}

const std::map<std::string, CommandHandler>& Commands() {
    static const std::map<std::string, CommandHandler> commands = {
        {"feedid", CmdFeedId},
        {"decodefeedid", CmdDecodeFeedId},
        {"towei", CmdToWei},
        {"leafhash", CmdLeafHash},
        {"verifyproof", CmdVerifyProof},
    };
    return commands;
}

// ============================================================================
// Configuration Loading
// ============================================================================

bool LoadConfig(util::ConfigManager& manager, feeds::RegistryConfig& config) {
    std::string confPath = manager.GetString("conf", "");
    bool explicitConf = !confPath.empty();
    if (!explicitConf) {
        confPath = util::DEFAULT_CONFIG_FILENAME;
    }

    if (explicitConf || std::ifstream(confPath).good()) {
        util::ConfigParseResult fileResult = manager.ParseFile(confPath);
        if (!fileResult.success) {
            std::cerr << "Error: " << fileResult.ToString() << "\n";
            return false;
        }
    }

    util::ConfigParseResult result = feeds::LoadRegistryConfig(manager, config);
    if (!result.success) {
        std::cerr << "Error: " << result.ToString() << "\n";
        return false;
    }
    return true;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigManager manager;
    util::ConfigParseResult parsed = manager.ParseCommandLine(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        std::cerr << "Use 'feedroute-util -help' for usage information.\n";
        return 1;
    }

    if (manager.GetBool("help", false) || manager.GetBool("h", false)) {
        PrintHelp();
        return 0;
    }
    if (manager.GetBool("version", false)) {
        PrintVersion();
        return 0;
    }

    feeds::RegistryConfig config;
    // Diagnostics go to stderr; command output owns stdout
    config.logLevel = util::LogLevel::Warn;
    if (!LoadConfig(manager, config)) {
        return 1;
    }

    util::Logger& logger = util::Logger::Instance();
    logger.AddSink(feeds::MakeConsoleSink(config));
    feeds::ApplyLoggingConfig(config);

    const CommandArgs& args = manager.GetPositionalArgs();
    if (args.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'feedroute-util -help' for usage information.\n";
        return 1;
    }

    auto it = Commands().find(args[0]);
    if (it == Commands().end()) {
        std::cerr << "Error: Unknown command '" << args[0] << "'\n";
        return 1;
    }

    LOG_DEBUG(util::LogCategory::CONFIG)
        << "Running '" << args[0] << "' with protocol id "
        << static_cast<int>(config.protocolId);

    int rc = it->second(args, config);
    logger.Flush();
    return rc;
}

} // namespace cli
} // namespace feedroute

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return feedroute::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
