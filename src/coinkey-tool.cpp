// COINKEY Key Tool
// Copyright (c) 2024 COINKEY Developers
// MIT License
//
// Command-line front end for secp256k1 key handling.
// Supports:
// - Generating key pairs
// - Deriving public keys from raw private scalars
// - Exporting and importing EC private key records (DER)
// - Public key hashing and compression changes

#include <coinkey/core/hex.h>
#include <coinkey/crypto/ecprivkey.h>
#include <coinkey/crypto/errors.h>
#include <coinkey/crypto/keys.h>
#include <coinkey/util/config.h>
#include <coinkey/util/logging.h>

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace coinkey;

// ============================================================================
// Constants
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* DEFAULT_LOG_LEVEL = "warn";

constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_KEY_ERROR = 2;
constexpr int EXIT_INTERNAL = 3;

/// Bad command-line input (unknown command, missing argument, bad hex)
class UsageError : public std::runtime_error {
public:
    explicit UsageError(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// Output Helpers
// ============================================================================

void PrintKeyPair(const KeyPair& keys) {
    const PublicKey& pub = keys.GetPublicKey();
    std::cout << "private:    " << keys.GetPrivateKey().ToHex() << "\n";
    std::cout << "public:     " << pub.ToHex() << "\n";
    std::cout << "compressed: " << (pub.IsCompressed() ? "yes" : "no") << "\n";
    std::cout << "hash160:    " << pub.GetPubKeyHash().ToHex() << "\n";
}

/// Hex argument at position idx of the positional list
Bytes HexArgument(const std::vector<std::string>& args, size_t idx, const char* what) {
    if (args.size() <= idx) {
        throw UsageError(std::string("missing ") + what);
    }
    if (!IsValidHex(args[idx])) {
        throw UsageError(std::string("invalid hex for ") + what + ": " + args[idx]);
    }
    return HexToBytes(args[idx]);
}

// ============================================================================
// Commands
// ============================================================================

int CommandGenerate(bool compressed) {
    KeyPair keys = KeyPair::Generate();
    if (!compressed) {
        keys = KeyPair::FromPrivateScalar(keys.GetPrivateKey().GetScalar(), false);
    }
    PrintKeyPair(keys);
    std::cout << "record:     " << BytesToHex(ToRecord(keys)) << "\n";
    return EXIT_OK;
}

int CommandDerive(const std::vector<std::string>& args, bool compressed, const KeyPolicy& policy) {
    KeyPair keys = KeyPair::FromPrivateBytes(HexArgument(args, 1, "private key"), compressed,
                                             policy);
    PrintKeyPair(keys);
    return EXIT_OK;
}

int CommandExport(const std::vector<std::string>& args, bool compressed, const KeyPolicy& policy) {
    KeyPair keys = KeyPair::FromPrivateBytes(HexArgument(args, 1, "private key"), compressed,
                                             policy);
    std::cout << BytesToHex(ToRecord(keys)) << "\n";
    return EXIT_OK;
}

int CommandImport(const std::vector<std::string>& args, const KeyPolicy& policy) {
    KeyPair keys = FromRecord(HexArgument(args, 1, "record"), policy);
    PrintKeyPair(keys);
    return EXIT_OK;
}

int CommandHash160(const std::vector<std::string>& args) {
    PublicKey pub = PublicKey::FromPublicOnly(HexArgument(args, 1, "public key"));
    std::cout << pub.GetPubKeyHash().ToHex() << "\n";
    return EXIT_OK;
}

int CommandRecode(const std::vector<std::string>& args, bool compressed) {
    PublicKey pub = PublicKey::FromPublicOnly(HexArgument(args, 1, "public key"));
    std::cout << pub.WithCompression(compressed).ToHex() << "\n";
    return EXIT_OK;
}

// ============================================================================
// Usage
// ============================================================================

void PrintUsage() {
    std::cout << "COINKEY Key Tool v" << VERSION << "\n";
    std::cout << "\n";
    std::cout << "Usage: coinkey-tool <command> [options] [arguments]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  generate              Generate a new key pair\n";
    std::cout << "  derive <privhex>      Derive the key pair of a private scalar\n";
    std::cout << "  export <privhex>      Print the DER EC private key record\n";
    std::cout << "  import <derhex>       Validate a DER record and print its keys\n";
    std::cout << "  hash160 <pubhex>      Print RIPEMD160(SHA256(pubkey))\n";
    std::cout << "  compress <pubhex>     Re-encode a public key in compressed form\n";
    std::cout << "  decompress <pubhex>   Re-encode a public key in uncompressed form\n";
    std::cout << "  help                  Show this help message\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --uncompressed        Use the 65-byte public key form\n";
    std::cout << "  --strict              Reject the private scalar 1\n";
    std::cout << "  --conf=<file>         Read options from an INI-style file\n";
    std::cout << "  --loglevel=<level>    trace, debug, info, warn, error, fatal, off\n";
    std::cout << "  --debug=<cat>[,<cat>] Debug output for curve, keys, asn1, tool (or all)\n";
    std::cout << "  --logfile=<file>      Also write the log to a file\n";
    std::cout << "  --noprinttoconsole    Do not log to stderr\n";
    std::cout << "  --version             Show version\n";
    std::cout << "\n";
    std::cout << "Exit status: 0 success, 1 usage error, 2 key error, 3 internal error\n";
}

void PrintVersion() {
    std::cout << "COINKEY Key Tool v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 COINKEY Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Setup
// ============================================================================

/// Command line first, then --conf, then the command line again so it wins
bool LoadConfig(int argc, char* argv[]) {
    auto& config = util::GetConfig();
    
    auto result = config.ParseCommandLine(argc, argv);
    if (!result.success) {
        std::cerr << "Error: " << result.errorMessage << "\n";
        return false;
    }
    
    auto confPath = config.TryGetString(util::ConfigKeys::CONF);
    if (confPath) {
        result = config.ParseFile(*confPath);
        if (!result.success) {
            std::cerr << "Error: " << result.errorMessage;
            if (result.errorLine > 0) {
                std::cerr << " (" << result.errorFile << ":" << result.errorLine << ")";
            }
            std::cerr << "\n";
            return false;
        }
        result = config.ParseCommandLine(argc, argv);
        if (!result.success) {
            std::cerr << "Error: " << result.errorMessage << "\n";
            return false;
        }
    }
    
    config.SetDefault(util::ConfigKeys::LOGLEVEL, DEFAULT_LOG_LEVEL);
    config.SetDefault(util::ConfigKeys::PRINTTOCONSOLE, "1");
    return true;
}

bool SetupLogging(const util::ConfigManager& config) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();
    logger.ClearCategoryLevels();
    
    std::string levelName = config.GetString(util::ConfigKeys::LOGLEVEL, DEFAULT_LOG_LEVEL);
    auto level = util::LogLevelFromString(levelName);
    if (!level) {
        std::cerr << "Error: unknown log level '" << levelName << "'\n";
        return false;
    }
    logger.SetLevel(*level);
    
    auto debug = config.TryGetString(util::ConfigKeys::DEBUG);
    if (debug && !util::EnableDebugCategories(*debug)) {
        std::cerr << "Error: unknown debug category in '" << *debug << "'\n";
        return false;
    }
    
    if (config.GetBool(util::ConfigKeys::PRINTTOCONSOLE, true)) {
        util::ConsoleSink::Options options;
        options.level = util::LogLevel::Trace;
        options.format.timestamp = false;
        logger.AddSink(std::make_shared<util::ConsoleSink>(options));
    }
    
    auto logPath = config.TryGetString(util::ConfigKeys::LOGFILE);
    if (logPath && !logPath->empty()) {
        auto fileSink = std::make_shared<util::FileSink>(*logPath, util::LogLevel::Trace);
        if (fileSink->IsOpen()) {
            logger.AddSink(fileSink);
        } else {
            LOG_WARN(util::LogCategory::TOOL) << "Cannot open log file " << *logPath;
        }
    }
    return true;
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    if (!LoadConfig(argc, argv)) {
        return EXIT_USAGE;
    }
    
    const auto& config = util::GetConfig();
    if (!SetupLogging(config)) {
        return EXIT_USAGE;
    }
    
    if (config.GetBool("version", false)) {
        PrintVersion();
        return EXIT_OK;
    }
    
    const auto& args = config.GetPositionalArgs();
    if (config.GetBool("help", false) || args.empty()) {
        PrintUsage();
        return args.empty() && !config.GetBool("help", false) ? EXIT_USAGE : EXIT_OK;
    }
    
    const std::string& command = args[0];
    bool compressed = !config.GetBool(util::ConfigKeys::UNCOMPRESSED, false);
    KeyPolicy policy = KeyPolicy::FromConfig(config);
    
    LOG_DEBUG(util::LogCategory::TOOL) << "Effective configuration:\n" << config.Dump();
    LOG_DEBUG(util::LogCategory::TOOL) << "Running command '" << command << "'"
                                       << (policy.rejectSentinelOne ? " (strict)" : "");
    
    try {
        if (command == "generate") {
            return CommandGenerate(compressed);
        } else if (command == "derive") {
            return CommandDerive(args, compressed, policy);
        } else if (command == "export") {
            return CommandExport(args, compressed, policy);
        } else if (command == "import") {
            return CommandImport(args, policy);
        } else if (command == "hash160") {
            return CommandHash160(args);
        } else if (command == "compress") {
            return CommandRecode(args, true);
        } else if (command == "decompress") {
            return CommandRecode(args, false);
        } else if (command == "help") {
            PrintUsage();
            return EXIT_OK;
        }
        
        std::cerr << "Unknown command: " << command << "\n";
        std::cerr << "Run 'coinkey-tool help' for usage.\n";
        return EXIT_USAGE;
    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const KeyError& e) {
        std::cerr << "Key error: " << e.what() << "\n";
        return EXIT_KEY_ERROR;
    } catch (const std::exception& e) {
        LOG_ERROR(util::LogCategory::TOOL) << "Internal error: " << e.what();
        std::cerr << "Internal error: " << e.what() << "\n";
        return EXIT_INTERNAL;
    }
}
