#include "Config.h"
#include "Constants.h"
#include "KeyGenerator.h"
#include "Logger.h"
#include "NamedKeyRegistry.h"
#include "PublicKeyPublisher.h"
#include "SqliteKeyValueStore.h"
#include "StaticIdentityResolver.h"
#include "TokenIssuer.h"
#include "commands/OidcCommands.h"
#include <json/json.h>
#include <unistd.h>
#include <iostream>
#include <string>
#include <vector>

extern char** environ;

using namespace Signet;

namespace {

// Accessor under which the command-line identity is registered
constexpr const char* CLI_ACCESSOR = "signet-cli";

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS] <command> [COMMAND OPTIONS]" << std::endl;
    std::cout << "\nOptions:" << std::endl;
    std::cout << "  --config <FILE>            key=value configuration file (repeatable, later wins)" << std::endl;
    std::cout << "  --db <FILE>                SQLite database (default: storage.path or signet.db)" << std::endl;
    std::cout << "  --log-level <LEVEL>        debug, info, warn, error or critical" << std::endl;
    std::cout << "  --log-file <FILE>          Append log lines to FILE" << std::endl;
    std::cout << "  --help                     Show this help message" << std::endl;
    std::cout << "\nCommands:" << std::endl;
    std::cout << "  create-key --name N [--rotation-period 6h] [--verification-ttl T] [--algorithm RS256]" << std::endl;
    std::cout << "  read-key --name N" << std::endl;
    std::cout << "  rotate-key --name N" << std::endl;
    std::cout << "  list-keys" << std::endl;
    std::cout << "  issue-token --name N --entity ID [--display-name D] [--policy P]... [--auth-path A] [--namespace NS]" << std::endl;
    std::cout << "  jwks" << std::endl;
    std::cout << "\nEnvironment variables prefixed with SIGNET_ override configuration" << std::endl;
    std::cout << "(SIGNET_OIDC_TOKEN_TTL=5m sets oidc.token_ttl)." << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    auto& config = Config::instance();
    logger.setComponent("signet_cli");

    std::vector<std::string> configFiles;
    std::string dbPath;
    std::string logLevel;
    std::string logFile;
    std::string command;
    Json::Value data(Json::objectValue);
    ResolvedIdentity identity;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--config" && hasValue) {
            configFiles.push_back(argv[++i]);
        } else if (arg == "--db" && hasValue) {
            dbPath = argv[++i];
        } else if (arg == "--log-level" && hasValue) {
            logLevel = argv[++i];
        } else if (arg == "--log-file" && hasValue) {
            logFile = argv[++i];
        } else if (arg == "--name" && hasValue) {
            data["name"] = argv[++i];
            data["key"] = data["name"];
        } else if (arg == "--rotation-period" && hasValue) {
            data["rotation_period"] = argv[++i];
        } else if (arg == "--verification-ttl" && hasValue) {
            data["verification_ttl"] = argv[++i];
        } else if (arg == "--algorithm" && hasValue) {
            data["algorithm"] = argv[++i];
        } else if (arg == "--entity" && hasValue) {
            identity.entityId = argv[++i];
        } else if (arg == "--display-name" && hasValue) {
            identity.displayName = argv[++i];
        } else if (arg == "--policy" && hasValue) {
            identity.policies.push_back(argv[++i]);
        } else if (arg == "--auth-path" && hasValue) {
            identity.authPath = argv[++i];
        } else if (arg == "--namespace" && hasValue) {
            identity.namespaceId = argv[++i];
        } else if (command.empty() && arg.rfind("--", 0) != 0) {
            command = arg;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    if (command.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    // --- Configuration: files, then environment, then flags ---
    if (configFiles.empty()) {
        // Optional system and working-directory defaults
        config.loadLayered({"/etc/signet/signet.conf", "signet.conf"});
    }
    for (const auto& path : configFiles) {
        if (!config.loadFromFile(path)) {
            std::cerr << "Cannot read configuration file: " << path << std::endl;
            return 2;
        }
    }
    config.applyEnvironment("SIGNET_", environ);

    auto rejected = config.validate({
        {"oidc.token_ttl", [](const std::string&, const std::string& v) {
            return TimeUtils::parseDuration(v).ok();
        }},
        {"oidc.default_rotation_period", [](const std::string&, const std::string& v) {
            return TimeUtils::parseDuration(v).ok();
        }},
        {"oidc.key_bits", [](const std::string&, const std::string& v) {
            try {
                return std::stoi(v) >= defaults::RSA_MIN_KEY_BITS;
            } catch (const std::exception&) {
                return false;
            }
        }},
    });
    for (const auto& key : rejected) {
        logger.log(LogLevel::WARN, "Ignoring invalid configuration value for " + key, "signet_cli");
        config.set(key, "");
    }

    if (logLevel.empty()) {
        logLevel = config.get("log.level", "warn");
    }
    logger.setLevel(Logger::parseLevel(logLevel, LogLevel::WARN));
    if (logFile.empty()) {
        logFile = config.get("log.file");
    }
    if (!logFile.empty()) {
        logger.setMaxFileSize(config.getSize("log.max_size_mb", 100));
        logger.setLogFile(logFile);
    }
    logger.setConsoleOutput(config.getBool("log.console", true));

    if (dbPath.empty()) {
        dbPath = config.get("storage.path", "signet.db");
    }

    try {
        auto store = SqliteKeyValueStore::open(dbPath);
        if (!store) {
            std::cerr << "Cannot open storage: " << store.error().toString() << std::endl;
            return 1;
        }

        PublicKeyPublisher publisher(store->get());
        auto loaded = publisher.load();
        if (!loaded) {
            std::cerr << "Cannot load published keys: " << loaded.error().toString() << std::endl;
            return 1;
        }

        int keyBits = config.getInt("oidc.key_bits", defaults::RSA_KEY_BITS);
        RsaKeyGenerator generator(keyBits);

        size_t capacity = config.getSize("oidc.ring_capacity", defaults::RING_CAPACITY);
        size_t maxCapacity = config.getSize("oidc.ring_max_capacity", defaults::RING_MAX_CAPACITY);
        NamedKeyRegistry registry(store->get(), &publisher, &generator, SystemClock::now, capacity, maxCapacity);

        StaticIdentityResolver resolver;
        if (!identity.entityId.empty()) {
            resolver.add(CLI_ACCESSOR, identity);
        }
        data["accessor"] = CLI_ACCESSOR;

        std::string defaultPeriod = config.get("oidc.default_rotation_period");
        if (command == "create-key" && !data.isMember("rotation_period") && !defaultPeriod.empty()) {
            data["rotation_period"] = defaultPeriod;
        }

        TokenIssuer issuer(&registry, &publisher, &resolver, IssuerOptions::fromConfig(config));

        OidcCommandContext ctx;
        ctx.registry = &registry;
        ctx.publisher = &publisher;
        ctx.issuer = &issuer;
        ctx.clock = SystemClock::now;

        OidcCommands commands(ctx);
        Json::Value response = commands.dispatch(command, data);

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        std::cout << Json::writeString(writer, response) << std::endl;
        return response["success"].asBool() ? 0 : 1;

    } catch (const std::exception& e) {
        logger.log(LogLevel::CRITICAL, std::string("Unhandled exception: ") + e.what(), "signet_cli");
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
