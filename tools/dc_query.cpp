/**
 * @file dc_query.cpp
 * @brief dc-query - resolve one context through a configured data connector
 *
 * Exit status: 0 on success, 1 on a resolution error, 2 on a usage or
 * configuration error.
 */

#include <idp/dc/config/config_manager.h>
#include <idp/dc/data_connector_factory.h>
#include <idp/dc/exceptions.h>
#include <idp/dc/logging/logger.h>

#include <getopt.h>
#include <json/json.h>
#include <iostream>
#include <string>
#include <vector>

using namespace idp::dc;

namespace {

constexpr int EXIT_RESOLUTION_ERROR = 1;
constexpr int EXIT_USAGE_ERROR = 2;

enum OptionId {
    kOptConfig = 'c',
    kOptPrincipal = 'p',
    kOptRequester = 'r',
    kOptIssuer = 'i',
    kOptAttribute = 'a',
    kOptLogLevel = 'l',
    kOptHelp = 'h',
};

const char* const kOptChars = "c:p:r:i:a:l:h";

const struct option kLongOptions[] = {
    { "config",     required_argument, nullptr, kOptConfig },
    { "principal",  required_argument, nullptr, kOptPrincipal },
    { "requester",  required_argument, nullptr, kOptRequester },
    { "issuer",     required_argument, nullptr, kOptIssuer },
    { "attribute",  required_argument, nullptr, kOptAttribute },
    { "log-level",  required_argument, nullptr, kOptLogLevel },
    { "help",       no_argument,       nullptr, kOptHelp },
    { nullptr,      0,                 nullptr, 0 },
};

struct Options {
    std::string configFile;
    std::string principal;
    std::string requester;
    std::string issuer;
    std::vector<std::pair<std::string, std::string>> attributes;
    std::string logLevel;
};

void usage(const char* prog, std::ostream& out) {
    out << "usage: " << prog << " [options]\n"
        << "  -c, --config FILE          load KEY=VALUE configuration\n"
        << "  -p, --principal NAME       principal to resolve\n"
        << "  -r, --requester ID         requester (relying party) id\n"
        << "  -i, --issuer ID            issuer id\n"
        << "  -a, --attribute NAME=VALUE upstream attribute value (repeatable)\n"
        << "  -l, --log-level LEVEL      trace|debug|info|warn|error|critical|off\n"
        << "  -h, --help                 show this help\n";
}

/**
 * @return false on a usage error (already reported)
 */
bool parseArguments(int argc, char* argv[], Options& options, bool& helpRequested) {
    int opt;
    while ((opt = getopt_long(argc, argv, kOptChars, kLongOptions, nullptr)) != -1) {
        switch (opt) {
            case kOptConfig:
                options.configFile = optarg;
                break;
            case kOptPrincipal:
                options.principal = optarg;
                break;
            case kOptRequester:
                options.requester = optarg;
                break;
            case kOptIssuer:
                options.issuer = optarg;
                break;
            case kOptAttribute: {
                std::string arg = optarg;
                size_t eq = arg.find('=');
                if (eq == std::string::npos || eq == 0) {
                    std::cerr << argv[0] << ": --attribute expects NAME=VALUE, got '" << arg << "'\n";
                    return false;
                }
                options.attributes.emplace_back(arg.substr(0, eq), arg.substr(eq + 1));
                break;
            }
            case kOptLogLevel:
                options.logLevel = optarg;
                break;
            case kOptHelp:
                helpRequested = true;
                return true;
            default:
                return false;
        }
    }

    if (optind < argc) {
        std::cerr << argv[0] << ": unexpected argument '" << argv[optind] << "'\n";
        return false;
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    bool helpRequested = false;
    if (!parseArguments(argc, argv, options, helpRequested)) {
        usage(argv[0], std::cerr);
        return EXIT_USAGE_ERROR;
    }
    if (helpRequested) {
        usage(argv[0], std::cout);
        return 0;
    }

    // stderr logger before any configuration is read; stdout carries only JSON
    Logger::initialize("dc-query", options.logLevel.empty() ? "warn" : options.logLevel);

    ConfigManager& config = ConfigManager::getInstance();
    std::unique_ptr<DataConnector> connector;

    try {
        if (!options.configFile.empty()) {
            config.loadFromFile(options.configFile);
        }

        std::string logLevel = options.logLevel.empty()
            ? config.getString(ConfigManager::LOG_LEVEL, "warn")
            : options.logLevel;
        std::string logFile = config.getString(ConfigManager::LOG_FILE);
        Logger::initialize("dc-query", logLevel, !logFile.empty(), logFile);

        connector = DataConnectorFactory::create(config);
        connector->initialize();
    } catch (const DataConnectorException& e) {
        std::cerr << "dc-query: " << e.what() << std::endl;
        return EXIT_USAGE_ERROR;
    }

    ResolutionContext context(options.principal, options.requester, options.issuer);
    for (const auto& [name, value] : options.attributes) {
        context.addDependencyAttribute(name, {AttributeValue::ofString(value)});
    }

    int status = 0;
    try {
        AttributeMap attributes = connector->retrieveAttributes(context);

        Json::StreamWriterBuilder writer;
        writer["indentation"] = "  ";
        std::cout << Json::writeString(writer, attributeMapToJson(attributes)) << std::endl;
    } catch (const DataConnectorException& e) {
        spdlog::error("[dc-query] Resolution failed: {}", e.what());
        std::cerr << "dc-query: " << e.what() << std::endl;
        status = EXIT_RESOLUTION_ERROR;
    }

    connector->destroy();
    Logger::flush();
    return status;
}
