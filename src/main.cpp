#include "data/StopwordManager.hpp"
#include "data/Stopwords.hpp"
#include "models/Config.hpp"
#include "models/Errors.hpp"
#include "utils/Logger.hpp"
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

namespace {

struct CliOptions {
    std::vector<std::string> resources;
    std::string format = "txt";
    std::string output;
    std::string metadataPath;
    std::string configFile;
    bool caseSensitive = false;
    bool filter = false;
    bool showConfig = false;
};

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\n"
              << "List stopwords from a resource, or filter tokens read from stdin.\n"
              << "\n"
              << "  -r, --resource NAME   Stopword resource (repeatable, default from config)\n"
              << "  -f, --format FMT      Output format: txt or json (default: txt)\n"
              << "  -o, --output PATH     Write the list to PATH instead of stdout\n"
              << "      --metadata PATH   Stopword metadata document\n"
              << "      --config PATH     JSON configuration file\n"
              << "      --case-sensitive  Match words without case folding\n"
              << "      --filter          Print stdin tokens that are not stopwords\n"
              << "      --show-config     Print the effective configuration\n"
              << "  -h, --help            Show this help\n";
}

// Returns false on a usage error
bool parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto nextValue = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "-r" || arg == "--resource") {
            std::string name;
            if (!nextValue(name)) return false;
            options.resources.push_back(name);
        } else if (arg == "-f" || arg == "--format") {
            if (!nextValue(options.format)) return false;
        } else if (arg == "-o" || arg == "--output") {
            if (!nextValue(options.output)) return false;
        } else if (arg == "--metadata") {
            if (!nextValue(options.metadataPath)) return false;
        } else if (arg == "--config") {
            if (!nextValue(options.configFile)) return false;
        } else if (arg == "--case-sensitive") {
            options.caseSensitive = true;
        } else if (arg == "--filter") {
            options.filter = true;
        } else if (arg == "--show-config") {
            options.showConfig = true;
        } else {
            std::cerr << "Error: unknown option " << arg << "\n";
            return false;
        }
    }
    return true;
}

int runFilter(const CliOptions& options, const Durak::ResourceOptions& resources) {
    auto manager = Durak::StopwordManager::fromResources(options.resources, resources);

    std::vector<std::string> tokens{std::istream_iterator<std::string>(std::cin),
                                    std::istream_iterator<std::string>()};

    Durak::FilterOptions filterOptions;
    filterOptions.manager = &manager;
    for (const auto& token : Durak::removeStopwords(tokens, filterOptions)) {
        std::cout << token << '\n';
    }

    LOG_CLI_INFO("Filtered {} tokens", tokens.size());
    return 0;
}

int runList(const CliOptions& options, const Durak::ResourceOptions& resources) {
    if (options.format != "txt" && options.format != "json") {
        throw Durak::ConfigurationError("Unsupported format '" + options.format + "'; use 'txt' or 'json'.");
    }

    if (!options.output.empty()) {
        Durak::StopwordManager::Options managerOptions;
        managerOptions.base = options.resources.empty()
            ? Durak::WordSet(*Durak::selectStopwords({}, resources))
            : Durak::loadStopwordResources(options.resources, resources);
        managerOptions.caseSensitive = resources.caseSensitive;
        Durak::StopwordManager manager(managerOptions);
        manager.exportTo(options.output, options.format);
        std::cerr << "Stopwords written to " << options.output << "\n";
        return 0;
    }

    auto words = Durak::listStopwords(options.resources, resources);
    if (options.format == "json") {
        std::cout << Durak::json(words).dump(2) << '\n';
    } else {
        for (const auto& word : words) {
            std::cout << word << '\n';
        }
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
    }

    CliOptions options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 2;
    }

    // Load configuration: file first, then environment overrides
    auto& config = Durak::getConfig();
    if (!options.configFile.empty() && !config.loadFromFile(options.configFile)) {
        std::cerr << "Error: could not load configuration from " << options.configFile << "\n";
        return 2;
    }
    config.loadFromEnvironment();

    Durak::Logger::initialize(config.logLevel, config.logDirectory);

    if (options.showConfig) {
        std::cout << config.toJson().dump(2) << '\n';
        Durak::Logger::shutdown();
        return 0;
    }

    Durak::ResourceOptions resources;
    resources.caseSensitive = options.caseSensitive;
    if (!options.metadataPath.empty()) {
        resources.metadataPath = options.metadataPath;
    }

    int status = 0;
    try {
        status = options.filter ? runFilter(options, resources) : runList(options, resources);
    } catch (const Durak::DurakError& e) {
        LOG_CLI_ERROR("{}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        status = 1;
    }

    Durak::Logger::shutdown();
    return status;
}
