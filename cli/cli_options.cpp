///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "cli_options.hpp"
#include "errors.hpp"
#include <cmath>
#include <map>
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Canonical long name for a flag, or an empty string if unknown.
 */
static std::string canonicalOption(const std::string& flag) {
    static const std::map<std::string, std::string> kAliases = {
            {"--input", "input"},             {"-i", "input"},
            {"--utilization", "utilization"}, {"-u", "utilization"},
            {"--format", "format"},           {"-f", "format"},
            {"--capacity", "capacity"},       {"-c", "capacity"},
            {"--algorithm", "algorithm"},     {"-a", "algorithm"},
    };
    auto it = kAliases.find(flag);
    return it == kAliases.end() ? std::string() : it->second;
}

static double parseUtilization(const std::string& text) {
    std::istringstream iss(text);
    double value = 0.0;
    iss >> value;
    if (iss.fail() || !(iss >> std::ws).eof() || !std::isfinite(value)) {
        throw ConfigurationError("utilization must be a number, got '" + text + "'");
    }
    if (value <= 0.0 || value > 1.0) {
        throw ConfigurationError("utilization must be between 0 (exclusive) and 1 (inclusive)");
    }
    return value;
}

static int parseCapacity(const std::string& text) {
    std::istringstream iss(text);
    long long value = 0;
    iss >> value;
    if (iss.fail() || !(iss >> std::ws).eof()) {
        throw ConfigurationError("capacity must be an integer, got '" + text + "'");
    }
    if (value < 0 || value > 2147483647LL) {
        throw ConfigurationError("capacity must be a non-negative integer, got '" + text + "'");
    }
    return (int)value;
}


///////////////////////////
///       OPTIONS       ///
///////////////////////////
PlannerConfig CliOptions::plannerConfig() const {
    PlannerConfig config;
    config.utilization = utilization;
    config.capacity = capacity;
    config.algorithm = algorithm;
    return config;
}

/**
 * @brief Collect flag/value pairs into a map, then validate each value.
 */
CliOptions parseCliArgs(const std::vector<std::string>& args) {
    CliOptions options;
    std::map<std::string, std::string> argvMap;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--help" || arg == "-h") {
            options.showHelp = true;
            return options;
        }

        std::string flag = arg;
        std::string value;
        bool inlineValue = false;
        size_t eq = arg.find('=');
        if (arg.compare(0, 2, "--") == 0 && eq != std::string::npos) {
            flag = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            inlineValue = true;
        }

        std::string name = canonicalOption(flag);
        if (name.empty()) {
            throw ConfigurationError("unrecognized argument '" + arg + "'");
        }
        if (!inlineValue) {
            if (i + 1 >= args.size()) {
                throw ConfigurationError("option " + flag + " expects a value");
            }
            value = args[++i];
        }
        argvMap[name] = value;
    }

    if (argvMap.find("input") == argvMap.end() || argvMap["input"].empty()) {
        throw ConfigurationError("the following argument is required: --input/-i");
    }
    options.inputPath = argvMap["input"];

    if (argvMap.find("utilization") != argvMap.end()) {
        options.utilization = parseUtilization(argvMap["utilization"]);
    }
    if (argvMap.find("format") != argvMap.end()) {
        options.format = parseOutputFormat(argvMap["format"]);
    }
    if (argvMap.find("capacity") != argvMap.end()) {
        options.capacity = parseCapacity(argvMap["capacity"]);
    }
    if (argvMap.find("algorithm") != argvMap.end()) {
        options.algorithm = parseAlgorithm(argvMap["algorithm"]);
    }
    return options;
}

CliOptions parseCliArgs(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parseCliArgs(args);
}

std::string usageText(const std::string& programName) {
    std::ostringstream ss;
    ss << "usage: " << programName
       << " --input PATH [--utilization U] [--format text|json|csv]"
          " [--capacity K] [--algorithm greedy|shift]\n\n"
       << "Compute hourly agent staffing requirements from customer call demand.\n\n"
       << "  -i, --input PATH        CSV file with customer requirements (required)\n"
       << "  -u, --utilization U     agent utilization factor, 0 < U <= 1 (default: 1.0)\n"
       << "  -f, --format FMT        output format: text, json or csv (default: text)\n"
       << "  -c, --capacity K        maximum agents per hour (enables priority allocation)\n"
       << "  -a, --algorithm ALGO    greedy (default) or shift (overflow redistribution)\n"
       << "  -h, --help              show this help and exit\n";
    return ss.str();
}
