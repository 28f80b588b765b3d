// make-map: route a topology and render it as SVG (or routed JSON)

#include <topomap/topomap.h>
#include <topomap/common/Logger.h>

#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace topomap;

namespace {

struct CliOptions {
    std::string configPath;
    std::string format = "svg";
    bool dumpConfig = false;
    bool noSpreadLinks = false;
    bool orthogonal = false;
    bool verbose = false;
    std::optional<LogLevel> logLevel;
    bool help = false;
    std::vector<std::string> positional;
};

void printHelp(std::ostream& out) {
    out << "make-map " << versionString() << "\n\n"
        << "Generates a map from a topology.\n\n"
        << "Usage:\n\n"
        << "    make-map [flags] [input [output]]\n\n"
        << "Flags:\n"
        << "    -c path             Read router options from a JSON file\n"
        << "    --dumpconf          Print the options as JSON and exit\n"
        << "    --no-spread-links   Don't spread links out when routing\n"
        << "    --orthogonal        Route with horizontal and vertical steps only\n"
        << "    --format svg|json   Output format (default: svg)\n"
        << "    -v                  Verbose logging (same as --log-level debug)\n"
        << "    --log-level name    trace, debug, info, warn, error or off\n"
        << "    -h, --help          Print this help\n\n"
        << "Input and output default to stdin and stdout; \"-\" selects them explicitly.\n";
}

std::string readAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string readFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    return readAll(file);
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions cli;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (arg.find("--format=") == 0) {
            cli.format = arg.substr(9);
        } else if (arg == "--format" && i + 1 < argc) {
            cli.format = argv[++i];
        } else if (arg == "--dumpconf" || arg == "-dumpconf") {
            cli.dumpConfig = true;
        } else if (arg == "--no-spread-links" || arg == "-no-spread-links") {
            cli.noSpreadLinks = true;
        } else if (arg == "--orthogonal") {
            cli.orthogonal = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cli.verbose = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.logLevel = Logger::parseLevel(argv[++i]);
            if (!cli.logLevel) {
                throw std::invalid_argument(std::string("Unknown log level: ") + argv[i]);
            }
        } else if (arg == "-h" || arg == "-help" || arg == "--help") {
            cli.help = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument("Unknown flag: " + arg);
        } else {
            cli.positional.push_back(arg);
        }
    }

    if (cli.format != "svg" && cli.format != "json") {
        throw std::invalid_argument("Unknown output format: " + cli.format);
    }
    if (cli.positional.size() > 2) {
        throw std::invalid_argument("Too many arguments");
    }
    return cli;
}

int run(const CliOptions& cli) {
    RouterOptions options;
    if (!cli.configPath.empty()) {
        options = TopologySerializer::optionsFromJson(readFile(cli.configPath));
    }
    if (cli.noSpreadLinks) {
        options.spreadLinks = false;
    }
    if (cli.orthogonal) {
        options.orthogonal = true;
    }

    if (cli.dumpConfig) {
        std::cout << TopologySerializer::optionsToJson(options) << std::endl;
        return 0;
    }

    std::string input;
    if (cli.positional.empty() || cli.positional[0] == "-") {
        input = readAll(std::cin);
    } else {
        input = readFile(cli.positional[0]);
    }

    Topology topology = TopologySerializer::fromJson(input);

    LinkRouter router(topology, options);
    auto [lo, hi] = router.extents();
    router.setExtents(lo.x - 1, lo.y - 1, hi.x + 1, hi.y + 1);

    std::size_t routed = router.routeLinks();
    if (routed < topology.links.size()) {
        LOG_WARN("[make-map] {} of {} links could not be routed",
                 topology.links.size() - routed, topology.links.size());
    }

    LabelPlacer labels;
    labels.place(topology);

    std::string output;
    if (cli.format == "json") {
        output = TopologySerializer::toJson(topology);
        output += '\n';
    } else {
        SvgExport svg;
        output = svg.exportToString(topology);
    }

    // Build the whole document before touching the destination so a
    // failed run never leaves a truncated file behind
    if (cli.positional.size() < 2 || cli.positional[1] == "-") {
        std::cout << output;
        std::cout.flush();
        return std::cout ? 0 : 1;
    }

    std::ofstream file(cli.positional[1]);
    if (!file.is_open()) {
        LOG_ERROR("[make-map] Cannot open output file: {}", cli.positional[1]);
        return 1;
    }
    file << output;
    if (!file) {
        LOG_ERROR("[make-map] Failed writing {}", cli.positional[1]);
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    Logger::initialize();

    CliOptions cli;
    try {
        cli = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        LOG_ERROR("[make-map] {}", e.what());
        printHelp(std::cerr);
        return 1;
    }

    if (cli.help) {
        printHelp(std::cout);
        return 0;
    }
    if (cli.logLevel) {
        Logger::setLevel(*cli.logLevel);
    } else if (cli.verbose) {
        Logger::setLevel(LogLevel::Debug);
    }

    try {
        return run(cli);
    } catch (const std::runtime_error& e) {
        LOG_ERROR("[make-map] {}", e.what());
        return 1;
    }
}
