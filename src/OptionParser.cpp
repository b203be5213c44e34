#include "../include/OptionParser.hpp"
#include "../include/ProgramMetadata.hpp"
#include "../include/logger.hpp"

#include <getopt.h>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <iomanip>
#include <stdexcept>

using routemap::DistancePolicy;

static void die_(const std::string& msg) { error_stream() << msg << "\n"; std::exit(1); }

static int64_t parse_bound_(const char* s) {
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != std::string(s).size()) die_(std::string("--bound is not an integer: ") + s);
        return static_cast<int64_t>(v);
    } catch (const std::invalid_argument&) {
        die_(std::string("--bound is not an integer: ") + s);
    } catch (const std::out_of_range&) {
        die_(std::string("--bound out of range: ") + s);
    }
    return -1;
}

static DistancePolicy parse_policy_(const char* s) {
    try {
        return routemap::parse_distance_policy(s);
    } catch (const routemap::InvalidInput& e) {
        die_(e.what());
    }
    return DistancePolicy::MaxStops;
}

// Non-option arguments after the subcommand name (getopt moves them to the end)
static std::vector<std::string> positional_args_(int argc, char** argv, const std::string& sub) {
    std::vector<std::string> out;
    bool skipped_sub = false;
    for (int i = optind; i < argc; ++i) {
        if (!skipped_sub && sub == argv[i]) { skipped_sub = true; continue; }
        out.emplace_back(argv[i]);
    }
    return out;
}

static void validate_and_print(AppConfig& cfg) {
    using std::left;
    using std::setw;

    auto ensure = [&](bool ok, const char* msg){ if (!ok) die_(msg); };
    auto onoff  = [](bool b){ return b ? "ON" : "OFF"; };

    const int KEYW = 25;

    auto kv = [&](const char* key, const auto& val) {
        std::ostringstream oss;
        oss << left << setw(KEYW) << key << ": " << val;
        log_stream() << oss.str() << "\n";
    };

    if (cfg.global.debug) set_debug(true);

    const char* mode =
        cfg.mode == ToolMode::stat     ? "stat" :
        cfg.mode == ToolMode::length   ? "length" :
        cfg.mode == ToolMode::count    ? "count" :
        cfg.mode == ToolMode::routes   ? "routes" :
        cfg.mode == ToolMode::shortest ? "shortest" : "unknown";

    ensure(!cfg.in.graphFile.empty(), "--graph is required");

    kv("Version", program::version);
    kv("Mode", mode);
    kv("Debug", onoff(cfg.global.debug));
    kv("Graph file", cfg.in.graphFile);

    switch (cfg.mode) {
        case ToolMode::stat:
            break;

        case ToolMode::length:
            ensure(!cfg.in.routes.empty(), "at least one ROUTE is required");
            kv("Routes", cfg.in.routes.size());
            break;

        case ToolMode::count:
        case ToolMode::routes:
            ensure(!cfg.query.source.empty(), "-s/--source is required");
            ensure(!cfg.query.target.empty(), "-t/--target is required");
            ensure(cfg.query.bound >= 0,      "-b/--bound is required and must be >= 0");
            ensure(cfg.query.policy_set,      "-p/--policy is required");
            kv("Source",      cfg.query.source);
            kv("Target",      cfg.query.target);
            kv("Bound",       cfg.query.bound);
            kv("Policy",      routemap::distance_policy_name(cfg.query.policy));
            if (cfg.mode == ToolMode::routes) {
                kv("Output", (cfg.out.routesOut.empty() ? std::string("stdout") : cfg.out.routesOut));
            }
            break;

        case ToolMode::shortest:
            ensure(!cfg.query.source.empty(), "-s/--source is required");
            ensure(!cfg.query.target.empty(), "-t/--target is required");
            kv("Source", cfg.query.source);
            kv("Target", cfg.query.target);
            break;
    }
}

void help(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " <subcommand> [options]\n\n"
        << program::description << "\n"
        << "Version: " << program::version << "\n"
        << "Date:    " << program::build_date << "\n"
        << "\n"
        << "Subcommands:\n"
        << "  stat        collect statistics about a transit graph\n"
        << "  length      distance along explicit routes\n"
        << "  count       number of routes between two stations within a bound\n"
        << "  routes      list the routes between two stations within a bound\n"
        << "  shortest    distance of the shortest route between two stations\n\n"
        << "Graph format: one track per line, '<from><to><distance>', e.g. 'AB5' (.gz accepted)\n\n";
}

void help_stat(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -g FILE\n\n"
        << "Collect statistics about a transit graph\n\n"
        << "Input/Output:\n"
        << "  -g, --graph  FILE    input edge list\n\n"
        << "General Options:\n"
        << "  -d, --debug          debug output\n"
        << "  -h, --help           show this help\n\n";
}

AppConfig main_stat(int argc, char** argv) {
    if (argc < 3) { help_stat(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::stat;

    const struct option long_opts[] = {
        {"graph",   required_argument, nullptr, 'g'},
        {"debug",   no_argument,       nullptr, 'd'},
        {"help",    no_argument,       nullptr, 'h'},
        {0,0,0,0}
    };
    const char* short_opts = "g:dh";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts, &idx)) != -1) {
        switch (c) {
            case 'g': cfg.in.graphFile = optarg; break;
            case 'd': cfg.global.debug = true;   break;
            case 'h': help_stat(argv); std::exit(0);
            default:  help_stat(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);
    return cfg;
}

void help_length(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -g FILE ROUTE [ROUTE ...]\n\n"
        << "Print the distance along each route, or 'NO SUCH ROUTE'\n"
        << "(route format: concatenated stations, e.g. 'AEBCD')\n\n"
        << "Input/Output:\n"
        << "  -g, --graph  FILE    input edge list\n\n"
        << "General Options:\n"
        << "  -d, --debug          debug output\n"
        << "  -h, --help           show this help\n\n";
}

AppConfig main_length(int argc, char** argv) {
    if (argc < 3) { help_length(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::length;
    const std::string sub = argv[1];

    const struct option long_opts[] = {
        {"graph",   required_argument, nullptr, 'g'},
        {"debug",   no_argument,       nullptr, 'd'},
        {"help",    no_argument,       nullptr, 'h'},
        {0,0,0,0}
    };
    const char* short_opts = "g:dh";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts, &idx)) != -1) {
        switch (c) {
            case 'g': cfg.in.graphFile = optarg; break;
            case 'd': cfg.global.debug = true;   break;
            case 'h': help_length(argv); std::exit(0);
            default:  help_length(argv); std::exit(1);
        }
    }
    cfg.in.routes = positional_args_(argc, argv, sub);

    validate_and_print(cfg);
    return cfg;
}

static void help_bounded_(char** argv, const char* what, bool with_output) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -g FILE -s STATION -t STATION -b INT -p POLICY"
        << (with_output ? " [-o FILE]" : "") << "\n\n"
        << what << "\n\n"
        << "Input/Output:\n"
        << "  -g, --graph     FILE    input edge list\n";
    if (with_output) {
        std::cerr
            << "  -o, --output    FILE    output file, one route per line (.gz compresses) [stdout]\n"
            << "      --sep       STR     separator printed between stations [\"\"]\n";
    }
    std::cerr
        << "\nQuery Options:\n"
        << "  -s, --source    STR     starting station\n"
        << "  -t, --target    STR     final station\n"
        << "  -b, --bound     INT     maximum (or exact) stops, or maximum distance\n"
        << "  -p, --policy    STR     max_stops | exact_stops | max_distance\n\n"
        << "General Options:\n"
        << "  -d, --debug             debug output\n"
        << "  -h, --help              show this help\n\n";
}

void help_count(char** argv) {
    help_bounded_(argv, "Count the distinct routes from source to target within the bound", false);
}

void help_routes(char** argv) {
    help_bounded_(argv, "List the distinct routes from source to target within the bound", true);
}

static AppConfig parse_bounded_(int argc, char** argv, ToolMode mode, void (*help_fn)(char**)) {
    if (argc < 3) { help_fn(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = mode;

    const struct option long_opts[] = {
        {"graph",   required_argument, nullptr, 'g'},
        {"output",  required_argument, nullptr, 'o'},
        {"sep",     required_argument, nullptr, 1001},
        {"source",  required_argument, nullptr, 's'},
        {"target",  required_argument, nullptr, 't'},
        {"bound",   required_argument, nullptr, 'b'},
        {"policy",  required_argument, nullptr, 'p'},
        {"debug",   no_argument,       nullptr, 'd'},
        {"help",    no_argument,       nullptr, 'h'},
        {0,0,0,0}
    };
    const char* short_opts = (mode == ToolMode::routes) ? "g:o:s:t:b:p:dh" : "g:s:t:b:p:dh";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts, &idx)) != -1) {
        switch (c) {
            case 'g':  cfg.in.graphFile      = optarg;               break;
            case 'o':  cfg.out.routesOut     = optarg;               break;
            case 1001: cfg.query.separator   = optarg;               break;
            case 's':  cfg.query.source      = optarg;               break;
            case 't':  cfg.query.target      = optarg;               break;
            case 'b':  cfg.query.bound       = parse_bound_(optarg); break;
            case 'p':  cfg.query.policy      = parse_policy_(optarg);
                       cfg.query.policy_set  = true;                 break;
            case 'd':  cfg.global.debug      = true;                 break;
            case 'h': help_fn(argv); std::exit(0);
            default:  help_fn(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);
    return cfg;
}

AppConfig main_count(int argc, char** argv) {
    return parse_bounded_(argc, argv, ToolMode::count, help_count);
}

AppConfig main_routes(int argc, char** argv) {
    return parse_bounded_(argc, argv, ToolMode::routes, help_routes);
}

void help_shortest(char** argv) {
    std::cerr
        << "Usage: " << argv[0] << " " << argv[1] << " -g FILE -s STATION -t STATION\n\n"
        << "Print the distance of the shortest route, or 'NO SUCH ROUTE'\n"
        << "(source == target asks for the shortest round trip)\n\n"
        << "Input/Output:\n"
        << "  -g, --graph   FILE    input edge list\n\n"
        << "Query Options:\n"
        << "  -s, --source  STR     starting station\n"
        << "  -t, --target  STR     final station\n\n"
        << "General Options:\n"
        << "  -d, --debug           debug output\n"
        << "  -h, --help            show this help\n\n";
}

AppConfig main_shortest(int argc, char** argv) {
    if (argc < 3) { help_shortest(argv); std::exit(1); }

    AppConfig cfg;
    cfg.mode = ToolMode::shortest;

    const struct option long_opts[] = {
        {"graph",   required_argument, nullptr, 'g'},
        {"source",  required_argument, nullptr, 's'},
        {"target",  required_argument, nullptr, 't'},
        {"debug",   no_argument,       nullptr, 'd'},
        {"help",    no_argument,       nullptr, 'h'},
        {0,0,0,0}
    };
    const char* short_opts = "g:s:t:dh";

    int idx = 0, c;
    while ((c = getopt_long(argc, argv, short_opts, long_opts, &idx)) != -1) {
        switch (c) {
            case 'g': cfg.in.graphFile  = optarg; break;
            case 's': cfg.query.source  = optarg; break;
            case 't': cfg.query.target  = optarg; break;
            case 'd': cfg.global.debug  = true;   break;
            case 'h': help_shortest(argv); std::exit(0);
            default:  help_shortest(argv); std::exit(1);
        }
    }

    validate_and_print(cfg);
    return cfg;
}
