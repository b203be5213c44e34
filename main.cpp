#include <iostream>
#include <string>
#include <iomanip>
#include <stdexcept>

#include "include/OptionParser.hpp"
#include "include/options.hpp"
#include "include/ProgramMetadata.hpp"
#include "include/digraph.hpp"
#include "include/route_query.hpp"
#include "include/route_writer.hpp"
#include "include/logger.hpp"
#include "include/sys.hpp"

using namespace routemap;

static const char* const NO_SUCH_ROUTE = "NO SUCH ROUTE";

static inline bool is_top_help_flag(const char* s) {
    return (std::string(s) == "-h" || std::string(s) == "--help");
}
static inline bool is_top_ver_flag(const char* s) {
    return (std::string(s) == "-v" || std::string(s) == "--version");
}

static std::string format_distance(const std::optional<Weight>& d) {
    return d ? std::to_string(*d) : std::string(NO_SUCH_ROUTE);
}

static int run(const std::string& sub, int argc, char** argv) {
    if (sub == "stat") {
        AppConfig cfg = main_stat(argc, argv);
        WeightedDigraph G;
        G.load_from_edge_list(cfg.in.graphFile);
        G.print_graph_stats();
        G.printArcList();
    } else if (sub == "length") {
        AppConfig cfg = main_length(argc, argv);
        WeightedDigraph G;
        G.load_from_edge_list(cfg.in.graphFile);
        RouteQueryEngine Q(G);
        for (const auto& route : cfg.in.routes) {
            std::cout << format_distance(Q.route_length(route)) << "\n";
        }
    } else if (sub == "count") {
        AppConfig cfg = main_count(argc, argv);
        WeightedDigraph G;
        G.load_from_edge_list(cfg.in.graphFile);
        RouteQueryEngine Q(G);
        std::cout << Q.count_routes(cfg.query.source, cfg.query.target,
                                    static_cast<uint64_t>(cfg.query.bound), cfg.query.policy) << "\n";
    } else if (sub == "routes") {
        AppConfig cfg = main_routes(argc, argv);
        WeightedDigraph G;
        G.load_from_edge_list(cfg.in.graphFile);
        RouteQueryEngine Q(G);
        const auto routes = Q.find_routes(cfg.query.source, cfg.query.target,
                                          static_cast<uint64_t>(cfg.query.bound), cfg.query.policy);
        RouteWriter writer(cfg.out.routesOut);
        for (const Route& r : routes) {
            writer.write_line(G.route_to_string(r, cfg.query.separator));
        }
        writer.flush();
        log_stream() << "Routes written: " << writer.lines() << "\n";
    } else if (sub == "shortest") {
        AppConfig cfg = main_shortest(argc, argv);
        WeightedDigraph G;
        G.load_from_edge_list(cfg.in.graphFile);
        RouteQueryEngine Q(G);
        std::cout << format_distance(Q.shortest_route(cfg.query.source, cfg.query.target)) << "\n";
    } else {
        error_stream() << "Unknown subcommand: " << sub << "\n";
        help(argv);
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { help(argv); return 1; }
    if (is_top_help_flag(argv[1])) { help(argv); return 0; }
    if (is_top_ver_flag(argv[1]))  { std::cerr << program::version << "\n"; return 0; }

    // Dispatch by subcommand
    const std::string sub = argv[1];

    // timing
    double realtime0 = realtime();

    int ret = 0;
    try {
        ret = run(sub, argc, argv);
    } catch (const InvalidInput& e) {
        error_stream() << "Invalid input: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        error_stream() << e.what() << "\n";
        return 1;
    }
    if (ret != 0) return ret;

    debug_stream() << "Command: " << program::cmdline(argc, argv) << "\n";
    log_stream()
        << "Real time: " << std::fixed << std::setprecision(3)
        << (realtime() - realtime0) << " sec; CPU: " << cputime()
        << " sec; Peak RSS: " << (peakrss() / 1024.0 / 1024.0 / 1024.0) << " GB\n";

    return 0;
}
