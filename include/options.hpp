#pragma once

#include <string>
#include <vector>
#include <cstdint>

#include "route_query.hpp"

/* ===================== I/O option ===================== */
struct IOInOpts {
    std::string graphFile;             // input edge list ("AB5" per line, .gz allowed)
    std::vector<std::string> routes;   // routes to measure (length), e.g. "AEBCD"
};

struct IOOutOpts {
    std::string routesOut = "";        // output file for listed routes [stdout]
};

/* ===================== Global ===================== */
struct GlobalOpts {
    bool debug = false;
};

/* ===================== Query options ===================== */
struct QueryOpts {
    std::string source;                // starting station
    std::string target;                // final station
    int64_t     bound = -1;            // stops or distance, depending on policy
    routemap::DistancePolicy policy = routemap::DistancePolicy::MaxStops;
    bool        policy_set = false;
    std::string separator = "";        // printed between stations when listing routes
};

/* ===================== Tool mode ===================== */
enum class ToolMode {
    stat,       // print graph statistics
    length,     // distance along explicit routes
    count,      // number of routes within a bound
    routes,     // list the routes within a bound
    shortest    // distance of the shortest route (or cycle)
};

/* ===================== Whole configuration ===================== */
struct AppConfig {
    ToolMode   mode = ToolMode::stat;
    IOInOpts   in;
    IOOutOpts  out;
    GlobalOpts global;
    QueryOpts  query;
};
