#include "../include/route_query.hpp"
#include "../include/logger.hpp"

#include <cctype>
#include <limits>

namespace routemap {

EnumerationPolicy to_enumeration_policy(DistancePolicy policy) {
    switch (policy) {
        case DistancePolicy::MaxStops:    return EnumerationPolicy{/*cumulative=*/true,  /*weighted=*/false};
        case DistancePolicy::ExactStops:  return EnumerationPolicy{/*cumulative=*/false, /*weighted=*/false};
        case DistancePolicy::MaxDistance: return EnumerationPolicy{/*cumulative=*/true,  /*weighted=*/true};
    }
    throw InvalidInput("unknown distance policy " + std::to_string(static_cast<int>(policy)));
}

DistancePolicy parse_distance_policy(const std::string& text) {
    if (text == "max_stops")    return DistancePolicy::MaxStops;
    if (text == "exact_stops")  return DistancePolicy::ExactStops;
    if (text == "max_distance") return DistancePolicy::MaxDistance;
    throw InvalidInput("unknown distance policy '" + text + "' (expected max_stops, exact_stops or max_distance)");
}

const char* distance_policy_name(DistancePolicy policy) {
    switch (policy) {
        case DistancePolicy::MaxStops:    return "max_stops";
        case DistancePolicy::ExactStops:  return "exact_stops";
        case DistancePolicy::MaxDistance: return "max_distance";
    }
    return "unknown";
}

/*------------------------------------------------------------*/
/*                       route length                          */
/*------------------------------------------------------------*/
std::optional<Weight> RouteQueryEngine::route_length(const std::vector<std::string>& stops) const {
    if (stops.size() < 2) return std::nullopt;

    Weight total = 0;
    std::optional<NodeId> prev = graph_.node_id(stops[0]);
    if (!prev) return std::nullopt;

    for (size_t i = 1; i < stops.size(); ++i) {
        std::optional<NodeId> cur = graph_.node_id(stops[i]);
        if (!cur) return std::nullopt;

        std::optional<Weight> w = graph_.edge_weight(*prev, *cur);
        if (!w) {
            debug_stream() << "No track " << stops[i - 1] << "->" << stops[i] << "\n";
            return std::nullopt;
        }
        total = checked_add(total, *w);
        prev = cur;
    }
    return total;
}

std::optional<Weight> RouteQueryEngine::route_length(const std::string& route_text) const {
    if (route_text.empty()) throw InvalidInput("empty route");

    std::vector<std::string> stops;
    stops.reserve(route_text.size());
    for (char c : route_text) {
        if (!std::isgraph(static_cast<unsigned char>(c))) {
            throw InvalidInput("malformed route '" + route_text + "': stations must be single printable characters");
        }
        stops.emplace_back(1, c);
    }
    return route_length(stops);
}

/*------------------------------------------------------------*/
/*                      route counting                         */
/*------------------------------------------------------------*/
std::set<Route> RouteQueryEngine::find_routes(const std::string& source, const std::string& target,
                                              uint64_t bound, DistancePolicy policy) const {
    const EnumerationPolicy ep = to_enumeration_policy(policy);

    std::optional<NodeId> s = graph_.node_id(source);
    std::optional<NodeId> t = graph_.node_id(target);
    if (!s || !t) {
        debug_stream() << "Unknown station in " << source << "->" << target << "\n";
        return {};
    }

    std::set<Route> routes = enumerator_.enumerate(*s, bound, ep);
    for (auto it = routes.begin(); it != routes.end(); ) {
        if (it->back() != *t) it = routes.erase(it);
        else                  ++it;
    }
    return routes;
}

uint64_t RouteQueryEngine::count_routes(const std::string& source, const std::string& target,
                                        uint64_t bound, DistancePolicy policy) const {
    return find_routes(source, target, bound, policy).size();
}

/*------------------------------------------------------------*/
/*                      shortest route                         */
/*------------------------------------------------------------*/
std::optional<Weight> RouteQueryEngine::shortest_route(const std::string& source, const std::string& target) const {
    std::optional<NodeId> s = graph_.node_id(source);
    std::optional<NodeId> t = graph_.node_id(target);
    if (!s || !t) return std::nullopt;
    if (!graph_.has_path(*s, *t)) return std::nullopt;

    if (*s != *t) return graph_.shortest_path_length(*s, *t);
    return shortest_cycle_(*s);
}

// Leave v at least once: the trivial zero-length route does not count
std::optional<Weight> RouteQueryEngine::shortest_cycle_(NodeId v) const {
    std::optional<Weight> best;
    for (const Arc& a : graph_.successors(v)) {
        std::optional<Weight> back = graph_.shortest_path_length(a.to, v);
        if (!back) continue;
        const Weight cand = checked_add(a.weight, *back);
        if (!best || cand < *best) best = cand;
    }
    return best;
}

} // namespace routemap
