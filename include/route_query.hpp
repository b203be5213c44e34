#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <cstdint>

#include "digraph.hpp"
#include "route_enumerator.hpp"

namespace routemap {

enum class DistancePolicy {
    MaxStops,     // at most N stops
    ExactStops,   // exactly N stops
    MaxDistance   // total distance at most N
};

// Map a distance policy onto enumeration flags; throws InvalidInput on an unknown value
EnumerationPolicy to_enumeration_policy(DistancePolicy policy);

// "max_stops" / "exact_stops" / "max_distance"
DistancePolicy parse_distance_policy(const std::string& text);
const char*    distance_policy_name(DistancePolicy policy);

/*============================================================*/
/*                     RouteQueryEngine                        */
/*============================================================*/
// Queries against a loaded, read-only transit graph.
// An empty optional means "no such route".
class RouteQueryEngine {
public:
    explicit RouteQueryEngine(const WeightedDigraph& graph)
        : graph_(graph), enumerator_(graph) {}

    // Total distance along the given stations
    std::optional<Weight> route_length(const std::vector<std::string>& stops) const;

    // Total distance along a route written as single-character stations, e.g. "AEBCD".
    // Throws InvalidInput on empty text or whitespace/control characters.
    std::optional<Weight> route_length(const std::string& route_text) const;

    // Number of distinct routes from source to target within the bound
    uint64_t count_routes(const std::string& source, const std::string& target,
                          uint64_t bound, DistancePolicy policy) const;

    // The routes counted by count_routes()
    std::set<Route> find_routes(const std::string& source, const std::string& target,
                                uint64_t bound, DistancePolicy policy) const;

    // Distance of the shortest route; source == target asks for the shortest cycle
    std::optional<Weight> shortest_route(const std::string& source, const std::string& target) const;

    const WeightedDigraph& graph() const { return graph_; }

private:
    std::optional<Weight> shortest_cycle_(NodeId v) const;

    const WeightedDigraph& graph_;
    RouteEnumerator        enumerator_;
};

} // namespace routemap
