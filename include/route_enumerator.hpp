#pragma once
#include <set>
#include <vector>
#include <cstdint>

#include "digraph.hpp"
#include "digraph_types.hpp"

namespace routemap {

// How the enumeration budget is consumed and which routes are kept.
struct EnumerationPolicy {
    bool cumulative{false};  // keep every route within the budget, not only those that exhaust it
    bool weighted{false};    // an arc consumes its weight instead of one stop
};

struct DFSFrame {
    NodeId   v;          // current station
    uint64_t nextIdx;    // next outgoing arc index to visit
    uint64_t budgetLeft; // remaining budget on arrival at v
};

/* ============================================================
 *  RouteEnumerator: all distinct routes from a source station
 *  whose consumption fits the budget. Routes may revisit
 *  stations; single-station routes are never reported.
 *  Weighted mode throws InvalidInput on a zero-weight cycle.
 * ============================================================ */
class RouteEnumerator {
public:
    explicit RouteEnumerator(const WeightedDigraph& graph)
        : graph_(graph) {}

    std::set<Route> enumerate(NodeId source, uint64_t bound, const EnumerationPolicy& policy) const;

    // Number of DFS frames expanded by the last enumerate() call
    uint64_t last_states() const { return last_states_; }

private:
    uint64_t consumption_(const Arc& a, const EnumerationPolicy& policy) const;
    bool     closes_free_cycle_(const std::vector<DFSFrame>& stk, NodeId v, uint64_t left) const;

    const WeightedDigraph& graph_;
    mutable uint64_t last_states_{0};
};

} // namespace routemap
