#include "../include/route_enumerator.hpp"
#include "../include/logger.hpp"

#include <string>

namespace routemap {

uint64_t RouteEnumerator::consumption_(const Arc& a, const EnumerationPolicy& policy) const {
    return policy.weighted ? a.weight : 1;
}

// Budgets never grow along the stack, so the frames sharing `left` are a
// suffix of it; meeting `v` there again means a cycle that costs nothing.
bool RouteEnumerator::closes_free_cycle_(const std::vector<DFSFrame>& stk, NodeId v, uint64_t left) const {
    for (auto it = stk.rbegin(); it != stk.rend() && it->budgetLeft == left; ++it) {
        if (it->v == v) return true;
    }
    return false;
}

std::set<Route> RouteEnumerator::enumerate(NodeId source, uint64_t bound, const EnumerationPolicy& policy) const {
    std::set<Route> results;
    last_states_ = 0;
    if (source >= graph_.getNumNodes() || bound == 0) return results;

    // route prefix shared by all frames; path[i] is the station of stk[i]
    Route path; path.reserve(16);
    std::vector<DFSFrame> stk; stk.reserve(16);

    // a station is entered with `left` budget remaining
    auto enter = [&](NodeId v, uint64_t left) {
        path.push_back(v);
        stk.push_back({v, 0, left});
        ++last_states_;

        const bool exhausted = (left == 0);
        if ((exhausted || policy.cumulative) && path.size() > 1) {
            results.insert(path);
        }
    };

    enter(source, bound);

    while (!stk.empty()) {
        DFSFrame& top = stk.back();
        const std::vector<Arc>& arcs = graph_.successors(top.v);

        if (top.budgetLeft == 0 || top.nextIdx >= arcs.size()) {
            stk.pop_back();
            path.pop_back();
            continue;
        }

        const Arc& a = arcs[top.nextIdx++];
        const uint64_t cost = consumption_(a, policy);
        if (cost > top.budgetLeft) continue;

        const uint64_t left = top.budgetLeft - cost;
        if (cost == 0 && closes_free_cycle_(stk, a.to, left)) {
            throw InvalidInput("zero-weight cycle through " + graph_.node_name(a.to)
                               + " cannot be bounded by distance");
        }

        enter(a.to, left);  // invalidates `top`
    }

    debug_stream() << "Enumerated " << results.size() << " routes from " << graph_.node_name(source)
                   << " in " << last_states_ << " states (bound=" << bound
                   << ", cumulative=" << policy.cumulative << ", weighted=" << policy.weighted << ")\n";
    return results;
}

} // namespace routemap
