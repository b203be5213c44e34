#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace routemap {

using NodeId = uint32_t;   // dense id, assigned in first-seen order
using Weight = uint64_t;   // edge weight / accumulated distance

inline constexpr NodeId INVALID_NODE = std::numeric_limits<NodeId>::max();

// Largest accepted edge weight. Any simple path (< 2^32 arcs) then sums below
// UINT64_MAX, which stays free as the "unreached" distance.
inline constexpr Weight MAX_EDGE_WEIGHT = std::numeric_limits<uint32_t>::max();

// Malformed input data or an invalid request; fatal for the caller.
class InvalidInput : public std::runtime_error {
public:
    explicit InvalidInput(const std::string& what) : std::runtime_error(what) {}
};

// a + b, throwing InvalidInput instead of wrapping
inline Weight checked_add(Weight a, Weight b) {
    if (b > std::numeric_limits<Weight>::max() - a) {
        throw InvalidInput("distance overflow: " + std::to_string(a) + " + " + std::to_string(b));
    }
    return a + b;
}

// station structure
struct Node {
    std::string name;
    uint32_t    out_deg{0};
    uint32_t    in_deg{0};
};

// Arc structure: one per ordered (from, to) pair
struct Arc {
    NodeId to{INVALID_NODE};
    Weight weight{0};
};

// A walk through the graph, compared by its node sequence
using Route = std::vector<NodeId>;

} // namespace routemap
