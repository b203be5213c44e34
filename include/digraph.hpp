#pragma once
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>

#include "digraph_types.hpp"
#include "logger.hpp"


/*============================================================*/
/*                      WeightedDigraph                        */
/*============================================================*/
namespace routemap {

class WeightedDigraph {
public:
    WeightedDigraph();
    ~WeightedDigraph();

    // Load a line-oriented edge list ("AB5" per line), plain or gzip-compressed
    void load_from_edge_list(const std::string& filename);

    /* ---------- mutation ---------- */
    // Add or overwrite the edge from -> to (last write wins)
    void add_edge(const std::string& from, const std::string& to, Weight weight);
    void add_edge(NodeId from, NodeId to, Weight weight);
    NodeId get_or_add_node(const std::string& name);

    /* ---------- accessors ---------- */
    bool                      has_node(const std::string& name)     const { return name_to_id_map_.count(name) != 0; }
    std::optional<NodeId>     node_id(const std::string& name)      const;
    const std::string&        node_name(NodeId id)                  const;
    const std::vector<Arc>&   successors(NodeId id)                 const;
    std::optional<Weight>     edge_weight(NodeId from, NodeId to)   const;
    size_t                    getNumNodes()                         const { return nodes_.size(); }
    size_t                    getNumEdges()                         const { return total_edges_; }
    Weight                    getTotalWeight()                      const { return total_weight_; }
    Weight                    getMinWeight()                        const { return total_edges_ ? min_weight_ : 0; }
    Weight                    getMaxWeight()                        const { return max_weight_; }
    uint32_t                  getMaxOutDeg()                        const;
    double                    getAveOutDeg()                        const { return nodes_.empty() ? 0.0 : static_cast<double>(total_edges_) / nodes_.size(); }

    // Render a route as its concatenated node names
    std::string route_to_string(const Route& route, const std::string& sep = "") const;

    /* ---------- queries ---------- */
    // BFS reachability; a node always reaches itself
    bool has_path(NodeId from, NodeId to) const;

    // Dijkstra over edge weights; 0 when from == to, nullopt when unreachable
    std::optional<Weight> shortest_path_length(NodeId from, NodeId to) const;

    /* ---------- debug ---------- */
    void print_graph_stats() const;
    void printArcList()      const;

protected:
    /* ---------- nodes ---------- */
    std::vector<Node>                          nodes_;
    std::unordered_map<std::string, NodeId>    name_to_id_map_;

    /* ---------- arcs ---------- */
    std::vector<std::vector<Arc>>              adj_;  // adj_[v] = outgoing arcs, first-insertion order
    uint64_t                                   total_edges_{0};
    Weight                                     total_weight_{0};
    Weight                                     min_weight_{0};
    Weight                                     max_weight_{0};

protected:
    /* line parser */
    void parseEdgeLine(const std::string& line, const std::string& filename, uint64_t line_no);

    void recount_weights_();
};

} // namespace routemap
