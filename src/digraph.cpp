#include "../include/digraph.hpp"
#include "../include/line_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <functional>
#include <iomanip>
#include <limits>
#include <queue>
#include <utility>

namespace routemap {

WeightedDigraph::WeightedDigraph()  = default;
WeightedDigraph::~WeightedDigraph() = default;

// Load edge list into the graph structure
void WeightedDigraph::load_from_edge_list(const std::string& filename) {
    log_stream() << "Loading transit graph from '" << filename << "' ...\n";

    LineReader reader(filename);
    std::string line;
    uint64_t n_lines = 0;
    while (reader.getline(line)) {
        if (line.empty() || line[0] == '#') continue;
        parseEdgeLine(line, filename, reader.line_number());
        ++n_lines;
    }

    debug_stream() << "Parsed " << n_lines << " edge lines from '" << filename << "'\n";
    return;
}

/*------------------------------------------------------------*/
/*                     edge-line parser                        */
/*------------------------------------------------------------*/
// <from:1 char><to:1 char><weight:decimal>, e.g. "AB5"
void WeightedDigraph::parseEdgeLine(const std::string& line, const std::string& filename, uint64_t line_no) {
    auto fail = [&](const std::string& why) {
        throw InvalidInput(filename + ":" + std::to_string(line_no) + ": " + why + " in edge line '" + line + "'");
    };

    if (line.size() < 3) fail("expected <from><to><weight>");

    const unsigned char c_from = static_cast<unsigned char>(line[0]);
    const unsigned char c_to   = static_cast<unsigned char>(line[1]);
    if (!std::isgraph(c_from) || !std::isgraph(c_to)) fail("invalid station identifier");

    // weight occupies the rest of the line, surrounding blanks tolerated
    size_t beg = 2, end = line.size();
    while (beg < end && std::isspace(static_cast<unsigned char>(line[beg])))     ++beg;
    while (end > beg && std::isspace(static_cast<unsigned char>(line[end - 1]))) --end;
    if (beg == end) fail("missing weight");

    Weight weight = 0;
    const char* first = line.data() + beg;
    const char* last  = line.data() + end;
    auto [ptr, ec] = std::from_chars(first, last, weight);
    if (ec == std::errc::result_out_of_range) fail("weight out of range");
    if (ec != std::errc() || ptr != last)     fail("non-numeric weight");
    if (weight > MAX_EDGE_WEIGHT)             fail("weight exceeds " + std::to_string(MAX_EDGE_WEIGHT));

    add_edge(std::string(1, line[0]), std::string(1, line[1]), weight);
}

/*------------------------------------------------------------*/
/*                         mutation                            */
/*------------------------------------------------------------*/
NodeId WeightedDigraph::get_or_add_node(const std::string& name) {
    if (name.empty()) throw InvalidInput("station name must not be empty");

    auto it = name_to_id_map_.find(name);
    if (it != name_to_id_map_.end()) return it->second;

    /* unseen before */
    NodeId id = static_cast<NodeId>(nodes_.size());
    name_to_id_map_[name] = id;
    nodes_.push_back(Node{name, 0, 0});
    adj_.emplace_back();
    return id;
}

void WeightedDigraph::add_edge(const std::string& from, const std::string& to, Weight weight) {
    NodeId v = get_or_add_node(from);
    NodeId w = get_or_add_node(to);
    add_edge(v, w, weight);
}

void WeightedDigraph::add_edge(NodeId from, NodeId to, Weight weight) {
    if (from >= nodes_.size() || to >= nodes_.size()) {
        throw InvalidInput("add_edge: node id out of range (" + std::to_string(from) + " -> " + std::to_string(to) + ")");
    }
    if (weight > MAX_EDGE_WEIGHT) {
        throw InvalidInput("add_edge: weight " + std::to_string(weight) + " exceeds " + std::to_string(MAX_EDGE_WEIGHT));
    }

    for (Arc& a : adj_[from]) {
        if (a.to != to) continue;
        debug_stream() << "Overwriting " << nodes_[from].name << "->" << nodes_[to].name
                       << " weight " << a.weight << " with " << weight << "\n";
        a.weight = weight;
        recount_weights_();
        return;
    }

    adj_[from].push_back(Arc{to, weight});
    ++nodes_[from].out_deg;
    ++nodes_[to].in_deg;

    min_weight_ = total_edges_ ? std::min(min_weight_, weight) : weight;
    max_weight_ = std::max(max_weight_, weight);
    total_weight_ += weight;
    ++total_edges_;
}

void WeightedDigraph::recount_weights_() {
    total_weight_ = 0;
    min_weight_   = std::numeric_limits<Weight>::max();
    max_weight_   = 0;
    for (const auto& arcs : adj_) {
        for (const Arc& a : arcs) {
            total_weight_ += a.weight;
            min_weight_ = std::min(min_weight_, a.weight);
            max_weight_ = std::max(max_weight_, a.weight);
        }
    }
    if (total_edges_ == 0) min_weight_ = 0;
}

/*============================================================*/
/*                  getters & summary                         */
/*============================================================*/
std::optional<NodeId> WeightedDigraph::node_id(const std::string& name) const {
    auto it = name_to_id_map_.find(name);
    if (it == name_to_id_map_.end()) return std::nullopt;
    return it->second;
}

const std::string& WeightedDigraph::node_name(NodeId id) const {
    if (id >= nodes_.size())
        throw std::out_of_range("node id " + std::to_string(id) + " not found");
    return nodes_[id].name;
}

const std::vector<Arc>& WeightedDigraph::successors(NodeId id) const {
    static const std::vector<Arc> kNoArcs;
    return id < adj_.size() ? adj_[id] : kNoArcs;
}

std::optional<Weight> WeightedDigraph::edge_weight(NodeId from, NodeId to) const {
    for (const Arc& a : successors(from)) {
        if (a.to == to) return a.weight;
    }
    return std::nullopt;
}

uint32_t WeightedDigraph::getMaxOutDeg() const {
    uint32_t max_deg = 0;
    for (const auto& n : nodes_) max_deg = std::max(max_deg, n.out_deg);
    return max_deg;
}

std::string WeightedDigraph::route_to_string(const Route& route, const std::string& sep) const {
    std::string out;
    for (size_t i = 0; i < route.size(); ++i) {
        if (i) out += sep;
        out += node_name(route[i]);
    }
    return out;
}

/*============================================================*/
/*                        queries                             */
/*============================================================*/
bool WeightedDigraph::has_path(NodeId from, NodeId to) const {
    const NodeId V = static_cast<NodeId>(nodes_.size());
    if (from >= V || to >= V) return false;
    if (from == to) return true;

    std::vector<uint8_t> vis(V, 0);
    std::queue<NodeId> q;
    q.push(from); vis[from] = 1;

    while (!q.empty()) {
        NodeId u = q.front(); q.pop();
        for (const Arc& a : adj_[u]) {
            if (a.to == to) return true;
            if (!vis[a.to]) { vis[a.to] = 1; q.push(a.to); }
        }
    }
    return false;
}

std::optional<Weight> WeightedDigraph::shortest_path_length(NodeId from, NodeId to) const {
    const NodeId V = static_cast<NodeId>(nodes_.size());
    if (from >= V || to >= V) return std::nullopt;
    if (from == to) return Weight{0};

    const Weight INF = std::numeric_limits<Weight>::max();
    std::vector<Weight> dist(V, INF);
    dist[from] = 0;

    using QN = std::pair<Weight, NodeId>;
    std::priority_queue<QN, std::vector<QN>, std::greater<QN>> pq;
    pq.emplace(0, from);

    while (!pq.empty()) {
        auto [d, u] = pq.top(); pq.pop();
        if (d != dist[u]) continue;
        if (u == to) return d;  // settled

        for (const Arc& a : adj_[u]) {
            const Weight nd = checked_add(d, a.weight);
            if (nd < dist[a.to]) {
                dist[a.to] = nd;
                pq.emplace(nd, a.to);
            }
        }
    }
    return std::nullopt;
}

/*------------------------------------------------------------*/
/*                     print summary                          */
/*------------------------------------------------------------*/
void WeightedDigraph::print_graph_stats() const {
    const int label_width = 25, value_width = 12;
    log_stream() << std::left << std::setw(label_width) << "Transit graph stats:" << '\n';
    log_stream() << "   - " << std::left << std::setw(label_width) << "Stations:"         << std::right << std::setw(value_width) << getNumNodes() << '\n';
    log_stream() << "   - " << std::left << std::setw(label_width) << "Directed tracks:"  << std::right << std::setw(value_width) << getNumEdges() << '\n';
    log_stream() << "   - " << std::left << std::setw(label_width) << "Total distance:"   << std::right << std::setw(value_width) << getTotalWeight() << '\n';
    log_stream() << "   - " << std::left << std::setw(label_width) << "Min track length:" << std::right << std::setw(value_width) << getMinWeight() << '\n';
    log_stream() << "   - " << std::left << std::setw(label_width) << "Max track length:" << std::right << std::setw(value_width) << getMaxWeight() << '\n';
    log_stream() << "   - " << std::left << std::setw(label_width) << "Max out-degree:"   << std::right << std::setw(value_width) << getMaxOutDeg() << '\n';
    log_stream() << "   - " << std::left << std::setw(label_width) << "Average out-degree:" << std::right << std::setw(value_width)
                 << std::fixed << std::setprecision(3) << getAveOutDeg() << '\n';
}

// debug
void WeightedDigraph::printArcList() const {
    debug_stream() << "=== Arc list ===\n";
    for (NodeId v = 0; v < adj_.size(); ++v) {
        for (const Arc& a : adj_[v]) {
            debug_stream() << nodes_[v].name << "(v=" << v << ") -> "
                           << nodes_[a.to].name << "(w=" << a.to << ")"
                           << ", weight=" << a.weight << '\n';
        }
    }
}

} // namespace routemap
