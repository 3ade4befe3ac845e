#pragma once

#include <cstddef>
#include <utility>
#include <vector>

#include "netconn/disjoint_set.hpp" // vertex_t

namespace netconn {

// Immutable adjacency list in CSR form: neighbors of v are
// neighbors_[offsets_[v] .. offsets_[v + 1]) in insertion order.
// Edges are directed as stored; list both directions for undirected graphs.
class AdjacencyList {
public:
    using Edge = std::pair<vertex_t, vertex_t>;

    AdjacencyList() = default;

    // lists[v] holds the neighbors of v. Throws std::out_of_range for a
    // neighbor id >= lists.size().
    explicit AdjacencyList(const std::vector<std::vector<vertex_t>>& lists);

    // Build from an edge list over n vertices. With symmetric, each edge (u,v)
    // is listed under u and under v. Neighbors keep edge order.
    static AdjacencyList from_edges(std::size_t n, const std::vector<Edge>& edges,
                                    bool symmetric = true);

    std::size_t vertex_count() const { return offsets_.empty() ? 0 : offsets_.size() - 1; }
    std::size_t entry_count() const { return neighbors_.size(); }

    std::size_t degree(vertex_t v) const { return offsets_[v + 1] - offsets_[v]; }
    const vertex_t* begin(vertex_t v) const { return neighbors_.data() + offsets_[v]; }
    const vertex_t* end(vertex_t v) const { return neighbors_.data() + offsets_[v + 1]; }

    // Copy of the neighbors of v (bounds checked).
    std::vector<vertex_t> neighbors(vertex_t v) const;

private:
    std::vector<std::size_t> offsets_{};
    std::vector<vertex_t> neighbors_{};
};

// Connected-component labeling by depth-first search.
//
// Vertices are scanned in order 0..n-1; each vertex still unvisited opens the
// next label (0, 1, ...) and everything reachable from it through unvisited
// vertices receives that label. The traversal keeps its own stack, so component
// size is not limited by call-stack depth.
class DepthFirstLabeler {
public:
    static constexpr int kUnvisited = -1;

    explicit DepthFirstLabeler(AdjacencyList adjacency);

    // Run the labeling and return one label per vertex. Every call starts from a
    // fresh label array.
    const std::vector<int>& depth_first_search();

    const std::vector<int>& labels() const { return labels_; }
    unsigned num_components() const { return components_; }
    const AdjacencyList& adjacency() const { return adj_; }

private:
    void visit(vertex_t start, int label);

    AdjacencyList adj_;
    std::vector<int> labels_{};
    std::vector<vertex_t> stack_{};
    unsigned components_{0};
};

} // namespace netconn
