#include "netconn/connectivity.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace netconn {

namespace {

bool debug_enabled() {
    static const bool enabled = std::getenv("NETCONN_DEBUG") != nullptr;
    return enabled;
}

void check_endpoint(vertex_t v, std::size_t n) {
    if (v >= n) {
        throw std::out_of_range("neighbor id " + std::to_string(v) + " out of range [0, " +
                                std::to_string(n) + ")");
    }
}

} // namespace

AdjacencyList::AdjacencyList(const std::vector<std::vector<vertex_t>>& lists) {
    const std::size_t n = lists.size();
    offsets_.assign(n + 1, 0);
    for (std::size_t v = 0; v < n; ++v) offsets_[v + 1] = offsets_[v] + lists[v].size();
    neighbors_.reserve(offsets_[n]);
    for (const auto& list : lists) {
        for (vertex_t u : list) {
            check_endpoint(u, n);
            neighbors_.push_back(u);
        }
    }
}

AdjacencyList AdjacencyList::from_edges(std::size_t n, const std::vector<Edge>& edges,
                                        bool symmetric) {
    AdjacencyList out;
    // Counting pass, then prefix sums give each vertex its slot range.
    std::vector<std::size_t> counts(n + 1, 0);
    for (const auto& e : edges) {
        check_endpoint(e.first, n);
        check_endpoint(e.second, n);
        ++counts[e.first + 1];
        if (symmetric) ++counts[e.second + 1];
    }
    for (std::size_t v = 0; v < n; ++v) counts[v + 1] += counts[v];
    out.offsets_ = counts;
    out.neighbors_.resize(counts[n]);

    // Fill forward so each vertex sees its neighbors in edge order.
    std::vector<std::size_t> cursor(counts.begin(), counts.end() - 1);
    for (const auto& e : edges) {
        out.neighbors_[cursor[e.first]++] = e.second;
        if (symmetric) out.neighbors_[cursor[e.second]++] = e.first;
    }
    return out;
}

std::vector<vertex_t> AdjacencyList::neighbors(vertex_t v) const {
    if (v >= vertex_count()) {
        throw std::out_of_range("vertex id " + std::to_string(v) + " out of range [0, " +
                                std::to_string(vertex_count()) + ")");
    }
    return std::vector<vertex_t>(begin(v), end(v));
}

DepthFirstLabeler::DepthFirstLabeler(AdjacencyList adjacency) : adj_(std::move(adjacency)) {}

const std::vector<int>& DepthFirstLabeler::depth_first_search() {
    const std::size_t n = adj_.vertex_count();
    labels_.assign(n, kUnvisited);
    components_ = 0;
    int now = -1;
    for (std::size_t v = 0; v < n; ++v) {
        if (labels_[v] != kUnvisited) continue;
        ++now;
        visit(static_cast<vertex_t>(v), now);
    }
    components_ = static_cast<unsigned>(now + 1);
    stack_.clear();
    stack_.shrink_to_fit();

    if (debug_enabled()) {
        std::cerr << "[dfs_labels] n=" << n
                  << " entries=" << adj_.entry_count()
                  << " comps=" << components_ << "\n";
    }
    return labels_;
}

void DepthFirstLabeler::visit(vertex_t start, int label) {
    stack_.clear();
    stack_.push_back(start);
    labels_[start] = label;
    while (!stack_.empty()) {
        const vertex_t k = stack_.back();
        stack_.pop_back();
        for (const vertex_t* it = adj_.begin(k); it != adj_.end(k); ++it) {
            if (labels_[*it] == kUnvisited) {
                // label on push so a vertex enters the stack at most once
                labels_[*it] = label;
                stack_.push_back(*it);
            }
        }
    }
}

} // namespace netconn
