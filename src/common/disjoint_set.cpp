// ----------------------------------------------------------------------------
// disjoint_set.cpp
//
// Quick-union forest with batched root lookup, two path-compression variants,
// unbalanced batch union and size-weighted scalar union.
//
//  - Batches move in lock step: gather for every walker, then scatter. This
//    keeps results identical to element-wise array semantics even when a batch
//    contains a vertex together with one of its ancestors.
//  - The root-size table is derived lazily from a full-compression pass over
//    all vertices and then maintained incrementally by weighted_union().
//    A snapshot whose length differs from the forest is rebuilt, never reported.
//  - Set NETCONN_DEBUG to trace size-table rebuilds on stderr.
// ----------------------------------------------------------------------------

#include "netconn/disjoint_set.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace netconn {

namespace {

bool debug_enabled() {
    static const bool enabled = std::getenv("NETCONN_DEBUG") != nullptr;
    return enabled;
}

// True while at least one walker has not reached a self-parented vertex.
bool any_off_root(const std::vector<vertex_t>& parent, const std::vector<vertex_t>& walk) {
    for (vertex_t v : walk) {
        if (parent[v] != v) return true;
    }
    return false;
}

// Pending root links of a batch union (root -> new parent, last write wins).
// A link chain that returns to its start would turn the forest into a cycle.
bool links_form_cycle(const std::unordered_map<vertex_t, vertex_t>& links) {
    std::unordered_map<vertex_t, unsigned char> state; // 1 on current chain, 2 finished
    state.reserve(links.size());
    std::vector<vertex_t> chain;
    for (const auto& kv : links) {
        if (state[kv.first] == 2) continue;
        chain.clear();
        vertex_t v = kv.first;
        while (true) {
            auto it = links.find(v);
            if (it == links.end() || it->second == v) break; // stays a root
            unsigned char& s = state[v];
            if (s == 2) break;
            if (s == 1) return true;
            s = 1;
            chain.push_back(v);
            v = it->second;
        }
        for (vertex_t c : chain) state[c] = 2;
    }
    return false;
}

// Ids are vertex_t, so a forest holds at most max(vertex_t) + 1 vertices.
void check_capacity(std::size_t n, std::size_t count) {
    constexpr std::size_t limit = std::size_t{std::numeric_limits<vertex_t>::max()} + 1;
    if (n > limit || count > limit - n) {
        throw std::out_of_range("forest of " + std::to_string(n) + " + " + std::to_string(count) +
                                " vertices exceeds the vertex id range (" +
                                std::to_string(limit) + ")");
    }
}

} // namespace

const char* to_string(PathCompression type) {
    switch (type) {
    case PathCompression::Halving: return "halving";
    case PathCompression::Full: return "full";
    }
    return "unknown";
}

QuickUnionForest::QuickUnionForest(std::size_t n) {
    check_capacity(0, n);
    parent_.resize(n);
    std::iota(parent_.begin(), parent_.end(), vertex_t{0});
}

QuickUnionForest::QuickUnionForest(std::vector<vertex_t> parents) {
    reset(std::move(parents));
}

void QuickUnionForest::reset(std::vector<vertex_t> parents) {
    validate_forest(parents);
    parent_ = std::move(parents);
    size_table_.reset();
}

void QuickUnionForest::add_vertices(std::size_t count) {
    const std::size_t n = parent_.size();
    check_capacity(n, count);
    parent_.resize(n + count);
    std::iota(parent_.begin() + static_cast<std::ptrdiff_t>(n), parent_.end(),
              static_cast<vertex_t>(n));
}

vertex_t QuickUnionForest::parent(vertex_t v) const {
    check_vertex(v);
    return parent_[v];
}

void QuickUnionForest::check_vertex(vertex_t v) const {
    if (v >= parent_.size()) {
        throw std::out_of_range("vertex id " + std::to_string(v) + " out of range [0, " +
                                std::to_string(parent_.size()) + ")");
    }
}

void QuickUnionForest::check_vertices(const std::vector<vertex_t>& ids) const {
    for (vertex_t v : ids) check_vertex(v);
}

void QuickUnionForest::validate_forest(const std::vector<vertex_t>& parent) {
    const std::size_t n = parent.size();
    check_capacity(0, n);
    for (std::size_t v = 0; v < n; ++v) {
        if (parent[v] >= n) {
            throw std::out_of_range("parent of vertex " + std::to_string(v) + " is " +
                                    std::to_string(parent[v]) + ", outside [0, " +
                                    std::to_string(n) + ")");
        }
    }
    // 0 unseen, 1 on the chain being walked, 2 known to reach a root
    std::vector<unsigned char> state(n, 0);
    std::vector<vertex_t> chain;
    for (std::size_t start = 0; start < n; ++start) {
        if (state[start] == 2) continue;
        chain.clear();
        vertex_t v = static_cast<vertex_t>(start);
        while (state[v] == 0 && parent[v] != v) {
            state[v] = 1;
            chain.push_back(v);
            v = parent[v];
        }
        if (state[v] == 1) {
            throw std::invalid_argument("parent array is not a forest: vertex " +
                                        std::to_string(v) + " lies on a cycle");
        }
        state[v] = 2;
        for (vertex_t c : chain) state[c] = 2;
    }
}

vertex_t QuickUnionForest::root(vertex_t v) const {
    check_vertex(v);
    while (parent_[v] != v) v = parent_[v];
    return v;
}

std::vector<vertex_t> QuickUnionForest::root(const std::vector<vertex_t>& ids) const {
    check_vertices(ids);
    std::vector<vertex_t> walk = ids;
    while (any_off_root(parent_, walk)) {
        for (vertex_t& v : walk) v = parent_[v];
    }
    return walk;
}

std::vector<vertex_t> QuickUnionForest::compress_halving(std::vector<vertex_t> walk) {
    std::vector<vertex_t> grand(walk.size());
    while (any_off_root(parent_, walk)) {
        for (std::size_t k = 0; k < walk.size(); ++k) grand[k] = parent_[parent_[walk[k]]];
        for (std::size_t k = 0; k < walk.size(); ++k) parent_[walk[k]] = grand[k];
        for (vertex_t& v : walk) v = parent_[v];
    }
    return walk;
}

std::vector<vertex_t> QuickUnionForest::compress_full(std::vector<vertex_t> walk) {
    const std::vector<vertex_t> roots = root(walk);
    std::vector<vertex_t> up(walk.size());
    while (walk != roots) {
        for (std::size_t k = 0; k < walk.size(); ++k) up[k] = parent_[walk[k]];
        for (std::size_t k = 0; k < walk.size(); ++k) parent_[walk[k]] = roots[k];
        walk.swap(up);
    }
    return roots;
}

std::vector<vertex_t> QuickUnionForest::root_compressed(const std::vector<vertex_t>& ids,
                                                        PathCompression type) {
    check_vertices(ids);
    if (type == PathCompression::Full) return compress_full(ids);
    return compress_halving(ids);
}

vertex_t QuickUnionForest::root_compressed(vertex_t v, PathCompression type) {
    return root_compressed(std::vector<vertex_t>{v}, type).front();
}

std::vector<vertex_t> QuickUnionForest::lookup(const std::vector<vertex_t>& ids,
                                               bool path_compression, PathCompression type) {
    return path_compression ? root_compressed(ids, type) : root(ids);
}

std::vector<vertex_t> QuickUnionForest::find_root(const std::vector<vertex_t>& ids,
                                                  bool path_compression, PathCompression type) {
    if (!path_compression) return root(ids);
    std::vector<vertex_t> roots = root_compressed(ids, type);
    for (std::size_t k = 0; k < ids.size(); ++k) parent_[ids[k]] = roots[k];
    return roots;
}

vertex_t QuickUnionForest::find_root(vertex_t v, bool path_compression, PathCompression type) {
    return find_root(std::vector<vertex_t>{v}, path_compression, type).front();
}

void QuickUnionForest::quick_union(const std::vector<vertex_t>& minor,
                                   const std::vector<vertex_t>& main, bool path_compression,
                                   PathCompression type) {
    if (minor.size() != main.size()) {
        throw std::invalid_argument("quick_union batches differ in length (" +
                                    std::to_string(minor.size()) + " vs " +
                                    std::to_string(main.size()) + ")");
    }
    check_vertices(minor);
    check_vertices(main);

    const std::vector<vertex_t> i = lookup(minor, path_compression, type);
    const std::vector<vertex_t> j = lookup(main, path_compression, type);
    if (i == j) return;

    std::unordered_map<vertex_t, vertex_t> links;
    links.reserve(i.size());
    for (std::size_t k = 0; k < i.size(); ++k) links[i[k]] = j[k];
    if (links_form_cycle(links)) {
        throw std::invalid_argument("quick_union batch links roots into a cycle");
    }

    // i[k] is no longer a root; its parent (also a root) is j[k]
    for (std::size_t k = 0; k < i.size(); ++k) parent_[i[k]] = j[k];
    size_table_.reset();
}

QuickUnionForest::SizeTable& QuickUnionForest::ensure_size_table() {
    if (size_table_ && size_table_->roots.size() == parent_.size()) return *size_table_;

    const std::size_t n = parent_.size();
    std::vector<vertex_t> all(n);
    std::iota(all.begin(), all.end(), vertex_t{0});

    SizeTable table;
    table.roots = compress_full(std::move(all));
    std::vector<unsigned> counts(n, 0);
    for (vertex_t r : table.roots) ++counts[r];
    for (std::size_t r = 0; r < n; ++r) {
        if (counts[r] != 0) table.sizes.emplace_back(static_cast<vertex_t>(r), counts[r]);
    }

    if (debug_enabled()) {
        std::cerr << "[uf_size_table] rebuilt n=" << n
                  << " roots=" << table.sizes.size()
                  << " stale=" << (size_table_ ? 1 : 0) << "\n";
    }
    size_table_ = std::move(table);
    return *size_table_;
}

void QuickUnionForest::attach(vertex_t child, vertex_t keep, std::size_t child_index,
                              std::size_t keep_index) {
    SizeTable& t = *size_table_;
    parent_[child] = keep;
    std::replace(t.roots.begin(), t.roots.end(), child, keep);
    t.sizes[keep_index].second += t.sizes[child_index].second;
    t.sizes.erase(t.sizes.begin() + static_cast<std::ptrdiff_t>(child_index));
}

void QuickUnionForest::weighted_union(vertex_t minor, vertex_t main, bool path_compression,
                                      PathCompression type) {
    check_vertex(minor);
    check_vertex(main);
    const vertex_t i = lookup({minor}, path_compression, type).front();
    const vertex_t j = lookup({main}, path_compression, type).front();
    if (i == j) return;

    SizeTable& t = ensure_size_table();
    auto index_of = [&t](vertex_t r) {
        auto it = std::find_if(t.sizes.begin(), t.sizes.end(),
                               [r](const std::pair<vertex_t, unsigned>& e) { return e.first == r; });
        if (it == t.sizes.end()) {
            throw std::logic_error("root " + std::to_string(r) + " missing from size table");
        }
        return static_cast<std::size_t>(it - t.sizes.begin());
    };
    const std::size_t ii = index_of(i);
    const std::size_t jj = index_of(j);

    if (t.sizes[ii].second <= t.sizes[jj].second) {
        attach(i, j, ii, jj);
    } else {
        attach(j, i, jj, ii);
    }
}

unsigned QuickUnionForest::components() const {
    unsigned count = 0;
    for (std::size_t v = 0; v < parent_.size(); ++v) {
        if (parent_[v] == v) ++count;
    }
    return count;
}

std::vector<int> QuickUnionForest::component_labels() const {
    const std::size_t n = parent_.size();
    std::vector<int> label_of_root(n, -1);
    std::vector<int> labels(n, -1);
    int next = 0;
    for (std::size_t v = 0; v < n; ++v) {
        const vertex_t r = root(static_cast<vertex_t>(v));
        if (label_of_root[r] < 0) label_of_root[r] = next++;
        labels[v] = label_of_root[r];
    }
    return labels;
}

} // namespace netconn
