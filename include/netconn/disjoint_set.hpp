#pragma once

#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace netconn {

using vertex_t = unsigned;

// How a compressing root lookup rewrites the parents it walks over.
//  - Halving: one pass, each visited vertex is pointed at its grandparent.
//  - Full:    two passes, each visited vertex is pointed at its root.
enum class PathCompression { Halving, Full };

const char* to_string(PathCompression type);

// Quick-union forest over vertices 0..n-1 (array-backed parent encoding).
//
// Every batched operation advances all supplied ids in lock step: each step
// gathers from the parent array for the whole batch before any write, then
// scatters (duplicate ids: last write wins). Vertices that reached their root
// simply keep pointing at themselves while the others continue.
//
// Lookups that take a PathCompression argument MUTATE the parent array; only
// root() is a pure query.
//
// quick_union() is batched and unbalanced. weighted_union() takes one scalar
// pair and keeps the root-size table current.
class QuickUnionForest {
public:
    // Root -> number of vertices in its tree, plus each vertex's root at the
    // time the table was derived (kept current by weighted_union()).
    struct SizeTable {
        std::vector<std::pair<vertex_t, unsigned>> sizes; // sorted by root id at build time
        std::vector<vertex_t> roots;                      // vertex -> root snapshot
    };

    // n singleton trees. Throws std::out_of_range if n exceeds the vertex id range.
    explicit QuickUnionForest(std::size_t n = 0);

    // Arbitrary forest encoding: parents[v] is v's parent, roots are self-parented.
    // Throws std::out_of_range for a parent id >= parents.size() and
    // std::invalid_argument if a parent chain does not end at a root.
    explicit QuickUnionForest(std::vector<vertex_t> parents);

    // Replace the parent array (validated as above) and drop derived state.
    void reset(std::vector<vertex_t> parents);

    // Append count self-parented vertices. The size table, if any, no longer
    // matches and is rebuilt on the next weighted_union(). Throws
    // std::out_of_range (forest unchanged) if ids would no longer fit vertex_t.
    void add_vertices(std::size_t count);

    std::size_t size() const { return parent_.size(); }
    const std::vector<vertex_t>& parents() const { return parent_; }
    vertex_t parent(vertex_t v) const;

    // Plain root lookup, no mutation.
    vertex_t root(vertex_t v) const;
    std::vector<vertex_t> root(const std::vector<vertex_t>& ids) const;

    // Root lookup with path compression; rewrites every visited parent.
    vertex_t root_compressed(vertex_t v, PathCompression type = PathCompression::Halving);
    std::vector<vertex_t> root_compressed(const std::vector<vertex_t>& ids,
                                          PathCompression type = PathCompression::Halving);

    // Connectivity query. With compression, runs root_compressed() and then points
    // each queried id directly at its root; without, identical to root().
    std::vector<vertex_t> find_root(const std::vector<vertex_t>& ids,
                                    bool path_compression = true,
                                    PathCompression type = PathCompression::Halving);
    vertex_t find_root(vertex_t v, bool path_compression = true,
                       PathCompression type = PathCompression::Halving);

    // Whether a and b currently share a root (pure).
    bool connected(vertex_t a, vertex_t b) const { return root(a) == root(b); }

    // Batched unbalanced union: root(minor[k]) is attached under root(main[k]).
    // The call is a no-op only when every pair already shares a root; otherwise
    // every pair is written, including already-joined ones (self-assignment).
    // Discards the size table when it writes.
    // Throws std::invalid_argument if the batches differ in length or if the
    // root links would form a cycle (nothing is linked then).
    void quick_union(const std::vector<vertex_t>& minor, const std::vector<vertex_t>& main,
                     bool path_compression = true,
                     PathCompression type = PathCompression::Halving);

    // Size-weighted union of one pair: the root of the smaller tree (ties: minor's)
    // is attached under the other root. Derives the size table on first use.
    void weighted_union(vertex_t minor, vertex_t main, bool path_compression = true,
                        PathCompression type = PathCompression::Halving);

    // Derived state, empty until the first effective weighted_union().
    const std::optional<SizeTable>& size_table() const { return size_table_; }

    // Number of trees in the forest.
    unsigned components() const;

    // Dense labels 0..K-1 numbered by first appearance of each root in vertex order.
    std::vector<int> component_labels() const;

private:
    void check_vertex(vertex_t v) const;
    void check_vertices(const std::vector<vertex_t>& ids) const;
    static void validate_forest(const std::vector<vertex_t>& parent);

    std::vector<vertex_t> compress_halving(std::vector<vertex_t> walk);
    std::vector<vertex_t> compress_full(std::vector<vertex_t> walk);
    std::vector<vertex_t> lookup(const std::vector<vertex_t>& ids, bool path_compression,
                                 PathCompression type);

    SizeTable& ensure_size_table();
    void attach(vertex_t child, vertex_t keep, std::size_t child_index, std::size_t keep_index);

    std::vector<vertex_t> parent_;
    std::optional<SizeTable> size_table_;
};

} // namespace netconn
