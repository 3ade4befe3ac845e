#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "netconn/connectivity.hpp"
#include "netconn/disjoint_set.hpp"

namespace netconn {

// Text formats shared by the executables. In every format '#' starts a comment
// and blank lines are ignored. Structural problems (unknown keyword, missing
// field) raise std::runtime_error; a bad vertex id raises std::invalid_argument
// (not an integer, or a list where one id is expected) or std::out_of_range
// (negative or too large). Messages are prefixed with "<source>:<line>: ".

// Without an explicit vertex count ("n <count>" header, or the vertices
// argument of read_edge_list), the count is 1 + the largest id seen. That id
// may exceed the number of ids read so far by less than this slack; a larger
// id raises std::out_of_range, so one stray id cannot size the graph.
constexpr std::size_t kInferredVertexSlack = std::size_t{1} << 20;

// Vertex id token at an API boundary that accepts exactly one vertex.
vertex_t parse_vertex(const std::string& token);

// Comma-separated vertex ids, e.g. "2,10,7". A single id is a batch of one.
std::vector<vertex_t> parse_vertex_list(const std::string& token);

// Compression setting of one lookup or union: "none", "halving" or "full".
struct CompressionChoice {
    bool enabled = true;
    PathCompression type = PathCompression::Halving;
};
std::optional<CompressionChoice> parse_compression(const std::string& word);
std::string to_string(const CompressionChoice& choice);

// Parent array: integers separated by whitespace or commas, in vertex order.
std::vector<vertex_t> read_parent_array(std::istream& in, const std::string& source = "<stream>");
std::vector<vertex_t> read_parent_array(const std::string& path);

// Adjacency list: "v: n1 n2 ..." per line, optional header "n <count>".
// Vertices that never appear on the left have no neighbors. Without the
// header, vertex ids are bounded by kInferredVertexSlack.
AdjacencyList read_adjacency_list(std::istream& in, const std::string& source = "<stream>");
AdjacencyList read_adjacency_list(const std::string& path);

// Edge list: "u,v" per line, optional "u,v" header line. With vertices == 0
// the count is inferred and endpoints are bounded by kInferredVertexSlack.
struct EdgeList {
    std::size_t n = 0; // explicit count, or 1 + largest endpoint
    std::vector<AdjacencyList::Edge> edges;
};
EdgeList read_edge_list(std::istream& in, const std::string& source = "<stream>",
                        std::size_t vertices = 0);
EdgeList read_edge_list(const std::string& path, std::size_t vertices = 0);

// One line of a union-find operation script:
//   find IDS [MODE] | root IDS | union MINOR MAIN [MODE] | wunion A B [MODE] | grow COUNT
struct UnionFindOp {
    enum class Kind { Find, Root, Union, WeightedUnion, Grow };
    Kind kind = Kind::Find;
    std::vector<vertex_t> first;               // find/root ids, union minor
    std::vector<vertex_t> second;              // union main
    std::size_t count = 0;                     // grow
    std::optional<CompressionChoice> mode;     // unset: use the caller's default
    std::size_t line = 0;
};
std::vector<UnionFindOp> read_union_find_ops(std::istream& in, const std::string& source = "<stream>");

const char* to_string(UnionFindOp::Kind kind);

// Apply one operation; find/root return the roots, other kinds return nothing.
std::vector<vertex_t> run_union_find_op(QuickUnionForest& forest, const UnionFindOp& op,
                                        const CompressionChoice& fallback);

} // namespace netconn
