#include "netconn/graph_io.hpp"
#include "netconn/cli.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace netconn {

namespace {

std::string strip_comment(const std::string& line) {
    const auto p = line.find('#');
    return p == std::string::npos ? line : line.substr(0, p);
}

// Split on whitespace, and also on commas when commas is set.
std::vector<std::string> split_tokens(const std::string& s, bool commas) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        const bool sep = std::isspace(static_cast<unsigned char>(c)) || (commas && c == ',');
        if (sep) {
            if (!cur.empty()) out.push_back(std::move(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) out.push_back(std::move(cur));
    return out;
}

std::string where(const std::string& source, std::size_t line) {
    return source + ":" + std::to_string(line) + ": ";
}

// Run fn, prefixing the location to vertex-id errors without changing their type.
template <class Fn>
auto at_line(const std::string& source, std::size_t line, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const std::out_of_range& e) {
        throw std::out_of_range(where(source, line) + e.what());
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(where(source, line) + e.what());
    }
}

// ids_read counts every id parsed so far, including v.
void check_inferred_id(vertex_t v, std::size_t ids_read) {
    if (v >= ids_read + kInferredVertexSlack) {
        throw std::out_of_range("vertex id " + std::to_string(v) + " is too far beyond the " +
                                std::to_string(ids_read) +
                                " ids read; declare the vertex count explicitly");
    }
}

std::ifstream open_input(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) throw std::runtime_error("cannot open input file: " + path);
    return in;
}

} // namespace

vertex_t parse_vertex(const std::string& token) {
    if (token.find(',') != std::string::npos) {
        throw std::invalid_argument("expected a single vertex id, got '" + token + "'");
    }
    return static_cast<vertex_t>(parse_int64(token, 0, std::numeric_limits<vertex_t>::max()));
}

std::vector<vertex_t> parse_vertex_list(const std::string& token) {
    std::vector<vertex_t> ids;
    std::size_t pos = 0;
    while (true) {
        const std::size_t comma = token.find(',', pos);
        const std::string part = token.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
        if (part.empty()) throw std::invalid_argument("empty entry in vertex list '" + token + "'");
        ids.push_back(parse_vertex(part));
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return ids;
}

std::optional<CompressionChoice> parse_compression(const std::string& word) {
    if (word == "none") return CompressionChoice{false, PathCompression::Halving};
    if (word == "halving") return CompressionChoice{true, PathCompression::Halving};
    if (word == "full") return CompressionChoice{true, PathCompression::Full};
    return std::nullopt;
}

std::string to_string(const CompressionChoice& choice) {
    return choice.enabled ? to_string(choice.type) : "none";
}

std::vector<vertex_t> read_parent_array(std::istream& in, const std::string& source) {
    std::vector<vertex_t> parents;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        for (const auto& tok : split_tokens(strip_comment(line), true)) {
            parents.push_back(at_line(source, lineno, [&] { return parse_vertex(tok); }));
        }
    }
    return parents;
}

std::vector<vertex_t> read_parent_array(const std::string& path) {
    std::ifstream in = open_input(path);
    return read_parent_array(in, path);
}

AdjacencyList read_adjacency_list(std::istream& in, const std::string& source) {
    std::vector<std::vector<vertex_t>> lists;
    std::vector<char> listed;
    std::optional<std::size_t> declared;
    std::size_t ids_read = 0;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const std::string body = strip_comment(line);
        const auto head = split_tokens(body, false);
        if (head.empty()) continue;

        if (head.front() == "n") {
            if (head.size() != 2 || !lists.empty() || declared) {
                throw std::runtime_error(where(source, lineno) +
                                         "header must be 'n <count>' before any vertex line");
            }
            declared = at_line(source, lineno, [&] {
                return static_cast<std::size_t>(parse_vertex(head[1]));
            });
            lists.resize(*declared);
            listed.resize(*declared, 0);
            continue;
        }

        const auto colon = body.find(':');
        if (colon == std::string::npos) {
            throw std::runtime_error(where(source, lineno) + "expected 'v: neighbors...'");
        }
        const auto left = split_tokens(body.substr(0, colon), false);
        if (left.size() != 1) {
            throw std::runtime_error(where(source, lineno) + "expected one vertex id before ':'");
        }
        at_line(source, lineno, [&] {
            const vertex_t v = parse_vertex(left.front());
            const auto neighbors = split_tokens(body.substr(colon + 1), true);
            ids_read += 1 + neighbors.size();
            if (declared && v >= *declared) {
                throw std::out_of_range("vertex id " + std::to_string(v) + " out of range [0, " +
                                        std::to_string(*declared) + ")");
            }
            if (!declared) check_inferred_id(v, ids_read);
            if (v >= lists.size()) {
                lists.resize(static_cast<std::size_t>(v) + 1);
                listed.resize(static_cast<std::size_t>(v) + 1, 0);
            }
            if (listed[v]) {
                throw std::runtime_error(where(source, lineno) + "vertex " + std::to_string(v) +
                                         " listed twice");
            }
            listed[v] = 1;
            for (const auto& tok : neighbors) lists[v].push_back(parse_vertex(tok));
        });
    }
    try {
        return AdjacencyList(lists);
    } catch (const std::out_of_range& e) {
        throw std::out_of_range(source + ": " + e.what());
    }
}

AdjacencyList read_adjacency_list(const std::string& path) {
    std::ifstream in = open_input(path);
    return read_adjacency_list(in, path);
}

EdgeList read_edge_list(std::istream& in, const std::string& source, std::size_t vertices) {
    EdgeList out;
    std::string line;
    std::size_t lineno = 0;
    bool first = true;
    std::size_t max_id_plus_one = 0;
    std::size_t ids_read = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const auto toks = split_tokens(strip_comment(line), true);
        if (toks.empty()) continue;
        if (toks.size() != 2) {
            throw std::runtime_error(where(source, lineno) + "expected 'u,v'");
        }
        const bool numeric = std::isdigit(static_cast<unsigned char>(toks[0].front())) ||
                             toks[0].front() == '-' || toks[0].front() == '+';
        if (first && !numeric) { // header
            first = false;
            continue;
        }
        first = false;
        out.edges.push_back(at_line(source, lineno, [&] {
            const vertex_t u = parse_vertex(toks[0]);
            const vertex_t v = parse_vertex(toks[1]);
            if (vertices && std::max(u, v) >= vertices) {
                throw std::out_of_range("edge (" + std::to_string(u) + "," + std::to_string(v) +
                                        ") outside [0, " + std::to_string(vertices) + ")");
            }
            ids_read += 2;
            if (!vertices) check_inferred_id(std::max(u, v), ids_read);
            return AdjacencyList::Edge{u, v};
        }));
        max_id_plus_one = std::max<std::size_t>(max_id_plus_one,
                                                std::max(out.edges.back().first, out.edges.back().second) + std::size_t{1});
    }
    out.n = vertices ? vertices : max_id_plus_one;
    return out;
}

EdgeList read_edge_list(const std::string& path, std::size_t vertices) {
    std::ifstream in = open_input(path);
    return read_edge_list(in, path, vertices);
}

const char* to_string(UnionFindOp::Kind kind) {
    switch (kind) {
    case UnionFindOp::Kind::Find: return "find";
    case UnionFindOp::Kind::Root: return "root";
    case UnionFindOp::Kind::Union: return "union";
    case UnionFindOp::Kind::WeightedUnion: return "wunion";
    case UnionFindOp::Kind::Grow: return "grow";
    }
    return "unknown";
}

std::vector<UnionFindOp> read_union_find_ops(std::istream& in, const std::string& source) {
    std::vector<UnionFindOp> ops;
    std::string line;
    std::size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        const auto toks = split_tokens(strip_comment(line), false);
        if (toks.empty()) continue;

        UnionFindOp op;
        op.line = lineno;
        const std::string& word = toks.front();
        std::size_t min_args = 0, max_args = 0;
        if (word == "find") { op.kind = UnionFindOp::Kind::Find; min_args = 1; max_args = 2; }
        else if (word == "root") { op.kind = UnionFindOp::Kind::Root; min_args = 1; max_args = 1; }
        else if (word == "union") { op.kind = UnionFindOp::Kind::Union; min_args = 2; max_args = 3; }
        else if (word == "wunion") { op.kind = UnionFindOp::Kind::WeightedUnion; min_args = 2; max_args = 3; }
        else if (word == "grow") { op.kind = UnionFindOp::Kind::Grow; min_args = 1; max_args = 1; }
        else throw std::runtime_error(where(source, lineno) + "unknown operation '" + word + "'");

        const std::size_t nargs = toks.size() - 1;
        if (nargs < min_args || nargs > max_args) {
            throw std::runtime_error(where(source, lineno) + "wrong number of arguments for '" + word + "'");
        }

        at_line(source, lineno, [&] {
            switch (op.kind) {
            case UnionFindOp::Kind::Find:
            case UnionFindOp::Kind::Root:
                op.first = parse_vertex_list(toks[1]);
                break;
            case UnionFindOp::Kind::Union:
                op.first = parse_vertex_list(toks[1]);
                op.second = parse_vertex_list(toks[2]);
                break;
            case UnionFindOp::Kind::WeightedUnion:
                op.first = {parse_vertex(toks[1])};
                op.second = {parse_vertex(toks[2])};
                break;
            case UnionFindOp::Kind::Grow:
                op.count = static_cast<std::size_t>(
                    parse_int64(toks[1], 0, std::numeric_limits<vertex_t>::max()));
                break;
            }
        });

        const std::size_t mode_at = min_args + 1;
        if (toks.size() > mode_at) {
            op.mode = parse_compression(toks[mode_at]);
            if (!op.mode) {
                throw std::runtime_error(where(source, lineno) + "unknown compression mode '" +
                                         toks[mode_at] + "' (expected none|halving|full)");
            }
        }
        ops.push_back(std::move(op));
    }
    return ops;
}

std::vector<vertex_t> run_union_find_op(QuickUnionForest& forest, const UnionFindOp& op,
                                        const CompressionChoice& fallback) {
    const CompressionChoice m = op.mode.value_or(fallback);
    switch (op.kind) {
    case UnionFindOp::Kind::Find:
        return forest.find_root(op.first, m.enabled, m.type);
    case UnionFindOp::Kind::Root:
        return forest.root(op.first);
    case UnionFindOp::Kind::Union:
        forest.quick_union(op.first, op.second, m.enabled, m.type);
        break;
    case UnionFindOp::Kind::WeightedUnion:
        if (op.first.size() != 1 || op.second.size() != 1) {
            throw std::invalid_argument("weighted union takes one vertex id per side");
        }
        forest.weighted_union(op.first.front(), op.second.front(), m.enabled, m.type);
        break;
    case UnionFindOp::Kind::Grow:
        forest.add_vertices(op.count);
        break;
    }
    return {};
}

} // namespace netconn
