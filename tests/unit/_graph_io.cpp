#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "framework/include.h"
#include "netconn/graph_io.hpp"

using namespace netconn;

TEST_CASE("single vertex ids", "[graph_io][fast]") {
    CHECK(parse_vertex("7") == 7);
    CHECK(parse_vertex("+3") == 3);
    CHECK_THROWS_AS(parse_vertex("2,3"), std::invalid_argument);
    CHECK_THROWS_AS(parse_vertex("2.5"), std::invalid_argument);
    CHECK_THROWS_AS(parse_vertex("abc"), std::invalid_argument);
    CHECK_THROWS_AS(parse_vertex(""), std::invalid_argument);
    CHECK_THROWS_AS(parse_vertex("-1"), std::out_of_range);
    CHECK_THROWS_AS(parse_vertex("99999999999"), std::out_of_range);
}

TEST_CASE("vertex lists", "[graph_io][fast]") {
    CHECK(parse_vertex_list("2,10,7") == std::vector<vertex_t>({2, 10, 7}));
    CHECK(parse_vertex_list("4") == std::vector<vertex_t>({4}));
    CHECK_THROWS_AS(parse_vertex_list("2,,3"), std::invalid_argument);
    CHECK_THROWS_AS(parse_vertex_list("2,"), std::invalid_argument);
    CHECK_THROWS_AS(parse_vertex_list("2,-3"), std::out_of_range);
}

TEST_CASE("compression words", "[graph_io][fast]") {
    REQUIRE(parse_compression("none"));
    CHECK_FALSE(parse_compression("none")->enabled);
    CHECK(parse_compression("full")->type == PathCompression::Full);
    CHECK(parse_compression("halving")->type == PathCompression::Halving);
    CHECK_FALSE(parse_compression("Full"));
    CHECK(to_string(*parse_compression("none")) == "none");
    CHECK(to_string(*parse_compression("full")) == "full");
}

TEST_CASE("parent arrays", "[graph_io][fast]") {
    std::istringstream in("# sample\n0 0 0 3,3,3\n\n9 7 9 4 8  # tail\n");
    CHECK(read_parent_array(in) == std::vector<vertex_t>({0, 0, 0, 3, 3, 3, 9, 7, 9, 4, 8}));

    std::istringstream bad("0 1\n1 x\n");
    try {
        read_parent_array(bad, "parents.txt");
        FAIL("expected invalid_argument");
    } catch (const std::invalid_argument &e) {
        CHECK(std::string(e.what()).rfind("parents.txt:2: ", 0) == 0);
    }
}

TEST_CASE("adjacency lists", "[graph_io][fast]") {
    SECTION("header declares trailing isolated vertices") {
        std::istringstream in("n 4\n0: 1 2\n2: 0\n");
        const AdjacencyList adj = read_adjacency_list(in);
        CHECK(adj.vertex_count() == 4);
        CHECK(adj.entry_count() == 3);
        CHECK(adj.neighbors(0) == std::vector<vertex_t>({1, 2}));
        CHECK(adj.degree(1) == 0);
        CHECK(adj.degree(3) == 0);
    }
    SECTION("without header the largest listed vertex sets the count") {
        std::istringstream in("1: 0,3\n# comment\n3: 1\n");
        const AdjacencyList adj = read_adjacency_list(in);
        CHECK(adj.vertex_count() == 4);
        CHECK(adj.neighbors(1) == std::vector<vertex_t>({0, 3}));
    }
    SECTION("vertex with an empty list") {
        std::istringstream in("0:\n1: 1\n");
        CHECK(read_adjacency_list(in).vertex_count() == 2);
    }
    SECTION("structural errors") {
        std::istringstream dup("0: 1\n1: 0\n0: 1\n");
        CHECK_THROWS_AS(read_adjacency_list(dup), std::runtime_error);
        std::istringstream noColon("0 1\n");
        CHECK_THROWS_AS(read_adjacency_list(noColon), std::runtime_error);
        std::istringstream lateHeader("0: 0\nn 2\n");
        CHECK_THROWS_AS(read_adjacency_list(lateHeader), std::runtime_error);
    }
    SECTION("ids outside the graph") {
        std::istringstream neighbor("n 2\n0: 5\n");
        CHECK_THROWS_AS(read_adjacency_list(neighbor), std::out_of_range);
        std::istringstream vertex("n 2\n3: 0\n");
        CHECK_THROWS_AS(read_adjacency_list(vertex), std::out_of_range);
        std::istringstream unlisted("0: 1\n1: 7\n");
        CHECK_THROWS_AS(read_adjacency_list(unlisted), std::out_of_range);
    }
}

TEST_CASE("inferred vertex counts are bounded by the ids read", "[graph_io][fast]") {
    SECTION("adjacency list without header") {
        std::istringstream in("0: 1\n1: 0\n4000000000: 0\n");
        try {
            read_adjacency_list(in, "graph.adj");
            FAIL("expected out_of_range");
        } catch (const std::out_of_range &e) {
            CHECK(std::string(e.what()).rfind("graph.adj:3: ", 0) == 0);
        }
    }
    SECTION("adjacency list with header accepts the declared range") {
        std::istringstream in("n 2000000\n1999999: 0\n0: 1999999\n");
        CHECK(read_adjacency_list(in).vertex_count() == 2000000);
    }
    SECTION("edge list without a vertex count") {
        std::istringstream in("0,1\n1,3999999999\n");
        try {
            read_edge_list(in, "graph.csv");
            FAIL("expected out_of_range");
        } catch (const std::out_of_range &e) {
            CHECK(std::string(e.what()).rfind("graph.csv:2: ", 0) == 0);
        }
    }
    SECTION("ids within the slack are accepted") {
        const std::string far = std::to_string(kInferredVertexSlack);
        std::istringstream in("0," + far + "\n");
        CHECK(read_edge_list(in).n == kInferredVertexSlack + 1);
        std::istringstream adj(far + ":\n");
        CHECK(read_adjacency_list(adj).vertex_count() == kInferredVertexSlack + 1);
    }
}

TEST_CASE("edge lists", "[graph_io][fast]") {
    SECTION("header line is skipped and the count is inferred") {
        std::istringstream in("source,target\n0,1\n2, 5\n");
        const EdgeList el = read_edge_list(in);
        CHECK(el.n == 6);
        REQUIRE(el.edges.size() == 2);
        CHECK(el.edges[1] == AdjacencyList::Edge{2, 5});
    }
    SECTION("explicit vertex count") {
        std::istringstream in("0,1\n");
        CHECK(read_edge_list(in, "<stream>", 10).n == 10);
        std::istringstream over("0,1\n4,10\n");
        CHECK_THROWS_AS(read_edge_list(over, "<stream>", 10), std::out_of_range);
    }
    SECTION("malformed rows") {
        std::istringstream three("0,1,2\n");
        CHECK_THROWS_AS(read_edge_list(three), std::runtime_error);
        std::istringstream laterText("0,1\na,b\n");
        CHECK_THROWS_AS(read_edge_list(laterText), std::invalid_argument);
    }
    SECTION("empty input") {
        std::istringstream in("");
        const EdgeList el = read_edge_list(in);
        CHECK(el.n == 0);
        CHECK(el.edges.empty());
    }
}

TEST_CASE("union-find scripts", "[graph_io][fast]") {
    std::istringstream in(
        "# batched ops\n"
        "union 2,0 7,6 full\n"
        "find 2,6\n"
        "root 7\n"
        "wunion 1 10 none\n"
        "grow 2\n");
    const auto ops = read_union_find_ops(in);
    REQUIRE(ops.size() == 5);

    CHECK(ops[0].kind == UnionFindOp::Kind::Union);
    CHECK(ops[0].first == std::vector<vertex_t>({2, 0}));
    CHECK(ops[0].second == std::vector<vertex_t>({7, 6}));
    REQUIRE(ops[0].mode);
    CHECK(ops[0].mode->type == PathCompression::Full);
    CHECK(ops[0].line == 2);

    CHECK(ops[1].kind == UnionFindOp::Kind::Find);
    CHECK_FALSE(ops[1].mode);
    CHECK(ops[2].kind == UnionFindOp::Kind::Root);
    CHECK(ops[3].kind == UnionFindOp::Kind::WeightedUnion);
    CHECK_FALSE(ops[3].mode->enabled);
    CHECK(ops[4].kind == UnionFindOp::Kind::Grow);
    CHECK(ops[4].count == 2);
    CHECK(std::string(to_string(ops[4].kind)) == "grow");

    QuickUnionForest forest(std::vector<vertex_t>{0, 0, 0, 3, 3, 3, 9, 7, 9, 4, 8});
    const CompressionChoice fallback;
    CHECK(run_union_find_op(forest, ops[0], fallback).empty());
    CHECK(run_union_find_op(forest, ops[1], fallback) == std::vector<vertex_t>({3, 3}));
    CHECK(run_union_find_op(forest, ops[2], fallback) == std::vector<vertex_t>({7}));
    CHECK(run_union_find_op(forest, ops[3], fallback).empty());
    CHECK(forest.connected(1, 10));
    CHECK(run_union_find_op(forest, ops[4], fallback).empty());
    CHECK(forest.size() == 13);
    // {0..6,8,9,10}, {7}, {11}, {12}
    CHECK(forest.components() == 4);
}

TEST_CASE("union-find script errors", "[graph_io][fast]") {
    auto parse = [](const std::string &text) {
        std::istringstream in(text);
        return read_union_find_ops(in, "ops.txt");
    };

    CHECK_THROWS_AS(parse("merge 1 2\n"), std::runtime_error);
    CHECK_THROWS_AS(parse("find 1 fast\n"), std::runtime_error);
    CHECK_THROWS_AS(parse("root 1 full\n"), std::runtime_error);
    CHECK_THROWS_AS(parse("union 1\n"), std::runtime_error);
    CHECK_THROWS_AS(parse("wunion 2,3 7\n"), std::invalid_argument);
    CHECK_THROWS_AS(parse("find 1,-2\n"), std::out_of_range);

    try {
        parse("find 1\nwunion 2,3 7\n");
        FAIL("expected invalid_argument");
    } catch (const std::invalid_argument &e) {
        CHECK(std::string(e.what()).rfind("ops.txt:2: ", 0) == 0);
    }

    std::istringstream grow("grow 4294967295\n");
    const auto growOps = read_union_find_ops(grow);
    REQUIRE(growOps.size() == 1);
    QuickUnionForest small(2);
    CHECK_THROWS_AS(run_union_find_op(small, growOps[0], CompressionChoice{}), std::out_of_range);
    CHECK(small.size() == 2);

    UnionFindOp op;
    op.kind = UnionFindOp::Kind::WeightedUnion;
    op.first = {1, 2};
    op.second = {3};
    QuickUnionForest forest(4);
    CHECK_THROWS_AS(run_union_find_op(forest, op, CompressionChoice{}), std::invalid_argument);
}
