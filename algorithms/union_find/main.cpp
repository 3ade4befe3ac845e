#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "netconn/cli.hpp"
#include "netconn/comp_metrics.hpp"
#include "netconn/csv.hpp"
#include "netconn/disjoint_set.hpp"
#include "netconn/graph_io.hpp"
#include "netconn/timer.hpp"

static std::string join_ids(const std::vector<netconn::vertex_t>& ids) {
    std::ostringstream oss;
    for (std::size_t k = 0; k < ids.size(); ++k) oss << (k ? "," : "") << ids[k];
    return oss.str();
}

int main(int argc, char** argv) {
    using namespace netconn;

    ArgParser cli("Replay union-find operations on a parent-array forest.");
    cli.add_option(OptionSpec{.longName = "parents", .shortName = 'p', .type = ArgType::String, .valueName = "FILE", .help = "Initial parent array (integers in vertex order)"});
    cli.add_option(OptionSpec{.longName = "identity", .shortName = 'n', .type = ArgType::Size, .valueName = "N", .help = "Start from N singleton vertices instead of --parents"});
    cli.add_option(OptionSpec{.longName = "ops", .shortName = 'o', .type = ArgType::String, .valueName = "FILE|-", .help = "Operation script (find/root/union/wunion/grow), '-' for stdin"});
    cli.add_option(OptionSpec{.longName = "mode", .shortName = 'm', .type = ArgType::Choice, .valueName = "MODE", .help = "Path compression for operations that do not name one", .defaultValue = "halving", .choices = {"halving", "full"}});
    cli.add_flag("no-compress", '\0', "Disable path compression for operations that do not name a mode");
    cli.add_option(OptionSpec{.longName = "out", .shortName = '\0', .type = ArgType::String, .valueName = "FILE", .help = "Write final forest as CSV (vertex,parent,root)"});
    cli.add_flag("quiet", 'q', "Do not print find/root results");

    bool proceed = true;
    try {
        proceed = cli.parse(argc, argv);
        if (proceed && cli.provided("parents") == cli.provided("identity")) {
            throw std::runtime_error("exactly one of --parents or --identity is required");
        }
    } catch (const std::exception& e) {
        std::cerr << cli.usage(argv[0]) << "\n" << e.what() << "\n";
        return 1;
    }
    if (!proceed) {
        std::cout << cli.help(argv[0]);
        return 0;
    }

    CompressionChoice fallback;
    fallback.enabled = !cli.get_flag("no-compress");
    fallback.type = parse_compression(cli.get_string("mode"))->type; // validated by --mode choices
    const bool quiet = cli.get_flag("quiet");

    Stopwatch sw;
    QuickUnionForest forest;
    std::vector<UnionFindOp> ops;
    try {
        if (cli.provided("parents")) {
            forest.reset(read_parent_array(cli.get_string("parents")));
        } else {
            forest = QuickUnionForest(cli.get_size("identity"));
        }
        if (cli.provided("ops")) {
            const std::string ops_path = cli.get_string("ops");
            if (ops_path == "-") {
                ops = read_union_find_ops(std::cin, "<stdin>");
            } else {
                std::ifstream in(ops_path);
                if (!in.is_open()) throw std::runtime_error("cannot open ops file: " + ops_path);
                ops = read_union_find_ops(in, ops_path);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 2;
    }
    const double sec_load = sw.lap();

    std::size_t applied = 0;
    for (const auto& op : ops) {
        try {
            const auto roots = run_union_find_op(forest, op, fallback);
            if (!quiet && (op.kind == UnionFindOp::Kind::Find || op.kind == UnionFindOp::Kind::Root)) {
                std::cout << to_string(op.kind)
                          << " ids=" << join_ids(op.first)
                          << " roots=" << join_ids(roots) << "\n";
            }
        } catch (const std::exception& e) {
            std::cerr << "line " << op.line << " (" << to_string(op.kind) << "): " << e.what() << "\n";
            return 2;
        }
        ++applied;
    }
    const double sec_ops = sw.lap();

    if (cli.provided("out")) {
        const std::string out_path = cli.get_string("out");
        CSVWriter csv(out_path);
        if (!csv.is_open()) {
            std::cerr << "Failed to open output file: " << out_path << "\n";
            return 3;
        }
        csv.header({"vertex", "parent", "root"});
        for (vertex_t v = 0; v < forest.size(); ++v) {
            csv.row(v, forest.parent(v), forest.root(v));
        }
    }

    const auto& table = forest.size_table();
    const CompSummary cs = summarize_components(component_sizes(
        static_cast<uint32_t>(forest.size()), [&](uint32_t v) { return forest.root(v); }));
    std::cout << "vertices=" << forest.size()
              << " ops=" << applied
              << " comps=" << forest.components()
              << " largest=" << cs.largest
              << " singletons=" << cs.singletons
              << " size_table=" << (table ? table->sizes.size() : 0)
              << " mode=" << to_string(fallback)
              << " load_sec=" << sec_load
              << " ops_sec=" << sec_ops
              << " total_sec=" << sw.total()
              << "\n";
    return 0;
}
