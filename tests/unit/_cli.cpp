#include <stdexcept>
#include <string>
#include <vector>
#include "framework/include.h"
#include "netconn/cli.hpp"

using namespace netconn;

namespace {

// Owns argv storage for ArgParser::parse.
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : args_(args) {
        for (auto &a : args_) ptrs_.push_back(a.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(args_.size()); }
    char **argv() { return ptrs_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char *> ptrs_;
};

ArgParser makeParser() {
    ArgParser cli("test tool");
    cli.add_option(OptionSpec{.longName = "parents", .shortName = 'p', .type = ArgType::String, .valueName = "FILE", .help = "Parent array"});
    cli.add_option(OptionSpec{.longName = "identity", .shortName = 'n', .type = ArgType::Size, .valueName = "N", .help = "Vertex count"});
    cli.add_option(OptionSpec{.longName = "mode", .shortName = 'm', .type = ArgType::Choice, .valueName = "MODE", .help = "Compression", .defaultValue = "halving", .choices = {"halving", "full"}});
    cli.add_flag("quiet", 'q', "Summary only");
    return cli;
}

}  // namespace

TEST_CASE("parse long and short options", "[cli][fast]") {
    ArgParser cli = makeParser();
    Argv args{"prog", "--parents", "p.txt", "-n", "12", "-q"};

    REQUIRE(cli.parse(args.argc(), args.argv()));
    CHECK(cli.provided("parents"));
    CHECK(cli.get_string("parents") == "p.txt");
    CHECK(cli.get_size("identity") == 12);
    CHECK(cli.get_flag("quiet"));
    CHECK_FALSE(cli.provided("mode"));
    CHECK(cli.get_string("mode") == "halving");
}

TEST_CASE("choice options accept only listed words", "[cli][fast]") {
    ArgParser cli = makeParser();
    SECTION("listed") {
        Argv args{"prog", "--mode", "full"};
        REQUIRE(cli.parse(args.argc(), args.argv()));
        CHECK(cli.get_string("mode") == "full");
    }
    SECTION("unlisted") {
        Argv args{"prog", "-m", "fast"};
        CHECK_THROWS_AS(cli.parse(args.argc(), args.argv()), std::runtime_error);
    }
}

TEST_CASE("malformed command lines", "[cli][fast]") {
    ArgParser cli = makeParser();
    SECTION("unknown option") {
        Argv args{"prog", "--nope"};
        CHECK_THROWS_AS(cli.parse(args.argc(), args.argv()), std::runtime_error);
    }
    SECTION("missing value") {
        Argv args{"prog", "--parents"};
        CHECK_THROWS_AS(cli.parse(args.argc(), args.argv()), std::runtime_error);
    }
    SECTION("positional argument") {
        Argv args{"prog", "p.txt"};
        CHECK_THROWS_AS(cli.parse(args.argc(), args.argv()), std::runtime_error);
    }
    SECTION("bundled short flags") {
        Argv args{"prog", "-qn"};
        CHECK_THROWS_AS(cli.parse(args.argc(), args.argv()), std::runtime_error);
    }
    SECTION("non-numeric size") {
        Argv args{"prog", "-n", "twelve"};
        REQUIRE(cli.parse(args.argc(), args.argv()));
        CHECK_THROWS_AS(cli.get_size("identity"), std::runtime_error);
    }
    SECTION("value never given") {
        Argv args{"prog"};
        REQUIRE(cli.parse(args.argc(), args.argv()));
        CHECK_THROWS_AS(cli.get_string("parents"), std::runtime_error);
    }
}

TEST_CASE("required options and help", "[cli][fast]") {
    ArgParser cli("tool");
    cli.add_option(OptionSpec{.longName = "ops", .shortName = 'o', .type = ArgType::String, .valueName = "FILE", .help = "Script", .required = true});

    SECTION("missing required") {
        Argv args{"prog"};
        CHECK_THROWS_AS(cli.parse(args.argc(), args.argv()), std::runtime_error);
    }
    SECTION("help short-circuits") {
        Argv args{"prog", "--help"};
        CHECK_FALSE(cli.parse(args.argc(), args.argv()));
        const std::string text = cli.help("prog");
        CHECK(text.find("--ops FILE") != std::string::npos);
        CHECK(text.find("[required]") != std::string::npos);
    }
    CHECK_THROWS_AS(cli.add_flag("ops", 'x', "again"), std::logic_error);
}

TEST_CASE("bounded integers", "[cli][fast]") {
    CHECK(parse_int64("42", 0, 100) == 42);
    CHECK(parse_int64("+7", 0, 100) == 7);
    CHECK(parse_int64("-5", -10, 10) == -5);
    CHECK_THROWS_AS(parse_int64("101", 0, 100), std::out_of_range);
    CHECK_THROWS_AS(parse_int64("-1", 0, 100), std::out_of_range);
    CHECK_THROWS_AS(parse_int64("99999999999999999999", 0, 100), std::out_of_range);
    CHECK_THROWS_AS(parse_int64("4x", 0, 100), std::invalid_argument);
    CHECK_THROWS_AS(parse_int64("", 0, 100), std::invalid_argument);
    CHECK_THROWS_AS(parse_int64("+", 0, 100), std::invalid_argument);
}
