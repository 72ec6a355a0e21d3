#include <catch2/catch.hpp>

#include <regex>
#include <vector>

#include "TestSupport.hpp"
#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/History.hpp"
#include "shell/Parser.hpp"
#include "text/TextAlgorithms.hpp"

using gtos_test::Session;
using gtos_test::TempDir;

namespace {
    Config parse(std::vector<std::string> args) {
        args.insert(args.begin(), "gtos");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(&a[0]);
        argv.push_back(nullptr);
        return Config::from_args(static_cast<int>(args.size()), argv.data());
    }
}

TEST_CASE("command line options", "[config]") {
    SECTION("explicit root puts the log beside it") {
        auto cfg = parse({"--root", "/srv/gtos/rootfs"});
        CHECK(cfg.root == fs::path("/srv/gtos/rootfs"));
        CHECK(cfg.log_file == fs::path("/srv/gtos/gtos.log"));
        CHECK_FALSE(cfg.show_help);
        CHECK_FALSE(cfg.show_version);
    }
    SECTION("a trailing slash on the root does not move the log inside it") {
        auto cfg = parse({"--root", "/srv/gtos/rootfs/"});
        CHECK(cfg.log_file == fs::path("/srv/gtos/gtos.log"));
    }
    SECTION("explicit log") {
        auto cfg = parse({"--root", "/srv/r", "--log", "/var/tmp/session.log"});
        CHECK(cfg.log_file == fs::path("/var/tmp/session.log"));
    }
    SECTION("portable root is under the working directory") {
        auto cfg = parse({"--portable"});
        CHECK(cfg.root == (fs::current_path() / "data" / "rootfs").lexically_normal());
    }
    SECTION("flags") {
        CHECK(parse({"--version"}).show_version);
        CHECK(parse({"--help"}).show_help);
        CHECK(parse({"-h"}).show_help);
    }
    SECTION("bad command lines") {
        CHECK_THROWS_AS(parse({"--bogus"}), UsageError);
        CHECK_THROWS_AS(parse({"--root"}), UsageError);
        CHECK_THROWS_AS(parse({"stray"}), UsageError);
        CHECK(Config::usage().rfind("usage: gtos", 0) == 0);
    }
}

TEST_CASE("log records carry time, level and source location", "[logger]") {
    TempDir dir;
    auto path = dir.path / "logs" / "gtos.log";
    {
        Logger logger(path);
        GTOS_LOG_INFO(logger, "hello");
        logger.set_min_level(LogLevel::Warning);
        GTOS_LOG_INFO(logger, "dropped");
        GTOS_LOG_ERROR(logger, "bad thing");
    }
    auto text = gtos_test::read_host_file(path);
    std::regex record(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} - (INFO|ERROR) - test_core\.cpp:\d+ - (hello|bad thing))");
    auto lines = TextAlgorithms::split_lines(text);
    REQUIRE(lines.size() == 2);
    CHECK(std::regex_match(lines[0], record));
    CHECK(std::regex_match(lines[1], record));
    CHECK(lines[0].find(" - INFO - ") != std::string::npos);
    CHECK(lines[1].find(" - ERROR - ") != std::string::npos);
    CHECK(text.find("dropped") == std::string::npos);

    // appends rather than truncating
    {
        Logger again(path);
        GTOS_LOG_WARN(again, "third");
    }
    CHECK(TextAlgorithms::split_lines(gtos_test::read_host_file(path)).size() == 3);
    CHECK(gtos_test::read_host_file(path).find(" - WARNING - ") != std::string::npos);
}

TEST_CASE("an unwritable log is fatal", "[logger]") {
    TempDir dir;
    auto file = dir.path / "plain";
    {
        std::ofstream(file) << "x";
    }
    CHECK_THROWS_AS(Logger(file / "gtos.log"), FatalError);
}

TEST_CASE("command line splitting", "[parser]") {
    CHECK(Parser::split("  ls\t-l   /docs ") == std::vector<std::string>{"ls", "-l", "/docs"});
    CHECK(Parser::split("echo 'a b'") == std::vector<std::string>{"echo", "'a", "b'"});
    CHECK(Parser::split("   ").empty());
    CHECK(Parser::join({"time", "sort", "x.txt"}, 1) == "sort x.txt");
    CHECK(Parser::join({"a"}, 3).empty());
    CHECK(Parser::to_lower("ExIt") == "exit");
    CHECK(Parser::trim(" \t pwd \r") == "pwd");
}

TEST_CASE("history keeps lines with their positions", "[history]") {
    History h;
    h.add("pwd");
    h.add("ls");
    h.add("cat a");
    auto last = h.tail(2);
    REQUIRE(last.size() == 2);
    CHECK(last[0] == std::make_pair(std::size_t{2}, std::string("ls")));
    CHECK(last[1] == std::make_pair(std::size_t{3}, std::string("cat a")));
    CHECK(h.tail(10).size() == 3);
    CHECK(h.tail(0).empty());
}

TEST_CASE("the REPL loop", "[shell]") {
    Session s;

    SECTION("exit ends the session") {
        s.in.str("pwd\n\n   \nEXIT\npwd\n");
        CHECK(s.shell.run() == 0);
        CHECK(s.out.str() == "/$ /\n/$ /$ /$ ");
        REQUIRE(s.shell.history().size() == 1);
        CHECK(s.shell.history().at(0) == "pwd");
        CHECK(s.log().find("session ended (exit)") != std::string::npos);
    }
    SECTION("end of input ends the session") {
        s.in.str("mkdir a\ncd a\n");
        s.shell.run();
        CHECK(s.out.str() == "/$ directory 'a' created\n/$ /a$ \nEnd of input, closing session.\n");
        CHECK(s.log().find("session ended (end of input)") != std::string::npos);
    }
    SECTION("history lists the lines entered so far") {
        s.in.str("  pwd  \nbogus\nhistory\n");
        s.shell.run();
        CHECK(s.out.str().find("1: pwd\n2: bogus\n3: history\n") != std::string::npos);
        CHECK(s.out.str().find("bogus: command not found\n") != std::string::npos);
    }
}
