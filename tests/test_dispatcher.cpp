#include <catch2/catch.hpp>

#include <chrono>
#include <thread>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/Interrupt.hpp"
#include "shell/CommandRegistry.hpp"

using gtos_test::Session;

namespace {
    // Raises the interrupt flag from another thread after a delay, the way a
    // SIGINT handler would.
    struct DelayedInterrupt {
        std::thread worker;
        explicit DelayedInterrupt(std::chrono::milliseconds delay)
            : worker([delay] {
                  std::this_thread::sleep_for(delay);
                  Interrupt::set();
              }) {}
        ~DelayedInterrupt() {
            if (worker.joinable()) worker.join();
        }
    };
}

TEST_CASE("alias expansion replaces the first word", "[dispatcher][alias]") {
    Session s;
    s.aliases.set("ll", "ls -l");
    auto tokens = s.shell.dispatcher().expand({"ll", "/docs"});
    REQUIRE(tokens == std::vector<std::string>{"ls", "-l", "/docs"});

    SECTION("chains are followed") {
        s.aliases.set("l", "ll");
        CHECK(s.shell.dispatcher().expand({"l"}) == std::vector<std::string>{"ls", "-l"});
    }
    SECTION("only the exact first token is looked up") {
        CHECK(s.shell.dispatcher().expand({"LL"}) == std::vector<std::string>{"LL"});
        CHECK(s.shell.dispatcher().expand({"echo", "ll"}) == std::vector<std::string>{"echo", "ll"});
    }
}

TEST_CASE("an alias may reuse the name of the command it wraps", "[dispatcher][alias]") {
    Session s;
    s.vfs.mkdir("/docs", false);
    s.aliases.set("ls", "ls -l");
    CHECK(s.shell.dispatcher().expand({"ls"}) == std::vector<std::string>{"ls", "-l"});
    auto out = s.run("ls");
    CHECK(s.status == 0);
    CHECK(out.find("docs/") != std::string::npos);
}

TEST_CASE("alias cycles are reported instead of looping", "[dispatcher][alias]") {
    Session s;
    s.aliases.set("a", "b");
    s.aliases.set("b", "a");
    CHECK_THROWS_AS(s.shell.dispatcher().expand({"a"}), AliasCycleError);

    auto out = s.run("a");
    CHECK(s.status == 1);
    CHECK(out == "a: cycle detected: a -> b -> a\n");
    CHECK(s.log().find("[alias-cycle] a") != std::string::npos);

    SECTION("self reference to a non-command") {
        s.aliases.set("x", "x y");
        CHECK_THROWS_AS(s.shell.dispatcher().expand({"x"}), AliasCycleError);
    }
    SECTION("the shell keeps working afterwards") {
        CHECK(s.run("pwd") == "/\n");
        CHECK(s.status == 0);
    }
}

TEST_CASE("long acyclic alias chains terminate", "[dispatcher][alias]") {
    Session s;
    const int n = 40;
    for (int i = 0; i < n; ++i) s.aliases.set("a" + std::to_string(i), "a" + std::to_string(i + 1));
    s.aliases.set("a" + std::to_string(n), "pwd");
    CHECK(s.run("a0") == "/\n");
    CHECK(s.status == 0);
}

TEST_CASE("a chain deeper than the limit is an error", "[dispatcher][alias]") {
    Session s;
    const auto n = static_cast<int>(Dispatcher::kMaxAliasDepth) + 5;
    for (int i = 0; i < n; ++i) s.aliases.set("a" + std::to_string(i), "a" + std::to_string(i + 1));
    s.aliases.set("a" + std::to_string(n), "pwd");
    CHECK_THROWS_AS(s.shell.dispatcher().expand({"a0"}), AliasCycleError);
}

TEST_CASE("dispatcher failure boundary", "[dispatcher]") {
    Session s;

    SECTION("unknown command") {
        CHECK(s.run("frobnicate now") == "frobnicate: command not found\n");
        CHECK(s.status == 127);
    }
    SECTION("command names are case-insensitive") {
        CHECK(s.run("PWD") == "/\n");
        CHECK(s.status == 0);
    }
    SECTION("wrong argument count prints the usage line") {
        auto* mkdir = s.shell.dispatcher().registry().find("mkdir");
        REQUIRE(mkdir != nullptr);
        CHECK(s.run("mkdir") == "usage: " + mkdir->usage() + "\n");
        CHECK(s.status == 2);
        CHECK(s.run("mkdir a b c") == "usage: " + mkdir->usage() + "\n");
    }
    SECTION("errors are printed with the command name and logged") {
        auto out = s.run("cat missing.txt");
        CHECK(s.status == 1);
        CHECK(out.rfind("cat: ", 0) == 0);
        CHECK(out.find("missing.txt") != std::string::npos);
        auto log = s.log();
        CHECK(log.find(" - ERROR - ") != std::string::npos);
        CHECK(log.find("[not-found] cat missing.txt") != std::string::npos);
    }
    SECTION("expression errors") {
        s.run("expr 1 / 0");
        CHECK(s.status == 1);
        s.run("seq 1 0 5");
        CHECK(s.status == 1);
    }
    SECTION("blank lines do nothing") {
        CHECK(s.run("   ").empty());
        CHECK(s.status == 0);
    }
}

TEST_CASE("an interrupted command returns to the prompt", "[dispatcher][interrupt]") {
    Session s;
    Interrupt::clear();

    SECTION("sleep") {
        Interrupt::set();
        auto out = s.run("sleep 5");
        CHECK(s.status == 130);
        CHECK(out == "\ninterrupted\n");
        CHECK_FALSE(Interrupt::check());
    }
    SECTION("yes stops when the flag is raised") {
        std::string out;
        {
            DelayedInterrupt later(std::chrono::milliseconds(350));
            out = s.run("yes hi");
        }
        CHECK(s.status == 130);
        CHECK(out.rfind("hi\n", 0) == 0);
        CHECK(out.size() >= std::string("hi\ninterrupted\n").size());
        CHECK(out.substr(out.size() - 13) == "\ninterrupted\n");
        CHECK_FALSE(Interrupt::check());
    }
    SECTION("watch stops between runs") {
        std::string out;
        {
            DelayedInterrupt later(std::chrono::milliseconds(200));
            out = s.run("watch pwd");
        }
        CHECK(s.status == 130);
        CHECK(out.rfind("/\n", 0) == 0);
    }
    SECTION("an interrupt inside time reaches the outer line") {
        std::string out;
        {
            DelayedInterrupt later(std::chrono::milliseconds(200));
            out = s.run("time yes");
        }
        CHECK(s.status == 130);
        CHECK(out.find("real ") == std::string::npos);
    }
    SECTION("state survives the interrupt") {
        s.run("alias p pwd");
        s.run("export EDITOR vim");
        Interrupt::set();
        s.run("sleep 1");
        CHECK(s.aliases.find("p") != nullptr);
        CHECK(s.env.get("EDITOR") == "vim");
        CHECK(s.run("p") == "/\n");
    }
}

TEST_CASE("time reports the elapsed time and the command status", "[dispatcher]") {
    Session s;
    auto out = s.run("time pwd");
    CHECK(s.status == 0);
    CHECK(out.rfind("/\nreal ", 0) == 0);

    s.run("time cat nothing.txt");
    CHECK(s.status == 1);
}

TEST_CASE("aliases that recurse through time or watch hit the nesting limit", "[dispatcher][alias]") {
    Session s;
    const std::string expected = "command nesting exceeds " + std::to_string(Dispatcher::kMaxAliasDepth) + " levels";

    SECTION("time") {
        s.run("alias t time t");
        auto out = s.run("t");
        CHECK(s.status == 1);
        CHECK(out == "time: " + expected + "\n");
    }
    SECTION("watch") {
        s.run("alias w watch w");
        auto out = s.run("w");
        CHECK(s.status == 1);
        CHECK(out == "watch: " + expected + "\n");
    }
    CHECK(s.log().find("[nesting]") != std::string::npos);
    CHECK(s.run("pwd") == "/\n");
}

TEST_CASE("nesting below the limit still runs", "[dispatcher]") {
    Session s;
    auto out = s.run("time time pwd");
    CHECK(s.status == 0);
    CHECK(out.rfind("/\nreal ", 0) == 0);
}
