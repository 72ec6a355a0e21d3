#include <catch2/catch.hpp>

#include <random>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "vfs/VirtualPath.hpp"

using gtos_test::Session;
using gtos_test::TempDir;

TEST_CASE("resolve is pure path arithmetic under /", "[vfs]") {
    CHECK(VirtualPath::resolve("/", "a/b").generic_string() == "/a/b");
    CHECK(VirtualPath::resolve("/a/b", "..").generic_string() == "/a");
    CHECK(VirtualPath::resolve("/a/b", "./c//d/").generic_string() == "/a/b/c/d");
    CHECK(VirtualPath::resolve("/a/b", "/x").generic_string() == "/x");
    CHECK(VirtualPath::resolve("/a/b", "~").generic_string() == "/");
    CHECK(VirtualPath::resolve("/a/b", "~/notes").generic_string() == "/notes");
    CHECK(VirtualPath::resolve("/", "").generic_string() == "/");
}

TEST_CASE("dot-dot never climbs above the root", "[vfs]") {
    CHECK(VirtualPath::resolve("/", "..").generic_string() == "/");
    CHECK(VirtualPath::resolve("/a", "../../../../etc/passwd").generic_string() == "/etc/passwd");
    CHECK(VirtualPath::resolve("/a/b", "/../..").generic_string() == "/");

    std::mt19937 rng(12345);
    const char* const segs[] = {"..", ".", "x", "y", "", "..", "~"};
    std::uniform_int_distribution<int> pick(0, 6);
    std::uniform_int_distribution<int> len(1, 12);
    for (int round = 0; round < 500; ++round) {
        std::string input;
        int n = len(rng);
        for (int i = 0; i < n; ++i) {
            if (i) input += '/';
            input += segs[pick(rng)];
        }
        auto out = VirtualPath::resolve("/x/y", input);
        INFO(input);
        REQUIRE(out.generic_string().rfind('/', 0) == 0);
        for (const auto& part : out) REQUIRE(part.string() != "..");
    }
}

TEST_CASE("change_directory only accepts existing directories", "[vfs]") {
    Session s;
    s.vfs.mkdir("/docs", false);
    s.write("/notes.txt", "x\n");
    VirtualPath cwd;

    cwd.change_directory("docs", s.vfs);
    CHECK(cwd.display() == "/docs");

    CHECK_THROWS_AS(cwd.change_directory("missing", s.vfs), NotFoundError);
    CHECK_THROWS_AS(cwd.change_directory("/notes.txt", s.vfs), NotFoundError);
    CHECK(cwd.display() == "/docs");

    cwd.change_directory("..", s.vfs);
    cwd.change_directory("..", s.vfs);
    CHECK(cwd.display() == "/");
}

TEST_CASE("a symlink pointing outside the root is refused", "[vfs]") {
    Session s;
    auto outside = s.dir.path / "outside";
    fs::create_directories(outside);
    {
        std::ofstream(outside / "secret.txt") << "top secret\n";
    }
    fs::create_directory_symlink(outside, s.vfs.root() / "escape");

    CHECK_THROWS_AS(s.vfs.readFile("/escape/secret.txt"), IoError);
    CHECK_THROWS_AS(s.vfs.writeFile("/escape/new.txt", "x", false), IoError);
    CHECK_FALSE(fs::exists(outside / "new.txt"));
}

TEST_CASE("FolderVfs creates a missing root", "[vfs]") {
    TempDir dir;
    auto root = dir.path / "a" / "b" / "rootfs";
    FolderVfs vfs(root);
    CHECK(fs::is_directory(root));
    CHECK(vfs.isDirectory("/"));
}

TEST_CASE("FolderVfs refuses a root that is a file", "[vfs]") {
    TempDir dir;
    auto file = dir.path / "plain";
    {
        std::ofstream(file) << "x";
    }
    CHECK_THROWS_AS(FolderVfs(file), FatalError);
}
