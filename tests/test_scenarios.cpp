#include <catch2/catch.hpp>

#include <algorithm>

#include "TestSupport.hpp"
#include "text/TextAlgorithms.hpp"

using gtos_test::Session;

TEST_CASE("mkdir, cd and pwd track the virtual directory", "[scenario]") {
    Session s;
    CHECK(s.run("mkdir a") == "directory 'a' created\n");
    CHECK(s.run("cd a").empty());
    CHECK(s.run("pwd") == "/a\n");
    s.run("mkdir b");
    s.run("cd b");
    CHECK(s.run("pwd") == "/a/b\n");
    s.run("cd ../../../..");
    CHECK(s.run("pwd") == "/\n");

    s.run("cd nowhere");
    CHECK(s.status == 1);
    CHECK(s.run("pwd") == "/\n");

    s.run("cd a/b");
    s.run("cd");
    CHECK(s.run("pwd") == "/\n");
}

TEST_CASE("touch, echo and cat", "[scenario]") {
    Session s;
    CHECK(s.run("touch f") == "file 'f' created\n");
    CHECK(s.run("echo hello >") == "wrote 'output.txt'\n");
    CHECK(s.run("cat output.txt") == "hello\n");

    s.run("echo two words > note.txt");
    CHECK(s.read("/note.txt") == "two words\n");
    CHECK(s.run("cat note.txt output.txt") == "two words\nhello\n");

    s.write("/raw.txt", "no newline");
    CHECK(s.run("cat raw.txt") == "no newline\n");
}

TEST_CASE("seq and factor", "[scenario]") {
    Session s;
    CHECK(s.run("seq 3") == "1\n2\n3\n");
    CHECK(s.run("seq 2 4") == "2\n3\n4\n");
    CHECK(s.run("seq 10 -3 1") == "10\n7\n4\n1\n");
    CHECK(s.run("seq 5 1").empty());
    CHECK(s.run("seq 9223372036854775806 9223372036854775807") == "9223372036854775806\n9223372036854775807\n");
    CHECK(s.run("seq -9223372036854775807 -1 -9223372036854775808") == "-9223372036854775807\n-9223372036854775808\n");
    CHECK(s.run("seq -9223372036854775808 9223372036854775807 9223372036854775807") == "-9223372036854775808\n-1\n9223372036854775806\n");
    CHECK(s.run("seq 9223372036854775807 -9223372036854775808 -9223372036854775808") == "9223372036854775807\n-1\n");
    CHECK(s.run("factor 12") == "1 2 3 4 6 12\n");
    s.run("factor -3");
    CHECK(s.status == 1);
}

TEST_CASE("listing and file operations", "[scenario]") {
    Session s;
    s.run("mkdir docs");
    s.write("/b.txt", "bee\n");
    s.write("/a.txt", "ay\n");
    s.write("/.hidden", "x\n");

    CHECK(s.run("ls") == "a.txt\nb.txt\ndocs/\n");
    CHECK(s.run("ls -a").find(".hidden") != std::string::npos);

    CHECK(s.run("cp a.txt docs/c.txt") == "copied 'a.txt' to 'docs/c.txt'\n");
    CHECK(s.read("/docs/c.txt") == "ay\n");
    s.run("mv b.txt docs/b.txt");
    CHECK(s.run("ls docs") == "b.txt\nc.txt\n");

    s.run("rm docs");
    CHECK(s.status == 1);
    CHECK(s.run("rm a.txt") == "file 'a.txt' removed\n");
    s.run("rm a.txt");
    CHECK(s.status == 1);

    s.run("ln docs/b.txt bee");
    CHECK(s.run("readlink bee") == "/docs/b.txt\n");
    CHECK(s.run("cat bee") == "bee\n");
    CHECK(s.run("realpath docs/../docs/c.txt") == "/docs/c.txt\n");

    s.run("truncate docs/c.txt 1");
    CHECK(s.read("/docs/c.txt") == "a");

    s.run("rmdir docs");
    CHECK(s.run("ls") == "bee\n");
}

TEST_CASE("mktemp, split and csplit", "[scenario]") {
    Session s;
    auto path = s.run("mktemp");
    CHECK(path.rfind("/tmp/tmp.", 0) == 0);
    CHECK(s.vfs.isFile(path.substr(0, path.size() - 1)));

    s.write("/big.bin", std::string(2500, 'x'));
    CHECK(s.run("split big.bin part") == "split 'big.bin' into 3 file(s) named 'partNNN'\n");
    CHECK(s.read("/part000").size() == 1024);
    CHECK(s.read("/part002").size() == 452);

    s.write("/book.txt", "intro--one--two");
    s.run("csplit book.txt -- ch");
    CHECK(s.read("/ch000") == "intro");
    CHECK(s.read("/ch001") == "one");
    CHECK(s.read("/ch002") == "two");
}

TEST_CASE("head, tail, wc, nl, tac and rev", "[scenario]") {
    Session s;
    std::string text;
    for (int i = 1; i <= 12; ++i) text += "line " + std::to_string(i) + "\n";
    s.write("/t.txt", text);

    CHECK(s.run("head t.txt 2") == "line 1\nline 2\n");
    CHECK(s.run("tail t.txt 2") == "line 11\nline 12\n");
    auto ten = s.run("head t.txt");
    CHECK(std::count(ten.begin(), ten.end(), '\n') == 10);
    CHECK(s.run("wc t.txt") == "12 24 " + std::to_string(text.size()) + " t.txt\n");

    s.write("/s.txt", "ab\ncd\n");
    CHECK(s.run("tac s.txt") == "cd\nab\n");
    CHECK(s.run("rev s.txt") == "ba\ndc\n");
    CHECK(s.run("nl s.txt") == "1\tab\n2\tcd\n");
}

TEST_CASE("sorting and set commands", "[scenario]") {
    Session s;
    s.write("/fruit.txt", "pear\napple\npear\nfig\napple\n");
    CHECK(s.run("sort fruit.txt") == "apple\napple\nfig\npear\npear\n");
    CHECK(s.run("uniq fruit.txt") == "pear\napple\nfig\n");

    auto shuffled = TextAlgorithms::split_lines(s.run("shuf fruit.txt"));
    CHECK(TextAlgorithms::sort_lines(shuffled) == TextAlgorithms::sort_lines(TextAlgorithms::split_lines(s.read("/fruit.txt"))));

    s.write("/other.txt", "fig\nkiwi\n");
    CHECK(s.run("comm fruit.txt other.txt") == "< apple\n  fig\n> kiwi\n< pear\n");

    s.write("/deps.txt", "a b\nb c\n");
    CHECK(s.run("tsort deps.txt") == "a b c\n");
    s.write("/loop.txt", "a b\nb a\n");
    CHECK(s.run("tsort loop.txt") == "tsort: input contains a cycle: a -> b -> a\n");
    CHECK(s.status == 1);
}

TEST_CASE("diff, cmp and patch", "[scenario]") {
    Session s;
    s.write("/one.txt", "a\nb\nc\n");
    s.write("/two.txt", "a\nx\nc\nd\n");
    s.write("/same.txt", "a\nb\nc\n");

    CHECK(s.run("diff one.txt two.txt") == "2c2\n< b\n---\n> x\n4a4\n> d\n");
    CHECK(s.status == 1);
    CHECK(s.run("diff one.txt same.txt").empty());
    CHECK(s.status == 0);

    CHECK(s.run("cmp one.txt two.txt") == "one.txt two.txt differ: byte 3\n");
    CHECK(s.run("cmp one.txt same.txt") == "one.txt same.txt are identical\n");

    s.write("/fix.patch", "--- one.txt\n+++ one.txt\n@@ -1 +1 @@\n-b\n+z\n-missing\n");
    CHECK(s.run("patch one.txt fix.patch") == "patched 'one.txt': 1 added, 1 removed, 1 not found\n");
    CHECK(s.status == 1);
    CHECK(s.read("/one.txt") == "a\nc\nz\n");

    SECTION("a removal entry takes out one copy of a repeated line") {
        s.write("/dup.txt", "x\ny\nx\nx\n");
        s.write("/one.patch", "-x\n");
        CHECK(s.run("patch dup.txt one.patch") == "patched 'dup.txt': 0 added, 1 removed\n");
        CHECK(s.status == 0);
        CHECK(s.read("/dup.txt") == "y\nx\nx\n");

        s.write("/two.patch", "-x\n-x\n");
        s.run("patch dup.txt two.patch");
        CHECK(s.read("/dup.txt") == "y\n");
    }
}

TEST_CASE("search", "[scenario]") {
    Session s;
    s.run("mkdir src");
    s.write("/src/main.cpp", "int main() {\n  // TODO: work\n}\n");
    s.write("/src/util.hpp", "#pragma once\n");
    s.write("/notes.md", "TODO list\n");

    CHECK(s.run("find / *.cpp") == "/src/main.cpp\n");
    CHECK(s.run("find src *") == "/src\n/src/main.cpp\n/src/util.hpp\n");
    CHECK(s.run("grep TODO src/main.cpp notes.md") == "src/main.cpp:2:  // TODO: work\nnotes.md:1:TODO list\n");
    s.run("grep nothing notes.md");
    CHECK(s.status == 1);
}

TEST_CASE("column commands", "[scenario]") {
    Session s;
    s.write("/t.txt", "id name\n1 alice\n2 bob\n");
    s.write("/ages.txt", "1 30\n2 41\n");
    CHECK(s.run("cut -f 2 t.txt") == "name\nalice\nbob\n");
    CHECK(s.run("join t.txt ages.txt 1") == "1 alice 30\n2 bob 41\n");
    CHECK(s.run("paste t.txt ages.txt") == "id name\t1 30\n1 alice\t2 41\n2 bob\t\n");
    CHECK(s.run("column t.txt") == "id name\n1  alice\n2  bob\n");
    CHECK(s.run("colrm t.txt 1 2") == " name\nalice\nbob\n");
    CHECK(s.run("fold t.txt 3") == "id \nnam\ne\n1 a\nlic\ne\n2 b\nob\n");

    s.write("/tabs.txt", "a\tb\n");
    CHECK(s.run("expand tabs.txt") == "a       b\n");
    CHECK(s.run("col tabs.txt") == "a    b\n");
}

TEST_CASE("transform commands", "[scenario]") {
    Session s;
    s.write("/t.txt", "hello world\n");
    CHECK(s.run("tr lo 01 t.txt") == "he001 w1r0d\n");
    CHECK(s.run("sed world there t.txt") == "hello there\n");
    CHECK(s.read("/t.txt") == "hello world\n");

    s.write("/sales.txt", "north 120\nsouth 80\neast 300\n");
    CHECK(s.run("awk $2>100 sales.txt") == "north 120\neast 300\n");
    CHECK(s.run("awk $1=='south' sales.txt") == "south 80\n");
    s.run("awk $2>>1 sales.txt");
    CHECK(s.status == 1);

    auto pr = s.run("pr t.txt");
    CHECK(pr == "File: t.txt\n" + std::string(72, '-') + "\nhello world\n" + std::string(72, '-') + "\n");

    s.write("/u.txt", "a_b\n");
    CHECK(s.run("ul u.txt") == "a\x1b[4m_\x1b[0mb\n");
}

TEST_CASE("dumps", "[scenario]") {
    Session s;
    s.write("/h.txt", "Hello\n");
    CHECK(s.run("hexdump h.txt") == "00000000  48 65 6c 6c 6f 0a" + std::string(31, ' ') + "  |Hello.|\n");
    CHECK(s.run("od h.txt").rfind("0000000: 48 65", 0) == 0);
    s.write("/bin.dat", std::string("\x01\x02word\x00longer text\x03", 18));
    CHECK(s.run("strings bin.dat") == "word\nlonger text\n");
}

TEST_CASE("number and expression commands", "[scenario]") {
    Session s;
    CHECK(s.run("expr 2 + 3 * 4") == "14\n");
    CHECK(s.run("bc (7 // 2) == 3") == "1\n");
    CHECK(s.run("printf %s-%03d abc 7") == "abc-007\n");
    CHECK(s.run("numfmt {:.2f} 3.14159") == "3.14\n");
    CHECK(s.run("test 3 -lt 10") == "true\n");
    CHECK(s.status == 0);
    CHECK(s.run("test abc = abd") == "false\n");
    CHECK(s.status == 1);
    s.run("test 1 -xx 2");
    CHECK(s.status == 1);
}

TEST_CASE("information commands", "[scenario]") {
    Session s;
    s.run("mkdir d");
    s.write("/d/x.png", "\x89PNG\r\n");
    s.write("/run.sh", "#!/bin/sh\necho\n");
    s.write("/plain.txt", "just text\n");

    CHECK(s.run("file d") == "d: directory\n");
    CHECK(s.run("file d/x.png") == "d/x.png: PNG image data\n");
    CHECK(s.run("file run.sh") == "run.sh: script, /bin/sh interpreter\n");
    CHECK(s.run("file plain.txt") == "plain.txt: ASCII text\n");
    CHECK(s.run("mime nothing.zzz") == "nothing.zzz: unknown MIME type\n");
    CHECK(s.run("basename d/x.png") == "x.png\n");
    CHECK(s.run("dirname d/x.png") == "/d\n");
    CHECK(s.run("stat plain.txt").find("Size: 10") != std::string::npos);
    CHECK(s.run("df").rfind("Filesystem", 0) == 0);
    CHECK(s.run("pathchk a/b") == "'a/b' is a valid path\n");
    s.run("pathchk " + std::string(300, 'n'));
    CHECK(s.status == 1);
}

TEST_CASE("session commands", "[scenario]") {
    Session s;
    CHECK(s.run("alias ll ls -l") == "alias 'll' set to 'ls -l'\n");
    CHECK(s.run("alias") == "alias ll='ls -l'\n");
    CHECK(s.run("unalias ll") == "alias 'll' removed\n");
    CHECK(s.run("unalias ll") == "alias 'll' not found\n");
    CHECK(s.status == 0);

    CHECK(s.run("export EDITOR vim") == "EDITOR=vim\n");
    CHECK(s.run("env").find("EDITOR=vim\n") != std::string::npos);

    CHECK(s.run("about") == "GTOS 1.0\nDeveloped by G.E. Studios\n");
    CHECK(s.run("uname") == "GTOS 1.0\n");
    CHECK(s.run("ps") == "PID: 1, Name: systemd, Status: running\nPID: 2, Name: kernel, Status: running\n"
                         "PID: 3, Name: GTOS, Status: running\n");
    CHECK(s.run("kill 42") == "simulated termination of process 42\n");
    s.run("kill abc");
    CHECK(s.status == 1);
    CHECK(s.run("clear") == "\x1b[2J\x1b[3J\x1b[H");
}

TEST_CASE("cal lays out weeks from Monday", "[scenario]") {
    Session s;
    auto year = s.run("cal 2024");
    CHECK(s.status == 0);
    CHECK(year.find("January") != std::string::npos);
    CHECK(year.find("December") != std::string::npos);
    // 1 January 2024 was a Monday
    CHECK(year.find("Mo Tu We Th Fr Sa Su      Mo Tu We Th Fr Sa Su      Mo Tu We Th Fr Sa Su\n"
                    " 1  2  3  4  5  6  7") != std::string::npos);
    s.run("cal 0");
    CHECK(s.status == 1);
}

TEST_CASE("sleep and printf reject numbers they cannot use", "[scenario]") {
    Session s;
    CHECK(s.run("sleep nan") == "sleep: invalid time interval 'nan'\n");
    CHECK(s.status == 1);
    CHECK(s.run("sleep inf") == "sleep: invalid time interval 'inf'\n");
    CHECK(s.run("sleep 1e12") == "sleep: invalid time interval '1e12'\n");
    CHECK(s.run("sleep -1") == "sleep: invalid time interval '-1'\n");
    CHECK(s.run("sleep 0") == "");
    CHECK(s.status == 0);

    CHECK(s.run("printf %d 1e30") == "printf: integer out of range: '1e30'\n");
    CHECK(s.status == 1);
}
