#include <catch2/catch.hpp>

#include <algorithm>
#include <map>
#include <set>

#include "core/Errors.hpp"
#include "text/TextAlgorithms.hpp"

using namespace TextAlgorithms;
using Lines = std::vector<std::string>;

TEST_CASE("split_lines", "[text]") {
    CHECK(split_lines("") == Lines{});
    CHECK(split_lines("a\nb\n") == Lines{"a", "b"});
    CHECK(split_lines("a\nb") == Lines{"a", "b"});
    CHECK(split_lines("a\r\n\nb") == Lines{"a", "", "b"});
    CHECK(split_lines("\n") == Lines{""});
}

TEST_CASE("split_words and join", "[text]") {
    CHECK(split_words("  one\ttwo   three \n") == Lines{"one", "two", "three"});
    CHECK(split_words("   ").empty());
    CHECK(join({"a", "b", "c"}, ", ") == "a, b, c");
    CHECK(join({}, "-").empty());
}

TEST_CASE("sort_lines is an ordered, idempotent permutation", "[text][sort]") {
    Lines input{"pear", "apple", "Zebra", "apple", "banana", ""};
    auto sorted = sort_lines(input);
    CHECK(std::is_sorted(sorted.begin(), sorted.end()));
    CHECK(std::is_permutation(sorted.begin(), sorted.end(), input.begin()));
    CHECK(sort_lines(sorted) == sorted);
    CHECK(sorted.front().empty());
    CHECK(sorted[1] == "Zebra");
}

TEST_CASE("uniq_lines keeps first occurrences anywhere in the input", "[text][uniq]") {
    Lines input{"b", "a", "b", "c", "a", "b"};
    auto out = uniq_lines(input);
    CHECK(out == Lines{"b", "a", "c"});
    CHECK(out.size() <= input.size());
    CHECK(std::set<std::string>(out.begin(), out.end()).size() == out.size());
    CHECK(uniq_lines({}).empty());
}

TEST_CASE("comm partitions the union of both inputs", "[text][comm]") {
    Lines first{"apple", "banana", "cherry", "apple"};
    Lines second{"banana", "date", "cherry", "elder"};
    auto entries = comm(first, second);

    std::set<std::string> uni(first.begin(), first.end());
    uni.insert(second.begin(), second.end());
    REQUIRE(entries.size() == uni.size());

    std::map<CommSide, int> counts;
    std::set<std::string> seen;
    for (const auto& e : entries) {
        ++counts[e.side];
        seen.insert(e.line);
    }
    CHECK(seen == uni);
    CHECK(counts[CommSide::OnlyFirst] == 1);
    CHECK(counts[CommSide::OnlySecond] == 2);
    CHECK(counts[CommSide::Both] == 2);

    CHECK(format_comm(entries[0]) == "< apple");
    CHECK(format_comm({CommSide::OnlySecond, "date"}) == "> date");
    CHECK(format_comm({CommSide::Both, "banana"}) == "  banana");
}

TEST_CASE("diff compares line by line", "[text][diff]") {
    SECTION("identical") {
        CHECK(diff({"a", "b"}, {"a", "b"}).empty());
    }
    SECTION("changed line") {
        auto hunks = diff({"a", "b", "c"}, {"a", "x", "c"});
        REQUIRE(hunks.size() == 1);
        CHECK(format_diff(hunks) == Lines{"2c2", "< b", "---", "> x"});
    }
    SECTION("extra lines in either file") {
        CHECK(format_diff(diff({"a", "b", "c"}, {"a"})) == Lines{"2d2", "< b", "3d3", "< c"});
        CHECK(format_diff(diff({"a"}, {"a", "z"})) == Lines{"2a2", "> z"});
    }
}

TEST_CASE("tsort orders every edge", "[text][tsort]") {
    Lines input{"shirt tie", "tie jacket", "socks shoes", "pants shoes", "pants belt", "shirt belt", "belt jacket",
                "undershorts pants"};
    auto order = tsort(input);
    auto pos = [&](const std::string& n) {
        return std::find(order.begin(), order.end(), n) - order.begin();
    };
    CHECK(order.size() == 8);
    for (const auto& line : input) {
        auto w = split_words(line);
        INFO(line);
        CHECK(pos(w[0]) < pos(w[1]));
    }

    SECTION("simple chain") {
        CHECK(tsort({"a b", "b c"}) == Lines{"a", "b", "c"});
    }
    SECTION("self pair declares a node") {
        CHECK(tsort({"solo solo"}) == Lines{"solo"});
    }
    SECTION("several pairs on one line") {
        CHECK(tsort({"a b b c"}) == Lines{"a", "b", "c"});
    }
    SECTION("odd token count") {
        CHECK_THROWS_AS(tsort({"a b c"}), ExpressionError);
    }
    SECTION("cycle") {
        CHECK_THROWS_AS(tsort({"a b", "b c", "c a"}), CycleError);
        try {
            tsort({"a b", "b a"});
            FAIL("expected a cycle");
        } catch (const CycleError& e) {
            CHECK(std::string(e.what()) == "input contains a cycle: a -> b -> a");
        }
    }
}

TEST_CASE("hexdump and od rows", "[text][dump]") {
    auto rows = hexdump_rows("Hello\n");
    REQUIRE(rows.size() == 1);
    CHECK(rows[0] == "00000000  48 65 6c 6c 6f 0a" + std::string(31, ' ') + "  |Hello.|");

    std::string bytes(20, 'A');
    rows = hexdump_rows(bytes);
    REQUIRE(rows.size() == 2);
    CHECK(rows[1].rfind("00000010  41 41 41 41", 0) == 0);

    auto od = od_rows(bytes);
    REQUIRE(od.size() == 2);
    CHECK(od[1].rfind("0000020: 41 41 41 41", 0) == 0);
    CHECK(od[1].substr(od[1].size() - 4) == "AAAA");

    CHECK(hexdump_rows("").empty());
}

TEST_CASE("printable_runs", "[text][dump]") {
    std::string bytes = std::string("\x01\x02", 2) + "abc" + '\0' + "long enough" + '\xff' + "tail";
    CHECK(printable_runs(bytes) == Lines{"long enough", "tail"});
    CHECK(printable_runs(bytes, 3) == Lines{"abc", "long enough", "tail"});
}

TEST_CASE("divisors", "[text]") {
    CHECK(divisors(12) == std::vector<std::uint64_t>{1, 2, 3, 4, 6, 12});
    CHECK(divisors(1) == std::vector<std::uint64_t>{1});
    CHECK(divisors(49) == std::vector<std::uint64_t>{1, 7, 49});
    CHECK(divisors(13) == std::vector<std::uint64_t>{1, 13});
}

TEST_CASE("word_count", "[text]") {
    auto wc = word_count("one two\nthree\n");
    CHECK(wc.lines == 2);
    CHECK(wc.words == 3);
    CHECK(wc.bytes == 14);
    CHECK(word_count("no newline").lines == 1);
    CHECK(word_count("").lines == 0);
}

TEST_CASE("field, paste and join_fields", "[text][columns]") {
    std::string out;
    CHECK(field("a  b c", 2, out));
    CHECK(out == "b");
    CHECK_FALSE(field("a b", 3, out));
    CHECK_FALSE(field("a b", 0, out));

    CHECK(paste({{"1", "2", "3"}, {"a", "b"}}) == Lines{"1\ta", "2\tb", "3\t"});

    Lines names{"1 alice", "2 bob", "3 carol"};
    Lines ages{"1 30", "3 41", "4 50"};
    CHECK(join_fields(names, ages, 1) == Lines{"1 alice 30", "3 carol 41"});
    CHECK(join_fields(names, ages, 0).empty());
}

TEST_CASE("columnate pads every column but the last", "[text][columns]") {
    CHECK(columnate({"name age", "alexander 7", "bo 100"}) ==
          Lines{"name      age", "alexander 7", "bo        100"});
}

TEST_CASE("colrm, expand_tabs and replace_all", "[text][columns]") {
    CHECK(colrm("abcdef", 2, 3) == "adef");
    CHECK(colrm("abcdef", 5, 100) == "abcd");
    CHECK(colrm("abc", 10, 12) == "abc");

    CHECK(expand_tabs("a\tb") == "a       b");
    CHECK(expand_tabs("\tx", 4) == "    x");
    CHECK(expand_tabs("abcd\tx", 4) == "abcd    x");

    CHECK(replace_all("a.b.c", ".", "::") == "a::b::c");
    CHECK(replace_all("aaa", "aa", "b") == "ba");
    CHECK(replace_all("abc", "", "x") == "abc");
}

TEST_CASE("fold and fill", "[text]") {
    CHECK(fold("abcdefg", 3) == Lines{"abc", "def", "g"});
    CHECK(fold("", 3) == Lines{""});

    auto filled = fill("the quick brown fox jumps over the lazy dog", 10);
    CHECK(filled == Lines{"the quick", "brown fox", "jumps over", "the lazy", "dog"});
    for (const auto& l : filled) CHECK(l.size() <= 10);
    CHECK(fill("abcdefghij klm", 4) == Lines{"abcd", "efgh", "ij", "klm"});
}

TEST_CASE("translate and reverse", "[text]") {
    CHECK(translate("hello", "el", "ip") == "hippo");
    CHECK(translate("abcabc", "abc", "x") == "xxxxxx");
    CHECK(translate("abc", "", "xyz") == "abc");
    CHECK_THROWS_AS(translate("abc", "a", ""), ExpressionError);
    CHECK(reverse("stressed") == "desserts");
    CHECK(reverse("").empty());
}
