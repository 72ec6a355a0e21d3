#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Pure transforms over lines and bytes. Nothing here touches storage.
namespace TextAlgorithms {

// Split on '\n'. A trailing newline does not produce an empty last line,
// and a '\r' before the newline is dropped.
std::vector<std::string> split_lines(const std::string& data);
// Split on runs of whitespace.
std::vector<std::string> split_words(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Stable, byte-wise lexicographic order.
std::vector<std::string> sort_lines(std::vector<std::string> lines);

// Each distinct line once, in order of first appearance anywhere in the
// input. Unlike POSIX uniq, repeats need not be adjacent.
std::vector<std::string> uniq_lines(const std::vector<std::string>& lines);

enum class CommSide { OnlyFirst, OnlySecond, Both };
struct CommEntry {
    CommSide side;
    std::string line;
};
// Merge-walk over the sorted distinct lines of both inputs.
std::vector<CommEntry> comm(const std::vector<std::string>& first, const std::vector<std::string>& second);
// "< x", "> x" or "  x".
std::string format_comm(const CommEntry& entry);

// Line-aligned comparison, not a minimal edit script: line i of one file
// is only ever compared with line i of the other.
struct DiffHunk {
    char op;            // 'c' changed, 'd' only in first, 'a' only in second
    std::size_t line;   // 1-based
    std::string first;
    std::string second;
};
std::vector<DiffHunk> diff(const std::vector<std::string>& first, const std::vector<std::string>& second);
std::vector<std::string> format_diff(const std::vector<DiffHunk>& hunks);

// Topological order of the graph whose edges are the token pairs on each
// line ("u v" is u -> v, "a a" only declares a). Throws ExpressionError for
// a line with an odd token count and CycleError when the graph has a cycle.
std::vector<std::string> tsort(const std::vector<std::string>& lines);

// Rows of 16 bytes: "00000000  48 65 ...  |He...|"
std::vector<std::string> hexdump_rows(const std::string& bytes);
// Same rows with an octal offset: "0000000: 48 65 ... He..."
std::vector<std::string> od_rows(const std::string& bytes);
// Runs of at least min_len printable ASCII bytes.
std::vector<std::string> printable_runs(const std::string& bytes, std::size_t min_len = 4);

// Every divisor of n in ascending order (trial division up to sqrt(n)).
std::vector<std::uint64_t> divisors(std::uint64_t n);

struct WordCount {
    std::size_t lines;
    std::size_t words;
    std::size_t bytes;
};
WordCount word_count(const std::string& data);

// Copies whitespace field `index` (1-based) into out; false when the line
// has fewer fields.
bool field(const std::string& line, std::size_t index, std::string& out);
std::vector<std::string> paste(const std::vector<std::vector<std::string>>& files);
// Joins rows whose field `index` (1-based) is equal: all fields of the first
// row followed by the fields of the second row after the join field.
std::vector<std::string> join_fields(const std::vector<std::string>& first,
                                     const std::vector<std::string>& second, std::size_t index);
// Whitespace-separated cells padded into left-aligned columns.
std::vector<std::string> columnate(const std::vector<std::string>& lines);
// Drop columns [start, end] (1-based, inclusive).
std::string colrm(const std::string& line, std::size_t start, std::size_t end);
std::string expand_tabs(const std::string& line, std::size_t tab_size = 8);
std::string replace_all(const std::string& text, const std::string& from, const std::string& to);
std::vector<std::string> fold(const std::string& line, std::size_t width);
// Greedy paragraph fill; words longer than width are broken.
std::vector<std::string> fill(const std::string& text, std::size_t width = 70);
// Map each character of set1 to the same position of set2; a shorter set2
// is padded with its last character.
std::string translate(const std::string& text, const std::string& set1, const std::string& set2);
std::string reverse(std::string line);

}
