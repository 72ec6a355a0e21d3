#include "TextAlgorithms.hpp"
#include "../core/Errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <set>
#include <unordered_map>

namespace TextAlgorithms {

namespace {

bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
bool is_printable(unsigned char c) { return c >= 32 && c <= 126; }

std::string hex_cells(const std::string& bytes, std::size_t offset, std::size_t count) {
    std::string out;
    char buf[4];
    for (std::size_t i = 0; i < count; ++i) {
        if (i) out.push_back(' ');
        std::snprintf(buf, sizeof(buf), "%02x", static_cast<unsigned char>(bytes[offset + i]));
        out += buf;
    }
    out.resize(48, ' ');
    return out;
}

std::string ascii_cells(const std::string& bytes, std::size_t offset, std::size_t count) {
    std::string out;
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto c = static_cast<unsigned char>(bytes[offset + i]);
        out.push_back(is_printable(c) ? static_cast<char>(c) : '.');
    }
    return out;
}

}

std::vector<std::string> split_lines(const std::string& data) {
    std::vector<std::string> lines;
    std::size_t pos = 0;
    while (pos < data.size()) {
        std::size_t end = data.find('\n', pos);
        if (end == std::string::npos) end = data.size();
        std::string line = data.substr(pos, end - pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        pos = end + 1;
    }
    return lines;
}

std::vector<std::string> split_words(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;
    for (char c : s) {
        if (is_space(c)) {
            if (!cur.empty()) { words.push_back(cur); cur.clear(); }
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty()) words.push_back(cur);
    return words;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> sort_lines(std::vector<std::string> lines) {
    std::stable_sort(lines.begin(), lines.end());
    return lines;
}

std::vector<std::string> uniq_lines(const std::vector<std::string>& lines) {
    std::vector<std::string> out;
    std::set<std::string> seen;
    for (const auto& line : lines) {
        if (seen.insert(line).second) out.push_back(line);
    }
    return out;
}

std::vector<CommEntry> comm(const std::vector<std::string>& first, const std::vector<std::string>& second) {
    std::set<std::string> a(first.begin(), first.end());
    std::set<std::string> b(second.begin(), second.end());
    std::vector<CommEntry> out;
    auto i = a.begin();
    auto j = b.begin();
    while (i != a.end() && j != b.end()) {
        if (*i < *j) {
            out.push_back({CommSide::OnlyFirst, *i++});
        } else if (*j < *i) {
            out.push_back({CommSide::OnlySecond, *j++});
        } else {
            out.push_back({CommSide::Both, *i});
            ++i;
            ++j;
        }
    }
    for (; i != a.end(); ++i) out.push_back({CommSide::OnlyFirst, *i});
    for (; j != b.end(); ++j) out.push_back({CommSide::OnlySecond, *j});
    return out;
}

std::string format_comm(const CommEntry& entry) {
    switch (entry.side) {
        case CommSide::OnlyFirst: return "< " + entry.line;
        case CommSide::OnlySecond: return "> " + entry.line;
        case CommSide::Both: break;
    }
    return "  " + entry.line;
}

std::vector<DiffHunk> diff(const std::vector<std::string>& first, const std::vector<std::string>& second) {
    std::vector<DiffHunk> hunks;
    std::size_t common = std::min(first.size(), second.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (first[i] != second[i]) hunks.push_back({'c', i + 1, first[i], second[i]});
    }
    for (std::size_t i = common; i < first.size(); ++i) hunks.push_back({'d', i + 1, first[i], std::string()});
    for (std::size_t i = common; i < second.size(); ++i) hunks.push_back({'a', i + 1, std::string(), second[i]});
    return hunks;
}

std::vector<std::string> format_diff(const std::vector<DiffHunk>& hunks) {
    std::vector<std::string> out;
    for (const auto& h : hunks) {
        auto n = std::to_string(h.line);
        out.push_back(n + h.op + n);
        if (h.op == 'c') {
            out.push_back("< " + h.first);
            out.push_back("---");
            out.push_back("> " + h.second);
        } else if (h.op == 'd') {
            out.push_back("< " + h.first);
        } else {
            out.push_back("> " + h.second);
        }
    }
    return out;
}

std::vector<std::string> tsort(const std::vector<std::string>& lines) {
    std::vector<std::string> names;
    std::unordered_map<std::string, std::size_t> index;
    std::vector<std::vector<std::size_t>> edges;
    auto node = [&](const std::string& name) {
        auto it = index.find(name);
        if (it != index.end()) return it->second;
        index.emplace(name, names.size());
        names.push_back(name);
        edges.emplace_back();
        return names.size() - 1;
    };

    for (std::size_t ln = 0; ln < lines.size(); ++ln) {
        auto tokens = split_words(lines[ln]);
        if (tokens.size() % 2 != 0) {
            throw ExpressionError("line " + std::to_string(ln + 1) + ": odd number of tokens");
        }
        for (std::size_t i = 0; i + 1 < tokens.size(); i += 2) {
            std::size_t u = node(tokens[i]);
            std::size_t v = node(tokens[i + 1]);
            if (u == v) continue;
            auto& out = edges[u];
            if (std::find(out.begin(), out.end(), v) == out.end()) out.push_back(v);
        }
    }

    enum : char { White, Grey, Black };
    std::vector<char> colour(names.size(), White);
    std::vector<std::size_t> postorder;
    postorder.reserve(names.size());
    // (node, next edge to follow)
    std::vector<std::pair<std::size_t, std::size_t>> stack;
    for (std::size_t start = 0; start < names.size(); ++start) {
        if (colour[start] != White) continue;
        colour[start] = Grey;
        stack.emplace_back(start, 0);
        while (!stack.empty()) {
            std::size_t u = stack.back().first;
            std::size_t& next = stack.back().second;
            if (next == edges[u].size()) {
                colour[u] = Black;
                postorder.push_back(u);
                stack.pop_back();
                continue;
            }
            std::size_t v = edges[u][next++];
            if (colour[v] == Grey) {
                std::string chain;
                auto from = std::find_if(stack.begin(), stack.end(),
                                         [v](const std::pair<std::size_t, std::size_t>& f) { return f.first == v; });
                for (auto it = from; it != stack.end(); ++it) chain += names[it->first] + " -> ";
                chain += names[v];
                throw CycleError("input contains a cycle: " + chain);
            }
            if (colour[v] == White) {
                colour[v] = Grey;
                stack.emplace_back(v, 0);
            }
        }
    }

    std::vector<std::string> order;
    order.reserve(postorder.size());
    for (auto it = postorder.rbegin(); it != postorder.rend(); ++it) order.push_back(names[*it]);
    return order;
}

std::vector<std::string> hexdump_rows(const std::string& bytes) {
    std::vector<std::string> rows;
    char offset[32];
    for (std::size_t i = 0; i < bytes.size(); i += 16) {
        std::size_t n = std::min<std::size_t>(16, bytes.size() - i);
        std::snprintf(offset, sizeof(offset), "%08zx", i);
        rows.push_back(std::string(offset) + "  " + hex_cells(bytes, i, n) + "  |" + ascii_cells(bytes, i, n) + "|");
    }
    return rows;
}

std::vector<std::string> od_rows(const std::string& bytes) {
    std::vector<std::string> rows;
    char offset[32];
    for (std::size_t i = 0; i < bytes.size(); i += 16) {
        std::size_t n = std::min<std::size_t>(16, bytes.size() - i);
        std::snprintf(offset, sizeof(offset), "%07zo", i);
        rows.push_back(std::string(offset) + ": " + hex_cells(bytes, i, n) + " " + ascii_cells(bytes, i, n));
    }
    return rows;
}

std::vector<std::string> printable_runs(const std::string& bytes, std::size_t min_len) {
    std::vector<std::string> runs;
    std::string cur;
    for (char ch : bytes) {
        if (is_printable(static_cast<unsigned char>(ch))) {
            cur.push_back(ch);
            continue;
        }
        if (cur.size() >= min_len) runs.push_back(cur);
        cur.clear();
    }
    if (cur.size() >= min_len) runs.push_back(cur);
    return runs;
}

std::vector<std::uint64_t> divisors(std::uint64_t n) {
    std::vector<std::uint64_t> low, high;
    for (std::uint64_t i = 1; i <= n / i; ++i) {
        if (n % i != 0) continue;
        low.push_back(i);
        if (i != n / i) high.push_back(n / i);
    }
    low.insert(low.end(), high.rbegin(), high.rend());
    return low;
}

WordCount word_count(const std::string& data) {
    WordCount wc{0, 0, data.size()};
    wc.lines = static_cast<std::size_t>(std::count(data.begin(), data.end(), '\n'));
    if (!data.empty() && data.back() != '\n') ++wc.lines;
    wc.words = split_words(data).size();
    return wc;
}

bool field(const std::string& line, std::size_t index, std::string& out) {
    auto words = split_words(line);
    if (index == 0 || index > words.size()) return false;
    out = words[index - 1];
    return true;
}

std::vector<std::string> paste(const std::vector<std::vector<std::string>>& files) {
    std::size_t rows = 0;
    for (const auto& f : files) rows = std::max(rows, f.size());
    std::vector<std::string> out;
    out.reserve(rows);
    for (std::size_t r = 0; r < rows; ++r) {
        std::string row;
        for (std::size_t c = 0; c < files.size(); ++c) {
            if (c) row.push_back('\t');
            if (r < files[c].size()) row += files[c][r];
        }
        out.push_back(std::move(row));
    }
    return out;
}

std::vector<std::string> join_fields(const std::vector<std::string>& first,
                                     const std::vector<std::string>& second, std::size_t index) {
    std::vector<std::string> out;
    if (index == 0) return out;
    for (const auto& l1 : first) {
        auto f1 = split_words(l1);
        if (f1.size() < index) continue;
        for (const auto& l2 : second) {
            auto f2 = split_words(l2);
            if (f2.size() < index || f1[index - 1] != f2[index - 1]) continue;
            std::vector<std::string> row = f1;
            row.insert(row.end(), f2.begin() + static_cast<std::ptrdiff_t>(index), f2.end());
            out.push_back(join(row, " "));
        }
    }
    return out;
}

std::vector<std::string> columnate(const std::vector<std::string>& lines) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::size_t> widths;
    for (const auto& l : lines) {
        rows.push_back(split_words(l));
        const auto& row = rows.back();
        if (widths.size() < row.size()) widths.resize(row.size(), 0);
        for (std::size_t i = 0; i < row.size(); ++i) widths[i] = std::max(widths[i], row[i].size());
    }
    std::vector<std::string> out;
    out.reserve(rows.size());
    for (const auto& row : rows) {
        std::string text;
        for (std::size_t i = 0; i < row.size(); ++i) {
            if (i) text.push_back(' ');
            text += row[i];
            if (i + 1 < row.size()) text.append(widths[i] - row[i].size(), ' ');
        }
        out.push_back(std::move(text));
    }
    return out;
}

std::string colrm(const std::string& line, std::size_t start, std::size_t end) {
    if (start == 0) start = 1;
    std::string out = line.substr(0, std::min(line.size(), start - 1));
    if (end < line.size()) out += line.substr(end);
    return out;
}

std::string expand_tabs(const std::string& line, std::size_t tab_size) {
    std::string out;
    std::size_t col = 0;
    for (char c : line) {
        if (c == '\t') {
            std::size_t spaces = tab_size ? tab_size - (col % tab_size) : 0;
            out.append(spaces, ' ');
            col += spaces;
        } else if (c == '\n' || c == '\r') {
            out.push_back(c);
            col = 0;
        } else {
            out.push_back(c);
            ++col;
        }
    }
    return out;
}

std::string replace_all(const std::string& text, const std::string& from, const std::string& to) {
    if (from.empty()) return text;
    std::string out;
    std::size_t pos = 0;
    while (true) {
        std::size_t hit = text.find(from, pos);
        if (hit == std::string::npos) break;
        out.append(text, pos, hit - pos);
        out += to;
        pos = hit + from.size();
    }
    out.append(text, pos, std::string::npos);
    return out;
}

std::vector<std::string> fold(const std::string& line, std::size_t width) {
    std::vector<std::string> out;
    if (line.empty() || width == 0) {
        out.push_back(line);
        return out;
    }
    for (std::size_t i = 0; i < line.size(); i += width) out.push_back(line.substr(i, width));
    return out;
}

std::vector<std::string> fill(const std::string& text, std::size_t width) {
    std::vector<std::string> out;
    if (width == 0) width = 1;
    std::string cur;
    for (auto word : split_words(text)) {
        if (!cur.empty() && cur.size() + 1 + word.size() <= width) {
            cur += ' ';
            cur += word;
            continue;
        }
        if (!cur.empty()) {
            out.push_back(cur);
            cur.clear();
        }
        while (word.size() > width) {
            out.push_back(word.substr(0, width));
            word.erase(0, width);
        }
        cur = word;
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

std::string translate(const std::string& text, const std::string& set1, const std::string& set2) {
    if (set2.empty()) throw ExpressionError("replacement set must not be empty");
    std::array<char, 256> table;
    for (std::size_t i = 0; i < table.size(); ++i) table[i] = static_cast<char>(i);
    for (std::size_t i = 0; i < set1.size(); ++i) {
        char to = i < set2.size() ? set2[i] : set2.back();
        table[static_cast<unsigned char>(set1[i])] = to;
    }
    std::string out = text;
    for (auto& c : out) c = table[static_cast<unsigned char>(c)];
    return out;
}

std::string reverse(std::string line) {
    std::reverse(line.begin(), line.end());
    return line;
}

}
