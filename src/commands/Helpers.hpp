#pragma once
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "../shell/CommandContext.hpp"
#include "../vfs/IVfs.hpp"
#include "../vfs/VirtualPath.hpp"
#include "../text/Format.hpp"
#include "../text/TextAlgorithms.hpp"
#include "../core/Errors.hpp"

inline std::filesystem::path to_vfs_path(const CommandContext& ctx, const std::string& s) {
    return ctx.cwd.resolve(s);
}

inline std::string read_text(const CommandContext& ctx, const std::string& arg) {
    return ctx.vfs.readFile(to_vfs_path(ctx, arg));
}

inline std::vector<std::string> read_lines(const CommandContext& ctx, const std::string& arg) {
    return TextAlgorithms::split_lines(read_text(ctx, arg));
}

// Like print_lines for one block of text: a final newline is added if missing.
inline void print_text(std::ostream& out, const std::string& text) {
    out << text;
    if (!text.empty() && text.back() != '\n') out << '\n';
    out.flush();
}

inline void print_lines(std::ostream& out, const std::vector<std::string>& lines) {
    for (const auto& l : lines) out << l << '\n';
    out.flush();
}

// Non-negative decimal count ("10"); ExpressionError otherwise.
inline std::size_t to_count(const std::string& s) {
    long long v = Format::to_integer(s);
    if (v < 0) throw ExpressionError("invalid count: '" + s + "'");
    return static_cast<std::size_t>(v);
}

// Simple glob: * and ? only, no character classes.
inline bool match_glob(const std::string& name, const std::string& pat) {
    size_t n = 0, p = 0, star = std::string::npos, match = 0;
    while (n < name.size()) {
        if (p < pat.size() && (pat[p] == '?' || pat[p] == name[n])) { ++n; ++p; }
        else if (p < pat.size() && pat[p] == '*') { star = p++; match = n; }
        else if (star != std::string::npos) { p = star + 1; n = ++match; }
        else return false;
    }
    while (p < pat.size() && pat[p] == '*') ++p;
    return p == pat.size();
}

// Bytes per read when streaming a file through a checksum.
const std::size_t kChunk = 4096;

// 1-based column or field number.
inline std::size_t position_arg(const std::string& s) {
    auto n = to_count(s);
    if (n == 0) throw ExpressionError("positions start at 1, got '" + s + "'");
    return n;
}

// Output piece names for split/csplit: prefix000, prefix001, ...
inline std::string numbered(const std::string& prefix, std::size_t i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%03zu", i);
    return prefix + buf;
}

// 512 -> "512B", 2048 -> "2.0K", 5 MiB -> "5.0M"
inline std::string human_size(std::uintmax_t bytes) {
    static const char* const units[] = {"B", "K", "M", "G", "T", "P"};
    if (bytes < 1024) return std::to_string(bytes) + "B";
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024 && u < 5) { v /= 1024; ++u; }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%s", v, units[u]);
    return buf;
}
