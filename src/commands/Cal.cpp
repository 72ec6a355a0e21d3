#include "../shell/ICommand.hpp"
#include "Helpers.hpp"

#include <cstdio>
#include <ctime>

namespace {
    const char* const kMonthNames[] = {"January", "February", "March", "April", "May", "June", "July",
                                       "August", "September", "October", "November", "December"};

    bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

    int days_in_month(int y, int m) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return m == 2 && is_leap(y) ? 29 : days[m - 1];
    }

    // 0 = Monday .. 6 = Sunday
    int weekday(int y, int m, int d) {
        static const int t[] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
        if (m < 3) y -= 1;
        int sunday_first = (y + y / 4 - y / 100 + y / 400 + t[m - 1] + d) % 7;
        return (sunday_first + 6) % 7;
    }

    std::string center(const std::string& s, std::size_t width) {
        if (s.size() >= width) return s;
        std::size_t pad = width - s.size();
        return std::string(pad / 2, ' ') + s + std::string(pad - pad / 2, ' ');
    }

    // One month as lines of exactly 20 columns: title, weekday header and
    // six week rows (trailing rows blank).
    std::vector<std::string> month_block(int year, int month, bool with_year) {
        std::vector<std::string> lines;
        std::string title = kMonthNames[month - 1];
        if (with_year) title += " " + std::to_string(year);
        lines.push_back(center(title, 20));
        lines.push_back("Mo Tu We Th Fr Sa Su");
        std::string row;
        int col = weekday(year, month, 1);
        row.append(static_cast<std::size_t>(col) * 3, ' ');
        char cell[8];
        for (int d = 1; d <= days_in_month(year, month); ++d) {
            std::snprintf(cell, sizeof(cell), "%2d", d);
            if (col > 0) row += ' ';
            row += cell;
            if (++col == 7) {
                lines.push_back(row);
                row.clear();
                col = 0;
            }
        }
        if (!row.empty()) lines.push_back(row);
        while (lines.size() < 8) lines.emplace_back();
        for (auto& l : lines) l.resize(20, ' ');
        return lines;
    }

    std::string rstrip(std::string s) {
        while (!s.empty() && s.back() == ' ') s.pop_back();
        return s;
    }
}

class Cal : public ICommand {
public:
    std::string name() const override { return "cal"; }
    std::string usage() const override { return "cal [year]"; }
    std::string summary() const override { return "display a calendar"; }
    std::string help() const override {
        return R"(cal: display a calendar
Synopsis:
  cal
  cal <year>
Notes:
  Without a year, shows the current month. Weeks start on Monday.
  A year is shown as four rows of three months.
Examples:
  cal 2024
)";
    }
    Arity arity() const override { return {0, 1}; }
    int execute(CommandContext& ctx) override {
        if (ctx.args.size() == 1) {
            std::time_t now = std::time(nullptr);
            std::tm tm{};
            localtime_r(&now, &tm);
            for (const auto& l : month_block(tm.tm_year + 1900, tm.tm_mon + 1, true)) {
                auto s = rstrip(l);
                if (!s.empty()) ctx.out << s << '\n';
            }
            ctx.out.flush();
            return 0;
        }
        long long year = Format::to_integer(ctx.args[1]);
        if (year < 1 || year > 9999) throw ExpressionError("year out of range: " + ctx.args[1]);
        int y = static_cast<int>(year);
        ctx.out << rstrip(center(std::to_string(y), 72)) << "\n\n";
        for (int first = 1; first <= 12; first += 3) {
            std::vector<std::vector<std::string>> blocks;
            for (int m = first; m < first + 3; ++m) blocks.push_back(month_block(y, m, false));
            for (std::size_t row = 0; row < blocks[0].size(); ++row) {
                std::string line = blocks[0][row] + "      " + blocks[1][row] + "      " + blocks[2][row];
                ctx.out << rstrip(line) << '\n';
            }
        }
        ctx.out.flush();
        return 0;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_cal(){ return std::make_unique<Cal>(); } }
