#pragma once
#include <cstddef>
#include <limits>
#include <string>

class CommandContext;

// Accepted number of arguments after the command name.
struct Arity {
    static constexpr std::size_t unbounded = std::numeric_limits<std::size_t>::max();
    std::size_t min;
    std::size_t max;

    bool accepts(std::size_t n) const { return n >= min && n <= max; }
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual std::string name() const = 0;
    // One line, e.g. "cp <src> <dst>". Printed on a UsageError.
    virtual std::string usage() const = 0;
    // One-line description listed by `help`.
    virtual std::string summary() const = 0;
    // Full manual page shown by `man`.
    virtual std::string help() const = 0;
    virtual Arity arity() const = 0;
    virtual int execute(CommandContext& context) = 0;
};
