#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

// Failure reported by a command. status() is what the dispatcher returns for
// the line that raised it.
class ShellError : public std::runtime_error {
public:
    ShellError(const std::string& what, int status)
        : std::runtime_error(what), status_(status) {}
    int status() const { return status_; }
    virtual const char* category() const { return "error"; }
private:
    int status_;
};

// Wrong argument count or shape. what() is the command's usage line.
class UsageError : public ShellError {
public:
    explicit UsageError(const std::string& usage) : ShellError(usage, 2) {}
    const char* category() const override { return "usage"; }
};

class NotFoundError : public ShellError {
public:
    explicit NotFoundError(const std::string& what) : ShellError(what, 1) {}
    const char* category() const override { return "not-found"; }
};

class IoError : public ShellError {
public:
    explicit IoError(const std::string& what) : ShellError(what, 1) {}
    const char* category() const override { return "io"; }
};

// Malformed arithmetic or format input.
class ExpressionError : public ShellError {
public:
    explicit ExpressionError(const std::string& what) : ShellError(what, 1) {}
    const char* category() const override { return "expression"; }
};

class AliasCycleError : public ShellError {
public:
    explicit AliasCycleError(const std::string& chain)
        : ShellError("cycle detected: " + chain, 1) {}
    const char* category() const override { return "alias-cycle"; }
};

// Commands that run other command lines (`time`, `watch`) nested past the
// limit, usually through an alias that names itself.
class NestingError : public ShellError {
public:
    explicit NestingError(std::size_t limit)
        : ShellError("command nesting exceeds " + std::to_string(limit) + " levels", 1) {}
    const char* category() const override { return "nesting"; }
};

// Dependency graph given to tsort is not acyclic.
class CycleError : public ShellError {
public:
    explicit CycleError(const std::string& what) : ShellError(what, 1) {}
    const char* category() const override { return "cycle"; }
};

class InterruptedError : public ShellError {
public:
    InterruptedError() : ShellError("interrupted", 130) {}
    const char* category() const override { return "interrupt"; }
};

// Startup cannot continue (root or log unusable). Never raised once the REPL runs.
class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& what) : std::runtime_error(what) {}
};
