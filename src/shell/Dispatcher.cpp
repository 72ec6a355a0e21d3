#include "Dispatcher.hpp"

#include <filesystem>
#include <set>

#include "CommandContext.hpp"
#include "CommandRegistry.hpp"
#include "ICommand.hpp"
#include "Parser.hpp"
#include "../core/AliasTable.hpp"
#include "../core/Errors.hpp"
#include "../core/Interrupt.hpp"
#include "../core/Logger.hpp"

namespace {
    struct DepthGuard {
        int& depth;
        explicit DepthGuard(int& d) : depth(d) { ++depth; }
        ~DepthGuard() { --depth; }
    };
}

Dispatcher::Dispatcher(const CommandRegistry& registry,
                       IVfs& vfs,
                       VirtualPath& cwd,
                       Environment& env,
                       AliasTable& aliases,
                       History& history,
                       Logger& logger,
                       std::ostream& out)
    : registry_(registry), vfs_(vfs), cwd_(cwd), env_(env), aliases_(aliases),
      history_(history), logger_(logger), out_(out),
      started_(std::chrono::steady_clock::now()) {}

std::vector<std::string> Dispatcher::expand(std::vector<std::string> tokens) const {
    if (tokens.empty()) return tokens;
    std::vector<std::string> chain{tokens[0]};
    std::set<std::string> seen;
    while (!tokens.empty()) {
        const std::string* expansion = aliases_.find(tokens[0]);
        if (!expansion) break;
        if (seen.count(tokens[0])) {
            if (registry_.contains(tokens[0])) break;
            std::string path;
            for (const auto& n : chain) path += (path.empty() ? "" : " -> ") + n;
            throw AliasCycleError(path);
        }
        if (seen.size() >= kMaxAliasDepth) {
            throw AliasCycleError(chain.front() + " (more than " + std::to_string(kMaxAliasDepth) + " expansions)");
        }
        seen.insert(tokens[0]);
        auto head = Parser::split(*expansion);
        head.insert(head.end(), tokens.begin() + 1, tokens.end());
        tokens = std::move(head);
        if (!tokens.empty()) chain.push_back(tokens[0]);
    }
    return tokens;
}

int Dispatcher::execute(const std::string& line) {
    auto tokens = Parser::split(line);
    if (tokens.empty()) return 0;
    DepthGuard guard(depth_);
    std::string name = tokens[0];
    try {
        if (static_cast<std::size_t>(depth_) > kMaxAliasDepth) throw NestingError(kMaxAliasDepth);
        tokens = expand(std::move(tokens));
        if (tokens.empty()) return 0;
        name = tokens[0];
        ICommand* cmd = registry_.find(name);
        if (!cmd) {
            out_ << name << ": command not found" << std::endl;
            GTOS_LOG_WARN(logger_, "command not found: " + line);
            return 127;
        }
        name = cmd->name();
        if (!cmd->arity().accepts(tokens.size() - 1)) throw UsageError(cmd->usage());
        CommandContext ctx(tokens, out_, vfs_, cwd_, env_, aliases_, history_, *this);
        return cmd->execute(ctx);
    } catch (const InterruptedError& e) {
        if (depth_ > 1) throw;
        Interrupt::clear();
        out_ << std::endl << e.what() << std::endl;
        GTOS_LOG_INFO(logger_, "interrupted: " + line);
        return e.status();
    } catch (const NestingError& e) {
        if (depth_ > 1) throw;
        out_ << name << ": " << e.what() << std::endl;
        GTOS_LOG_ERROR(logger_, std::string("[") + e.category() + "] " + line + ": " + e.what());
        return e.status();
    } catch (const UsageError& e) {
        out_ << "usage: " << e.what() << std::endl;
        GTOS_LOG_WARN(logger_, std::string("[usage] ") + line);
        return e.status();
    } catch (const ShellError& e) {
        out_ << name << ": " << e.what() << std::endl;
        GTOS_LOG_ERROR(logger_, std::string("[") + e.category() + "] " + line + ": " + e.what());
        return e.status();
    } catch (const std::filesystem::filesystem_error& e) {
        out_ << name << ": " << e.code().message() << std::endl;
        GTOS_LOG_ERROR(logger_, "[io] " + line + ": " + e.what());
        return 1;
    } catch (const std::exception& e) {
        out_ << name << ": " << e.what() << std::endl;
        GTOS_LOG_ERROR(logger_, "[internal] " + line + ": " + e.what());
        return 1;
    }
}
