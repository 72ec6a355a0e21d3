#pragma once

class CommandRegistry;

namespace Builtins {
    // Adds every built-in command to reg.
    void register_all(CommandRegistry& reg);
}
