#pragma once
#include <chrono>

namespace Interrupt {
    // Returns true if an interrupt (e.g., Ctrl+C) was requested
    bool check();
    // Set interrupt flag (signal-safe usage expected from handlers)
    void set();
    // Clear interrupt flag
    void clear();

    // Route SIGINT to the flag. Blocking reads are not restarted, so a
    // pending getline() at the prompt fails and the REPL can see the flag.
    void install();
    // Put back whatever handler was active before install().
    void restore();

    // Sleeps in short slices; returns false as soon as the flag is raised.
    bool sleep_for(std::chrono::milliseconds duration);
}
