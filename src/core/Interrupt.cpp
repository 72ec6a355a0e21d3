#include "Interrupt.hpp"

#include <atomic>
#include <csignal>
#include <thread>
#include <signal.h>

namespace {
    std::atomic<bool> g_interrupted{false};
    struct sigaction g_previous;
    bool g_installed = false;

    void on_sigint(int) { g_interrupted.store(true, std::memory_order_relaxed); }
}

namespace Interrupt {
    bool check() { return g_interrupted.load(std::memory_order_relaxed); }
    void set() { g_interrupted.store(true, std::memory_order_relaxed); }
    void clear() { g_interrupted.store(false, std::memory_order_relaxed); }

    void install() {
        if (g_installed) return;
        struct sigaction sa{};
        sa.sa_handler = on_sigint;
        sigemptyset(&sa.sa_mask);
        sa.sa_flags = 0; // no SA_RESTART
        if (sigaction(SIGINT, &sa, &g_previous) == 0) g_installed = true;
    }

    void restore() {
        if (!g_installed) return;
        sigaction(SIGINT, &g_previous, nullptr);
        g_installed = false;
    }

    bool sleep_for(std::chrono::milliseconds duration) {
        using clock = std::chrono::steady_clock;
        const auto slice = std::chrono::milliseconds(20);
        auto deadline = clock::now() + duration;
        while (!check()) {
            auto now = clock::now();
            if (now >= deadline) return true;
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(left < slice ? left : slice);
        }
        return false;
    }
}
