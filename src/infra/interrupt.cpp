#include "interrupt.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

namespace rcopy::infra {

std::atomic<bool> g_interrupted{false};

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

InterruptForwarder::InterruptForwarder(std::stop_source target)
    : watcher_([target](std::stop_token st) mutable {
        while (!st.stop_requested()) {
            if (is_interrupted()) {
                spdlog::warn("stopping");
                target.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    })
{}

} // namespace rcopy::infra
