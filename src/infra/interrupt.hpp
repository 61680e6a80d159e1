#pragma once

#include <atomic>
#include <csignal>
#include <stop_token>
#include <thread>

namespace rcopy::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

/// Polls the signal flag and turns it into a stop request on `target`.
/// request_stop() is never called from the signal handler itself.
class InterruptForwarder {
public:
    explicit InterruptForwarder(std::stop_source target);

    InterruptForwarder(const InterruptForwarder&) = delete;
    InterruptForwarder& operator=(const InterruptForwarder&) = delete;

private:
    std::jthread watcher_;
};

} // namespace rcopy::infra
