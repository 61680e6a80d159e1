#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace rcopy::infra {

/// Progress of a single resumable copy.
///
/// pulse() is called from both the reader and the writer stage, update() only
/// from the writer. When enabled, a background thread redraws a one-line
/// spinner with percent, speed and ETA.
class ProgressMonitor {
public:
    struct Stats {
        std::uint64_t total_bytes = 0;
        std::uint64_t start_offset = 0;     // уже было скопировано до запуска
        std::uint64_t committed_bytes = 0;
        std::uint64_t pulses = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_total(std::uint64_t total_bytes, std::uint64_t start_offset = 0);
    void pulse();
    void update(std::uint64_t committed_bytes);

    // floor(100 * committed / total); 100, если копировать нечего
    [[nodiscard]] auto percent() const -> int;
    [[nodiscard]] auto spinner() const -> char;

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    bool render_() const;  // false, если рисовать нечего
    void start_rendering_thread_();
    void stop_rendering_thread_();

    std::atomic<std::uint64_t> pulses_{0};
    std::atomic<std::uint64_t> committed_bytes_{0};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<std::uint64_t> start_offset_{0};

    const bool enabled_;
    const bool quiet_;
    std::chrono::steady_clock::time_point start_time_;
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace rcopy::infra
