#include "monitoring.hpp"
#include <fmt/core.h>
#include <cstdio>
#include <utility>
#include <cmath>
#include <string>
#include <thread>

namespace rcopy::infra {

namespace {

constexpr char kSpinner[] = {'/', '-', '\\', '|'};
constexpr auto kRedrawPeriod = std::chrono::milliseconds(100);

auto scale_rate(double bytes_per_sec) -> std::pair<double, const char*> {
    constexpr double KiB = 1024.0;
    if (bytes_per_sec > KiB * KiB * KiB) return {bytes_per_sec / (KiB * KiB * KiB), "GB/s"};
    if (bytes_per_sec > KiB * KiB) return {bytes_per_sec / (KiB * KiB), "MB/s"};
    if (bytes_per_sec > KiB) return {bytes_per_sec / KiB, "KB/s"};
    return {bytes_per_sec, "B/s"};
}

// "mm:ss" или "hh:mm:ss"; "inf", пока скорость неизвестна
auto format_eta(double seconds) -> std::string {
    if (!std::isfinite(seconds) || seconds <= 0) return "inf";
    const auto total = static_cast<long long>(seconds);
    const auto h = total / 3600;
    const auto m = (total % 3600) / 60;
    const auto s = total % 60;
    return h > 0 ? fmt::format("{:02d}:{:02d}:{:02d}", h, m, s)
                 : fmt::format("{:02d}:{:02d}", m, s);
}

} // namespace

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    if (render_thread_) {
        stop_rendering_thread_();
    }
}

void ProgressMonitor::set_total(std::uint64_t total_bytes, std::uint64_t start_offset) {
    total_bytes_.store(total_bytes, std::memory_order_relaxed);
    start_offset_.store(start_offset, std::memory_order_relaxed);
    committed_bytes_.store(start_offset, std::memory_order_relaxed);
}

void ProgressMonitor::pulse() {
    pulses_.fetch_add(1, std::memory_order_relaxed);
}

void ProgressMonitor::update(std::uint64_t committed_bytes) {
    committed_bytes_.store(committed_bytes, std::memory_order_relaxed);
    pulse();
}

auto ProgressMonitor::percent() const -> int {
    const auto total = total_bytes_.load(std::memory_order_relaxed);
    if (total == 0) return 100;
    const auto committed = committed_bytes_.load(std::memory_order_relaxed);
    return static_cast<int>((committed * 100) / total);
}

auto ProgressMonitor::spinner() const -> char {
    return kSpinner[pulses_.load(std::memory_order_relaxed) % 4];
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_bytes = total_bytes_.load(),
        .start_offset = start_offset_.load(),
        .committed_bytes = committed_bytes_.load(),
        .pulses = pulses_.load(),
        .start_time = start_time_
    };
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        bool drawn = false;
        while (!st.stop_requested()) {
            drawn = render_() || drawn;
            std::this_thread::sleep_for(kRedrawPeriod);
        }
        if (render_() || drawn) {
            std::fputs("\n", stdout);
            std::fflush(stdout);
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    render_thread_->request_stop();
    render_thread_.reset(); // join
}

bool ProgressMonitor::render_() const {
    if (quiet_ || !enabled_) return false;

    const auto stats = get_stats();
    if (stats.total_bytes == 0) return false;

    // Скорость только по байтам этого запуска, без уже скопированного префикса
    const double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - stats.start_time).count();
    const double rate = elapsed > 0
        ? static_cast<double>(stats.committed_bytes - stats.start_offset) / elapsed
        : 0.0;
    const double eta = rate > 0
        ? static_cast<double>(stats.total_bytes - stats.committed_bytes) / rate
        : 0.0;

    const auto [speed, unit] = scale_rate(rate);
    fmt::print("\r\033[K{}   {}% | {:.1f} {} | ETA: {}",
               kSpinner[stats.pulses % 4], percent(), speed, unit, format_eta(eta));
    std::fflush(stdout);
    return true;
}

} // namespace rcopy::infra
