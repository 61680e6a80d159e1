#pragma once

#include <exception>
#include <functional>
#include <future>
#include <stop_token>
#include <string>
#include <thread>
#include <utility>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "infra/error_handler/error.hpp"

namespace rcopy::infra {

/// Runs one pipeline stage on its own thread.
///
/// The stage result (or an exception escaping the stage, turned into an Error)
/// is delivered through the completion future. A failed stage requests a stop
/// on `pipeline` so that the neighbouring stages stop waiting on their queues.
class StageWorker {
public:
    using Body = std::function<VoidResult()>;

    StageWorker(std::string name, std::stop_source pipeline, Body body);

    // Как jthread: если wait() не вызывали, сначала останавливаем конвейер, потом join
    ~StageWorker();

    StageWorker(const StageWorker&) = delete;
    StageWorker& operator=(const StageWorker&) = delete;

    // Блокирует до завершения стадии и возвращает её результат. Вызывать один раз.
    [[nodiscard]] auto wait() -> VoidResult;

    [[nodiscard]] auto name() const -> const std::string& { return name_; }

private:
    std::string name_;
    std::stop_source pipeline_;
    std::future<VoidResult> completion_;
    std::jthread thread_;
};

inline StageWorker::StageWorker(std::string name, std::stop_source pipeline, Body body)
    : name_(std::move(name))
    , pipeline_(pipeline)
{
    std::packaged_task<VoidResult()> task(
        [stage = name_, pipeline, body = std::move(body)]() mutable -> VoidResult {
            spdlog::debug("Stage '{}' started", stage);
            VoidResult result;
            try {
                result = body();
            } catch (const std::exception& e) {
                result = std::unexpected(make_error(ErrorCode::Unknown,
                    fmt::format("Stage '{}' failed: {}", stage, e.what())));
            }

            if (!result) {
                spdlog::debug("Stage '{}' failed: {}", stage, result.error().message);
                pipeline.request_stop();
            } else {
                spdlog::debug("Stage '{}' finished", stage);
            }
            return result;
        });

    completion_ = task.get_future();
    thread_ = std::jthread(std::move(task));
}

inline StageWorker::~StageWorker() {
    if (thread_.joinable()) {
        spdlog::debug("Stage '{}' abandoned, stopping pipeline", name_);
        pipeline_.request_stop();
        thread_.join();
    }
}

inline auto StageWorker::wait() -> VoidResult {
    auto result = completion_.get();
    if (thread_.joinable()) {
        thread_.join();
    }
    return result;
}

} // namespace rcopy::infra
