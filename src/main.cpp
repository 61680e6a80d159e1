#include <chrono>
#include <cstdio>
#include <filesystem>
#include <string>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/copier/copier.hpp"
#include "core/copy_job.hpp"
#include <git_info.hpp>

using GIT = rcopy::build_info::GitInfo;

constexpr auto load_from_cli = rcopy::infra::config_from_cli;
constexpr auto git = rcopy::build_info::get_git_info();

namespace {

constexpr int kExitUsage = 2;

void out_git_verse(const GIT& git) {
    fmt::print("rcopy {}\n", rcopy::build_info::version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

std::string format_elapsed(std::chrono::steady_clock::duration elapsed) {
    const auto total = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    return fmt::format("{} hours, {} minutes, {} seconds",
                       total / 3600, (total % 3600) / 60, total % 60);
}

} // namespace

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        auto args_opt = rcopy::args_parser::parse_args(argc, argv);
        if (!args_opt) {
            return kExitUsage;
        }
        const auto& args = *args_opt;

        if (args.help) {
            rcopy::args_parser::print_usage(stdout, argv[0]);
            return 0;
        }
        if (args.version) {
            out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = rcopy::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args));

        if (config.log_level) {
            spdlog::set_level(spdlog::level::from_str(*config.log_level));
        } else if (config.quiet) {
            spdlog::set_level(spdlog::level::warn);
        }

        rcopy::core::CopyJob job{
            .source = args.source,
            .destination = args.destination,
            .checkpoint = args.offset_file
                ? std::filesystem::path(*args.offset_file)
                : rcopy::core::default_checkpoint_path(args.destination),
            .chunk_size = config.chunk_size.value_or(rcopy::core::kDefaultChunkSize),
            .max_chunks_buffer = config.max_chunks_buffer.value_or(rcopy::core::kDefaultMaxChunksBuffer),
        };

        rcopy::infra::install_signal_handler();
        std::stop_source stop;
        rcopy::infra::InterruptForwarder forwarder{stop};

        if (!config.quiet) {
            fmt::print("copying from \"{}\" to \"{}\"\n", job.source.string(), job.destination.string());
        }
        spdlog::debug("Chunk size {}, buffer {} chunks, offset file {}",
                      job.chunk_size, job.max_chunks_buffer, job.checkpoint.string());

        const auto start_time = std::chrono::steady_clock::now();

        auto result = [&]() -> rcopy::infra::Result<rcopy::core::CopyOutcome> {
            // Монитор живёт только на время копирования: деструктор дорисовывает строку
            rcopy::infra::ProgressMonitor monitor(config.progress, config.quiet);
            auto copier = rcopy::core::Copier::create(job, monitor);
            if (!copier) {
                return std::unexpected(std::move(copier.error()));
            }
            return copier->start(stop.get_token());
        }();

        const auto elapsed = format_elapsed(std::chrono::steady_clock::now() - start_time);

        if (!result) {
            auto& err = result.error();
            const int exit_code = err.to_exit_code();
            if (err.is_cancellation()) {
                spdlog::warn("{}", err.message);
            } else if (err.is_operator_error()) {
                spdlog::error("{}", err.message);
            } else {
                (void)rcopy::infra::log_and_return(std::move(err));
            }
            fmt::print("stopped after {}\n", elapsed);
            return exit_code;
        }

        if (*result == rcopy::core::CopyOutcome::AlreadyComplete) {
            spdlog::info("Destination is already complete according to {}", job.checkpoint.string());
        }
        if (!config.quiet) {
            fmt::print("copy finished successfully in {}\n", elapsed);
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
