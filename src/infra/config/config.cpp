#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "cli/args_parser/args_parser.hpp"

namespace rcopy::infra {
    void Config::merge_with(const Config& other) {
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.max_chunks_buffer) max_chunks_buffer = other.max_chunks_buffer;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (other.log_level) log_level = other.log_level;
    }

    // spdlog::level::from_str отдаёт off для любого незнакомого имени
    auto is_known_log_level(std::string_view name) -> bool {
        return name == "off" || spdlog::level::from_str(std::string(name)) != spdlog::level::off;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".rcopy.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "rcopy" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "rcopy" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from_file(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["chunk_size"]) cfg.chunk_size = config["chunk_size"].as<std::size_t>();
            if (config["max_chunks_buffer"]) {
                cfg.max_chunks_buffer = config["max_chunks_buffer"].as<std::size_t>();
            }

            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) {
                auto level = config["log_level"].as<std::string>();
                if (!is_known_log_level(level)) {
                    return std::unexpected(fmt::format(
                        "Failed to parse {}: unknown log_level '{}' "
                        "(expected trace, debug, info, warn, error, critical or off)",
                        path.string(), level));
                }
                cfg.log_level = std::move(level);
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from_file(path);
        }

        // Файл не найден: пустой конфиг, это не ошибка
        return Config{};
    }

    auto config_from_cli(const rcopy::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.chunk_size = args.chunk_size;
        cfg.max_chunks_buffer = args.max_chunks_buffer;
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

} // namespace rcopy::infra
