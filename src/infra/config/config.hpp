#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <expected>
#include <filesystem>

namespace rcopy::args_parser {
    struct CLIArgs;
}

namespace rcopy::infra {

struct Config {
    // I/O
    std::optional<std::size_t> chunk_size;          // bytes
    std::optional<std::size_t> max_chunks_buffer;   // chunks in flight per queue

    // Вывод
    bool progress = true;
    bool quiet = false;
    std::optional<std::string> log_level;           // trace|debug|info|warn|error|off

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.rcopy.yaml
///   2. $XDG_CONFIG_HOME/rcopy/config.yaml или ~/.config/rcopy/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Loads one specific YAML file. A missing file is an error here.
[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// true for the level names spdlog understands ("warn", "warning", "err", ...).
[[nodiscard]] auto is_known_log_level(std::string_view name) -> bool;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const rcopy::args_parser::CLIArgs& args) -> Config;

} // namespace rcopy::infra
