#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <optional>

namespace rcopy::args_parser {

struct CLIArgs
{
    std::string source;                             // первый позиционный аргумент
    std::string destination;                        // второй позиционный аргумент
    std::optional<std::string> offset_file;         // -offset PATH, иначе <dest>.offset
    std::optional<std::size_t> chunk_size;          // --chunk-size=SIZE (K/M/G)
    std::optional<std::size_t> max_chunks_buffer;   // --buffer=N
    bool quiet{false};                              // -q, --quiet
    bool no_progress{false};                        // --no-progress
    bool verbose{false};                            // --verbose
    bool version{false};                            // --version
    bool help{false};                               // -h, --help
};

/// Parses command-line arguments. Options may be written with one dash or two
/// ("-offset" and "--offset" are the same). Returns nullopt on a usage error
/// after printing the reason and the usage text to stderr.
std::optional<CLIArgs> parse_args(int argc, char** argv);

void print_usage(std::FILE* out, const char* argv0);

/// "4096", "64K", "10M", "1G" -> bytes. nullopt for anything else.
std::optional<std::size_t> parse_size(std::string_view text);

} // namespace rcopy::args_parser
