#include "args_parser.hpp"

#include <charconv>
#include <limits>
#include <system_error>
#include <fmt/core.h>

#include <getopt.h>

namespace rcopy::args_parser {

namespace {

enum Option : int {
    OptOffset = 1000,
    OptChunkSize,
    OptBuffer,
    OptNoProgress,
    OptVerbose,
    OptVersion,
};

bool is_blank(std::string_view s) {
    return s.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

} // namespace

void print_usage(std::FILE* out, const char* argv0) {
    fmt::print(out,
        "Usage: {} [OPTIONS] <source> <dest>\n"
        "\n"
        "Arguments after <dest> are ignored with a warning.\n"
        "\n"
        "Resumable chunked copy of a single file. Progress is kept in an offset\n"
        "file so an interrupted copy continues from the last committed chunk.\n"
        "\n"
        "Options:\n"
        "  -offset PATH         Offset (checkpoint) file, default: <dest>.offset\n"
        "  --chunk-size SIZE    Chunk size, 1K to 1G (default: 10M). Suffixes: K, M, G\n"
        "  --buffer N           Chunks buffered between stages (default: 10)\n"
        "  -q, --quiet          Suppress progress and informational output\n"
        "  --no-progress        Disable the progress line\n"
        "  --verbose            Debug logging\n"
        "  --version            Show build information\n"
        "  -h, --help           Show this help\n",
        argv0);
}

std::optional<std::size_t> parse_size(std::string_view text) {
    if (text.empty()) return std::nullopt;

    std::size_t multiplier = 1;
    switch (text.back()) {
        case 'k': case 'K': multiplier = 1024; break;
        case 'm': case 'M': multiplier = 1024 * 1024; break;
        case 'g': case 'G': multiplier = 1024 * 1024 * 1024; break;
        default: break;
    }
    if (multiplier != 1) {
        text.remove_suffix(1);
    }

    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    if (value > std::numeric_limits<std::size_t>::max() / multiplier) {
        return std::nullopt;
    }
    return value * multiplier;
}

std::optional<CLIArgs> parse_args(int argc, char** argv) {
    static const struct option long_opts[] = {
        {"offset",      required_argument, nullptr, OptOffset},
        {"chunk-size",  required_argument, nullptr, OptChunkSize},
        {"buffer",      required_argument, nullptr, OptBuffer},
        {"quiet",       no_argument,       nullptr, 'q'},
        {"no-progress", no_argument,       nullptr, OptNoProgress},
        {"verbose",     no_argument,       nullptr, OptVerbose},
        {"version",     no_argument,       nullptr, OptVersion},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    const char* argv0 = argc > 0 ? argv[0] : "rcopy";
    CLIArgs args;

    // optind = 0 заставляет getopt заново инициализироваться (повторные вызовы в тестах)
    optind = 0;
    opterr = 0;

    int opt;
    while ((opt = getopt_long_only(argc, argv, "hq", long_opts, nullptr)) != -1) {
        switch (opt) {
        case OptOffset:
            args.offset_file = optarg;
            break;
        case OptChunkSize: {
            auto size = parse_size(optarg);
            if (!size) {
                fmt::print(stderr, "{}: invalid chunk size: {}\n", argv0, optarg);
                return std::nullopt;
            }
            args.chunk_size = *size;
            break;
        }
        case OptBuffer: {
            std::size_t value = 0;
            std::string_view text = optarg;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
                fmt::print(stderr, "{}: buffer must be a positive number of chunks: {}\n", argv0, optarg);
                return std::nullopt;
            }
            args.max_chunks_buffer = value;
            break;
        }
        case 'q':
            args.quiet = true;
            break;
        case OptNoProgress:
            args.no_progress = true;
            break;
        case OptVerbose:
            args.verbose = true;
            break;
        case OptVersion:
            args.version = true;
            return args;
        case 'h':
            args.help = true;
            return args;
        default:
            fmt::print(stderr, "{}: unrecognized or incomplete option: {}\n",
                       argv0, optind > 0 && optind <= argc ? argv[optind - 1] : "?");
            print_usage(stderr, argv0);
            return std::nullopt;
        }
    }

    const int remaining = argc - optind;
    if (remaining < 2 || is_blank(argv[optind]) || is_blank(argv[optind + 1])) {
        fmt::print(stderr, "{}: expected <source> and <dest>\n", argv0);
        print_usage(stderr, argv0);
        return std::nullopt;
    }

    for (int i = optind + 2; i < argc; ++i) {
        fmt::print(stderr, "{}: ignoring extra argument: {}\n", argv0, argv[i]);
    }

    args.source = argv[optind];
    args.destination = argv[optind + 1];
    if (args.offset_file && is_blank(*args.offset_file)) {
        args.offset_file.reset();
    }
    return args;
}

} // namespace rcopy::args_parser
