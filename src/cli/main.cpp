// =============================================================================
// skopje CLI
// =============================================================================
//
// Usage:
//   skopje [--config <file>] [-v|-q] <command> [options]
//
// Commands:
//   download    Download a file with parallel range requests
//   probe       Print the Content-Length of a URL
//   version     Show version information
//   help        Show this help message
//
// Examples:
//   skopje download https://example.org/dump.zip data/dump.zip --parallel 8
//   skopje probe https://example.org/dump.zip
//
// =============================================================================

#include <cstring>
#include <iostream>
#include <limits>
#include <string>

#include "skopje/config.hpp"
#include "skopje/download/downloader.hpp"
#include "skopje/error.hpp"
#include "skopje/http/http_client.hpp"
#include "skopje/logging.hpp"
#include "skopje/util.hpp"

namespace skopje::cli {
    int cmd_download(int argc, char* argv[]);
    int cmd_probe(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

#define SKOPJE_VERSION_STRING "1.0.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"download", "Download a file with parallel range requests", skopje::cli::cmd_download},
    {"probe",    "Print the Content-Length of a URL", skopje::cli::cmd_probe},
    {"version",  "Show version information", skopje::cli::cmd_version},
    {"help",     "Show this help message", skopje::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;
static skopje::Config g_config;

// Consume global options up to the command name; argc/argv then start at the command.
static void parse_global_options(int& argc, char**& argv) {
    ++argv;
    --argc;
    while (argc > 0) {
        std::string arg = argv[0];
        if (arg == "--config" && argc > 1) {
            g_options.config_file = argv[1];
            argv += 2;
            argc -= 2;
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
            ++argv;
            --argc;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
            ++argv;
            --argc;
        } else {
            break;
        }
    }
}

static uint64_t parse_option(const std::string& text, const char* option,
                             uint64_t max = std::numeric_limits<uint64_t>::max()) {
    try {
        return skopje::parse_unsigned(text, max);
    } catch (const skopje::InvalidArgumentError& e) {
        throw skopje::InvalidArgumentError(std::string("invalid value for ") + option + ": " + text,
                                           "skopje download", e.message());
    }
}

namespace skopje::cli {

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "skopje - extract/load toolkit\n";
    std::cout << "Version " << SKOPJE_VERSION_STRING << "\n\n";
    std::cout << "Usage: skopje [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 12; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  --config <file>         YAML configuration file\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only log warnings and errors\n";
    std::cout << "\nDownload Options:\n";
    std::cout << "  --chunk-size <bytes>    Bytes per range request (default: 100 MiB)\n";
    std::cout << "  --parallel <n>          Concurrent range requests (default: 4)\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  SKOPJE_DB_HOST, SKOPJE_DB_PORT, SKOPJE_DB_NAME, SKOPJE_DB_USER, SKOPJE_DB_PASS\n";
    std::cout << "  SKOPJE_LOG_LEVEL        trace|debug|info|warning|error|critical\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "skopje " << SKOPJE_VERSION_STRING << "\n";
    return 0;
}

// =============================================================================
// Download Command
// =============================================================================

int cmd_download(int argc, char* argv[]) {
    std::string url;
    std::string destination;
    DownloadConfig download = g_config.download;

    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--chunk-size" && i + 1 < argc) {
            download.chunk_size = parse_option(argv[++i], "--chunk-size");
        } else if (arg == "--parallel" && i + 1 < argc) {
            download.max_parallel_chunks = static_cast<uint32_t>(
                parse_option(argv[++i], "--parallel", std::numeric_limits<uint32_t>::max()));
        } else if (url.empty()) {
            url = arg;
        } else if (destination.empty()) {
            destination = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            return 1;
        }
    }

    if (url.empty() || destination.empty()) {
        std::cerr << "Usage: skopje download <url> <destination> [--chunk-size bytes] [--parallel n]\n";
        return 1;
    }

    http::HttpClient client(download);
    download::Downloader downloader(client, download);
    auto report = downloader.download_file(url, destination);

    if (!g_options.quiet) {
        std::cout << destination << ": " << format_bytes(report.bytes_written) << " in "
                  << report.chunk_count << " chunks, " << report.elapsed.count() << " ms\n";
    }
    return 0;
}

// =============================================================================
// Probe Command
// =============================================================================

int cmd_probe(int argc, char* argv[]) {
    if (argc < 1) {
        std::cerr << "Usage: skopje probe <url>\n";
        return 1;
    }

    http::HttpClient client(g_config.download);
    auto length = client.content_length(argv[0]);
    if (length) {
        std::cout << *length << " (" << format_bytes(*length) << ")\n";
    } else {
        std::cout << "unknown\n";
    }
    return 0;
}

} // namespace skopje::cli

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        skopje::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    try {
        g_config = skopje::load_config(g_options.config_file);
        skopje::init_logging(g_config.logging);
        if (g_options.verbose) {
            skopje::Logger::getInstance().set_level(skopje::LogLevel::DEBUG);
        } else if (g_options.quiet) {
            skopje::Logger::getInstance().set_level(skopje::LogLevel::WARNING);
        }

        for (const Command* cmd = g_commands; cmd->name; ++cmd) {
            if (strcmp(cmd->name, cmd_name) == 0) {
                return cmd->handler(argc, argv);
            }
        }
    } catch (const skopje::SkopjeException& e) {
        LOG_ERROR(e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Unexpected error: ") + e.what());
        return 1;
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'skopje help' for usage.\n";
    return 1;
}
