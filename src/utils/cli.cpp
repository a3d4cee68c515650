#include "utils/cli.h"
#include "utils/version.h"
#include <cstring>
#include <sstream>

namespace segdl {

std::string getDownloadHelpMessage();
std::string getProbeHelpMessage();

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "segdl " << SEGDL_VERSION << " - segmented, resumable downloader\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    segdl <COMMAND>\n";
    oss << "\n";
    oss << "COMMANDS:\n";
    oss << "    download   Download a URL in parallel segments\n";
    oss << "    probe      Show size, range support and ETag of a URL\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -h, --help       Print help information\n";
    oss << "    -V, --version    Print version information\n";
    oss << "\n";
    oss << "Run 'segdl <COMMAND> --help' for more info.\n";
    return oss.str();
}

std::string getDownloadHelpMessage() {
    std::ostringstream oss;
    oss << "segdl download - Download a URL\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    segdl download <URL> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -o, --output <PATH>     Destination file or directory (default: derived name)\n";
    oss << "    -s, --segments <N>      Parallel segments (default: 10, or SEGDL_SEGMENTS)\n";
    oss << "    -H, --header <K: V>     Extra request header (repeatable)\n";
    oss << "    --timeout <SEC>         Per-request timeout in seconds (default: 20)\n";
    oss << "    --retries <N>           Retry failed attempts N times (default: 0)\n";
    oss << "    --proxy <HOST:PORT>     HTTP proxy\n";
    oss << "    --insecure              Skip TLS certificate verification\n";
    oss << "    --single                Never split the download\n";
    oss << "    --overwrite             Download even if the file already exists\n";
    oss << "    -q, --quiet             No progress output\n";
    oss << "    -v, --verbose           Print info logs to stderr\n";
    oss << "    -h, --help              Print help\n";
    oss << "\n";
    oss << "An interrupted download resumes when run again with the same destination.\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    SEGDL_CONFIG              Config file path (default: ~/.segdl/config.json)\n";
    oss << "    SEGDL_SEGMENTS            Default segment count\n";
    oss << "    SEGDL_CHUNK               Write chunk size in bytes\n";
    oss << "    SEGDL_TIMEOUT_MS          Per-request timeout\n";
    oss << "    SEGDL_MAX_RETRIES         Attempt retries\n";
    oss << "    SEGDL_BACKOFF_MS          Delay between attempts\n";
    oss << "    SEGDL_LOG_LEVEL           Log level (trace|debug|info|warn|error)\n";
    oss << "    SEGDL_LOG_DIR             Log directory (default: ~/.segdl/logs)\n";
    oss << "    SEGDL_LOG_RETENTION_DAYS  Log retention days (default: 7)\n";
    return oss.str();
}

std::string getProbeHelpMessage() {
    std::ostringstream oss;
    oss << "segdl probe - Inspect a URL without downloading it\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    segdl probe <URL> [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -H, --header <K: V>     Extra request header (repeatable)\n";
    oss << "    -v, --verbose           Print info logs to stderr\n";
    oss << "    -h, --help              Print help\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "segdl " << SEGDL_VERSION << "\n";
    return oss.str();
}

std::string subcommandToString(Subcommand cmd) {
    switch (cmd) {
        case Subcommand::None:
            return "none";
        case Subcommand::Download:
            return "download";
        case Subcommand::Probe:
            return "probe";
    }
    return "unknown";
}

std::optional<std::pair<std::string, std::string>> parseHeaderArg(const std::string& arg) {
    const auto colon = arg.find(':');
    if (colon == std::string::npos || colon == 0) return std::nullopt;
    std::string name = arg.substr(0, colon);
    std::string value = arg.substr(colon + 1);
    while (!name.empty() && name.back() == ' ') name.pop_back();
    while (!value.empty() && value.front() == ' ') value.erase(value.begin());
    if (name.empty()) return std::nullopt;
    return std::make_pair(name, value);
}

namespace {

bool hasHelpFlag(int argc, char* argv[], int start) {
    for (int i = start; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            return true;
        }
    }
    return false;
}

std::optional<int> parsePositive(const char* text, int min) {
    try {
        size_t consumed = 0;
        const int v = std::stoi(text, &consumed);
        if (text[consumed] != '\0' || v < min) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

CliResult usageError(CliResult result, const std::string& message, const std::string& usage) {
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: " + message + "\n\nUsage: " + usage + "\n";
    return result;
}

}  // namespace

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    if (argc < 2) {
        result.should_exit = true;
        result.exit_code = 1;
        result.output = getHelpMessage();
        return result;
    }

    const char* command = argv[1];

    if (std::strcmp(command, "-h") == 0 || std::strcmp(command, "--help") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getHelpMessage();
        return result;
    }

    if (std::strcmp(command, "-V") == 0 || std::strcmp(command, "--version") == 0) {
        result.should_exit = true;
        result.exit_code = 0;
        result.output = getVersionMessage();
        return result;
    }

    if (std::strcmp(command, "download") == 0) {
        result.subcommand = Subcommand::Download;
        const std::string usage = "segdl download <URL> [OPTIONS]";

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getDownloadHelpMessage();
            return result;
        }

        auto& opts = result.download_options;
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            const bool has_value = i + 1 < argc;
            if ((arg == "-o" || arg == "--output") && has_value) {
                opts.output = argv[++i];
            } else if ((arg == "-s" || arg == "--segments") && has_value) {
                auto v = parsePositive(argv[++i], 1);
                if (!v) return usageError(result, "--segments expects a positive integer", usage);
                opts.segments = *v;
            } else if ((arg == "-H" || arg == "--header") && has_value) {
                auto header = parseHeaderArg(argv[++i]);
                if (!header) return usageError(result, "--header expects 'Name: value'", usage);
                opts.headers[header->first] = header->second;
            } else if (arg == "--timeout" && has_value) {
                auto v = parsePositive(argv[++i], 1);
                if (!v) return usageError(result, "--timeout expects seconds", usage);
                opts.timeout_sec = *v;
            } else if (arg == "--retries" && has_value) {
                auto v = parsePositive(argv[++i], 0);
                if (!v) return usageError(result, "--retries expects a non-negative integer", usage);
                opts.max_retries = *v;
            } else if (arg == "--proxy" && has_value) {
                opts.proxy = argv[++i];
                if (opts.proxy.find(':') == std::string::npos) {
                    return usageError(result, "--proxy expects HOST:PORT", usage);
                }
            } else if (arg == "--insecure") {
                opts.insecure = true;
            } else if (arg == "--overwrite") {
                opts.overwrite = true;
            } else if (arg == "--single") {
                opts.single_stream = true;
            } else if (arg == "-q" || arg == "--quiet") {
                opts.quiet = true;
            } else if (arg == "-v" || arg == "--verbose") {
                opts.verbose = true;
            } else if (!arg.empty() && arg[0] != '-' && opts.url.empty()) {
                opts.url = arg;
            } else {
                return usageError(result, "unexpected argument '" + arg + "'", usage);
            }
        }

        if (opts.url.empty()) {
            return usageError(result, "URL required", usage);
        }
        return result;
    }

    if (std::strcmp(command, "probe") == 0) {
        result.subcommand = Subcommand::Probe;
        const std::string usage = "segdl probe <URL>";

        if (hasHelpFlag(argc, argv, 2)) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getProbeHelpMessage();
            return result;
        }

        auto& opts = result.probe_options;
        for (int i = 2; i < argc; ++i) {
            const std::string arg = argv[i];
            if ((arg == "-H" || arg == "--header") && i + 1 < argc) {
                auto header = parseHeaderArg(argv[++i]);
                if (!header) return usageError(result, "--header expects 'Name: value'", usage);
                opts.headers[header->first] = header->second;
            } else if (arg == "-v" || arg == "--verbose") {
                opts.verbose = true;
            } else if (!arg.empty() && arg[0] != '-' && opts.url.empty()) {
                opts.url = arg;
            } else {
                return usageError(result, "unexpected argument '" + arg + "'", usage);
            }
        }

        if (opts.url.empty()) {
            return usageError(result, "URL required", usage);
        }
        return result;
    }

    result.should_exit = true;
    result.exit_code = 1;
    result.output = "Error: unknown command '" + std::string(command) + "'\n\n" + getHelpMessage();
    return result;
}

}  // namespace segdl
