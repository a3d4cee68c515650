#pragma once

#include <map>
#include <optional>
#include <string>

namespace segdl {

/// Subcommand types for the segdl CLI
enum class Subcommand {
    None,
    Download,  // download <url>
    Probe,     // probe <url>
};

/// Options for the download command. Unset optionals fall back to the
/// loaded DownloadConfig.
struct DownloadOptions {
    std::string url;
    std::string output;
    std::optional<int> segments;
    std::optional<int> max_retries;
    std::optional<int> timeout_sec;
    std::map<std::string, std::string> headers;
    std::string proxy;  // host:port
    bool insecure{false};
    bool overwrite{false};
    bool single_stream{false};
    bool quiet{false};
    bool verbose{false};
};

struct ProbeOptions {
    std::string url;
    std::map<std::string, std::string> headers;
    bool verbose{false};
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (help, version, usage error)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Help text, version info or error message
    std::string output;

    Subcommand subcommand{Subcommand::None};
    DownloadOptions download_options;
    ProbeOptions probe_options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

std::string getHelpMessage();
std::string getVersionMessage();
std::string subcommandToString(Subcommand cmd);

/// Split "Name: value" into its parts; std::nullopt without a colon or name.
std::optional<std::pair<std::string, std::string>> parseHeaderArg(const std::string& arg);

}  // namespace segdl
