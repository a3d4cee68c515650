#pragma once

#include "utils/cli.h"

namespace segdl {
namespace cli {
namespace commands {

/// Execute the 'download' command
/// @return Exit code (0=completed, 1=failed, 130=cancelled)
int download(const DownloadOptions& options);

/// Execute the 'probe' command
/// @return Exit code (0=success, 1=error)
int probe(const ProbeOptions& options);

}  // namespace commands
}  // namespace cli
}  // namespace segdl
