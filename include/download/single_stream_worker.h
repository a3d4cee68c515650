#pragma once

#include <string>

#include "download/download_worker.h"

namespace segdl {

/// Downloads a whole resource sequentially into the destination, truncating
/// whatever was there. Used when the server offers no usable ranges.
class SingleStreamWorker : public DownloadWorker {
public:
    SingleStreamWorker(std::string url,
                       std::string destination,
                       Transport& transport,
                       DownloadSession& session,
                       RequestOptions options,
                       size_t chunk_size = kDefaultChunkSize);

    void run() override;

protected:
    const char* name() const override { return "SingleStreamWorker"; }

private:
    std::string url_;
    std::string destination_;
};

}  // namespace segdl
