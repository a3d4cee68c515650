#pragma once

#include <string>

#include "download/download_worker.h"
#include "download/segment_table.h"

namespace segdl {

/// Downloads one byte range into its segment file.
///
/// Resume is size based: an existing segment file no larger than the
/// segment is trusted as a prefix and continued with a ranged request; a
/// larger one is discarded. Content is not verified, so same-size
/// corruption goes unnoticed.
class SegmentWorker : public DownloadWorker {
public:
    SegmentWorker(SegmentSpec spec,
                  std::string url,
                  Transport& transport,
                  DownloadSession& session,
                  RequestOptions options,
                  size_t chunk_size = kDefaultChunkSize);

    void run() override;

    const SegmentSpec& spec() const { return spec_; }

protected:
    const char* name() const override { return "SegmentWorker"; }

private:
    SegmentSpec spec_;
    std::string url_;
};

}  // namespace segdl
