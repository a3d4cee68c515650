#include "download/single_stream_worker.h"

namespace segdl {

SingleStreamWorker::SingleStreamWorker(std::string url,
                                       std::string destination,
                                       Transport& transport,
                                       DownloadSession& session,
                                       RequestOptions options,
                                       size_t chunk_size)
    : DownloadWorker(0, transport, session, std::move(options), chunk_size),
      url_(std::move(url)),
      destination_(std::move(destination)) {}

void SingleStreamWorker::run() {
    const auto status = stream(url_, destination_, std::ios::trunc, {});
    state_.completed.store(status == StreamStatus::Finished);
}

}  // namespace segdl
