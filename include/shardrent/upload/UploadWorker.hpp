#pragma once

#include "shardrent/upload/Channel.hpp"
#include "shardrent/upload/File.hpp"
#include "shardrent/upload/HostUploader.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace shardrent::upload {

// Outcome of one worker, sent exactly once when it stops.
struct WorkerReport {
    HostAddress address;
    std::optional<FileContract> contract;
    std::size_t pieces_uploaded{0};
    std::optional<std::string> failure;
};

using PieceChannel = Channel<UploadPiece>;
using ReportChannel = Channel<WorkerReport>;

// Pulls pieces for a single host until the request channel is exhausted or
// the host fails once. Must be registered as a receiver on requests before
// run() starts.
class UploadWorker {
public:
    UploadWorker(HostUploader& host,
                 PieceChannel& requests,
                 ReportChannel& results,
                 File& file);

    void run();

private:
    HostUploader& host_;
    PieceChannel& requests_;
    ReportChannel& results_;
    File& file_;
};

}  // namespace shardrent::upload
