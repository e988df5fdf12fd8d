#pragma once

#include "shardrent/Export.hpp"
#include "shardrent/upload/File.hpp"
#include "shardrent/upload/HostUploader.hpp"

#include <atomic>
#include <cstdint>
#include <istream>
#include <memory>
#include <string_view>
#include <vector>

namespace shardrent::upload {

enum class UploadState {
    Setup,
    Dispatching,
    Draining,
    Committed,
    Aborted
};

std::string_view to_string(UploadState state) noexcept;

struct UploadReport {
    std::uint64_t chunks{0};
    std::uint64_t pieces_uploaded{0};
    std::vector<HostAddress> failed_hosts;
};

// Runs one upload of a file across a fixed set of host sessions: one worker
// thread per host, the chunk dispatcher on the calling thread.
class SHARDRENT_API UploadPipeline {
public:
    explicit UploadPipeline(File& file);

    // Contracts are committed to the file only when the whole source was
    // dispatched. On failure every worker is still drained and joined before
    // the dispatcher's error is rethrown. Throws InsufficientHostsError for an
    // empty host list.
    UploadReport run(std::istream& source, const std::vector<std::unique_ptr<HostUploader>>& hosts);

    UploadState state() const noexcept { return state_.load(std::memory_order_acquire); }

private:
    File& file_;
    std::atomic<UploadState> state_{UploadState::Setup};

    void transition(UploadState next);
};

}  // namespace shardrent::upload
