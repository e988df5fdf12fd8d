#pragma once

#include "shardrent/upload/FileContract.hpp"
#include "shardrent/upload/UploadPiece.hpp"

namespace shardrent::upload {

// Live upload relationship with one host for one file.
class HostUploader {
public:
    virtual ~HostUploader() = default;

    virtual const HostAddress& address() const noexcept = 0;

    // Sends one piece and records it in the contract. Throws TransportError or
    // ProtocolError; a failed piece is never retried by the caller. Calls are
    // sequential, never concurrent.
    virtual void add_piece(const UploadPiece& piece) = 0;

    // Snapshot of every piece recorded so far.
    virtual FileContract file_contract() const = 0;
};

}  // namespace shardrent::upload
