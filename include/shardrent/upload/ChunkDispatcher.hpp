#pragma once

#include "shardrent/upload/File.hpp"
#include "shardrent/upload/UploadWorker.hpp"

#include <cstdint>
#include <istream>

namespace shardrent::upload {

// Reads the source in chunk_size() slices, erasure codes each one and hands
// the pieces to whichever worker asks first.
class ChunkDispatcher {
public:
    ChunkDispatcher(File& file, PieceChannel& requests);

    // Returns the number of chunks dispatched and closes the request channel.
    // Throws IoError on a failed read, EncodingError when the coder rejects a
    // chunk and UploadFailedError when every worker has stopped. The channel
    // is left open on failure.
    std::uint64_t run(std::istream& source);

private:
    File& file_;
    PieceChannel& requests_;

    // Fills buffer from source; returns bytes read.
    std::size_t read_chunk(std::istream& source, ByteBuffer& buffer, std::uint64_t chunk_index);
};

}  // namespace shardrent::upload
