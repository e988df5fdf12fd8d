#include "shardrent/upload/ChunkDispatcher.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/log/StructuredLogger.hpp"

#include <algorithm>
#include <ios>
#include <string>
#include <utility>

namespace shardrent::upload {

ChunkDispatcher::ChunkDispatcher(File& file, PieceChannel& requests)
    : file_(file),
      requests_(requests) {}

std::size_t ChunkDispatcher::read_chunk(std::istream& source, ByteBuffer& buffer, std::uint64_t chunk_index) {
    std::fill(buffer.begin(), buffer.end(), std::uint8_t{0});
    try {
        source.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    } catch (const std::ios_base::failure& ex) {
        // Streams with failbit in their exception mask throw at end of input.
        if (source.eof() && !source.bad()) {
            return static_cast<std::size_t>(source.gcount());
        }
        throw IoError("reading chunk " + std::to_string(chunk_index) + " of " + file_.nickname() +
                      " failed: " + ex.what());
    }
    if (source.bad()) {
        throw IoError("reading chunk " + std::to_string(chunk_index) + " of " + file_.nickname() + " failed");
    }
    return static_cast<std::size_t>(source.gcount());
}

std::uint64_t ChunkDispatcher::run(std::istream& source) {
    auto& logger = log::StructuredLogger::instance();
    const auto& coder = file_.erasure_code();
    const auto piece_size = static_cast<std::size_t>(file_.piece_size());

    ByteBuffer chunk(static_cast<std::size_t>(file_.chunk_size()));
    std::uint64_t chunk_index = 0;

    while (true) {
        const auto read = read_chunk(source, chunk, chunk_index);
        if (read == 0) {
            break;
        }

        auto pieces = coder.encode(chunk, piece_size);
        for (std::size_t piece_index = 0; piece_index < pieces.size(); ++piece_index) {
            UploadPiece piece{std::move(pieces[piece_index]), chunk_index, piece_index};
            if (!requests_.send(std::move(piece))) {
                throw UploadFailedError("every host stopped accepting pieces at chunk " +
                                        std::to_string(chunk_index) + " of " + file_.nickname());
            }
        }
        file_.add_chunk_uploaded();
        logger.debug("upload.chunk.dispatched",
                     {{"file", file_.nickname()},
                      {"chunk", std::to_string(chunk_index)},
                      {"bytes", std::to_string(read)}});
        ++chunk_index;

        if (read < chunk.size()) {
            break;
        }
    }

    requests_.close();
    return chunk_index;
}

}  // namespace shardrent::upload
