#include "shardrent/Errors.hpp"
#include "shardrent/erasure/ReedSolomon.hpp"
#include "shardrent/log/StructuredLogger.hpp"
#include "shardrent/upload/ChunkDispatcher.hpp"
#include "shardrent/upload/File.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cassert>
#include <istream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

using shardrent::ByteBuffer;
using shardrent::upload::ChunkDispatcher;
using shardrent::upload::File;
using shardrent::upload::PieceChannel;
using shardrent::upload::UploadPiece;

constexpr std::uint64_t kPieceSize = 36;

struct Dispatched {
    std::uint64_t chunks{0};
    std::vector<UploadPiece> pieces;
};

Dispatched dispatch(File& file, std::istream& source) {
    PieceChannel requests;
    Dispatched result;
    std::thread collector([&] {
        while (auto piece = requests.receive()) {
            result.pieces.push_back(std::move(*piece));
        }
    });
    try {
        result.chunks = ChunkDispatcher(file, requests).run(source);
    } catch (...) {
        requests.close();
        collector.join();
        throw;
    }
    collector.join();
    return result;
}

void check_exhaustive(std::size_t length) {
    const auto source_bytes = shardrent::test::patterned_bytes(length, static_cast<std::uint32_t>(length));
    File file{"chunks.bin", shardrent::erasure::make_reed_solomon(2, 3), kPieceSize, length, {}};
    const auto chunk_size = file.chunk_size();
    assert(chunk_size == 72);

    std::istringstream source(std::string(source_bytes.begin(), source_bytes.end()));
    const auto result = dispatch(file, source);

    const auto expected_chunks = (length + chunk_size - 1) / chunk_size;
    assert(result.chunks == expected_chunks);
    assert(file.chunks_uploaded() == expected_chunks);
    assert(result.pieces.size() == expected_chunks * 5);

    // Pieces arrive chunk by chunk in piece order; the data pieces tile the
    // source with zero padding after the end.
    ByteBuffer rebuilt;
    for (std::size_t i = 0; i < result.pieces.size(); ++i) {
        const auto& piece = result.pieces[i];
        assert(piece.chunk_index == i / 5);
        assert(piece.piece_index == i % 5);
        assert(piece.data.size() == kPieceSize);
        if (piece.piece_index < 2) {
            rebuilt.insert(rebuilt.end(), piece.data.begin(), piece.data.end());
        }
    }
    assert(rebuilt.size() == expected_chunks * chunk_size);
    assert(std::equal(source_bytes.begin(), source_bytes.end(), rebuilt.begin()));
    for (std::size_t i = length; i < rebuilt.size(); ++i) {
        assert(rebuilt[i] == 0);
    }
}

}  // namespace

int main() {
    shardrent::log::StructuredLogger::instance().set_enabled(false);

    for (const std::size_t length : {std::size_t{0}, std::size_t{1}, std::size_t{71}, std::size_t{72},
                                     std::size_t{73}, std::size_t{144}, std::size_t{1000}, std::size_t{4099}}) {
        check_exhaustive(length);
    }

    // End of input on a stream that throws on failbit still ends dispatch normally.
    for (const std::size_t length : {std::size_t{144}, std::size_t{100}}) {
        File file{"throwing.bin", shardrent::erasure::make_reed_solomon(2, 3), kPieceSize, length, {}};
        const auto bytes = shardrent::test::patterned_bytes(length);
        std::istringstream source(std::string(bytes.begin(), bytes.end()));
        source.exceptions(std::ios::failbit | std::ios::badbit);
        const auto result = dispatch(file, source);
        assert(result.chunks == 2);
        assert(result.pieces.size() == 10);
        assert(file.chunks_uploaded() == 2);
    }

    // A read failure aborts dispatch with IoError and leaves the channel open.
    {
        File file{"broken.bin", shardrent::erasure::make_reed_solomon(2, 3), kPieceSize, 1000, {}};
        shardrent::test::FailingStreambuf buffer{100};
        std::istream source(&buffer);
        bool threw = false;
        try {
            (void)dispatch(file, source);
        } catch (const shardrent::IoError& ex) {
            threw = true;
            assert(ex.code() == "E_IO");
        }
        assert(threw);
        assert(file.chunks_uploaded() == 1);
    }

    // Every receiver gone mid-upload surfaces as an upload failure.
    {
        File file{"orphan.bin", shardrent::erasure::make_reed_solomon(2, 3), kPieceSize, 1000, {}};
        PieceChannel requests;
        requests.add_receiver();
        std::thread quitter([&] {
            const auto first = requests.receive();
            assert(first.has_value());
            requests.remove_receiver();
        });
        const auto bytes = shardrent::test::patterned_bytes(1000);
        std::istringstream source(std::string(bytes.begin(), bytes.end()));
        bool threw = false;
        try {
            (void)ChunkDispatcher(file, requests).run(source);
        } catch (const shardrent::UploadFailedError&) {
            threw = true;
        }
        quitter.join();
        assert(threw);
        assert(!requests.closed());
    }

    return 0;
}
