#include "shardrent/upload/File.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/crypto/PieceCipher.hpp"

#include <algorithm>
#include <limits>
#include <set>
#include <utility>
#include <vector>

namespace shardrent::upload {

File::File(std::string nickname,
           std::shared_ptr<const erasure::ErasureCoder> coder,
           std::uint64_t piece_size,
           std::uint64_t size,
           crypto::Key master_key)
    : nickname_(std::move(nickname)),
      coder_(std::move(coder)),
      piece_size_(piece_size),
      size_(size),
      master_key_(master_key) {
    if (!coder_) {
        throw ValidationError("file " + nickname_ + " has no erasure code");
    }
    if (piece_size_ == 0 || (piece_size_ + crypto::kPieceCipherOverhead) % crypto::kSegmentSize != 0) {
        throw ValidationError("piece size " + std::to_string(piece_size_) +
                              " does not leave sealed pieces aligned to " + std::to_string(crypto::kSegmentSize) +
                              " byte segments");
    }
}

std::uint64_t File::chunk_size() const noexcept {
    return piece_size_ * coder_->min_pieces();
}

std::uint64_t File::num_chunks() const noexcept {
    const auto chunk = chunk_size();
    const auto chunks = (size_ + chunk - 1) / chunk;
    return std::max<std::uint64_t>(chunks, 1);
}

void File::add_bytes_uploaded(std::uint64_t bytes) noexcept {
    bytes_uploaded_.fetch_add(bytes, std::memory_order_relaxed);
}

void File::add_chunk_uploaded() noexcept {
    chunks_uploaded_.fetch_add(1, std::memory_order_relaxed);
}

std::uint64_t File::bytes_uploaded() const noexcept {
    return bytes_uploaded_.load(std::memory_order_relaxed);
}

std::uint64_t File::chunks_uploaded() const noexcept {
    return chunks_uploaded_.load(std::memory_order_relaxed);
}

void File::restore_progress(std::uint64_t bytes, std::uint64_t chunks) noexcept {
    bytes_uploaded_.store(bytes, std::memory_order_relaxed);
    chunks_uploaded_.store(chunks, std::memory_order_relaxed);
}

double File::upload_progress() const noexcept {
    // An empty file has nothing to dispatch.
    if (size_ == 0) {
        return 100.0;
    }
    const double expected = static_cast<double>(num_chunks()) *
                            static_cast<double>(coder_->num_pieces()) *
                            static_cast<double>(piece_size_);
    const double done = static_cast<double>(bytes_uploaded()) * 100.0 / expected;
    return std::min(done, 100.0);
}

double File::redundancy() const {
    if (size_ == 0) {
        return static_cast<double>(coder_->num_pieces()) / static_cast<double>(coder_->min_pieces());
    }
    const auto chunks = num_chunks();
    std::vector<std::set<std::uint64_t>> pieces_per_chunk(chunks);
    for (const auto& [address, contract] : contracts_) {
        for (const auto& record : contract.pieces) {
            if (record.chunk_index < chunks) {
                pieces_per_chunk[record.chunk_index].insert(record.piece_index);
            }
        }
    }

    std::size_t lowest = std::numeric_limits<std::size_t>::max();
    for (const auto& pieces : pieces_per_chunk) {
        lowest = std::min(lowest, pieces.size());
    }
    if (lowest < coder_->min_pieces()) {
        return 0.0;
    }
    return static_cast<double>(lowest) / static_cast<double>(coder_->min_pieces());
}

void File::set_contract(FileContract contract) {
    auto address = contract.address;
    contracts_.insert_or_assign(std::move(address), std::move(contract));
}

}  // namespace shardrent::upload
