#pragma once

#include "shardrent/Types.hpp"
#include "shardrent/crypto/ChaCha20.hpp"
#include "shardrent/erasure/ErasureCoder.hpp"
#include "shardrent/upload/FileContract.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <utility>

namespace shardrent::upload {

// Renter-side record of one stored file.
//
// The progress counters are written by upload threads with relaxed atomics
// and may be read from anywhere. Everything else is owned by whoever holds the
// file table lock; the contract map is only touched once all workers of an
// upload have reported.
class File {
public:
    File(std::string nickname,
         std::shared_ptr<const erasure::ErasureCoder> coder,
         std::uint64_t piece_size,
         std::uint64_t size,
         crypto::Key master_key);

    File(const File&) = delete;
    File& operator=(const File&) = delete;

    const std::string& nickname() const noexcept { return nickname_; }
    void set_nickname(std::string nickname) { nickname_ = std::move(nickname); }

    const erasure::ErasureCoder& erasure_code() const noexcept { return *coder_; }
    std::shared_ptr<const erasure::ErasureCoder> erasure_code_ptr() const noexcept { return coder_; }

    std::uint64_t piece_size() const noexcept { return piece_size_; }
    std::uint64_t size() const noexcept { return size_; }
    const crypto::Key& master_key() const noexcept { return master_key_; }

    std::uint64_t chunk_size() const noexcept;
    // Never zero: an empty file still occupies one padded chunk.
    std::uint64_t num_chunks() const noexcept;

    void add_bytes_uploaded(std::uint64_t bytes) noexcept;
    void add_chunk_uploaded() noexcept;
    std::uint64_t bytes_uploaded() const noexcept;
    std::uint64_t chunks_uploaded() const noexcept;
    void restore_progress(std::uint64_t bytes, std::uint64_t chunks) noexcept;

    // Percentage of the expected piece bytes delivered so far, capped at 100.
    // An empty file counts as fully uploaded.
    double upload_progress() const noexcept;

    // Lowest number of distinct contracts holding each chunk piece, divided by
    // the minimum pieces needed. 0 when any chunk is unrecoverable; an empty
    // file reports the full code ratio.
    double redundancy() const;

    const std::map<HostAddress, FileContract>& contracts() const noexcept { return contracts_; }
    void set_contract(FileContract contract);
    void clear_contracts() { contracts_.clear(); }

private:
    std::string nickname_;
    std::shared_ptr<const erasure::ErasureCoder> coder_;
    std::uint64_t piece_size_;
    std::uint64_t size_;
    crypto::Key master_key_;
    std::map<HostAddress, FileContract> contracts_;
    std::atomic<std::uint64_t> bytes_uploaded_{0};
    std::atomic<std::uint64_t> chunks_uploaded_{0};
};

}  // namespace shardrent::upload
