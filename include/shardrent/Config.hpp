#pragma once

#include "shardrent/Types.hpp"
#include "shardrent/crypto/PieceCipher.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace shardrent {

struct Config {
    BlockHeight default_duration{6000};
    std::uint8_t default_data_pieces{2};
    std::uint8_t default_parity_pieces{10};
    std::uint64_t default_piece_size{(1ull << 22) - crypto::kPieceCipherOverhead};
    std::uint64_t small_piece_size{(1ull << 16) - crypto::kPieceCipherOverhead};
    std::uint64_t max_file_size{5ull * 1024ull * 1024ull * 1024ull};
    std::uint32_t host_sample_percent{150};
    std::uint64_t cost_buffer_factor{2};
    std::string renter_directory{"renter"};
    std::chrono::seconds http_connect_timeout{std::chrono::seconds(10)};
    std::chrono::seconds http_transfer_timeout{std::chrono::seconds(120)};
    bool logging_enabled{true};
    std::string log_level{"info"};
};

// Number of hosts requested for an upload of num_pieces pieces, rounded up.
std::size_t host_sample_size(const Config& config, std::size_t num_pieces);

}  // namespace shardrent
