#pragma once

#include "shardrent/Types.hpp"
#include "shardrent/erasure/ErasureCoder.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace shardrent::renter {

// Zero or null fields are replaced with the configured defaults.
struct UploadParams {
    std::filesystem::path filename;
    std::string nickname;
    BlockHeight duration{0};
    std::shared_ptr<const erasure::ErasureCoder> erasure_code;
    std::uint64_t piece_size{0};
};

}  // namespace shardrent::renter
