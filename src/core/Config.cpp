#include "shardrent/Config.hpp"

namespace shardrent {

std::size_t host_sample_size(const Config& config, std::size_t num_pieces) {
    const auto scaled = static_cast<std::uint64_t>(num_pieces) * config.host_sample_percent;
    return static_cast<std::size_t>((scaled + 99) / 100);
}

}  // namespace shardrent
