#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace shardrent::crypto {

using Digest = std::array<std::uint8_t, 32>;

class Sha256 {
public:
    Sha256() noexcept;

    Sha256& update(std::span<const std::uint8_t> data) noexcept;
    Sha256& update(std::uint8_t byte) noexcept;
    Digest finalize() noexcept;

    static Digest digest(std::span<const std::uint8_t> data) noexcept;

private:
    void compress(const std::uint8_t* block) noexcept;

    std::array<std::uint32_t, 8> state_;
    std::array<std::uint8_t, 64> pending_{};
    std::size_t pending_size_{0};
    std::uint64_t total_bytes_{0};
};

}  // namespace shardrent::crypto
