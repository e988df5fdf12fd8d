#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace shardrent::crypto {

struct Key {
    std::array<std::uint8_t, 32> bytes{};
};

struct Nonce {
    std::array<std::uint8_t, 12> bytes{};
};

// RFC 8439 keystream. The stream is positioned at a 64-byte block counter and
// XORs itself over caller buffers, so encryption and decryption are the same
// call.
class ChaCha20 {
public:
    static constexpr std::size_t kBlockSize = 64;

    ChaCha20(const Key& key, const Nonce& nonce, std::uint32_t counter = 0) noexcept;
    ~ChaCha20();

    ChaCha20(const ChaCha20&) = delete;
    ChaCha20& operator=(const ChaCha20&) = delete;

    void xor_stream(std::span<std::uint8_t> data) noexcept;

    static void apply(const Key& key,
                      const Nonce& nonce,
                      std::span<std::uint8_t> data,
                      std::uint32_t counter = 0) noexcept;

private:
    std::array<std::uint32_t, 16> input_{};
    std::array<std::uint8_t, kBlockSize> keystream_{};
    std::size_t keystream_used_{kBlockSize};

    void refill() noexcept;
};

}  // namespace shardrent::crypto
