#include "shardrent/crypto/PieceCipher.hpp"

#include "shardrent/crypto/HmacSha256.hpp"

#include <algorithm>
#include <array>
#include <random>

namespace shardrent::crypto {

namespace {

constexpr std::array<std::uint8_t, 5> kPieceLabel{'p', 'i', 'e', 'c', 'e'};

std::array<std::uint8_t, 8> to_big_endian(std::uint64_t value) {
    std::array<std::uint8_t, 8> bytes{};
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<std::uint8_t>(value >> (56 - 8 * i));
    }
    return bytes;
}

}  // namespace

PieceCipher::PieceCipher(const Key& master_key) : master_key_(master_key) {}

Key PieceCipher::derive_piece_key(std::uint64_t chunk_index, std::uint64_t piece_index) const {
    const auto chunk = to_big_endian(chunk_index);
    const auto piece = to_big_endian(piece_index);
    Key key{};
    key.bytes = HmacSha256::compute(master_key_.bytes, {kPieceLabel, chunk, piece});
    return key;
}

ByteBuffer PieceCipher::seal(std::uint64_t chunk_index,
                             std::uint64_t piece_index,
                             std::span<const std::uint8_t> plaintext) const {
    const auto piece_key = derive_piece_key(chunk_index, piece_index);

    ByteBuffer sealed(kPieceNonceSize + plaintext.size() + kPieceTagSize);
    Nonce nonce{};
    random_bytes(nonce.bytes);
    std::copy(nonce.bytes.begin(), nonce.bytes.end(), sealed.begin());

    const std::span<std::uint8_t> body{sealed.data() + kPieceNonceSize, plaintext.size()};
    std::copy(plaintext.begin(), plaintext.end(), body.begin());
    // Block 0 is reserved; the body keystream starts at counter 1 as in RFC 8439 AEAD.
    ChaCha20::apply(piece_key, nonce, body, 1);

    const auto tag = HmacSha256::compute(piece_key.bytes,
                                         std::span<const std::uint8_t>{sealed.data(), kPieceNonceSize + plaintext.size()});
    std::copy_n(tag.begin(), kPieceTagSize, sealed.end() - static_cast<std::ptrdiff_t>(kPieceTagSize));
    return sealed;
}

std::optional<ByteBuffer> PieceCipher::open(std::uint64_t chunk_index,
                                            std::uint64_t piece_index,
                                            std::span<const std::uint8_t> sealed) const {
    if (sealed.size() < kPieceCipherOverhead) {
        return std::nullopt;
    }
    const auto piece_key = derive_piece_key(chunk_index, piece_index);
    const auto authenticated = sealed.first(sealed.size() - kPieceTagSize);
    const auto tag = sealed.last(kPieceTagSize);

    const auto expected = HmacSha256::compute(piece_key.bytes, authenticated);
    if (!HmacSha256::equal(std::span<const std::uint8_t>{expected.data(), kPieceTagSize}, tag)) {
        return std::nullopt;
    }

    Nonce nonce{};
    std::copy_n(sealed.begin(), kPieceNonceSize, nonce.bytes.begin());
    ByteBuffer plaintext(authenticated.begin() + static_cast<std::ptrdiff_t>(kPieceNonceSize), authenticated.end());
    ChaCha20::apply(piece_key, nonce, plaintext, 1);
    return plaintext;
}

Key PieceCipher::generate_key() {
    Key key{};
    random_bytes(key.bytes);
    return key;
}

void PieceCipher::random_bytes(std::span<std::uint8_t> buffer) {
    std::random_device rd;
    for (auto& byte : buffer) {
        byte = static_cast<std::uint8_t>(rd());
    }
}

}  // namespace shardrent::crypto
