#include "shardrent/crypto/ChaCha20.hpp"
#include "shardrent/crypto/HmacSha256.hpp"
#include "shardrent/crypto/MerkleTree.hpp"
#include "shardrent/crypto/PieceCipher.hpp"
#include "shardrent/crypto/Sha256.hpp"

#include "test_support.hpp"

#include <array>
#include <cassert>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

using shardrent::ByteBuffer;
using shardrent::crypto::Digest;
using shardrent::crypto::MerkleTree;
using shardrent::crypto::PieceCipher;

std::span<const std::uint8_t> text_bytes(std::string_view text) {
    return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

std::string hex(std::span<const std::uint8_t> bytes) {
    return shardrent::bytes_to_hex(bytes);
}

bool throws_invalid(std::span<const std::uint8_t> data) {
    try {
        (void)MerkleTree::segment_root(data);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    assert(hex(shardrent::crypto::Sha256::digest(text_bytes("abc"))) ==
           "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    assert(hex(shardrent::crypto::Sha256::digest(text_bytes(""))) ==
           "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    assert(hex(shardrent::crypto::HmacSha256::compute(text_bytes("Jefe"), text_bytes("what do ya want for nothing?"))) ==
           "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");

    // Block function vector with counter 1.
    shardrent::crypto::Key key{};
    for (std::size_t i = 0; i < key.bytes.size(); ++i) {
        key.bytes[i] = static_cast<std::uint8_t>(i);
    }
    shardrent::crypto::Nonce nonce{{0x00, 0x00, 0x00, 0x09, 0x00, 0x00, 0x00, 0x4a, 0x00, 0x00, 0x00, 0x00}};
    std::array<std::uint8_t, 16> keystream{};
    shardrent::crypto::ChaCha20::apply(key, nonce, keystream, 1);
    assert(hex(keystream) == "10f1e7e4d13b5915500fdd1fa32071c4");

    const PieceCipher cipher{PieceCipher::generate_key()};
    const auto plaintext = shardrent::test::patterned_bytes(65508);
    const auto sealed = cipher.seal(3, 7, plaintext);
    assert(sealed.size() == plaintext.size() + shardrent::crypto::kPieceCipherOverhead);
    assert(sealed.size() % shardrent::crypto::kSegmentSize == 0);

    const auto opened = cipher.open(3, 7, sealed);
    assert(opened.has_value());
    assert(*opened == plaintext);

    // Pieces are bound to their position and to the key.
    assert(!cipher.open(3, 8, sealed).has_value());
    assert(!cipher.open(4, 7, sealed).has_value());
    assert(!PieceCipher{PieceCipher::generate_key()}.open(3, 7, sealed).has_value());

    auto tampered = sealed;
    tampered[100] ^= 0x01;
    assert(!cipher.open(3, 7, tampered).has_value());
    assert(!cipher.open(3, 7, ByteBuffer(10)).has_value());

    // Fresh nonces: sealing twice never repeats.
    assert(cipher.seal(3, 7, plaintext) != sealed);

    ByteBuffer segments(3 * shardrent::crypto::kSegmentSize);
    for (std::size_t i = 0; i < segments.size(); ++i) {
        segments[i] = static_cast<std::uint8_t>(i);
    }
    const std::span<const std::uint8_t> all{segments};
    const auto leaf0 = MerkleTree::leaf_hash(all.subspan(0, 64));
    const auto leaf1 = MerkleTree::leaf_hash(all.subspan(64, 64));
    const auto leaf2 = MerkleTree::leaf_hash(all.subspan(128, 64));

    assert(MerkleTree::segment_root(all.subspan(0, 64)) == leaf0);
    assert(MerkleTree::segment_root(all.subspan(0, 128)) == MerkleTree::node_hash(leaf0, leaf1));
    assert(MerkleTree::segment_root(all) == MerkleTree::node_hash(MerkleTree::node_hash(leaf0, leaf1), leaf2));
    assert(leaf0 != shardrent::crypto::Sha256::digest(all.subspan(0, 64)));

    assert(throws_invalid(all.subspan(0, 63)));
    assert(throws_invalid(all.subspan(0, 0)));
    assert(MerkleTree::segment_root(sealed) != Digest{});

    return 0;
}
