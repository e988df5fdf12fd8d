#include "shardrent/renter/FileCodec.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/erasure/ReedSolomon.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace shardrent::renter {

namespace {

constexpr std::array<std::uint8_t, 4> kMagic{'S', 'R', 'F', '1'};

void append_u64(ByteBuffer& buffer, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void append_u32(ByteBuffer& buffer, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFu));
    }
}

void append_u16(ByteBuffer& buffer, std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void append_string(ByteBuffer& buffer, const std::string& value) {
    if (value.size() > std::numeric_limits<std::uint16_t>::max()) {
        throw std::invalid_argument("string field too long for file record");
    }
    append_u16(buffer, static_cast<std::uint16_t>(value.size()));
    buffer.insert(buffer.end(), value.begin(), value.end());
}

template <std::size_t N>
void append_bytes(ByteBuffer& buffer, const std::array<std::uint8_t, N>& bytes) {
    buffer.insert(buffer.end(), bytes.begin(), bytes.end());
}

class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}

    std::uint8_t u8() {
        require(1);
        return bytes_[offset_++];
    }

    std::uint16_t u16() {
        require(2);
        const auto value = static_cast<std::uint16_t>((bytes_[offset_] << 8) | bytes_[offset_ + 1]);
        offset_ += 2;
        return value;
    }

    std::uint32_t u32() {
        require(4);
        std::uint32_t value = 0;
        for (int i = 0; i < 4; ++i) {
            value = (value << 8) | bytes_[offset_++];
        }
        return value;
    }

    std::uint64_t u64() {
        require(8);
        std::uint64_t value = 0;
        for (int i = 0; i < 8; ++i) {
            value = (value << 8) | bytes_[offset_++];
        }
        return value;
    }

    std::string string() {
        const auto length = u16();
        require(length);
        std::string value(reinterpret_cast<const char*>(bytes_.data() + offset_), length);
        offset_ += length;
        return value;
    }

    template <std::size_t N>
    std::array<std::uint8_t, N> bytes() {
        require(N);
        std::array<std::uint8_t, N> value{};
        std::copy_n(bytes_.begin() + static_cast<std::ptrdiff_t>(offset_), N, value.begin());
        offset_ += N;
        return value;
    }

    bool at_end() const noexcept { return offset_ == bytes_.size(); }

    std::size_t remaining() const noexcept { return bytes_.size() - offset_; }

private:
    void require(std::size_t count) const {
        if (bytes_.size() - offset_ < count) {
            throw std::invalid_argument("file record truncated");
        }
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t offset_{0};
};

// Smallest encoded sizes, used to reject absurd counts before allocating.
constexpr std::size_t kMinContractBytes = 32 + 2 + 8 + 4;
constexpr std::size_t kPieceRecordBytes = 8 * 4 + 32;

}  // namespace

ByteBuffer encode_file(const upload::File& file) {
    ByteBuffer buffer;
    buffer.insert(buffer.end(), kMagic.begin(), kMagic.end());
    buffer.push_back(kFileRecordVersion);
    append_string(buffer, file.nickname());
    buffer.push_back(static_cast<std::uint8_t>(file.erasure_code().data_pieces()));
    buffer.push_back(static_cast<std::uint8_t>(file.erasure_code().parity_pieces()));
    append_u64(buffer, file.piece_size());
    append_u64(buffer, file.size());
    append_bytes(buffer, file.master_key().bytes);
    append_u64(buffer, file.bytes_uploaded());
    append_u64(buffer, file.chunks_uploaded());

    append_u32(buffer, static_cast<std::uint32_t>(file.contracts().size()));
    for (const auto& [address, contract] : file.contracts()) {
        append_bytes(buffer, contract.id);
        append_string(buffer, address);
        append_u64(buffer, contract.duration);
        append_u32(buffer, static_cast<std::uint32_t>(contract.pieces.size()));
        for (const auto& piece : contract.pieces) {
            append_u64(buffer, piece.chunk_index);
            append_u64(buffer, piece.piece_index);
            append_u64(buffer, piece.offset);
            append_u64(buffer, piece.length);
            append_bytes(buffer, piece.merkle_root);
        }
    }
    return buffer;
}

std::unique_ptr<upload::File> decode_file(std::span<const std::uint8_t> bytes) {
    Reader reader(bytes);
    if (reader.bytes<kMagic.size()>() != kMagic) {
        throw std::invalid_argument("not a file record");
    }
    const auto version = reader.u8();
    if (version != kFileRecordVersion) {
        throw std::invalid_argument("unsupported file record version " + std::to_string(version));
    }

    auto nickname = reader.string();
    const auto data_pieces = reader.u8();
    const auto parity_pieces = reader.u8();
    const auto piece_size = reader.u64();
    const auto size = reader.u64();
    crypto::Key key{};
    key.bytes = reader.bytes<32>();
    const auto bytes_uploaded = reader.u64();
    const auto chunks_uploaded = reader.u64();

    std::unique_ptr<upload::File> file;
    try {
        file = std::make_unique<upload::File>(std::move(nickname),
                                              erasure::make_reed_solomon(data_pieces, parity_pieces),
                                              piece_size,
                                              size,
                                              key);
    } catch (const ValidationError& ex) {
        throw std::invalid_argument(std::string("file record is inconsistent: ") + ex.what());
    }
    file->restore_progress(bytes_uploaded, chunks_uploaded);

    const auto contract_count = reader.u32();
    if (contract_count > reader.remaining() / kMinContractBytes) {
        throw std::invalid_argument("file record truncated");
    }
    for (std::uint32_t i = 0; i < contract_count; ++i) {
        upload::FileContract contract;
        contract.id = reader.bytes<32>();
        contract.address = reader.string();
        contract.duration = reader.u64();
        const auto piece_count = reader.u32();
        if (piece_count > reader.remaining() / kPieceRecordBytes) {
            throw std::invalid_argument("file record truncated");
        }
        contract.pieces.reserve(piece_count);
        for (std::uint32_t p = 0; p < piece_count; ++p) {
            upload::PieceRecord record;
            record.chunk_index = reader.u64();
            record.piece_index = reader.u64();
            record.offset = reader.u64();
            record.length = reader.u64();
            record.merkle_root = reader.bytes<32>();
            contract.pieces.push_back(record);
        }
        file->set_contract(std::move(contract));
    }

    if (!reader.at_end()) {
        throw std::invalid_argument("trailing bytes after file record");
    }
    return file;
}

}  // namespace shardrent::renter
