#pragma once

#include "shardrent/Errors.hpp"
#include "shardrent/renter/FileCodec.hpp"
#include "shardrent/renter/HostSessionFactory.hpp"
#include "shardrent/renter/Persister.hpp"
#include "shardrent/renter/Wallet.hpp"
#include "shardrent/upload/HostUploader.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <utility>
#include <vector>

namespace shardrent::test {

// Holds every host inside add_piece until group_size pieces of the same chunk
// have been taken, so equally fast hosts end up with one piece each. Chunks
// from chunk_limit on pass straight through.
class Lockstep {
public:
    explicit Lockstep(std::size_t group_size,
                      std::uint64_t chunk_limit = std::numeric_limits<std::uint64_t>::max())
        : group_size_(group_size),
          chunk_limit_(chunk_limit) {}

    void arrive_and_wait(std::uint64_t chunk_index) {
        if (chunk_index >= chunk_limit_) {
            return;
        }
        std::unique_lock lock(mutex_);
        auto& arrivals = arrivals_[chunk_index];
        ++arrivals;
        released_.notify_all();
        released_.wait_for(lock, std::chrono::seconds(10), [&] { return arrivals >= group_size_; });
    }

private:
    std::size_t group_size_;
    std::uint64_t chunk_limit_;
    std::mutex mutex_;
    std::condition_variable released_;
    std::map<std::uint64_t, std::size_t> arrivals_;
};

// In-memory host. Records pieces without keeping their bytes unless asked to.
class MemoryHost final : public upload::HostUploader {
public:
    explicit MemoryHost(HostAddress address,
                        std::optional<std::size_t> fail_after = std::nullopt,
                        Lockstep* lockstep = nullptr,
                        bool keep_data = false)
        : address_(std::move(address)),
          fail_after_(fail_after),
          lockstep_(lockstep),
          keep_data_(keep_data) {
        contract_.address = address_;
        contract_.id[0] = static_cast<std::uint8_t>(address_.size());
    }

    const HostAddress& address() const noexcept override { return address_; }

    void add_piece(const upload::UploadPiece& piece) override {
        if (lockstep_ != nullptr) {
            lockstep_->arrive_and_wait(piece.chunk_index);
        }
        std::scoped_lock lock(mutex_);
        ++attempts_;
        if (fail_after_ && contract_.pieces.size() >= *fail_after_) {
            throw TransportError("host " + address_ + " dropped the connection");
        }
        contract_.pieces.push_back(upload::PieceRecord{piece.chunk_index, piece.piece_index, next_offset_,
                                                       piece.data.size(), {}});
        next_offset_ += piece.data.size();
        if (keep_data_) {
            data_[{piece.chunk_index, piece.piece_index}] = piece.data;
        }
    }

    upload::FileContract file_contract() const override {
        std::scoped_lock lock(mutex_);
        return contract_;
    }

    std::size_t attempts() const {
        std::scoped_lock lock(mutex_);
        return attempts_;
    }

    std::map<std::pair<std::uint64_t, std::uint64_t>, ByteBuffer> data() const {
        std::scoped_lock lock(mutex_);
        return data_;
    }

private:
    HostAddress address_;
    std::optional<std::size_t> fail_after_;
    Lockstep* lockstep_;
    bool keep_data_;
    mutable std::mutex mutex_;
    upload::FileContract contract_;
    std::uint64_t next_offset_{0};
    std::size_t attempts_{0};
    std::map<std::pair<std::uint64_t, std::uint64_t>, ByteBuffer> data_;
};

class FixedWallet final : public renter::Wallet {
public:
    explicit FixedWallet(Currency balance) : balance_(balance) {}

    Currency confirmed_balance() const override { return balance_; }

private:
    Currency balance_;
};

// Builds MemoryHost sessions and refuses the addresses listed as unreachable.
class ScriptedSessionFactory final : public renter::HostSessionFactory {
public:
    std::set<HostAddress> unreachable;
    std::set<HostAddress> failing;
    std::vector<MemoryHost*> created;
    std::size_t attempts{0};

    std::unique_ptr<upload::HostUploader> connect(const renter::HostEntry& host,
                                                  std::uint64_t,
                                                  BlockHeight,
                                                  const crypto::Key&) override {
        ++attempts;
        if (unreachable.count(host.address) != 0) {
            throw TransportError("cannot reach " + host.address);
        }
        const auto fail_after = failing.count(host.address) != 0 ? std::optional<std::size_t>{0} : std::nullopt;
        auto session = std::make_unique<MemoryHost>(host.address, fail_after);
        created.push_back(session.get());
        return session;
    }
};

class MemoryPersister final : public renter::RenterPersister {
public:
    std::vector<std::string> index;
    std::map<std::string, ByteBuffer> records;
    std::size_t index_saves{0};

    void save_index(const std::vector<std::string>& nicknames) override {
        index = nicknames;
        ++index_saves;
    }

    void save_file(const upload::File& file) override { records[file.nickname()] = renter::encode_file(file); }

    void remove_file(const std::string& nickname) override { records.erase(nickname); }

    std::vector<std::string> load_index() override { return index; }

    std::unique_ptr<upload::File> load_file(const std::string& nickname) override {
        const auto it = records.find(nickname);
        if (it == records.end()) {
            throw IoError("no record for " + nickname);
        }
        return renter::decode_file(it->second);
    }
};

// Serves good_bytes of a repeating pattern, then fails the next read.
class FailingStreambuf final : public std::streambuf {
public:
    explicit FailingStreambuf(std::size_t good_bytes) : data_(good_bytes) {
        for (std::size_t i = 0; i < data_.size(); ++i) {
            data_[i] = static_cast<char>(i % 251);
        }
        setg(data_.data(), data_.data(), data_.data() + data_.size());
    }

protected:
    int_type underflow() override { throw std::runtime_error("disk went away"); }

private:
    std::vector<char> data_;
};

// Empty source that remembers whether anyone tried to read from it.
class ProbeStreambuf final : public std::streambuf {
public:
    bool touched{false};

protected:
    int_type underflow() override {
        touched = true;
        return traits_type::eof();
    }

    std::streamsize xsgetn(char_type*, std::streamsize) override {
        touched = true;
        return 0;
    }
};

inline ByteBuffer patterned_bytes(std::size_t size, std::uint32_t seed = 7) {
    ByteBuffer bytes(size);
    std::uint32_t state = seed;
    for (auto& byte : bytes) {
        state = state * 1664525u + 1013904223u;
        byte = static_cast<std::uint8_t>(state >> 24);
    }
    return bytes;
}

}  // namespace shardrent::test
