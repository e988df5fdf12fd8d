#pragma once

#include "shardrent/Config.hpp"
#include "shardrent/Export.hpp"
#include "shardrent/crypto/ChaCha20.hpp"
#include "shardrent/crypto/PieceCipher.hpp"
#include "shardrent/renter/HostSessionFactory.hpp"
#include "shardrent/upload/HostUploader.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace shardrent::hosts {

struct HttpSessionOptions {
    std::chrono::seconds connect_timeout{std::chrono::seconds(10)};
    std::chrono::seconds transfer_timeout{std::chrono::seconds(120)};
    std::string user_agent{"shardrent/1.0"};

    static HttpSessionOptions from_config(const Config& config);
};

// Storage contract with one host spoken over plain HTTP.
//
//   POST /contracts                          negotiate, body carries id/size/duration
//   PUT  /contracts/<id>/pieces?chunk=&piece=&offset=   one sealed piece
//
// Pieces are sealed with the file master key before they leave the process.
class HttpHostSession final : public upload::HostUploader {
public:
    // Negotiates the contract; throws TransportError or ProtocolError.
    HttpHostSession(HostAddress address,
                    std::uint64_t total_size,
                    BlockHeight duration,
                    const crypto::Key& master_key,
                    HttpSessionOptions options = {});
    ~HttpHostSession() override;

    HttpHostSession(const HttpHostSession&) = delete;
    HttpHostSession& operator=(const HttpHostSession&) = delete;

    const HostAddress& address() const noexcept override { return address_; }

    void add_piece(const upload::UploadPiece& piece) override;
    upload::FileContract file_contract() const override;

private:
    struct CurlDeleter {
        void operator()(void* handle) const noexcept;
    };

    HostAddress address_;
    HttpSessionOptions options_;
    crypto::PieceCipher cipher_;
    std::unique_ptr<void, CurlDeleter> curl_;
    upload::FileContract contract_;
    std::uint64_t next_offset_{0};
    mutable std::mutex mutex_;

    // Throws TransportError when curl fails, ProtocolError on a non-2xx status.
    void perform(std::string_view method, const std::string& path, std::string_view body, std::string_view content_type);
};

class SHARDRENT_API HttpSessionFactory final : public renter::HostSessionFactory {
public:
    explicit HttpSessionFactory(HttpSessionOptions options = {});

    std::unique_ptr<upload::HostUploader> connect(const renter::HostEntry& host,
                                                  std::uint64_t total_size,
                                                  BlockHeight duration,
                                                  const crypto::Key& master_key) override;

private:
    HttpSessionOptions options_;
};

}  // namespace shardrent::hosts
