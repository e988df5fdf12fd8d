#pragma once

#include "shardrent/crypto/ChaCha20.hpp"
#include "shardrent/renter/HostDb.hpp"
#include "shardrent/upload/HostUploader.hpp"

#include <cstdint>
#include <memory>

namespace shardrent::renter {

// Negotiates a storage contract with one host. Throws TransportError or
// ProtocolError when the host cannot be used.
class HostSessionFactory {
public:
    virtual ~HostSessionFactory() = default;

    virtual std::unique_ptr<upload::HostUploader> connect(const HostEntry& host,
                                                          std::uint64_t total_size,
                                                          BlockHeight duration,
                                                          const crypto::Key& master_key) = 0;
};

}  // namespace shardrent::renter
