#pragma once

#include "shardrent/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

namespace shardrent::renter {

struct HostEntry {
    HostAddress address;
    // Price per byte per block.
    Currency price{0};
};

class HostDb {
public:
    virtual ~HostDb() = default;

    // Up to count distinct hosts in random order; fewer when the database
    // knows fewer.
    virtual std::vector<HostEntry> random_hosts(std::size_t count) const = 0;
};

class MemoryHostDb final : public HostDb {
public:
    explicit MemoryHostDb(std::uint32_t seed = std::random_device{}());
    MemoryHostDb(std::vector<HostEntry> hosts, std::uint32_t seed = std::random_device{}());

    // Replaces an existing entry with the same address.
    void insert(HostEntry entry);
    bool remove(const HostAddress& address);
    std::size_t size() const;

    std::vector<HostEntry> random_hosts(std::size_t count) const override;

private:
    mutable std::mutex mutex_;
    std::vector<HostEntry> hosts_;
    mutable std::mt19937 rng_;
};

}  // namespace shardrent::renter
