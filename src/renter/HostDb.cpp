#include "shardrent/renter/HostDb.hpp"

#include <algorithm>
#include <utility>

namespace shardrent::renter {

MemoryHostDb::MemoryHostDb(std::uint32_t seed)
    : rng_(seed) {}

MemoryHostDb::MemoryHostDb(std::vector<HostEntry> hosts, std::uint32_t seed)
    : rng_(seed) {
    for (auto& host : hosts) {
        insert(std::move(host));
    }
}

void MemoryHostDb::insert(HostEntry entry) {
    std::scoped_lock lock(mutex_);
    const auto it = std::find_if(hosts_.begin(), hosts_.end(), [&](const HostEntry& existing) {
        return existing.address == entry.address;
    });
    if (it != hosts_.end()) {
        *it = std::move(entry);
        return;
    }
    hosts_.push_back(std::move(entry));
}

bool MemoryHostDb::remove(const HostAddress& address) {
    std::scoped_lock lock(mutex_);
    const auto it = std::remove_if(hosts_.begin(), hosts_.end(), [&](const HostEntry& existing) {
        return existing.address == address;
    });
    if (it == hosts_.end()) {
        return false;
    }
    hosts_.erase(it, hosts_.end());
    return true;
}

std::size_t MemoryHostDb::size() const {
    std::scoped_lock lock(mutex_);
    return hosts_.size();
}

std::vector<HostEntry> MemoryHostDb::random_hosts(std::size_t count) const {
    std::scoped_lock lock(mutex_);
    auto sample = hosts_;
    std::shuffle(sample.begin(), sample.end(), rng_);
    if (sample.size() > count) {
        sample.resize(count);
    }
    return sample;
}

}  // namespace shardrent::renter
