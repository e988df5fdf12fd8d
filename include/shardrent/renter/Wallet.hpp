#pragma once

#include "shardrent/Types.hpp"

namespace shardrent::renter {

class Wallet {
public:
    virtual ~Wallet() = default;

    virtual Currency confirmed_balance() const = 0;
};

}  // namespace shardrent::renter
