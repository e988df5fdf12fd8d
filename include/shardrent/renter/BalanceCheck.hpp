#pragma once

#include "shardrent/Config.hpp"
#include "shardrent/renter/HostDb.hpp"
#include "shardrent/renter/UploadParams.hpp"
#include "shardrent/renter/Wallet.hpp"

#include <cstdint>

namespace shardrent::renter {

// Estimated cost of keeping file_size bytes for params.duration blocks at the
// average sampled host price, multiplied by the configured buffer factor.
// Saturates at the largest Currency value.
Currency estimate_upload_cost(Currency average_price, BlockHeight duration, std::uint64_t file_size,
                              std::uint64_t buffer_factor) noexcept;

// params must already carry its defaults. Throws InsufficientHostsError when
// the sample is empty and InsufficientFundsError when the wallet falls short.
void check_wallet_balance(const UploadParams& params,
                          std::uint64_t file_size,
                          const HostDb& host_db,
                          const Wallet& wallet,
                          const Config& config);

}  // namespace shardrent::renter
