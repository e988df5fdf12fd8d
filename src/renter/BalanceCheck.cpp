#include "shardrent/renter/BalanceCheck.hpp"

#include "shardrent/Errors.hpp"
#include "shardrent/log/StructuredLogger.hpp"

#include <limits>
#include <string>

namespace shardrent::renter {

namespace {

Currency saturating_mul(Currency a, Currency b) noexcept {
    if (a != 0 && b > std::numeric_limits<Currency>::max() / a) {
        return std::numeric_limits<Currency>::max();
    }
    return a * b;
}

Currency saturating_add(Currency a, Currency b) noexcept {
    if (b > std::numeric_limits<Currency>::max() - a) {
        return std::numeric_limits<Currency>::max();
    }
    return a + b;
}

}  // namespace

Currency estimate_upload_cost(Currency average_price, BlockHeight duration, std::uint64_t file_size,
                              std::uint64_t buffer_factor) noexcept {
    return saturating_mul(saturating_mul(saturating_mul(average_price, duration), file_size), buffer_factor);
}

void check_wallet_balance(const UploadParams& params,
                          std::uint64_t file_size,
                          const HostDb& host_db,
                          const Wallet& wallet,
                          const Config& config) {
    const auto sample_size = host_sample_size(config, params.erasure_code->num_pieces());
    const auto hosts = host_db.random_hosts(sample_size);
    if (hosts.empty()) {
        throw InsufficientHostsError("no hosts available to price the upload of " + params.nickname);
    }

    Currency total = 0;
    for (const auto& host : hosts) {
        total = saturating_add(total, host.price);
    }
    const Currency average = total / hosts.size();
    const auto cost = estimate_upload_cost(average, params.duration, file_size, config.cost_buffer_factor);
    const auto balance = wallet.confirmed_balance();

    log::StructuredLogger::instance().debug("renter.balance_check",
                                            {{"file", params.nickname},
                                             {"sampled_hosts", std::to_string(hosts.size())},
                                             {"cost", std::to_string(cost)},
                                             {"balance", std::to_string(balance)}});

    if (cost > balance) {
        throw InsufficientFundsError("upload of " + params.nickname + " needs " + std::to_string(cost) +
                                     " but the wallet holds " + std::to_string(balance));
    }
}

}  // namespace shardrent::renter
