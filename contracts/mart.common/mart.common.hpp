/** Mart common definitions file
 *  Description: Constants and helpers shared by the marketplace contracts.
 *  @file mart.common.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/system.hpp>
#include <eosiolib/time.hpp>

#include "mart.accounts.hpp"
#include "mart.errors.hpp"

#include <string>

namespace martio {

    using namespace eosio;
    using std::string;
    using std::to_string;

    static const symbol MARTSYMBOL = symbol("SYS", 4);

    static const uint64_t MAXFEEBPS      = 1000;  // 10%
    static const uint64_t BPSDENOMINATOR = 10000;
    static const uint64_t MAXBATCHSIZE   = 25;

    // listing status
    static const uint64_t LISTING_ACTIVE    = 1;
    static const uint64_t LISTING_SOLD      = 2;
    static const uint64_t LISTING_CANCELLED = 3;

    inline uint64_t present_time() {
        return current_time_point().sec_since_epoch();
    }

    // key of an asset across contracts, used by the byasset indexes
    inline uint128_t asset_key(const name &contract, const uint64_t &item_id) {
        return (uint128_t(contract.value) << 64) | item_id;
    }

    // floor(price * bps / 10000); the product is taken in 128 bits so it cannot overflow.
    inline int64_t compute_marketplace_fee(const int64_t &price, const uint64_t &fee_bps) {
        return static_cast<int64_t>((uint128_t(price) * fee_bps) / BPSDENOMINATOR);
    }

    inline bool is_valid_price(const asset &price) {
        return price.is_valid() && price.symbol == MARTSYMBOL && price.amount > 0;
    }
}
