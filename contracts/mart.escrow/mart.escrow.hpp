/** MartEscrow header file
 *  Description: MartEscrow is the smart contract that holds assets in escrow while they are
 *  listed and settles their sale.
 *  @file mart.escrow.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#ifndef MART_CONTRACTS_MART_ESCROW_H
#define MART_CONTRACTS_MART_ESCROW_H

#include <mart.common/mart.common.hpp>
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <eosiolib/singleton.hpp>
#include <string>
#include <vector>

#include "mart.vault.hpp"

namespace martio {

    using namespace eosio;
    using namespace std;

    struct [[eosio::table, eosio::contract("MartEscrow")]] listing {
        uint64_t id = 0;
        name     seller;
        name     asset_contract;
        uint64_t item_id = 0;
        uint8_t  kind = 0;    // asset_kind
        uint64_t amount = 0;
        asset    price;
        uint64_t status = 0;  // status = 1: on sale, status = 2: Sold, status = 3; Cancelled
        name     buyer;
        uint64_t date_listed = 0;
        uint64_t date_updated = 0;

        bool is_active() const { return status == LISTING_ACTIVE; }

        uint64_t primary_key() const { return id; }

        EOSLIB_SERIALIZE(listing,
                         (id)(seller)(asset_contract)(item_id)
                         (kind)(amount)(price)(status)
                         (buyer)(date_listed)(date_updated)
        )
    };

    typedef multi_index<"listings"_n, listing> listings_table;

    // marketplace fee policy, written by init and by the owner
    struct [[eosio::table("mrktconfig"), eosio::contract("MartEscrow")]] mrktconfig {
        name     owner;
        name     fee_recipient;
        uint64_t fee_bps = 0;
        uint64_t e_break = 0;

        EOSLIB_SERIALIZE(mrktconfig, (owner)(fee_recipient)(fee_bps)(e_break))
    };

    typedef singleton<"mrktconfig"_n, mrktconfig> mrktconfig_singleton;

    // locked is set from the start of a mutating action until its unlock inline action runs
    struct [[eosio::table("mrktstate"), eosio::contract("MartEscrow")]] mrktstate {
        uint64_t next_listing_id = 0;
        bool     locked = false;

        EOSLIB_SERIALIZE(mrktstate, (next_listing_id)(locked))
    };

    typedef singleton<"mrktstate"_n, mrktstate> mrktstate_singleton;
}

#endif //MART_CONTRACTS_MART_ESCROW_H
