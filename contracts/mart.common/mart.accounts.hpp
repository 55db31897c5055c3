/** Mart accounts file
 *  Description: Account names of the contracts the marketplace talks to.
 *  @file mart.accounts.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <eosiolib/eosio.hpp>

namespace martio {

    using eosio::name;

    static const name EscrowContract = name("mart.escrow");
    static const name TokenContract  = name("eosio.token");
}
