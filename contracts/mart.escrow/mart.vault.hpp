/** MartVault header file
 *  Description: Custody of listed assets. The vault moves assets between sellers, buyers and
 *  the escrow account through the asset contract's own transfer action and keeps a counter of
 *  what the escrow account holds for every (contract, item) pair.
 *  @file mart.vault.hpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#pragma once

#include <mart.common/mart.common.hpp>
#include <string>

namespace martio {

    using namespace eosio;

    enum class asset_kind : uint8_t {
        unique   = 0,   // indivisible item, always moved one at a time
        fungible = 1    // divisible-by-id item, moved in an explicit quantity
    };

    inline bool is_known_kind(const uint8_t &kind) {
        return kind == static_cast<uint8_t>(asset_kind::unique) ||
               kind == static_cast<uint8_t>(asset_kind::fungible);
    }

    inline bool is_valid_quantity(const asset_kind kind, const uint64_t &amount) {
        switch (kind) {
            case asset_kind::unique:
                return amount == 1;
            case asset_kind::fungible:
                return amount > 0;
        }
        return false;
    }

    struct asset_ref {
        name     contract;
        uint64_t item_id = 0;
    };

    struct [[eosio::table, eosio::contract("MartEscrow")]] custody {
        uint64_t id = 0;
        name     asset_contract;
        uint64_t item_id = 0;
        uint8_t  kind = 0;
        uint64_t amount = 0;

        uint64_t primary_key() const { return id; }
        uint128_t by_asset() const { return asset_key(asset_contract, item_id); }

        EOSLIB_SERIALIZE(custody, (id)(asset_contract)(item_id)(kind)(amount))
    };

    typedef multi_index<"custodies"_n, custody,
            indexed_by<"byasset"_n, const_mem_fun<custody, uint128_t, &custody::by_asset>>
    >
    custodies_table;

    class custody_vault {
    public:
        custody_vault(const name &self, custodies_table &custodies) : self(self), custodies(custodies) {}

        // Pulls the asset from the seller. Requires the seller to have delegated
        // mart.escrow@eosio.code on its active permission.
        void hold_from_seller(const asset_ref &ref, const asset_kind kind, const uint64_t &amount,
                              const name &seller) {
            credit(ref, kind, amount);
            send_transfer(ref, kind, amount, seller, self, permission_level{seller, "active"_n},
                          string("Marketplace custody"));
        }

        void release_to(const asset_ref &ref, const asset_kind kind, const uint64_t &amount,
                        const name &recipient) {
            debit(ref, kind, amount);
            send_transfer(ref, kind, amount, self, recipient, permission_level{self, "active"_n},
                          string("Marketplace release"));
        }

    private:
        name            self;
        custodies_table &custodies;

        void credit(const asset_ref &ref, const asset_kind kind, const uint64_t &amount) {
            auto custodybyasset = custodies.get_index<"byasset"_n>();
            auto custody_iter   = custodybyasset.find(asset_key(ref.contract, ref.item_id));

            if (custody_iter == custodybyasset.end()) {
                const uint64_t id = custodies.available_primary_key();
                custodies.emplace(self, [&](struct custody &c) {
                    c.id             = id;
                    c.asset_contract = ref.contract;
                    c.item_id        = ref.item_id;
                    c.kind           = static_cast<uint8_t>(kind);
                    c.amount         = amount;
                });
                return;
            }

            mart_424_assert(custody_iter->kind == static_cast<uint8_t>(kind), "kind",
                            to_string(static_cast<uint8_t>(kind)),
                            "Asset already held under a different kind", ErrorAlreadyInCustody);
            mart_424_assert(kind != asset_kind::unique, "item_id", to_string(ref.item_id),
                            "Unique asset already in custody", ErrorAlreadyInCustody);

            custodybyasset.modify(custody_iter, self, [&](auto &row) {
                row.amount += amount;
            });
        }

        void debit(const asset_ref &ref, const asset_kind kind, const uint64_t &amount) {
            auto custodybyasset = custodies.get_index<"byasset"_n>();
            auto custody_iter   = custodybyasset.find(asset_key(ref.contract, ref.item_id));

            mart_424_assert(custody_iter != custodybyasset.end() && custody_iter->amount >= amount &&
                            custody_iter->kind == static_cast<uint8_t>(kind),
                            "item_id", to_string(ref.item_id), "Insufficient custody",
                            ErrorInsufficientCustody);

            if (custody_iter->amount == amount) {
                custodybyasset.erase(custody_iter);
            } else {
                custodybyasset.modify(custody_iter, self, [&](auto &row) {
                    row.amount -= amount;
                });
            }
        }

        void send_transfer(const asset_ref &ref, const asset_kind kind, const uint64_t &amount,
                           const name &from, const name &to, const permission_level &auth,
                           const string &memo) {
            switch (kind) {
                case asset_kind::unique:
                    action(auth, ref.contract, "transfer"_n,
                           std::make_tuple(from, to, ref.item_id, memo)
                    ).send();
                    break;
                case asset_kind::fungible:
                    action(auth, ref.contract, "transfer"_n,
                           std::make_tuple(from, to, ref.item_id, amount, memo)
                    ).send();
                    break;
            }
        }
    };
}
