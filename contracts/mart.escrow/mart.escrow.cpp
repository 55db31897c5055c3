/** MartEscrow implementation file
 *  Description: MartEscrow is the smart contract that holds assets in escrow while they are
 *  listed and settles their sale. A purchase pays the marketplace fee to the fee recipient
 *  and the rest of the price to the seller, then releases the asset to the buyer.
 *  @file mart.escrow.cpp
 *  @license FIO Foundation ( https://github.com/fioprotocol/fio/blob/master/LICENSE )
 */

#include "mart.escrow.hpp"
#include "mart.vault.hpp"
#include <eosiolib/eosio.hpp>
#include <eosiolib/asset.hpp>
#include <mart.common/mart.common.hpp>

namespace martio {

    /***
     * Every action that changes marketplace state runs under the engine lock held in mrktstate.
     * Payments and asset moves are inline actions that reach accounts outside this contract
     * (through transfer notifications) before the action's effects are final, and any of those
     * accounts may try to call back into the marketplace. The lock is released by the unlock
     * inline action, queued after all the others. Inline actions execute depth first, so
     * unlock runs only once every transfer, and everything sent from its notifications, has
     * finished. A call arriving while the lock is held aborts the whole transaction.
     */
    class [[eosio::contract("MartEscrow")]] MartEscrow : public eosio::contract {
    private:
        listings_table       listings;
        custodies_table      custodies;
        mrktconfig_singleton configSingleton;
        mrktstate_singleton  stateSingleton;
        mrktconfig           appConfig;
        mrktstate            appState;

        void assert_initialized() {
            mart_409_assert(configSingleton.exists(), "marketplace", get_self().to_string(),
                            "Marketplace not initialized", ErrorNotInitialized);
        }

        void assert_marketplace_open() {
            assert_initialized();
            mart_409_assert(appConfig.e_break == 0, "e_break", to_string(appConfig.e_break),
                            "E-Break Enabled, action disabled", ErrorEBreakEnabled);
        }

        void assert_owner(const name &actor) {
            mart_403_assert(actor == appConfig.owner, "actor", actor.to_string(),
                            "Only owner of marketplace can modify config", ErrorNotOwner);
        }

        void assert_valid_fee(const uint64_t &fee_bps) {
            mart_400_assert(fee_bps <= MAXFEEBPS, "fee_bps", to_string(fee_bps),
                            "Fee should be between 0 and 1000 basis points", ErrorInvalidFee);
        }

        void assert_valid_recipient(const name &fee_recipient) {
            mart_400_assert(fee_recipient.value != 0, "fee_recipient", fee_recipient.to_string(),
                            "Fee recipient must not be empty", ErrorInvalidRecipient);
            mart_400_assert(is_account(fee_recipient), "fee_recipient", fee_recipient.to_string(),
                            "Fee recipient is not an account", ErrorInvalidRecipient);
        }

        void enter_guard() {
            mart_423_assert(!appState.locked, "engine", get_self().to_string(),
                            "Reentrant call rejected, a marketplace action is in progress",
                            ErrorReentrantCall);
            appState.locked = true;
            stateSingleton.set(appState, get_self());
        }

        // must be the last inline action the guarded action sends
        void exit_guard() {
            action(permission_level{get_self(), "active"_n},
                   get_self(), "unlock"_n,
                   std::make_tuple()
            ).send();
        }

        listings_table::const_iterator find_active_listing(const uint64_t &listing_id) {
            auto listing_iter = listings.find(listing_id);
            mart_409_assert(listing_iter != listings.end(), "listing_id", to_string(listing_id),
                            "Listing not found", ErrorListingNotFound);
            mart_409_assert(listing_iter->is_active(), "listing_id", to_string(listing_id),
                            "Listing is not active", ErrorListingInactive);
            return listing_iter;
        }

        void assert_exact_payment(const asset &paid, const asset &expected, const char *message) {
            mart_402_assert(paid.symbol == expected.symbol && paid.amount == expected.amount,
                            "paid", paid.to_string(), message, ErrorPaymentMismatch);
        }

        // A party paying itself (buyer is the seller or the fee recipient) keeps its share, no transfer is sent.
        void send_payment(const name &from, const name &to, const asset &quantity, const string &memo) {
            if (from == to) {
                return;
            }
            action(permission_level{from, "active"_n},
                   TokenContract, "transfer"_n,
                   make_tuple(from, to, quantity, memo)
            ).send();
        }

        uint64_t listasset_update(const name &seller, const name &asset_contract, const uint64_t &item_id,
                                  const uint8_t &kind, const uint64_t &amount, const asset &price) {
            const uint64_t id = appState.next_listing_id;
            appState.next_listing_id++;
            stateSingleton.set(appState, get_self());

            const uint64_t present = present_time();
            listings.emplace(seller, [&](struct listing &l) {
                l.id             = id;
                l.seller         = seller;
                l.asset_contract = asset_contract;
                l.item_id        = item_id;
                l.kind           = kind;
                l.amount         = amount;
                l.price          = price;
                l.status         = LISTING_ACTIVE;
                l.date_listed    = present;
                l.date_updated   = present;
            });
            return id;
        }
        // listasset_update

        // Pays the fee recipient and the seller out of the buyer's account, hands the asset to
        // the buyer and closes the listing. The caller has checked the listing is active and
        // that the buyer paid its price.
        void settle_listing(const listings_table::const_iterator &listing_iter, const name &buyer) {
            const asset   price          = listing_iter->price;
            const int64_t fee            = compute_marketplace_fee(price.amount, appConfig.fee_bps);
            const asset   toFeeRecipient = asset(fee, price.symbol);
            const asset   toSeller       = asset(price.amount - fee, price.symbol);

            if (toFeeRecipient.amount > 0) {
                send_payment(buyer, appConfig.fee_recipient, toFeeRecipient, string("Marketplace fee"));
            }
            send_payment(buyer, listing_iter->seller, toSeller, string("Marketplace sale"));

            custody_vault vault(get_self(), custodies);
            vault.release_to(asset_ref{listing_iter->asset_contract, listing_iter->item_id},
                             static_cast<asset_kind>(listing_iter->kind), listing_iter->amount, buyer);

            listings.modify(listing_iter, same_payer, [&](auto &row) {
                row.status       = LISTING_SOLD;
                row.buyer        = buyer;
                row.date_updated = present_time();
            });
        }
        // settle_listing

    public:
        using contract::contract;

        MartEscrow(name s, name code, datastream<const char *> ds) :
                contract(s, code, ds),
                listings(_self, _self.value),
                custodies(_self, _self.value),
                configSingleton(_self, _self.value),
                stateSingleton(_self, _self.value) {
            appConfig = configSingleton.get_or_default(mrktconfig());
            appState  = stateSingleton.get_or_default(mrktstate());
        }

        /***********
         * Sets up the marketplace. Can be called once, by the contract account.
         * @param owner the account allowed to change the fee policy from now on
         * @param fee_recipient the account receiving the marketplace fee
         * @param fee_bps the marketplace fee in basis points, at most 1000
         */
        [[eosio::action]]
        void init(const name &owner, const name &fee_recipient, const uint64_t &fee_bps) {
            require_auth(get_self());

            mart_409_assert(!configSingleton.exists(), "marketplace", get_self().to_string(),
                            "Marketplace already initialized", ErrorAlreadyInitialized);
            mart_400_assert(is_account(owner), "owner", owner.to_string(),
                            "Owner is not an account", ErrorInvalidOwner);
            assert_valid_recipient(fee_recipient);
            assert_valid_fee(fee_bps);

            appConfig.owner         = owner;
            appConfig.fee_recipient = fee_recipient;
            appConfig.fee_bps       = fee_bps;
            appConfig.e_break       = 0;
            configSingleton.set(appConfig, get_self());
            stateSingleton.set(appState, get_self());

            print("init -- marketplace owned by ", owner, "\n");
        }
        // init

        /***********
         * This action will list an asset for sale. The asset is moved into the custody of
         * `mart.escrow` for as long as the listing is active.
         * @param seller the account selling the asset, it must have delegated mart.escrow@eosio.code
         * @param asset_contract the contract managing the asset
         * @param item_id the id of the item inside asset_contract
         * @param kind 0 for a unique asset, 1 for a fungible asset
         * @param amount the quantity listed, always 1 for a unique asset
         * @param price the price of the whole listing in the native symbol
         */
        [[eosio::action]]
        void listasset(const name &seller, const name &asset_contract, const uint64_t &item_id,
                       const uint8_t &kind, const uint64_t &amount, const asset &price) {
            require_auth(seller);
            assert_marketplace_open();
            enter_guard();

            mart_400_assert(is_known_kind(kind), "kind", to_string(kind),
                            "Asset kind should be 0 (unique) or 1 (fungible)", ErrorInvalidAssetKind);
            mart_400_assert(is_account(asset_contract), "asset_contract", asset_contract.to_string(),
                            "Asset contract is not an account", ErrorInvalidAssetContract);
            mart_400_assert(is_valid_price(price), "price", price.to_string(),
                            "Price should be a positive amount of the native token", ErrorInvalidPrice);
            mart_400_assert(amount > 0, "amount", to_string(amount),
                            "Amount should be positive", ErrorInvalidAmount);

            const asset_kind assetKind = static_cast<asset_kind>(kind);
            mart_400_assert(is_valid_quantity(assetKind, amount), "amount", to_string(amount),
                            "Unique assets are listed with an amount of 1", ErrorKindAmountMismatch);

            custody_vault vault(get_self(), custodies);
            vault.hold_from_seller(asset_ref{asset_contract, item_id}, assetKind, amount, seller);

            const uint64_t listing_id = listasset_update(seller, asset_contract, item_id, kind, amount, price);

            print("listasset -- listing ", listing_id, " created by ", seller, "\n");

            action(permission_level{get_self(), "active"_n},
                   get_self(), "listed"_n,
                   std::make_tuple(listing_id, seller, asset_contract, item_id, amount, price, kind)
            ).send();

            exit_guard();
        }
        // listasset

        /***********
         * This action will cancel a listing and return the asset to the seller.
         * @param actor the account that listed the asset
         * @param listing_id the id of the listing
         */
        [[eosio::action]]
        void cxlisting(const name &actor, const uint64_t &listing_id) {
            require_auth(actor);
            assert_initialized();
            enter_guard();

            auto listing_iter = listings.find(listing_id);
            mart_409_assert(listing_iter != listings.end(), "listing_id", to_string(listing_id),
                            "Listing not found", ErrorListingNotFound);
            mart_403_assert(listing_iter->seller == actor, "actor", actor.to_string(),
                            "Only the seller may cancel the listing", ErrorNotSeller);
            mart_409_assert(listing_iter->is_active(), "listing_id", to_string(listing_id),
                            "Listing is not active", ErrorListingInactive);

            custody_vault vault(get_self(), custodies);
            vault.release_to(asset_ref{listing_iter->asset_contract, listing_iter->item_id},
                             static_cast<asset_kind>(listing_iter->kind), listing_iter->amount, actor);

            listings.modify(listing_iter, same_payer, [&](auto &row) {
                row.status       = LISTING_CANCELLED;
                row.date_updated = present_time();
            });

            print("cxlisting -- listing ", listing_id, " cancelled\n");

            action(permission_level{get_self(), "active"_n},
                   get_self(), "cancelled"_n,
                   std::make_tuple(listing_id, actor)
            ).send();

            exit_guard();
        }
        // cxlisting

        /***********
         * This action will buy a listed asset.
         * @param buyer the account buying, it must have delegated mart.escrow@eosio.code
         * @param listing_id the id of the listing
         * @param paid the payment, it must equal the listing price exactly
         */
        [[eosio::action]]
        void buylisting(const name &buyer, const uint64_t &listing_id, const asset &paid) {
            require_auth(buyer);
            assert_marketplace_open();
            enter_guard();

            auto listing_iter = find_active_listing(listing_id);
            assert_exact_payment(paid, listing_iter->price, "Payment should equal the listing price");

            settle_listing(listing_iter, buyer);

            print("buylisting -- listing ", listing_id, " sold to ", buyer, "\n");

            action(permission_level{get_self(), "active"_n},
                   get_self(), "bought"_n,
                   std::make_tuple(listing_id, buyer, paid)
            ).send();

            exit_guard();
        }
        // buylisting

        /***********
         * This action will buy several listings with one payment. Either every listing is
         * bought or none is. Listing ids are not deduplicated: an id given twice fails the
         * batch, since the listing is no longer active the second time it is settled.
         * @param buyer the account buying, it must have delegated mart.escrow@eosio.code
         * @param listing_ids the listings to buy, settled in this order
         * @param paid the payment, it must equal the sum of the listing prices exactly
         */
        [[eosio::action]]
        void buybatch(const name &buyer, const vector<uint64_t> &listing_ids, const asset &paid) {
            require_auth(buyer);
            assert_marketplace_open();
            enter_guard();

            mart_400_assert(!listing_ids.empty(), "listing_ids", "[]",
                            "Batch should contain at least one listing", ErrorInvalidBatch);
            mart_400_assert(listing_ids.size() <= MAXBATCHSIZE, "listing_ids", to_string(listing_ids.size()),
                            "Batch should contain at most 25 listings", ErrorInvalidBatch);

            // validate everything before anything moves
            asset total = asset(0, MARTSYMBOL);
            for (const uint64_t &listing_id : listing_ids) {
                auto listing_iter = find_active_listing(listing_id);
                mart_400_assert(listing_iter->price.amount <= asset::max_amount - total.amount,
                                "listing_ids", to_string(listing_id),
                                "Batch total is out of range", ErrorBatchOverflow);
                total.amount += listing_iter->price.amount;
            }

            assert_exact_payment(paid, total, "Payment should equal the sum of the listing prices");

            for (const uint64_t &listing_id : listing_ids) {
                settle_listing(find_active_listing(listing_id), buyer);
            }

            print("buybatch -- ", listing_ids.size(), " listings sold to ", buyer, "\n");

            action(permission_level{get_self(), "active"_n},
                   get_self(), "batchbought"_n,
                   std::make_tuple(buyer, listing_ids, paid)
            ).send();

            exit_guard();
        }
        // buybatch

        /***********
         * This action will set the marketplace fee applied to every purchase from now on.
         * @param actor the marketplace owner
         * @param fee_bps the fee in basis points, between 0 and 1000
         */
        [[eosio::action]]
        void setfee(const name &actor, const uint64_t &fee_bps) {
            require_auth(actor);
            assert_initialized();
            enter_guard();

            assert_owner(actor);
            assert_valid_fee(fee_bps);

            appConfig.fee_bps = fee_bps;
            configSingleton.set(appConfig, get_self());

            action(permission_level{get_self(), "active"_n},
                   get_self(), "feeupdated"_n,
                   std::make_tuple(fee_bps)
            ).send();

            exit_guard();
        }
        // setfee

        /***********
         * This action will set the account receiving the marketplace fee.
         * @param actor the marketplace owner
         * @param fee_recipient an existing account
         */
        [[eosio::action]]
        void setfeercpt(const name &actor, const name &fee_recipient) {
            require_auth(actor);
            assert_initialized();
            enter_guard();

            assert_owner(actor);
            assert_valid_recipient(fee_recipient);

            appConfig.fee_recipient = fee_recipient;
            configSingleton.set(appConfig, get_self());

            action(permission_level{get_self(), "active"_n},
                   get_self(), "rcptupdated"_n,
                   std::make_tuple(fee_recipient)
            ).send();

            exit_guard();
        }
        // setfeercpt

        /***********
         * Emergency break. While enabled no asset can be listed or bought, listings can still
         * be cancelled.
         * @param actor the marketplace owner
         * @param e_break 1 to enable, 0 to disable
         */
        [[eosio::action]]
        void setebreak(const name &actor, const uint64_t &e_break) {
            require_auth(actor);
            assert_initialized();
            enter_guard();

            assert_owner(actor);
            mart_400_assert(e_break <= 1, "e_break", to_string(e_break),
                            "E-break setting must be either 0 for disabled or 1 for enabled", ErrorInvalidEBreak);

            appConfig.e_break = e_break;
            configSingleton.set(appConfig, get_self());

            exit_guard();
        }
        // setebreak

        /***********
         * Releases the engine lock. Sent by the marketplace itself as the last inline action
         * of every state changing action.
         */
        [[eosio::action]]
        void unlock() {
            require_auth(get_self());

            mart_409_assert(appState.locked, "engine", get_self().to_string(),
                            "Marketplace is not locked", ErrorNotLocked);

            appState.locked = false;
            stateSingleton.set(appState, get_self());
        }
        // unlock

        // receipts

        [[eosio::action]]
        void listed(const uint64_t &listing_id, const name &seller, const name &asset_contract,
                    const uint64_t &item_id, const uint64_t &amount, const asset &price, const uint8_t &kind) {
            require_auth(get_self());
            require_recipient(seller);
        }

        [[eosio::action]]
        void cancelled(const uint64_t &listing_id, const name &seller) {
            require_auth(get_self());
            require_recipient(seller);
        }

        [[eosio::action]]
        void bought(const uint64_t &listing_id, const name &buyer, const asset &paid) {
            require_auth(get_self());
            require_recipient(buyer);
        }

        [[eosio::action]]
        void batchbought(const name &buyer, const vector<uint64_t> &listing_ids, const asset &paid) {
            require_auth(get_self());
            require_recipient(buyer);
        }

        [[eosio::action]]
        void feeupdated(const uint64_t &fee_bps) {
            require_auth(get_self());
        }

        [[eosio::action]]
        void rcptupdated(const name &fee_recipient) {
            require_auth(get_self());
        }
    }; // class MartEscrow

    EOSIO_DISPATCH(MartEscrow, (init)(listasset)(cxlisting)(buylisting)(buybatch)(setfee)(setfeercpt)
                               (setebreak)(unlock)(listed)(cancelled)(bought)(batchbought)(feeupdated)
                               (rcptupdated))
}
