#include "mart.escrow_tester.hpp"

using namespace mart_tests;

BOOST_AUTO_TEST_SUITE(listing_tests)

BOOST_FIXTURE_TEST_CASE(list_unique_asset_moves_it_into_custody, mart_escrow_tester) try {
   issue_unique(N(alice), 42);

   BOOST_REQUIRE_EQUAL(success(), list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(1000000)));

   auto listing = get_listing(0);
   BOOST_REQUIRE(!listing.is_null());
   BOOST_REQUIRE_EQUAL(listing["seller"].as_string(), "alice");
   BOOST_REQUIRE_EQUAL(listing["asset_contract"].as_string(), "test.unique");
   BOOST_REQUIRE_EQUAL(listing["item_id"].as_uint64(), 42u);
   BOOST_REQUIRE_EQUAL(listing["kind"].as_uint64(), 0u);
   BOOST_REQUIRE_EQUAL(listing["amount"].as_uint64(), 1u);
   BOOST_REQUIRE_EQUAL(listing["price"].as_string(), "100.0000 SYS");
   BOOST_REQUIRE_EQUAL(listing["status"].as_uint64(), status_active);

   BOOST_REQUIRE_EQUAL(unique_owner(42), N(mart.escrow));

   auto custody = get_custody(0);
   BOOST_REQUIRE(!custody.is_null());
   BOOST_REQUIRE_EQUAL(custody["item_id"].as_uint64(), 42u);
   BOOST_REQUIRE_EQUAL(custody["amount"].as_uint64(), 1u);

   BOOST_REQUIRE_EQUAL(get_state()["next_listing_id"].as_uint64(), 1u);
   BOOST_REQUIRE_EQUAL(get_state()["locked"].as_bool(), false);
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(list_fungible_asset_moves_the_listed_quantity, mart_escrow_tester) try {
   issue_fungible(N(bob), 7, 100);

   BOOST_REQUIRE_EQUAL(success(), list_asset(N(bob), N(test.multi), 7, fungible_kind, 40, sys(500000)));

   BOOST_REQUIRE_EQUAL(fungible_balance(N(bob), 7), 60u);
   BOOST_REQUIRE_EQUAL(fungible_balance(N(mart.escrow), 7), 40u);
   BOOST_REQUIRE_EQUAL(get_listing(0)["amount"].as_uint64(), 40u);

   // a second listing of the same item adds to the custody counter
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(bob), N(test.multi), 7, fungible_kind, 10, sys(100000)));
   BOOST_REQUIRE_EQUAL(fungible_balance(N(mart.escrow), 7), 50u);
   BOOST_REQUIRE_EQUAL(get_custody(0)["amount"].as_uint64(), 50u);
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(list_rejects_invalid_input_before_custody, mart_escrow_tester) try {
   issue_unique(N(alice), 42);
   issue_fungible(N(alice), 7, 100);

   require_failure(list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(0)),
                   "validation_error", "Price should be a positive amount of the native token");
   require_failure(list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(-5)),
                   "validation_error", "Price should be a positive amount of the native token");
   require_failure(list_asset(N(alice), N(test.unique), 42, unique_kind, 1, asset(100, symbol(4, "ABC"))),
                   "validation_error", "Price should be a positive amount of the native token");
   require_failure(list_asset(N(alice), N(test.multi), 7, fungible_kind, 0, sys(100)),
                   "validation_error", "Amount should be positive");
   require_failure(list_asset(N(alice), N(test.unique), 42, unique_kind, 0, sys(100)),
                   "validation_error", "Amount should be positive");
   require_failure(list_asset(N(alice), N(test.unique), 42, unique_kind, 2, sys(100)),
                   "validation_error", "Unique assets are listed with an amount of 1");
   require_failure(list_asset(N(alice), N(test.unique), 42, 2, 1, sys(100)),
                   "validation_error", "Asset kind should be 0 (unique) or 1 (fungible)");
   require_failure(list_asset(N(alice), N(nosuchacct), 42, unique_kind, 1, sys(100)),
                   "validation_error", "Asset contract is not an account");

   BOOST_REQUIRE_EQUAL(unique_owner(42), N(alice));
   BOOST_REQUIRE_EQUAL(fungible_balance(N(alice), 7), 100u);
   BOOST_REQUIRE(get_listing(0).is_null());
   BOOST_REQUIRE(get_custody(0).is_null());
   BOOST_REQUIRE_EQUAL(get_state()["next_listing_id"].as_uint64(), 0u);
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(list_fails_when_the_seller_does_not_hold_the_asset, mart_escrow_tester) try {
   issue_unique(N(bob), 43);
   issue_fungible(N(alice), 7, 5);

   BOOST_REQUIRE(success() != list_asset(N(alice), N(test.unique), 43, unique_kind, 1, sys(100)));
   BOOST_REQUIRE(success() != list_asset(N(alice), N(test.multi), 7, fungible_kind, 6, sys(100)));

   BOOST_REQUIRE_EQUAL(unique_owner(43), N(bob));
   BOOST_REQUIRE_EQUAL(fungible_balance(N(alice), 7), 5u);
   BOOST_REQUIRE(get_listing(0).is_null());
   BOOST_REQUIRE(get_custody(0).is_null());
   BOOST_REQUIRE_EQUAL(get_state()["next_listing_id"].as_uint64(), 0u);
   BOOST_REQUIRE_EQUAL(get_state()["locked"].as_bool(), false);
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(list_rejects_an_asset_already_in_custody, mart_escrow_tester) try {
   issue_unique(N(alice), 42);
   issue_fungible(N(bob), 7, 100);
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(100)));
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(bob), N(test.multi), 7, fungible_kind, 40, sys(100)));

   require_failure(list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(100)),
                   "transfer_failure", "Unique asset already in custody");
   require_failure(list_asset(N(bob), N(test.multi), 7, unique_kind, 1, sys(100)),
                   "transfer_failure", "Asset already held under a different kind");

   BOOST_REQUIRE_EQUAL(get_custody(0)["amount"].as_uint64(), 1u);
   BOOST_REQUIRE_EQUAL(get_custody(1)["amount"].as_uint64(), 40u);
   BOOST_REQUIRE_EQUAL(fungible_balance(N(bob), 7), 60u);
   BOOST_REQUIRE(get_listing(2).is_null());
   BOOST_REQUIRE_EQUAL(get_state()["next_listing_id"].as_uint64(), 2u);
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(list_fails_without_seller_delegation, mart_escrow_tester) try {
   issue_unique(N(dave), 44);

   BOOST_REQUIRE(success() != list_asset(N(dave), N(test.unique), 44, unique_kind, 1, sys(100)));
   BOOST_REQUIRE_EQUAL(unique_owner(44), N(dave));
   BOOST_REQUIRE(get_listing(0).is_null());
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(list_requires_seller_authority, mart_escrow_tester) try {
   issue_unique(N(alice), 42);

   BOOST_REQUIRE_EQUAL(error("missing authority of alice"),
                       push_escrow_action(N(bob), N(listasset), mvo()
                          ("seller", "alice")
                          ("asset_contract", "test.unique")
                          ("item_id", 42)
                          ("kind", unique_kind)
                          ("amount", 1)
                          ("price", sys(100))
                       ));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(listing_ids_are_never_reused, mart_escrow_tester) try {
   issue_unique(N(alice), 42);
   issue_unique(N(alice), 43);

   BOOST_REQUIRE_EQUAL(success(), list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(100)));
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(alice), N(test.unique), 43, unique_kind, 1, sys(200)));
   BOOST_REQUIRE_EQUAL(success(), cancel(N(alice), 0));

   // the returned item goes back on sale under a new id
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(300)));

   BOOST_REQUIRE_EQUAL(listing_status(0), status_cancelled);
   BOOST_REQUIRE_EQUAL(get_listing(2)["item_id"].as_uint64(), 42u);
   BOOST_REQUIRE_EQUAL(get_listing(2)["price"].as_string(), "0.0300 SYS");
   BOOST_REQUIRE_EQUAL(get_state()["next_listing_id"].as_uint64(), 3u);
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(cancel_returns_the_asset_to_the_seller, mart_escrow_tester) try {
   issue_unique(N(alice), 42);
   issue_fungible(N(bob), 7, 100);
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(1000000)));
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(bob), N(test.multi), 7, fungible_kind, 30, sys(500000)));

   BOOST_REQUIRE_EQUAL(success(), cancel(N(alice), 0));
   BOOST_REQUIRE_EQUAL(unique_owner(42), N(alice));
   BOOST_REQUIRE_EQUAL(listing_status(0), status_cancelled);

   BOOST_REQUIRE_EQUAL(success(), cancel(N(bob), 1));
   BOOST_REQUIRE_EQUAL(fungible_balance(N(bob), 7), 100u);
   BOOST_REQUIRE_EQUAL(fungible_balance(N(mart.escrow), 7), 0u);
   BOOST_REQUIRE_EQUAL(listing_status(1), status_cancelled);

   // nothing left in custody
   BOOST_REQUIRE(get_custody(0).is_null());
   BOOST_REQUIRE(get_custody(1).is_null());
   BOOST_REQUIRE_EQUAL(get_state()["locked"].as_bool(), false);
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(failed_return_keeps_the_listing_active, mart_escrow_tester) try {
   issue_unique(N(test.hostile), 50);
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(test.hostile), N(test.unique), 50, unique_kind, 1, sys(1000000)));
   set_hostile_refusal(true);

   BOOST_REQUIRE_EQUAL(wasm_assert_msg("item refused"), cancel(N(test.hostile), 0));

   BOOST_REQUIRE_EQUAL(listing_status(0), status_active);
   BOOST_REQUIRE_EQUAL(get_custody(0)["amount"].as_uint64(), 1u);
   BOOST_REQUIRE_EQUAL(unique_owner(50), N(mart.escrow));
   BOOST_REQUIRE_EQUAL(get_state()["locked"].as_bool(), false);
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(cancel_is_reserved_to_the_seller, mart_escrow_tester) try {
   issue_unique(N(alice), 42);
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(1000000)));

   require_failure(cancel(N(bob), 0), "authorization_error", "Only the seller may cancel the listing");
   require_failure(cancel(N(mrktowner), 0), "authorization_error", "Only the seller may cancel the listing");

   BOOST_REQUIRE_EQUAL(listing_status(0), status_active);
   BOOST_REQUIRE_EQUAL(unique_owner(42), N(mart.escrow));
} FC_LOG_AND_RETHROW()

BOOST_FIXTURE_TEST_CASE(cancel_rejects_missing_and_inactive_listings, mart_escrow_tester) try {
   issue_unique(N(alice), 42);
   BOOST_REQUIRE_EQUAL(success(), list_asset(N(alice), N(test.unique), 42, unique_kind, 1, sys(1000000)));

   require_failure(cancel(N(alice), 99), "state_error", "Listing not found");

   BOOST_REQUIRE_EQUAL(success(), cancel(N(alice), 0));
   require_failure(cancel(N(alice), 0), "state_error", "Listing is not active");

   BOOST_REQUIRE_EQUAL(unique_owner(42), N(alice));
} FC_LOG_AND_RETHROW()

BOOST_AUTO_TEST_SUITE_END()
