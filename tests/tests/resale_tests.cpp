/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#include <boost/test/unit_test.hpp>

#include <keymarket/chain/database.hpp>
#include <keymarket/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace keymarket::chain;
using namespace keymarket::db;

BOOST_FIXTURE_TEST_SUITE( resale_tests, database_fixture )

BOOST_AUTO_TEST_CASE( list_and_buy_with_royalty )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 1000 );
   fund( carol, 20000 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 1000, 0, 500, true, 3 ) );
   const game_id_type game = db.get_game( "g1" ).get_id();
   const license_key_id_type key = purchase( "g1", license, bob );
   authenticate( key, bob );

   const resale_listing_id_type listing_id = list_key( key, bob, 10000 );

   // the key left the key index and lives inside the listing
   KEYMARKET_REQUIRE_THROW( db.get_license_key( key ), license_key_not_found );
   BOOST_CHECK_EQUAL( db.get_license_keys_by_owner( bob ).size(), 0u );
   const resale_listing_object& listing = db.get_listing( listing_id );
   BOOST_CHECK( listing.get_key_id() == key );
   BOOST_CHECK( listing.key.owner == bob );
   BOOST_CHECK( listing.seller == bob );
   BOOST_CHECK_EQUAL( listing.price.value, 10000 );
   BOOST_CHECK_EQUAL( listing.reseller_name, "reseller" );
   BOOST_CHECK_EQUAL( db.get_resale_market().active_listings, 1u );

   {
      const auto& ops = db.get_applied_operations();
      BOOST_REQUIRE_EQUAL( ops.size(), 2u );
      BOOST_REQUIRE( ops[1]->op.is_type<license_listed_operation>() );
      const auto& listed = ops[1]->op.get<license_listed_operation>();
      BOOST_CHECK( listed.listing == listing_id );
      BOOST_CHECK( listed.key == key );
      BOOST_CHECK( listed.seller == bob );
      BOOST_CHECK_EQUAL( listed.price.value, 10000 );
   }

   const share_type sales_before = db.get_game_escrow_balance( game, sales_escrow );
   const license_key_id_type bought = buy_listing( listing_id, carol );

   // 5% royalty on 10000
   BOOST_CHECK( bought == key );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 10000 );
   BOOST_CHECK_EQUAL( db.get_game_escrow_balance( game, royalty_escrow ).value, 500 );
   BOOST_CHECK_EQUAL( db.get_payout_escrow_balance( bob ).value, 9500 );
   BOOST_CHECK_EQUAL( db.get_game_escrow_balance( game, sales_escrow ).value, sales_before.value );
   // resale pays no platform fee
   BOOST_CHECK_EQUAL( db.get_marketplace().purchase_fees.get_amount().value, 10 );

   // the key is back under its original id, only the owner changed
   const license_key_object& resold = db.get_license_key( key );
   BOOST_CHECK( resold.owner == carol );
   BOOST_CHECK( resold.user == bob );
   BOOST_CHECK_EQUAL( resold.auth_count, 1u );
   BOOST_CHECK( resold.license == license );
   BOOST_CHECK_EQUAL( db.get_license_keys_by_owner( carol ).size(), 1u );

   KEYMARKET_REQUIRE_THROW( db.get_listing( listing_id ), listing_not_found );
   BOOST_CHECK_EQUAL( db.get_resale_market().active_listings, 0u );
   BOOST_CHECK_EQUAL( db.get_resale_market().completed_resales, 1u );

   const auto& ops = db.get_applied_operations();
   BOOST_REQUIRE_EQUAL( ops.size(), 2u );
   BOOST_REQUIRE( ops[1]->op.is_type<license_resold_operation>() );
   const auto& resold_op = ops[1]->op.get<license_resold_operation>();
   BOOST_CHECK( resold_op.listing == listing_id );
   BOOST_CHECK( resold_op.key == key );
   BOOST_CHECK( resold_op.seller == bob );
   BOOST_CHECK( resold_op.buyer == carol );
   BOOST_CHECK_EQUAL( resold_op.price_paid.value, 10000 );
   BOOST_CHECK_EQUAL( resold_op.royalty.value, 500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( zero_royalty_creates_no_escrow )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 100 );
   fund( carol, 100 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100, 0, 0 ) );
   const license_key_id_type key = purchase( "g1", license, bob );

   buy_listing( list_key( key, bob, 80 ), carol );
   BOOST_CHECK( db.find_game_escrow( db.get_game( "g1" ).get_id(), royalty_escrow ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_payout_escrow_balance( bob ).value, 80 );
   BOOST_CHECK_EQUAL( db.get_applied_operations().back()->op.get<license_resold_operation>().royalty.value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( listing_requires_owner_and_permission )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 1000 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type open = create_license( "g1", cap, alice, make_license_options( 100, 0, 0, true, 1 ) );
   const license_id_type closed = create_license( "g1", cap, alice, make_license_options( 100, 0, 0, false, 1 ) );
   const license_key_id_type open_key = purchase( "g1", open, bob );
   const license_key_id_type closed_key = purchase( "g1", closed, bob );

   KEYMARKET_REQUIRE_THROW( list_key( open_key, carol, 10 ), not_owner );
   KEYMARKET_REQUIRE_THROW( list_key( closed_key, bob, 10 ), resale_not_permitted );
   KEYMARKET_REQUIRE_THROW( list_key( license_key_id_type( 99 ), bob, 10 ), license_key_not_found );

   // a key whose every activation is used up can not be sold
   authenticate( open_key, bob );
   KEYMARKET_REQUIRE_THROW( list_key( open_key, bob, 10 ), auth_limit_exceeded );

   BOOST_CHECK_EQUAL( db.get_resale_market().active_listings, 0u );
   BOOST_CHECK_EQUAL( db.get_license_keys_by_owner( bob ).size(), 2u );

   resale_list_operation op;
   op.key = open_key;
   op.price = -1;
   KEYMARKET_REQUIRE_THROW( op.validate(), fc::assert_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( resale_permission_is_read_live )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   fund( bob, 100 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100 ) );
   const license_key_id_type key = purchase( "g1", license, bob );

   license_update_operation op;
   op.game_key = "g1";
   op.license = license;
   op.capability = cap;
   op.new_permit_resale = false;
   push_op( op, alice );

   KEYMARKET_REQUIRE_THROW( list_key( key, bob, 10 ), resale_not_permitted );

   op.new_permit_resale = true;
   push_op( op, alice );
   list_key( key, bob, 10 );
   BOOST_CHECK_EQUAL( db.get_resale_market().active_listings, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( buy_requires_exact_payment )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 100 );
   fund( carol, 1000 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100 ) );
   const license_key_id_type key = purchase( "g1", license, bob );
   const resale_listing_id_type listing = list_key( key, bob, 300 );

   resale_buy_operation op;
   op.listing = listing;
   op.buyer = carol;
   op.payment = 299;
   KEYMARKET_REQUIRE_THROW( push_op( op, carol ), insufficient_funds );
   op.payment = 301;
   KEYMARKET_REQUIRE_THROW( push_op( op, carol ), insufficient_funds );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 1000 );
   BOOST_CHECK( db.get_listing( listing ).key.owner == bob );

   op.payment = 300;
   push_op( op, carol );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 700 );

   // the listing is gone once sold
   KEYMARKET_REQUIRE_THROW( push_op( op, carol ), listing_not_found );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 700 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( buy_without_funds_keeps_listing )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 100 );
   fund( carol, 50 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100, 0, 1000 ) );
   const license_key_id_type key = purchase( "g1", license, bob );
   const resale_listing_id_type listing = list_key( key, bob, 60 );

   KEYMARKET_REQUIRE_THROW( buy_listing( listing, carol ), insufficient_balance );
   BOOST_CHECK( db.get_listing( listing ).seller == bob );
   BOOST_CHECK_EQUAL( db.get_resale_market().active_listings, 1u );
   BOOST_CHECK_EQUAL( db.get_payout_escrow_balance( bob ).value, 0 );
   BOOST_CHECK( db.find_payout_escrow( bob ) == nullptr );
   BOOST_CHECK( db.find_game_escrow( db.get_game( "g1" ).get_id(), royalty_escrow ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_listing )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 100 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100, 0, 0, true, 2 ) );
   const license_key_id_type key = purchase( "g1", license, bob );
   authenticate( key, bob );
   const resale_listing_id_type listing = list_key( key, bob, 30 );

   resale_cancel_operation op;
   op.listing = listing;
   KEYMARKET_REQUIRE_THROW( push_op( op, carol ), not_owner );
   BOOST_CHECK_EQUAL( db.get_resale_market().active_listings, 1u );

   push_op( op, bob );
   KEYMARKET_REQUIRE_THROW( db.get_listing( listing ), listing_not_found );
   BOOST_CHECK_EQUAL( db.get_resale_market().active_listings, 0u );
   BOOST_CHECK_EQUAL( db.get_resale_market().completed_resales, 0u );

   const license_key_object& returned = db.get_license_key( key );
   BOOST_CHECK( returned.owner == bob );
   BOOST_CHECK( returned.user == bob );
   BOOST_CHECK_EQUAL( returned.auth_count, 1u );

   KEYMARKET_REQUIRE_THROW( push_op( op, bob ), listing_not_found );

   // the key can be listed again
   const resale_listing_id_type relisted = list_key( key, bob, 40 );
   BOOST_CHECK( relisted != listing );
   BOOST_CHECK_EQUAL( db.get_listing( relisted ).price.value, 40 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( listing_price_is_converted_at_purchase )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 100 );
   fund( carol, 10000 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100 ) );
   const license_key_id_type key = purchase( "g1", license, bob );
   const resale_listing_id_type listing = list_key( key, bob, 25 );

   db.set_price_oracle( std::make_shared<fixed_ratio_price_oracle>( 100 ) );
   buy_listing( listing, carol );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 7500 );
   BOOST_CHECK_EQUAL( db.get_payout_escrow_balance( bob ).value, 2500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
