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

BOOST_FIXTURE_TEST_SUITE( catalog_tests, database_fixture )

BOOST_AUTO_TEST_CASE( register_game_charges_submission_fee )
{ try {
   ACTORS( (alice) );
   fund( alice, 25 );

   const capability_id_type cap_id = register_game( "g1", alice );

   const game_object& game = db.get_game( "g1" );
   BOOST_CHECK_EQUAL( game.game_key, "g1" );
   BOOST_CHECK_EQUAL( game.metadata.name, "g1" );
   BOOST_CHECK( !game.sale_locked );
   BOOST_CHECK( game.creator == alice );
   BOOST_CHECK_EQUAL( db.license_count( game ), 0u );
   BOOST_CHECK_EQUAL( db.game_count(), 1u );

   // the exact submission fee moved into the platform pool
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 15 );
   BOOST_CHECK_EQUAL( db.get_marketplace().submission_fees.get_amount().value, 10 );

   const capability_object& cap = db.get_capability( cap_id );
   BOOST_CHECK( cap.kind == publisher_capability );
   BOOST_CHECK( cap.bound_id == game.id );
   BOOST_CHECK( cap.holder == alice );

   const auto& ops = db.get_applied_operations();
   BOOST_REQUIRE_EQUAL( ops.size(), 2u );
   BOOST_REQUIRE( ops[0].valid() && ops[1].valid() );
   BOOST_CHECK( ops[0]->op.is_type<game_register_operation>() );
   BOOST_CHECK( ops[0]->result.get<object_id_type>() == object_id_type( cap_id ) );
   BOOST_REQUIRE( ops[1]->op.is_type<game_registered_operation>() );
   const auto& registered = ops[1]->op.get<game_registered_operation>();
   BOOST_CHECK_EQUAL( registered.game_key, "g1" );
   BOOST_CHECK( registered.game == game.get_id() );
   BOOST_CHECK( registered.publisher == alice );
   BOOST_CHECK( registered.capability == cap_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( duplicate_game_key )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   fund( bob, 10 );

   register_game( "g1", alice );
   const game_id_type first = db.get_game( "g1" ).get_id();

   KEYMARKET_REQUIRE_THROW( register_game( "g1", bob ), duplicate_game_id );

   // the first registration is untouched and bob paid nothing
   BOOST_CHECK_EQUAL( db.game_count(), 1u );
   BOOST_CHECK( db.get_game( "g1" ).get_id() == first );
   BOOST_CHECK( db.get_game( "g1" ).creator == alice );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 10 );
   BOOST_CHECK_EQUAL( db.get_marketplace().submission_fees.get_amount().value, 10 );
   BOOST_CHECK_EQUAL( db.get_capabilities_by_holder( bob ).size(), 0u );
   // events of the failed transaction are discarded
   BOOST_CHECK_EQUAL( db.get_applied_operations().size(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( submission_fee_must_be_exact )
{ try {
   ACTORS( (alice) );
   fund( alice, 100 );

   game_register_operation op;
   op.game_key = "g1";
   op.metadata = make_metadata( "g1" );

   op.submission_fee = 9;
   KEYMARKET_REQUIRE_THROW( push_op( op, alice ), insufficient_fee );
   op.submission_fee = 11;
   KEYMARKET_REQUIRE_THROW( push_op( op, alice ), insufficient_fee );
   BOOST_CHECK( db.find_game( "g1" ) == nullptr );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 100 );

   op.submission_fee = 10;
   push_op( op, alice );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 90 );

   // the fee follows the marketplace parameters
   marketplace_update_operation update;
   update.capability = platform_capability;
   update.new_submission_fee_usd = 0;
   push_op( update, platform );

   op.game_key = "g2";
   op.submission_fee = 0;
   push_op( op, alice );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 90 );
   BOOST_CHECK_EQUAL( db.game_count(), 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( register_game_without_funds )
{ try {
   ACTORS( (alice) );
   fund( alice, 9 );

   KEYMARKET_REQUIRE_THROW( register_game( "g1", alice ), insufficient_balance );
   BOOST_CHECK( db.find_game( "g1" ) == nullptr );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 9 );
   BOOST_CHECK_EQUAL( db.get_marketplace().submission_fees.get_amount().value, 0 );

   ACTORS( (nobody) );
   KEYMARKET_REQUIRE_THROW( register_game( "g1", nobody ), insufficient_balance );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_licenses )
{ try {
   ACTORS( (alice) );
   fund( alice, 10 );
   const capability_id_type cap = register_game( "g1", alice );

   const license_id_type first = create_license( "g1", cap, alice, make_license_options( 10000, 2500, 500, true, 2 ) );
   const license_id_type second = create_license( "g1", cap, alice, make_license_options( 5000 ) );
   BOOST_CHECK( first != second );

   const game_object& game = db.get_game( "g1" );
   BOOST_CHECK_EQUAL( db.license_count( game ), 2u );

   const license_object& license = db.get_license( game, first );
   BOOST_CHECK( license.game == game.get_id() );
   BOOST_CHECK_EQUAL( license.options.publisher_price.value, 10000 );
   BOOST_CHECK_EQUAL( license.options.discount_rate, 2500 );
   BOOST_CHECK_EQUAL( license.options.royalty_rate, 500 );
   BOOST_CHECK( license.options.permit_resale );
   BOOST_CHECK_EQUAL( license.options.limit_auth_count, 2u );
   BOOST_CHECK_EQUAL( license.discounted_price().value, 7500 );

   const auto& ops = db.get_applied_operations();
   BOOST_REQUIRE_EQUAL( ops.size(), 2u );
   BOOST_REQUIRE( ops[1]->op.is_type<license_created_operation>() );
   BOOST_CHECK_EQUAL( ops[1]->op.get<license_created_operation>().game_key, "g1" );
   BOOST_CHECK( ops[1]->op.get<license_created_operation>().license == second );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( create_license_requires_publisher_capability )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   fund( bob, 10 );
   const capability_id_type alice_cap = register_game( "g1", alice );
   const capability_id_type bob_cap = register_game( "g2", bob );

   // a capability bound to another game
   KEYMARKET_REQUIRE_THROW( create_license( "g1", bob_cap, bob, make_license_options( 100 ) ), not_publisher );
   // a capability held by somebody else
   KEYMARKET_REQUIRE_THROW( create_license( "g1", alice_cap, bob, make_license_options( 100 ) ), not_authorized );
   // the platform capability is no publisher capability
   KEYMARKET_REQUIRE_THROW( create_license( "g1", platform_capability, platform, make_license_options( 100 ) ),
                            not_publisher );
   KEYMARKET_REQUIRE_THROW( create_license( "g3", alice_cap, alice, make_license_options( 100 ) ), game_not_found );

   BOOST_CHECK_EQUAL( db.license_count( db.get_game( "g1" ) ), 0u );
   BOOST_CHECK_EQUAL( db.license_count( db.get_game( "g2" ) ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( creator_without_capability_is_no_publisher )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   const capability_id_type cap = register_game( "g1", alice );

   capability_transfer_operation op;
   op.capability = cap;
   op.new_holder = bob;
   push_op( op, alice );

   // authority follows the capability, not the creator field of the game
   BOOST_CHECK( db.get_game( "g1" ).creator == alice );
   KEYMARKET_REQUIRE_THROW( create_license( "g1", cap, alice, make_license_options( 100 ) ), not_authorized );
   create_license( "g1", cap, bob, make_license_options( 100 ) );
   BOOST_CHECK_EQUAL( db.license_count( db.get_game( "g1" ) ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( catalog_lookups )
{ try {
   ACTORS( (alice) );
   fund( alice, 20 );
   const capability_id_type cap1 = register_game( "g1", alice );
   const capability_id_type cap2 = register_game( "g2", alice );

   const license_id_type l1 = create_license( "g1", cap1, alice, make_license_options( 100 ) );
   const license_id_type l2 = create_license( "g1", cap1, alice, make_license_options( 200 ) );
   const license_id_type l3 = create_license( "g2", cap2, alice, make_license_options( 300 ) );

   BOOST_CHECK( db.find_game( "g3" ) == nullptr );
   KEYMARKET_REQUIRE_THROW( db.get_game( "g3" ), game_not_found );

   BOOST_CHECK_EQUAL( db.game_count(), 2u );
   BOOST_CHECK_EQUAL( db.get_game_by_index( 0 ).game_key, "g1" );
   BOOST_CHECK_EQUAL( db.get_game_by_index( 1 ).game_key, "g2" );
   KEYMARKET_REQUIRE_THROW( db.get_game_by_index( 2 ), index_out_of_range );

   const game_object& g1 = db.get_game( "g1" );
   const game_object& g2 = db.get_game( "g2" );
   BOOST_CHECK( db.get_license_by_index( g1, 0 ).get_id() == l1 );
   BOOST_CHECK( db.get_license_by_index( g1, 1 ).get_id() == l2 );
   KEYMARKET_REQUIRE_THROW( db.get_license_by_index( g1, 2 ), index_out_of_range );
   BOOST_CHECK( db.get_license_by_index( g2, 0 ).get_id() == l3 );
   KEYMARKET_REQUIRE_THROW( db.get_license_by_index( g2, 1 ), index_out_of_range );

   // a license only resolves through the game it belongs to
   BOOST_CHECK( db.get_license( g2, l3 ).get_id() == l3 );
   KEYMARKET_REQUIRE_THROW( db.get_license( g2, l1 ), license_not_found );
   KEYMARKET_REQUIRE_THROW( db.get_license( g1, l3 ), license_not_found );
   KEYMARKET_REQUIRE_THROW( db.get_license( g1, license_id_type( 99 ) ), license_not_found );

   KEYMARKET_REQUIRE_THROW( db.get_license_key( license_key_id_type( 0 ) ), license_key_not_found );
   KEYMARKET_REQUIRE_THROW( db.get_listing( resale_listing_id_type( 0 ) ), listing_not_found );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_game )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   fund( bob, 10 );
   const capability_id_type cap = register_game( "g1", alice );
   const capability_id_type bob_cap = register_game( "g2", bob );

   game_update_operation op;
   op.game_key = "g1";
   op.capability = cap;
   op.sale_locked = true;
   push_op( op, alice );
   BOOST_CHECK( db.get_game( "g1" ).sale_locked );
   BOOST_CHECK_EQUAL( db.get_game( "g1" ).metadata.name, "g1" );

   op.sale_locked.reset();
   op.new_metadata = make_metadata( "renamed" );
   push_op( op, alice );
   BOOST_CHECK( db.get_game( "g1" ).sale_locked );
   BOOST_CHECK_EQUAL( db.get_game( "g1" ).metadata.name, "renamed" );
   BOOST_CHECK_EQUAL( db.get_game( "g1" ).game_key, "g1" );

   op.capability = bob_cap;
   KEYMARKET_REQUIRE_THROW( push_op( op, bob ), not_publisher );
   op.capability = cap;
   KEYMARKET_REQUIRE_THROW( push_op( op, bob ), not_authorized );
   op.game_key = "g3";
   KEYMARKET_REQUIRE_THROW( push_op( op, alice ), game_not_found );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_license )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   fund( bob, 1000 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100 ) );
   const license_key_id_type key = purchase( "g1", license, bob );

   license_update_operation op;
   op.game_key = "g1";
   op.license = license;
   op.capability = cap;
   op.new_name = "deluxe";
   op.new_publisher_price = 400;
   op.new_discount_rate = 5000;
   op.new_limit_auth_count = 3;
   push_op( op, alice );

   const game_object& game = db.get_game( "g1" );
   const license_object& updated = db.get_license( game, license );
   BOOST_CHECK_EQUAL( updated.options.name, "deluxe" );
   BOOST_CHECK_EQUAL( updated.options.publisher_price.value, 400 );
   BOOST_CHECK_EQUAL( updated.options.discount_rate, 5000 );
   BOOST_CHECK_EQUAL( updated.options.limit_auth_count, 3u );
   BOOST_CHECK_EQUAL( updated.discounted_price().value, 200 );
   // untouched fields keep their values
   BOOST_CHECK_EQUAL( updated.options.thumbnail, "https://example.com/standard.png" );
   BOOST_CHECK( updated.options.permit_resale );

   // issued keys keep the snapshot taken at purchase
   BOOST_CHECK_EQUAL( db.get_license_key( key ).license_name, "standard" );

   // later purchases pay the new price
   const share_type before = get_balance( bob );
   const license_key_id_type second = purchase( "g1", license, bob );
   BOOST_CHECK_EQUAL( ( before - get_balance( bob ) ).value, 200 );
   BOOST_CHECK_EQUAL( db.get_license_key( second ).license_name, "deluxe" );

   op.license = license_id_type( 42 );
   KEYMARKET_REQUIRE_THROW( push_op( op, alice ), license_not_found );
   op.license = license;
   KEYMARKET_REQUIRE_THROW( push_op( op, bob ), not_authorized );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
