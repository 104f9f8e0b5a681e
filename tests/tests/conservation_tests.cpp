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

#include <boost/signals2/connection.hpp>

#include "../common/database_fixture.hpp"

using namespace keymarket::chain;
using namespace keymarket::db;

BOOST_FIXTURE_TEST_SUITE( conservation_tests, database_fixture )

BOOST_AUTO_TEST_CASE( value_is_conserved_across_the_lifecycle )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 10000 );
   fund( carol, 10000 );
   verify_conservation();

   const capability_id_type cap = register_game( "g1", alice );
   verify_conservation();
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 10000, 2500, 500, true, 3 ) );
   const license_key_id_type key = purchase( "g1", license, bob );
   verify_conservation();
   authenticate( key, bob );
   const resale_listing_id_type listing = list_key( key, bob, 10000 );
   verify_conservation();
   buy_listing( listing, carol );
   verify_conservation();

   // draining every pool moves all value back into wallets
   game_proceeds_withdraw_operation proceeds;
   proceeds.game_key = "g1";
   proceeds.capability = cap;
   proceeds.kind = sales_escrow;
   push_op( proceeds, alice );
   proceeds.kind = royalty_escrow;
   push_op( proceeds, alice );
   push_op( payout_withdraw_operation(), bob );

   platform_withdraw_operation fees;
   fees.capability = platform_capability;
   fees.pool = submission_fee_pool;
   push_op( fees, platform );
   fees.pool = purchase_fee_pool;
   push_op( fees, platform );
   verify_conservation();

   BOOST_CHECK_EQUAL( get_balance( alice ).value, 7425 + 500 );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 2500 + 9500 );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( platform ).value, 10 + 75 );

   const share_type wallets = get_balance( faucet ) + get_balance( alice ) + get_balance( bob )
                            + get_balance( carol ) + get_balance( platform );
   BOOST_CHECK_EQUAL( wallets.value, initial_supply.value );
   BOOST_CHECK_EQUAL( db.get_total_value().value, initial_supply.value );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_transaction_changes_nothing )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 800 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 400 ) );

   // the first two operations succeed, the third one can not be paid
   transaction trx;
   transfer_operation gift;
   gift.to = carol;
   gift.amount = 100;
   trx.operations.push_back( gift );
   license_purchase_operation buy;
   buy.game_key = "g1";
   buy.license = license;
   buy.payment = 400;
   buy.buyer = bob;
   trx.operations.push_back( buy );
   trx.operations.push_back( buy );
   KEYMARKET_REQUIRE_THROW( db.push_transaction( trx, bob ), insufficient_balance );

   BOOST_CHECK_EQUAL( get_balance( bob ).value, 800 );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 0 );
   BOOST_CHECK_EQUAL( db.get_license_keys_by_owner( bob ).size(), 0u );
   BOOST_CHECK( db.find_game_escrow( db.get_game( "g1" ).get_id(), sales_escrow ) == nullptr );
   BOOST_CHECK_EQUAL( db.get_marketplace().purchase_fees.get_amount().value, 0 );
   BOOST_CHECK_EQUAL( db.get_applied_operations().size(), 0u );
   verify_conservation();

   // the same transaction with one purchase goes through as a whole
   trx.operations.pop_back();
   const processed_transaction ptrx = db.push_transaction( trx, bob );
   BOOST_REQUIRE_EQUAL( ptrx.operation_results.size(), 2u );
   BOOST_CHECK( ptrx.operation_results[0].is_type<void_result>() );
   const license_key_id_type key( ptrx.operation_results[1].get<object_id_type>() );
   BOOST_CHECK( db.get_license_key( key ).owner == bob );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 300 );
   BOOST_CHECK_EQUAL( get_balance( carol ).value, 100 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( events_are_published_on_commit )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   fund( bob, 1000 );

   std::vector<operation_history_object> seen;
   boost::signals2::scoped_connection connection( db.applied_operation.connect(
      [&seen]( const operation_history_object& o ) { seen.push_back( o ); } ) );

   const capability_id_type cap = register_game( "g1", alice );
   BOOST_REQUIRE_EQUAL( seen.size(), 2u );
   BOOST_CHECK( seen[0].op.is_type<game_register_operation>() );
   BOOST_CHECK( seen[1].op.is_type<game_registered_operation>() );
   BOOST_CHECK( seen[0].submitter == alice );
   BOOST_CHECK_EQUAL( seen[0].trx_num, seen[1].trx_num );
   BOOST_CHECK_EQUAL( seen[0].op_in_trx, 0u );
   BOOST_CHECK_EQUAL( seen[1].op_in_trx, 0u );
   BOOST_CHECK_EQUAL( seen[0].virtual_op, 0u );
   BOOST_CHECK_EQUAL( seen[1].virtual_op, 1u );
   const uint32_t first_trx = seen[0].trx_num;

   // nothing is published for a rejected transaction
   seen.clear();
   KEYMARKET_REQUIRE_THROW( register_game( "g1", alice ), duplicate_game_id );
   BOOST_CHECK_EQUAL( seen.size(), 0u );

   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100 ) );
   purchase( "g1", license, bob );
   BOOST_REQUIRE_EQUAL( seen.size(), 4u );
   BOOST_CHECK( seen[1].op.is_type<license_created_operation>() );
   BOOST_CHECK( seen[3].op.is_type<license_purchased_operation>() );
   BOOST_CHECK( seen[3].submitter == bob );
   // the rejected transaction consumed a number as well
   BOOST_CHECK_EQUAL( seen[0].trx_num, first_trx + 2 );
   BOOST_CHECK_EQUAL( seen[2].trx_num, first_trx + 3 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
