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

namespace {

platform_withdraw_operation make_platform_withdraw( capability_id_type cap, platform_pool pool )
{
   platform_withdraw_operation op;
   op.capability = cap;
   op.pool = pool;
   return op;
}

game_proceeds_withdraw_operation make_proceeds_withdraw( const string& game_key, capability_id_type cap,
                                                          game_escrow_kind kind )
{
   game_proceeds_withdraw_operation op;
   op.game_key = game_key;
   op.capability = cap;
   op.kind = kind;
   return op;
}

}

BOOST_FIXTURE_TEST_SUITE( withdraw_tests, database_fixture )

BOOST_AUTO_TEST_CASE( platform_withdraws_fee_pools )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 20 );
   fund( bob, 10000 );
   const capability_id_type cap = register_game( "g1", alice );
   register_game( "g2", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 10000, 2500 ) );
   purchase( "g1", license, bob );

   BOOST_CHECK_EQUAL( get_balance( platform ).value, 0 );

   push_op( make_platform_withdraw( platform_capability, submission_fee_pool ), platform );
   BOOST_CHECK_EQUAL( get_balance( platform ).value, 20 );
   BOOST_CHECK_EQUAL( db.get_marketplace().submission_fees.get_amount().value, 0 );
   BOOST_CHECK_EQUAL( db.get_marketplace().purchase_fees.get_amount().value, 75 );

   const auto& ops = db.get_applied_operations();
   BOOST_REQUIRE_EQUAL( ops.size(), 2u );
   BOOST_REQUIRE( ops[1]->op.is_type<proceeds_withdrawn_operation>() );
   const auto& withdrawn = ops[1]->op.get<proceeds_withdrawn_operation>();
   BOOST_CHECK( withdrawn.pool == db.get_marketplace().id );
   BOOST_CHECK( withdrawn.owner == platform );
   BOOST_CHECK_EQUAL( withdrawn.amount.value, 20 );

   KEYMARKET_REQUIRE_THROW( push_op( make_platform_withdraw( platform_capability, submission_fee_pool ), platform ),
                            no_funds_available );

   push_op( make_platform_withdraw( platform_capability, purchase_fee_pool ), platform );
   BOOST_CHECK_EQUAL( get_balance( platform ).value, 95 );
   BOOST_CHECK_EQUAL( db.get_marketplace().purchase_fees.get_amount().value, 0 );
   KEYMARKET_REQUIRE_THROW( push_op( make_platform_withdraw( platform_capability, purchase_fee_pool ), platform ),
                            no_funds_available );
   BOOST_CHECK_EQUAL( get_balance( platform ).value, 95 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( platform_withdraw_requires_platform_capability )
{ try {
   ACTORS( (alice) );
   fund( alice, 10 );
   const capability_id_type cap = register_game( "g1", alice );

   // a publisher capability is bound to its game, not to the marketplace
   KEYMARKET_REQUIRE_THROW( push_op( make_platform_withdraw( cap, submission_fee_pool ), alice ), not_authorized );
   // the platform capability only works for its holder
   KEYMARKET_REQUIRE_THROW( push_op( make_platform_withdraw( platform_capability, submission_fee_pool ), alice ),
                            not_authorized );
   BOOST_CHECK_EQUAL( db.get_marketplace().submission_fees.get_amount().value, 10 );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );

   platform_withdraw_operation op = make_platform_withdraw( platform_capability, submission_fee_pool );
   op.pool = static_cast<platform_pool>( 2 );
   KEYMARKET_REQUIRE_THROW( op.validate(), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( publisher_withdraws_sales_and_royalties )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 10000 );
   fund( carol, 10000 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 10000, 2500, 500, true, 2 ) );
   const game_id_type game = db.get_game( "g1" ).get_id();
   const license_key_id_type key = purchase( "g1", license, bob );
   buy_listing( list_key( key, bob, 10000 ), carol );

   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );

   push_op( make_proceeds_withdraw( "g1", cap, sales_escrow ), alice );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 7425 );
   BOOST_CHECK_EQUAL( db.get_game_escrow_balance( game, sales_escrow ).value, 0 );
   BOOST_CHECK_EQUAL( db.get_game_escrow_balance( game, royalty_escrow ).value, 500 );

   const auto& withdrawn = db.get_applied_operations().back()->op.get<proceeds_withdrawn_operation>();
   BOOST_CHECK( withdrawn.pool == db.find_game_escrow( game, sales_escrow )->id );
   BOOST_CHECK( withdrawn.owner == alice );
   BOOST_CHECK_EQUAL( withdrawn.amount.value, 7425 );

   KEYMARKET_REQUIRE_THROW( push_op( make_proceeds_withdraw( "g1", cap, sales_escrow ), alice ), no_funds_available );

   push_op( make_proceeds_withdraw( "g1", cap, royalty_escrow ), alice );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 7925 );
   BOOST_CHECK_EQUAL( db.get_game_escrow_balance( game, royalty_escrow ).value, 0 );
   KEYMARKET_REQUIRE_THROW( push_op( make_proceeds_withdraw( "g1", cap, royalty_escrow ), alice ), no_funds_available );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( proceeds_withdraw_requires_game_capability )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 10 );
   fund( carol, 1000 );
   const capability_id_type alice_cap = register_game( "g1", alice );
   const capability_id_type bob_cap = register_game( "g2", bob );
   const license_id_type license = create_license( "g1", alice_cap, alice, make_license_options( 500 ) );
   purchase( "g1", license, carol );

   KEYMARKET_REQUIRE_THROW( push_op( make_proceeds_withdraw( "g1", bob_cap, sales_escrow ), bob ), not_authorized );
   KEYMARKET_REQUIRE_THROW( push_op( make_proceeds_withdraw( "g1", alice_cap, sales_escrow ), bob ), not_authorized );
   KEYMARKET_REQUIRE_THROW( push_op( make_proceeds_withdraw( "g1", platform_capability, sales_escrow ), platform ),
                            not_authorized );
   KEYMARKET_REQUIRE_THROW( push_op( make_proceeds_withdraw( "g3", alice_cap, sales_escrow ), alice ), game_not_found );
   BOOST_CHECK_EQUAL( db.get_game_escrow_balance( db.get_game( "g1" ).get_id(), sales_escrow ).value, 495 );

   // g2 never sold anything
   KEYMARKET_REQUIRE_THROW( push_op( make_proceeds_withdraw( "g2", bob_cap, sales_escrow ), bob ), no_funds_available );
   KEYMARKET_REQUIRE_THROW( push_op( make_proceeds_withdraw( "g1", alice_cap, royalty_escrow ), alice ),
                            no_funds_available );

   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( reseller_withdraws_payout )
{ try {
   ACTORS( (alice)(bob)(carol)(dave) );
   fund( alice, 10 );
   fund( bob, 200 );
   fund( carol, 1000 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100, 0, 1000, true, 5 ) );
   const license_key_id_type k1 = purchase( "g1", license, bob );
   const license_key_id_type k2 = purchase( "g1", license, bob );
   buy_listing( list_key( k1, bob, 300 ), carol );
   buy_listing( list_key( k2, bob, 200 ), carol );

   // both sales land in one escrow
   BOOST_CHECK_EQUAL( db.get_payout_escrow_balance( bob ).value, 270 + 180 );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 0 );

   KEYMARKET_REQUIRE_THROW( push_op( payout_withdraw_operation(), carol ), no_funds_available );
   KEYMARKET_REQUIRE_THROW( push_op( payout_withdraw_operation(), dave ), no_funds_available );

   push_op( payout_withdraw_operation(), bob );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 450 );
   BOOST_CHECK_EQUAL( db.get_payout_escrow_balance( bob ).value, 0 );

   const auto& withdrawn = db.get_applied_operations().back()->op.get<proceeds_withdrawn_operation>();
   BOOST_CHECK( withdrawn.owner == bob );
   BOOST_CHECK_EQUAL( withdrawn.amount.value, 450 );

   KEYMARKET_REQUIRE_THROW( push_op( payout_withdraw_operation(), bob ), no_funds_available );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 450 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
