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
#include <keymarket/chain/price_oracle.hpp>
#include <keymarket/chain/stored_value.hpp>

#include "../common/database_fixture.hpp"

using namespace keymarket::chain;
using namespace keymarket::db;

BOOST_FIXTURE_TEST_SUITE( basic_tests, database_fixture )

BOOST_AUTO_TEST_CASE( stored_value_split_and_merge )
{ try {
   stored_debt debt;
   stored_value pool = debt.issue( 1000 );
   BOOST_CHECK_EQUAL( debt.get_amount().value, 1000 );
   BOOST_CHECK_EQUAL( pool.get_amount().value, 1000 );

   stored_value part = pool.split( 300 );
   BOOST_CHECK_EQUAL( part.get_amount().value, 300 );
   BOOST_CHECK_EQUAL( pool.get_amount().value, 700 );

   KEYMARKET_REQUIRE_THROW( pool.split( 701 ), insufficient_balance );
   KEYMARKET_REQUIRE_THROW( pool.split( -1 ), insufficient_balance );
   BOOST_CHECK_EQUAL( pool.get_amount().value, 700 );

   pool += std::move( part );
   BOOST_CHECK_EQUAL( pool.get_amount().value, 1000 );
   BOOST_CHECK_EQUAL( part.get_amount().value, 0 );

   stored_value empty = pool.split( 0 );
   BOOST_CHECK_EQUAL( empty.get_amount().value, 0 );

   debt.burn( std::move( pool ) );
   BOOST_CHECK_EQUAL( debt.get_amount().value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( stored_value_withdraw_all )
{ try {
   stored_debt debt;
   stored_value pool = debt.issue( 42 );

   stored_value drained = pool.withdraw_all();
   BOOST_CHECK_EQUAL( drained.get_amount().value, 42 );
   BOOST_CHECK_EQUAL( pool.get_amount().value, 0 );

   KEYMARKET_REQUIRE_THROW( pool.withdraw_all(), empty_pool );

   debt.burn( std::move( drained ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( stored_value_can_not_overwrite )
{ try {
   stored_debt debt;
   stored_value a = debt.issue( 5 );
   stored_value b = debt.issue( 7 );

   KEYMARKET_REQUIRE_THROW( a = std::move( b ), fc::assert_exception );
   BOOST_CHECK_EQUAL( a.get_amount().value, 5 );
   BOOST_CHECK_EQUAL( b.get_amount().value, 7 );

   debt.burn( std::move( a ) );
   debt.burn( std::move( b ) );
   BOOST_CHECK_EQUAL( debt.get_amount().value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( calculate_percent_rounds_down )
{ try {
   BOOST_CHECK_EQUAL( detail::calculate_percent( 10000, 2500 ).value, 2500 );
   BOOST_CHECK_EQUAL( detail::calculate_percent( 7500, 100 ).value, 75 );
   BOOST_CHECK_EQUAL( detail::calculate_percent( 10000, 500 ).value, 500 );
   BOOST_CHECK_EQUAL( detail::calculate_percent( 9999, 1 ).value, 0 );
   BOOST_CHECK_EQUAL( detail::calculate_percent( 199, 50 ).value, 0 );
   BOOST_CHECK_EQUAL( detail::calculate_percent( 200, 50 ).value, 1 );
   BOOST_CHECK_EQUAL( detail::calculate_percent( 12345, 0 ).value, 0 );
   BOOST_CHECK_EQUAL( detail::calculate_percent( 12345, KEYMARKET_100_PERCENT ).value, 12345 );
   // no intermediate overflow
   BOOST_CHECK_EQUAL( detail::calculate_percent( KEYMARKET_MAX_SHARE_SUPPLY, KEYMARKET_100_PERCENT ).value,
                      KEYMARKET_MAX_SHARE_SUPPLY );
   BOOST_CHECK_EQUAL( detail::calculate_percent( KEYMARKET_MAX_SHARE_SUPPLY, 5000 ).value,
                      KEYMARKET_MAX_SHARE_SUPPLY / 2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( fixed_ratio_price_oracle_conversion )
{ try {
   fixed_ratio_price_oracle oracle;
   BOOST_CHECK_EQUAL( oracle.token_decimal_scale(), KEYMARKET_TOKEN_DECIMAL_SCALE );
   BOOST_CHECK_EQUAL( oracle.usd_to_token( 0 ).value, 0 );
   BOOST_CHECK_EQUAL( oracle.usd_to_token( 10 ).value, 10 * KEYMARKET_TOKEN_DECIMAL_SCALE );
   BOOST_CHECK_EQUAL( oracle.usd_to_token( 1000000000 ).value, KEYMARKET_MAX_SHARE_SUPPLY );
   KEYMARKET_REQUIRE_THROW( oracle.usd_to_token( 1000000001 ), fc::assert_exception );
   KEYMARKET_REQUIRE_THROW( oracle.usd_to_token( -1 ), fc::assert_exception );

   fixed_ratio_price_oracle unit( 1 );
   BOOST_CHECK_EQUAL( unit.usd_to_token( 7500 ).value, 7500 );

   KEYMARKET_REQUIRE_THROW( fixed_ratio_price_oracle( 0 ), fc::assert_exception );

   // the fixture database converts one to one
   BOOST_CHECK_EQUAL( db.usd_to_token( 10 ).value, 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( replace_price_oracle )
{ try {
   db.set_price_oracle( std::make_shared<fixed_ratio_price_oracle>( 100 ) );
   BOOST_CHECK_EQUAL( db.usd_to_token( 10 ).value, 1000 );
   BOOST_CHECK_EQUAL( db.usd_to_token( db.get_marketplace().submission_fee_usd ).value, 1000 );

   ACTORS( (alice) );
   fund( alice, 1000 );
   register_game( "g1", alice );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );
   BOOST_CHECK_EQUAL( db.get_marketplace().submission_fees.get_amount().value, 1000 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( localized_text_validation )
{ try {
   game_register_operation op;
   op.game_key = "g1";
   op.submission_fee = 10;
   op.metadata = make_metadata( "g1" );
   op.validate();

   op.metadata.short_descriptions["eng"] = "English";
   KEYMARKET_REQUIRE_THROW( op.validate(), malformed_language_pair );
   op.metadata.short_descriptions.erase( "eng" );
   op.metadata.long_descriptions["e"] = "English";
   KEYMARKET_REQUIRE_THROW( op.validate(), malformed_language_pair );
   op.metadata.long_descriptions.clear();
   op.metadata.long_descriptions["ko"] = "Korean";
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, game_key, "" );
   REQUIRE_OP_VALIDATION_FAILURE( op, game_key, string( KEYMARKET_MAX_GAME_KEY_LENGTH + 1, 'g' ) );
   REQUIRE_OP_VALIDATION_FAILURE( op, submission_fee, -1 );

   game_update_operation update;
   update.game_key = "g1";
   KEYMARKET_REQUIRE_THROW( update.validate(), fc::assert_exception );
   update.sale_locked = true;
   update.validate();
   update.new_metadata = make_metadata( "g1" );
   update.new_metadata->short_descriptions["xyz"] = "bad";
   KEYMARKET_REQUIRE_THROW( update.validate(), malformed_language_pair );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( license_rate_validation )
{ try {
   license_create_operation op;
   op.game_key = "g1";
   op.options = make_license_options( 10000, 2500, 500 );
   op.validate();

   op.options.discount_rate = KEYMARKET_100_PERCENT;
   op.validate();
   op.options.discount_rate = KEYMARKET_100_PERCENT + 1;
   KEYMARKET_REQUIRE_THROW( op.validate(), invalid_discount_rate );
   op.options.discount_rate = 0;

   op.options.royalty_rate = KEYMARKET_100_PERCENT + 1;
   KEYMARKET_REQUIRE_THROW( op.validate(), invalid_royalty_rate );
   op.options.royalty_rate = 0;

   op.options.publisher_price = -1;
   KEYMARKET_REQUIRE_THROW( op.validate(), fc::assert_exception );
   op.options.publisher_price = 0;

   op.options.short_descriptions["english"] = "Standard";
   KEYMARKET_REQUIRE_THROW( op.validate(), malformed_language_pair );

   license_update_operation update;
   update.game_key = "g1";
   KEYMARKET_REQUIRE_THROW( update.validate(), fc::assert_exception );
   update.new_royalty_rate = KEYMARKET_100_PERCENT + 1;
   KEYMARKET_REQUIRE_THROW( update.validate(), invalid_royalty_rate );
   update.new_royalty_rate.reset();
   update.new_discount_rate = KEYMARKET_100_PERCENT + 1;
   KEYMARKET_REQUIRE_THROW( update.validate(), invalid_discount_rate );
   update.new_discount_rate = 100;
   update.validate();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transaction_validation )
{ try {
   ACTORS( (alice) );

   transaction empty;
   KEYMARKET_REQUIRE_THROW( db.push_transaction( empty, alice ), fc::assert_exception );

   transfer_operation op;
   op.to = alice;
   op.amount = 0;
   KEYMARKET_REQUIRE_THROW( op.validate(), fc::assert_exception );
   op.amount = 1;
   op.to = address();
   KEYMARKET_REQUIRE_THROW( op.validate(), fc::assert_exception );

   // events can only be produced by the database
   transaction forged;
   forged.operations.push_back( proceeds_withdrawn_operation( db.get_marketplace().id, alice, 100 ) );
   KEYMARKET_REQUIRE_THROW( db.push_transaction( forged, alice ), fc::assert_exception );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transfer_between_wallets )
{ try {
   ACTORS( (alice)(bob) );

   fund( alice, 500 );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 500 );
   BOOST_CHECK_EQUAL( get_balance( faucet ).value, ( initial_supply - 500 ).value );

   transfer( alice, bob, 200 );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 300 );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 200 );

   KEYMARKET_REQUIRE_THROW( transfer( alice, bob, 301 ), insufficient_balance );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 300 );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 200 );

   // emptied wallets stay around with a zero balance
   transfer( alice, bob, 300 );
   BOOST_CHECK_EQUAL( get_balance( alice ).value, 0 );
   BOOST_CHECK_EQUAL( get_balance( bob ).value, 500 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_restores_objects )
{ try {
   ACTORS( (alice) );
   fund( alice, 100 );
   register_game( "g1", alice );
   const game_id_type game_id = db.get_game( "g1" ).get_id();
   const uint16_t old_rate = db.get_marketplace().purchase_fee_rate;

   {
      auto session = db._undo_db.start_undo_session();
      db.create<game_object>( [&alice]( game_object& g ) {
         g.game_key = "g2";
         g.creator = alice;
      });
      db.modify( db.get_marketplace(), []( marketplace_object& m ) {
         m.purchase_fee_rate = 5000;
      });
      db.remove( db.get_game( "g1" ) );

      BOOST_CHECK( db.find_game( "g1" ) == nullptr );
      BOOST_CHECK( db.find_game( "g2" ) != nullptr );
      BOOST_CHECK_EQUAL( db.get_marketplace().purchase_fee_rate, 5000 );
      session.undo();
   }

   BOOST_CHECK( db.find_game( "g2" ) == nullptr );
   BOOST_REQUIRE( db.find_game( "g1" ) != nullptr );
   BOOST_CHECK( db.get_game( "g1" ).get_id() == game_id );
   BOOST_CHECK_EQUAL( db.get_marketplace().purchase_fee_rate, old_rate );
   BOOST_CHECK_EQUAL( db.game_count(), 1u );
   // stored values survive the round trip through the undo history
   BOOST_CHECK_EQUAL( db.get_marketplace().submission_fees.get_amount().value, 10 );

   // the next game still gets the next id
   fund( alice, 10 );
   register_game( "g2", alice );
   BOOST_CHECK( db.get_game( "g2" ).get_id() == game_id_type( game_id.instance.value + 1 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
