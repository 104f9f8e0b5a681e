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

BOOST_FIXTURE_TEST_SUITE( authentication_tests, database_fixture )

BOOST_AUTO_TEST_CASE( first_authentication_binds_user )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   fund( bob, 100 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100, 0, 0, false, 1 ) );
   const license_key_id_type key = purchase( "g1", license, bob );

   authenticate( key, bob );
   BOOST_CHECK_EQUAL( db.get_license_key( key ).auth_count, 1u );
   BOOST_CHECK( db.get_license_key( key ).user == bob );

   // binding the same user again changes nothing
   authenticate( key, bob );
   authenticate( key, bob );
   BOOST_CHECK_EQUAL( db.get_license_key( key ).auth_count, 1u );
   BOOST_CHECK( db.get_license_key( key ).user == bob );
   BOOST_CHECK_EQUAL( db.get_applied_operations().size(), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( only_owner_authenticates )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 100 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100 ) );
   const license_key_id_type key = purchase( "g1", license, bob );

   KEYMARKET_REQUIRE_THROW( authenticate( key, carol ), not_owner );
   KEYMARKET_REQUIRE_THROW( authenticate( key, alice ), not_owner );
   BOOST_CHECK_EQUAL( db.get_license_key( key ).auth_count, 0u );
   BOOST_CHECK( db.get_license_key( key ).user.is_null() );

   KEYMARKET_REQUIRE_THROW( authenticate( license_key_id_type( 12 ), bob ), license_key_not_found );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( zero_limit_never_authenticates )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, 10 );
   fund( bob, 100 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100, 0, 0, true, 0 ) );
   const license_key_id_type key = purchase( "g1", license, bob );

   KEYMARKET_REQUIRE_THROW( authenticate( key, bob ), auth_limit_exceeded );
   BOOST_CHECK_EQUAL( db.get_license_key( key ).auth_count, 0u );
   BOOST_CHECK( db.get_license_key( key ).user.is_null() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( activation_cap_counts_distinct_users )
{ try {
   ACTORS( (alice)(bob)(carol)(dave) );
   fund( alice, 10 );
   fund( bob, 100 );
   fund( carol, 100 );
   fund( dave, 100 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100, 0, 0, true, 2 ) );
   const license_key_id_type key = purchase( "g1", license, bob );

   authenticate( key, bob );
   buy_listing( list_key( key, bob, 50 ), carol );
   BOOST_CHECK( db.get_license_key( key ).owner == carol );
   // the previous user stays bound until the new owner authenticates
   BOOST_CHECK( db.get_license_key( key ).user == bob );
   BOOST_CHECK_EQUAL( db.get_license_key( key ).auth_count, 1u );

   authenticate( key, carol );
   BOOST_CHECK_EQUAL( db.get_license_key( key ).auth_count, 2u );
   BOOST_CHECK( db.get_license_key( key ).user == carol );

   // every allowed user has been bound, the key can not change hands any more
   KEYMARKET_REQUIRE_THROW( list_key( key, carol, 50 ), auth_limit_exceeded );
   authenticate( key, carol );
   BOOST_CHECK_EQUAL( db.get_license_key( key ).auth_count, 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( lowered_limit_applies_to_issued_keys )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, 10 );
   fund( bob, 100 );
   fund( carol, 100 );
   const capability_id_type cap = register_game( "g1", alice );
   const license_id_type license = create_license( "g1", cap, alice, make_license_options( 100, 0, 0, true, 2 ) );
   const license_key_id_type key = purchase( "g1", license, bob );

   authenticate( key, bob );
   buy_listing( list_key( key, bob, 50 ), carol );

   license_update_operation op;
   op.game_key = "g1";
   op.license = license;
   op.capability = cap;
   op.new_limit_auth_count = 1;
   push_op( op, alice );

   KEYMARKET_REQUIRE_THROW( authenticate( key, carol ), auth_limit_exceeded );
   BOOST_CHECK( db.get_license_key( key ).user == bob );

   op.new_limit_auth_count = 5;
   push_op( op, alice );
   authenticate( key, carol );
   BOOST_CHECK_EQUAL( db.get_license_key( key ).auth_count, 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
