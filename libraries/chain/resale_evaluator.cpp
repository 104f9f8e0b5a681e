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
#include <keymarket/chain/resale_evaluator.hpp>
#include <keymarket/chain/database.hpp>
#include <keymarket/chain/exceptions.hpp>
#include <keymarket/chain/marketplace_object.hpp>

namespace keymarket { namespace chain {

void_result resale_list_evaluator::do_evaluate( const resale_list_operation& op )
{ try {
   const database& d = db();

   key = &d.get_license_key( op.key );
   KEYMARKET_ASSERT( key->owner == submitter(), not_owner,
                     "License key ${k} is owned by ${o}", ("k",op.key)("o",key->owner) );

   const license_object& license = d.get( key->license );
   KEYMARKET_ASSERT( license.options.permit_resale, resale_not_permitted,
                     "License ${l} does not permit resale", ("l",key->license) );
   KEYMARKET_ASSERT( license.options.limit_auth_count > key->auth_count, auth_limit_exceeded,
                     "License key ${k} has no authentications left", ("k",op.key) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type resale_list_evaluator::do_apply( const resale_list_operation& op )
{ try {
   database& d = db();

   license_key_object listed_key = *key;
   d.remove( *key );
   key = nullptr;

   const resale_listing_object& listing = d.create<resale_listing_object>(
      [&op,&listed_key,this]( resale_listing_object& l ) {
         l.key           = std::move( listed_key );
         l.reseller_name = op.reseller_name;
         l.description   = op.description;
         l.price         = op.price;
         l.seller        = submitter();
   });

   d.modify( d.get_resale_market(), []( resale_market_object& m ) {
      ++m.active_listings;
   });

   license_listed_operation vop;
   vop.listing = listing.get_id();
   vop.key     = op.key;
   vop.seller  = submitter();
   vop.price   = op.price;
   d.push_applied_operation( vop );

   return listing.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result resale_buy_evaluator::do_evaluate( const resale_buy_operation& op )
{ try {
   const database& d = db();

   listing = &d.get_listing( op.listing );
   license = &d.get( listing->key.license );

   const share_type converted = d.usd_to_token( listing->price );
   KEYMARKET_ASSERT( op.payment == converted, insufficient_funds,
                     "Payment must be exactly ${c} (${p} USD), got ${a}",
                     ("c",converted)("p",listing->price)("a",op.payment) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type resale_buy_evaluator::do_apply( const resale_buy_operation& op )
{ try {
   database& d = db();

   stored_value payment = d.reduce_balance( submitter(), op.payment );

   const share_type royalty = detail::calculate_percent( payment.get_amount(), license->options.royalty_rate );
   if( royalty > 0 )
      d.deposit_game_escrow( listing->key.game, royalty_escrow, payment.split( royalty ) );
   const address seller = listing->seller;
   d.deposit_payout_escrow( seller, std::move( payment ) );

   license_key_object sold_key = listing->key;
   sold_key.owner = op.buyer;
   const resale_listing_id_type listing_id = listing->get_id();
   d.remove( *listing );
   listing = nullptr;

   const auto& key = static_cast<const license_key_object&>( d.insert( std::move( sold_key ) ) );

   d.modify( d.get_resale_market(), []( resale_market_object& m ) {
      --m.active_listings;
      ++m.completed_resales;
   });

   license_resold_operation vop;
   vop.listing    = listing_id;
   vop.key        = key.get_id();
   vop.seller     = seller;
   vop.buyer      = op.buyer;
   vop.price_paid = op.payment;
   vop.royalty    = royalty;
   d.push_applied_operation( vop );

   return key.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result resale_cancel_evaluator::do_evaluate( const resale_cancel_operation& op )
{ try {
   listing = &db().get_listing( op.listing );
   KEYMARKET_ASSERT( listing->seller == submitter(), not_owner,
                     "Listing ${l} belongs to ${s}", ("l",op.listing)("s",listing->seller) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type resale_cancel_evaluator::do_apply( const resale_cancel_operation& op )
{ try {
   database& d = db();

   license_key_object returned_key = listing->key;
   d.remove( *listing );
   listing = nullptr;

   const auto& key = static_cast<const license_key_object&>( d.insert( std::move( returned_key ) ) );

   d.modify( d.get_resale_market(), []( resale_market_object& m ) {
      --m.active_listings;
   });

   return key.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // keymarket::chain
