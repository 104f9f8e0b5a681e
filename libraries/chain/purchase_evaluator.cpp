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
#include <keymarket/chain/purchase_evaluator.hpp>
#include <keymarket/chain/database.hpp>
#include <keymarket/chain/exceptions.hpp>
#include <keymarket/chain/marketplace_object.hpp>

namespace keymarket { namespace chain {

void_result license_purchase_evaluator::do_evaluate( const license_purchase_operation& op )
{ try {
   const database& d = db();

   game = &d.get_game( op.game_key );
   license = &d.get_license( *game, op.license );

   KEYMARKET_ASSERT( !game->sale_locked, sale_locked, "Sales of game ${g} are locked", ("g",op.game_key) );

   const share_type price = license->discounted_price();
   const share_type converted = d.usd_to_token( price );
   KEYMARKET_ASSERT( op.payment == converted, insufficient_funds,
                     "Payment must be exactly ${c} (${p} USD), got ${a}",
                     ("c",converted)("p",price)("a",op.payment) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type license_purchase_evaluator::do_apply( const license_purchase_operation& op )
{ try {
   database& d = db();
   const marketplace_object& marketplace = d.get_marketplace();

   stored_value payment = d.reduce_balance( submitter(), op.payment );

   const share_type platform_fee = detail::calculate_percent( payment.get_amount(), marketplace.purchase_fee_rate );
   if( platform_fee > 0 )
   {
      d.modify( marketplace, [&payment,&platform_fee]( marketplace_object& m ) {
         m.purchase_fees += payment.split( platform_fee );
      });
   }
   d.deposit_game_escrow( game->get_id(), sales_escrow, std::move( payment ) );

   const license_key_object& new_key = d.create<license_key_object>( [this,&op]( license_key_object& k ) {
      k.game              = game->get_id();
      k.license           = license->get_id();
      k.auth_count        = 0;
      k.license_name      = license->options.name;
      k.license_thumbnail = license->options.thumbnail;
      k.owner             = op.buyer;
   });

   license_purchased_operation vop;
   vop.game_key     = op.game_key;
   vop.license      = license->get_id();
   vop.key          = new_key.get_id();
   vop.buyer        = op.buyer;
   vop.price_paid   = op.payment;
   vop.platform_fee = platform_fee;
   d.push_applied_operation( vop );

   return new_key.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result license_authenticate_evaluator::do_evaluate( const license_authenticate_operation& op )
{ try {
   const database& d = db();

   key = &d.get_license_key( op.key );
   KEYMARKET_ASSERT( key->owner == submitter(), not_owner,
                     "License key ${k} is owned by ${o}", ("k",op.key)("o",key->owner) );

   if( key->user != submitter() )
   {
      const license_object& license = d.get( key->license );
      KEYMARKET_ASSERT( license.options.limit_auth_count > key->auth_count, auth_limit_exceeded,
                        "License key ${k} has been authenticated ${n} times, the limit is ${l}",
                        ("k",op.key)("n",key->auth_count)("l",license.options.limit_auth_count) );
   }

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result license_authenticate_evaluator::do_apply( const license_authenticate_operation& op )
{ try {
   if( key->user == submitter() )
      return void_result();

   db().modify( *key, [this]( license_key_object& k ) {
      ++k.auth_count;
      k.user = submitter();
   });

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // keymarket::chain
