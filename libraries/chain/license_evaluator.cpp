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
#include <keymarket/chain/license_evaluator.hpp>
#include <keymarket/chain/database.hpp>
#include <keymarket/chain/exceptions.hpp>

namespace keymarket { namespace chain {

share_type license_object::discounted_price()const
{
   if( options.discount_rate == 0 )
      return options.publisher_price;
   return options.publisher_price - detail::calculate_percent( options.publisher_price, options.discount_rate );
}

void_result license_create_evaluator::do_evaluate( const license_create_operation& op )
{ try {
   const database& d = db();

   game = &d.get_game( op.game_key );
   const capability_object& cap = presented_capability( op.capability );
   KEYMARKET_ASSERT( cap.bound_id == game->id, not_publisher,
                     "Capability ${c} does not authorize changes to game ${g}",
                     ("c",op.capability)("g",op.game_key) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type license_create_evaluator::do_apply( const license_create_operation& op )
{ try {
   database& d = db();

   const license_object& new_license = d.create<license_object>( [&op,this]( license_object& l ) {
      l.game    = game->get_id();
      l.options = op.options;
   });

   d.push_applied_operation( license_created_operation( op.game_key, new_license.get_id() ) );

   return new_license.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result license_update_evaluator::do_evaluate( const license_update_operation& op )
{ try {
   const database& d = db();

   const game_object& game = d.get_game( op.game_key );
   const capability_object& cap = presented_capability( op.capability );
   KEYMARKET_ASSERT( cap.bound_id == game.id, not_publisher,
                     "Capability ${c} does not authorize changes to game ${g}",
                     ("c",op.capability)("g",op.game_key) );
   license = &d.get_license( game, op.license );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result license_update_evaluator::do_apply( const license_update_operation& op )
{ try {
   db().modify( *license, [&op]( license_object& l ) {
      if( op.new_name.valid() )
         l.options.name = *op.new_name;
      if( op.new_thumbnail.valid() )
         l.options.thumbnail = *op.new_thumbnail;
      if( op.new_short_descriptions.valid() )
         l.options.short_descriptions = *op.new_short_descriptions;
      if( op.new_publisher_price.valid() )
         l.options.publisher_price = *op.new_publisher_price;
      if( op.new_discount_rate.valid() )
         l.options.discount_rate = *op.new_discount_rate;
      if( op.new_royalty_rate.valid() )
         l.options.royalty_rate = *op.new_royalty_rate;
      if( op.new_permit_resale.valid() )
         l.options.permit_resale = *op.new_permit_resale;
      if( op.new_limit_auth_count.valid() )
         l.options.limit_auth_count = *op.new_limit_auth_count;
   });

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // keymarket::chain
