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
#include <keymarket/chain/game_evaluator.hpp>
#include <keymarket/chain/database.hpp>
#include <keymarket/chain/exceptions.hpp>
#include <keymarket/chain/marketplace_object.hpp>

namespace keymarket { namespace chain {

void_result game_register_evaluator::do_evaluate( const game_register_operation& op )
{ try {
   const database& d = db();

   KEYMARKET_ASSERT( d.find_game( op.game_key ) == nullptr, duplicate_game_id,
                     "Game ${g} is already registered", ("g",op.game_key) );

   const share_type required_fee = d.usd_to_token( d.get_marketplace().submission_fee_usd );
   KEYMARKET_ASSERT( op.submission_fee == required_fee, insufficient_fee,
                     "Submission fee must be exactly ${r}, got ${f}",
                     ("r",required_fee)("f",op.submission_fee) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type game_register_evaluator::do_apply( const game_register_operation& op )
{ try {
   database& d = db();

   stored_value fee = d.reduce_balance( submitter(), op.submission_fee );
   d.modify( d.get_marketplace(), [&fee]( marketplace_object& m ) {
      m.submission_fees += std::move( fee );
   });

   const game_object& new_game = d.create<game_object>( [&op,this]( game_object& g ) {
      g.game_key    = op.game_key;
      g.metadata    = op.metadata;
      g.sale_locked = op.sale_locked;
      g.creator     = submitter();
   });

   const capability_object& cap = d.issue_capability( publisher_capability, new_game.id, submitter() );

   d.push_applied_operation( game_registered_operation( op.game_key, new_game.get_id(), submitter(), cap.get_id() ) );

   return cap.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result game_update_evaluator::do_evaluate( const game_update_operation& op )
{ try {
   const database& d = db();

   game = &d.get_game( op.game_key );
   const capability_object& cap = presented_capability( op.capability );
   KEYMARKET_ASSERT( cap.bound_id == game->id, not_publisher,
                     "Capability ${c} does not authorize changes to game ${g}",
                     ("c",op.capability)("g",op.game_key) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result game_update_evaluator::do_apply( const game_update_operation& op )
{ try {
   db().modify( *game, [&op]( game_object& g ) {
      if( op.new_metadata.valid() )
         g.metadata = *op.new_metadata;
      if( op.sale_locked.valid() )
         g.sale_locked = *op.sale_locked;
   });

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // keymarket::chain
