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
#include <keymarket/chain/withdraw_evaluator.hpp>
#include <keymarket/chain/database.hpp>
#include <keymarket/chain/exceptions.hpp>
#include <keymarket/chain/marketplace_object.hpp>

namespace keymarket { namespace chain {

namespace {

   const stored_value& platform_pool_of( const marketplace_object& m, platform_pool pool )
   {
      return pool == submission_fee_pool ? m.submission_fees : m.purchase_fees;
   }

}

void_result platform_withdraw_evaluator::do_evaluate( const platform_withdraw_operation& op )
{ try {
   const database& d = db();

   const capability_object& cap = presented_capability( op.capability );
   KEYMARKET_ASSERT( cap.bound_id == marketplace_id_type(), not_authorized,
                     "Capability ${c} is not the platform capability", ("c",op.capability) );

   KEYMARKET_ASSERT( platform_pool_of( d.get_marketplace(), op.pool ).get_amount() > 0, no_funds_available,
                     "Platform pool ${p} is empty", ("p",op.pool) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result platform_withdraw_evaluator::do_apply( const platform_withdraw_operation& op )
{ try {
   database& d = db();
   const marketplace_object& marketplace = d.get_marketplace();

   stored_value drained;
   d.modify( marketplace, [&drained,&op]( marketplace_object& m ) {
      if( op.pool == submission_fee_pool )
         drained = m.submission_fees.withdraw_all();
      else
         drained = m.purchase_fees.withdraw_all();
   });

   const share_type amount = drained.get_amount();
   d.add_balance( submitter(), std::move( drained ) );

   ilog( "Platform withdrew ${a} from pool ${p}", ("a",amount)("p",op.pool) );
   d.push_applied_operation( proceeds_withdrawn_operation( marketplace.id, submitter(), amount ) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result game_proceeds_withdraw_evaluator::do_evaluate( const game_proceeds_withdraw_operation& op )
{ try {
   const database& d = db();

   const game_object& game = d.get_game( op.game_key );
   const capability_object& cap = presented_capability( op.capability );
   KEYMARKET_ASSERT( cap.bound_id == game.id, not_authorized,
                     "Capability ${c} does not authorize withdrawals of game ${g}",
                     ("c",op.capability)("g",op.game_key) );

   escrow = d.find_game_escrow( game.get_id(), op.kind );
   KEYMARKET_ASSERT( escrow != nullptr && escrow->balance.get_amount() > 0, no_funds_available,
                     "Game ${g} has no ${k} proceeds", ("g",op.game_key)("k",op.kind) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result game_proceeds_withdraw_evaluator::do_apply( const game_proceeds_withdraw_operation& op )
{ try {
   database& d = db();

   stored_value drained;
   d.modify( *escrow, [&drained]( game_escrow_object& e ) {
      drained = e.balance.withdraw_all();
   });

   const share_type amount = drained.get_amount();
   d.add_balance( submitter(), std::move( drained ) );

   ilog( "Publisher of ${g} withdrew ${a} ${k} proceeds", ("g",op.game_key)("a",amount)("k",op.kind) );
   d.push_applied_operation( proceeds_withdrawn_operation( escrow->id, submitter(), amount ) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result payout_withdraw_evaluator::do_evaluate( const payout_withdraw_operation& op )
{ try {
   escrow = db().find_payout_escrow( submitter() );
   KEYMARKET_ASSERT( escrow != nullptr && escrow->balance.get_amount() > 0, no_funds_available,
                     "${o} has no resale proceeds", ("o",submitter()) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result payout_withdraw_evaluator::do_apply( const payout_withdraw_operation& op )
{ try {
   database& d = db();

   stored_value drained;
   d.modify( *escrow, [&drained]( payout_escrow_object& e ) {
      drained = e.balance.withdraw_all();
   });

   const share_type amount = drained.get_amount();
   d.add_balance( submitter(), std::move( drained ) );

   ilog( "${o} withdrew ${a} resale proceeds", ("o",submitter())("a",amount) );
   d.push_applied_operation( proceeds_withdrawn_operation( escrow->id, submitter(), amount ) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // keymarket::chain
