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
#include <keymarket/chain/database.hpp>
#include <keymarket/chain/exceptions.hpp>

#include <keymarket/chain/balance_object.hpp>
#include <keymarket/chain/marketplace_object.hpp>

#include <fc/uint128.hpp>

namespace keymarket { namespace chain {

namespace detail {

   share_type calculate_percent( const share_type& value, uint16_t percent )
   {
      fc::uint128_t a(value.value);
      a *= percent;
      a /= KEYMARKET_100_PERCENT;
      FC_ASSERT( a <= KEYMARKET_MAX_SHARE_SUPPLY, "overflow when calculating percent" );
      return static_cast<int64_t>(a);
   }

} //detail

share_type database::get_balance( const address& owner )const
{
   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( owner );
   if( itr == index.end() )
      return 0;
   return itr->get_amount();
}

share_type database::get_game_escrow_balance( game_id_type game, game_escrow_kind kind )const
{
   const game_escrow_object* escrow = find_game_escrow( game, kind );
   return escrow ? escrow->balance.get_amount() : share_type(0);
}

share_type database::get_payout_escrow_balance( const address& owner )const
{
   const payout_escrow_object* escrow = find_payout_escrow( owner );
   return escrow ? escrow->balance.get_amount() : share_type(0);
}

void database::add_balance( const address& owner, stored_value&& what )
{ try {
   if( what.get_amount() == 0 )
      return;
   FC_ASSERT( what.get_amount() > 0, "Cannot add a negative amount!" );

   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( owner );
   if( itr == index.end() )
      create<account_balance_object>( [&owner,&what]( account_balance_object& b ) {
         b.owner = owner;
         b.add_balance( std::move(what) );
      });
   else
      modify( *itr, [&what]( account_balance_object& b ) {
         b.add_balance( std::move(what) );
      });
} FC_CAPTURE_AND_RETHROW( (owner)(what) ) }

stored_value database::reduce_balance( const address& owner, share_type how_much )
{ try {
   if( how_much == 0 )
      return stored_value();
   FC_ASSERT( how_much > 0, "Cannot reduce by a negative amount!" );

   const auto& index = get_index_type<account_balance_index>().indices().get<by_owner>();
   auto itr = index.find( owner );
   KEYMARKET_ASSERT( itr != index.end() && itr->get_amount() >= how_much, insufficient_balance,
                     "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                     ("a",owner)("b",get_balance( owner ))("r",how_much) );
   stored_value result;
   modify( *itr, [&how_much,&result]( account_balance_object& b ) {
      result = b.reduce_balance( how_much );
   });
   return result;
} FC_CAPTURE_AND_RETHROW( (owner)(how_much) ) }

void database::deposit_game_escrow( game_id_type game, game_escrow_kind kind, stored_value&& what )
{ try {
   if( what.get_amount() == 0 )
      return;
   FC_ASSERT( what.get_amount() > 0, "Cannot deposit a negative amount!" );

   const game_escrow_object* escrow = find_game_escrow( game, kind );
   if( escrow == nullptr )
      create<game_escrow_object>( [game,kind,&what]( game_escrow_object& e ) {
         e.game = game;
         e.kind = kind;
         e.balance = std::move(what);
      });
   else
      modify( *escrow, [&what]( game_escrow_object& e ) {
         e.balance += std::move(what);
      });
} FC_CAPTURE_AND_RETHROW( (game)(kind)(what) ) }

void database::deposit_payout_escrow( const address& owner, stored_value&& what )
{ try {
   if( what.get_amount() == 0 )
      return;
   FC_ASSERT( what.get_amount() > 0, "Cannot deposit a negative amount!" );

   const payout_escrow_object* escrow = find_payout_escrow( owner );
   if( escrow == nullptr )
      create<payout_escrow_object>( [&owner,&what]( payout_escrow_object& e ) {
         e.owner = owner;
         e.balance = std::move(what);
      });
   else
      modify( *escrow, [&what]( payout_escrow_object& e ) {
         e.balance += std::move(what);
      });
} FC_CAPTURE_AND_RETHROW( (owner)(what) ) }

share_type database::get_total_value()const
{
   share_type total = 0;
   const marketplace_object& marketplace = get_marketplace();
   total += marketplace.submission_fees.get_amount();
   total += marketplace.purchase_fees.get_amount();
   for( const auto& b : get_index_type<account_balance_index>().indices() )
      total += b.balance.get_amount();
   for( const auto& e : get_index_type<game_escrow_index>().indices() )
      total += e.balance.get_amount();
   for( const auto& e : get_index_type<payout_escrow_index>().indices() )
      total += e.balance.get_amount();
   return total;
}

} }
