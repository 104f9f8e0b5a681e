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
#include <keymarket/chain/capability_object.hpp>
#include <keymarket/chain/game_object.hpp>
#include <keymarket/chain/license_object.hpp>
#include <keymarket/chain/marketplace_object.hpp>
#include <keymarket/chain/resale_listing_object.hpp>

#include <iterator>

namespace keymarket { namespace chain {

const marketplace_object& database::get_marketplace()const
{
   return get( marketplace_id_type() );
}

const resale_market_object& database::get_resale_market()const
{
   return get( resale_market_id_type() );
}

const token_supply_object& database::get_token_supply()const
{
   return get( token_supply_id_type() );
}

const game_object* database::find_game( const string& game_key )const
{
   const auto& idx = get_index_type<game_index>().indices().get<by_game_key>();
   auto itr = idx.find( game_key );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const game_object& database::get_game( const string& game_key )const
{
   const game_object* game = find_game( game_key );
   KEYMARKET_ASSERT( game != nullptr, game_not_found, "Game ${g} does not exist", ("g",game_key) );
   return *game;
}

const game_object& database::get_game_by_index( uint64_t n )const
{
   const auto& idx = get_index_type<game_index>().indices().get<by_id>();
   KEYMARKET_ASSERT( n < idx.size(), index_out_of_range, "There are only ${c} games", ("c",idx.size())("n",n) );
   auto itr = idx.begin();
   std::advance( itr, n );
   return *itr;
}

uint64_t database::game_count()const
{
   return get_index_type<game_index>().indices().size();
}

const license_object& database::get_license( const game_object& game, license_id_type license )const
{
   const license_object* obj = find( license );
   KEYMARKET_ASSERT( obj != nullptr && obj->game == game.get_id(), license_not_found,
                     "Game ${g} has no license ${l}", ("g",game.game_key)("l",license) );
   return *obj;
}

const license_object& database::get_license_by_index( const game_object& game, uint64_t n )const
{
   const auto& idx = get_index_type<license_index>().indices().get<by_game>();
   auto range = idx.equal_range( boost::make_tuple( game.get_id() ) );
   const uint64_t count = std::distance( range.first, range.second );
   KEYMARKET_ASSERT( n < count, index_out_of_range, "Game ${g} has only ${c} licenses",
                     ("g",game.game_key)("c",count)("n",n) );
   auto itr = range.first;
   std::advance( itr, n );
   return *itr;
}

uint64_t database::license_count( const game_object& game )const
{
   const auto& idx = get_index_type<license_index>().indices().get<by_game>();
   return idx.count( boost::make_tuple( game.get_id() ) );
}

const license_key_object& database::get_license_key( license_key_id_type id )const
{
   const license_key_object* key = find( id );
   KEYMARKET_ASSERT( key != nullptr, license_key_not_found, "License key ${k} does not exist", ("k",id) );
   return *key;
}

vector<license_key_id_type> database::get_license_keys_by_owner( const address& owner )const
{
   vector<license_key_id_type> result;
   const auto& idx = get_index_type<license_key_index>().indices().get<by_owner>();
   auto range = idx.equal_range( boost::make_tuple( owner ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

const resale_listing_object& database::get_listing( resale_listing_id_type id )const
{
   const resale_listing_object* listing = find( id );
   KEYMARKET_ASSERT( listing != nullptr, listing_not_found, "Listing ${l} does not exist", ("l",id) );
   return *listing;
}

const capability_object& database::get_capability( capability_id_type id )const
{
   const capability_object* cap = find( id );
   FC_ASSERT( cap != nullptr, "Capability ${c} does not exist", ("c",id) );
   return *cap;
}

vector<capability_id_type> database::get_capabilities_by_holder( const address& holder )const
{
   vector<capability_id_type> result;
   const auto& idx = get_index_type<capability_index>().indices().get<by_holder>();
   auto range = idx.equal_range( boost::make_tuple( holder ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( itr->get_id() );
   return result;
}

const game_escrow_object* database::find_game_escrow( game_id_type game, game_escrow_kind kind )const
{
   const auto& idx = get_index_type<game_escrow_index>().indices().get<by_game_kind>();
   auto itr = idx.find( boost::make_tuple( game, kind ) );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const payout_escrow_object* database::find_payout_escrow( const address& owner )const
{
   const auto& idx = get_index_type<payout_escrow_index>().indices().get<by_owner>();
   auto itr = idx.find( owner );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

} }
