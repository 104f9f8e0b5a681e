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

#include <keymarket/chain/balance_object.hpp>
#include <keymarket/chain/capability_object.hpp>
#include <keymarket/chain/marketplace_object.hpp>

namespace keymarket { namespace chain {

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( !_genesis_done, "Genesis state has already been applied" );
   genesis_state.validate();

   _undo_db.disable();

   if( !_price_oracle )
      _price_oracle = std::make_shared<fixed_ratio_price_oracle>( genesis_state.token_decimal_scale );

   // Create the two marketplace roots and the supply tracker
   const marketplace_object& marketplace = create<marketplace_object>( [&genesis_state]( marketplace_object& m ) {
      m.purchase_fee_rate  = genesis_state.initial_parameters.purchase_fee_rate;
      m.submission_fee_usd = genesis_state.initial_parameters.submission_fee_usd;
   });
   FC_ASSERT( marketplace.get_id() == marketplace_id_type() );
   FC_ASSERT( create<resale_market_object>( []( resale_market_object& ){} ).get_id() == resale_market_id_type() );
   const token_supply_object& supply = create<token_supply_object>( []( token_supply_object& ){} );
   FC_ASSERT( supply.get_id() == token_supply_id_type() );

   // The platform operator holds the only capability bound to the marketplace root
   issue_capability( platform_capability, marketplace.id, genesis_state.platform_operator );

   // Issue the initial supply
   for( const auto& handout : genesis_state.initial_balances )
   {
      stored_value issued;
      modify( supply, [&issued,&handout]( token_supply_object& s ) {
         issued = s.current_supply.issue( handout.amount );
      });
      add_balance( handout.owner, std::move( issued ) );
   }

   ilog( "Initialized marketplace with ${n} initial balances totalling ${s}, platform operator ${o}",
         ("n",genesis_state.initial_balances.size())
         ("s",get_token_supply().current_supply.get_amount())
         ("o",genesis_state.platform_operator) );

   _genesis_done = true;
   _undo_db.enable();
} FC_CAPTURE_AND_RETHROW() }

} }
