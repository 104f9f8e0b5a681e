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
#include <keymarket/chain/genesis_state.hpp>

#include <fc/exception/exception.hpp>

namespace keymarket { namespace chain {

void genesis_state_type::validate()const
{ try {
   FC_ASSERT( !platform_operator.is_null(), "The platform operator must be set" );
   FC_ASSERT( initial_parameters.purchase_fee_rate <= KEYMARKET_100_PERCENT,
              "Purchase fee rate can not exceed 100%" );
   FC_ASSERT( initial_parameters.submission_fee_usd >= 0, "Submission fee can not be negative" );
   FC_ASSERT( token_decimal_scale > 0, "Token decimal scale must be positive" );

   share_type total_supply = 0;
   for( const auto& balance : initial_balances )
   {
      FC_ASSERT( !balance.owner.is_null(), "Initial balance without owner" );
      FC_ASSERT( balance.amount > 0, "Initial balance of ${o} must be positive", ("o",balance.owner) );
      FC_ASSERT( balance.amount <= KEYMARKET_MAX_SHARE_SUPPLY - total_supply,
                 "Initial balances exceed the maximum supply" );
      total_supply += balance.amount;
   }
} FC_CAPTURE_AND_RETHROW( (*this) ) }

} } // keymarket::chain
