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
#pragma once

#include <keymarket/chain/types.hpp>

#include <string>
#include <vector>

namespace keymarket { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_parameters_type {
      /// in KEYMARKET_100_PERCENT units
      uint16_t   purchase_fee_rate = KEYMARKET_DEFAULT_PURCHASE_FEE_RATE;
      /// in USD-equivalent units
      share_type submission_fee_usd = KEYMARKET_DEFAULT_SUBMISSION_FEE_USD;
   };
   struct initial_balance_type {
      address owner;
      share_type amount;
   };

   /// receives the platform capability
   address                         platform_operator;
   initial_parameters_type         initial_parameters;
   /// token units per USD-equivalent unit, used by the default price oracle
   int64_t                         token_decimal_scale = KEYMARKET_TOKEN_DECIMAL_SCALE;
   vector<initial_balance_type>    initial_balances;

   /// Checks the genesis state for consistency, throws fc::assert_exception on failure
   void validate()const;
};

} } // namespace keymarket::chain

FC_REFLECT( keymarket::chain::genesis_state_type::initial_parameters_type, (purchase_fee_rate)(submission_fee_usd) )
FC_REFLECT( keymarket::chain::genesis_state_type::initial_balance_type, (owner)(amount) )
FC_REFLECT( keymarket::chain::genesis_state_type,
            (platform_operator)(initial_parameters)(token_decimal_scale)(initial_balances) )
