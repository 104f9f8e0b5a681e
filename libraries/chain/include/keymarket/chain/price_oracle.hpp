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

namespace keymarket { namespace chain {

   /**
    *  @brief Converts USD-equivalent amounts into ledger token units
    *
    *  Prices of licenses, listings and the submission fee are quoted in USD-equivalent units.
    *  Every payment is checked against the converted amount, so an oracle must be deterministic
    *  for the duration of a transaction.
    */
   class price_oracle
   {
      public:
         virtual ~price_oracle() = default;

         /// @throw fc::exception if @p usd is negative or the result does not fit into a share_type
         virtual share_type usd_to_token( share_type usd )const = 0;
   };

   /**
    *  Converts at a constant rate of token_decimal_scale token units per USD-equivalent unit.
    */
   class fixed_ratio_price_oracle : public price_oracle
   {
      public:
         explicit fixed_ratio_price_oracle( int64_t token_decimal_scale = KEYMARKET_TOKEN_DECIMAL_SCALE );

         virtual share_type usd_to_token( share_type usd )const override;

         int64_t token_decimal_scale()const { return _scale; }

      private:
         int64_t _scale;
   };

} } // keymarket::chain
