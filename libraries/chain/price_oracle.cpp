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
#include <keymarket/chain/price_oracle.hpp>

#include <fc/exception/exception.hpp>
#include <fc/uint128.hpp>

namespace keymarket { namespace chain {

fixed_ratio_price_oracle::fixed_ratio_price_oracle( int64_t token_decimal_scale )
   : _scale( token_decimal_scale )
{
   FC_ASSERT( _scale > 0, "Token decimal scale must be positive", ("scale",_scale) );
}

share_type fixed_ratio_price_oracle::usd_to_token( share_type usd )const
{
   FC_ASSERT( usd >= 0, "Cannot convert a negative amount", ("usd",usd) );
   fc::uint128_t result( usd.value );
   result *= static_cast<uint64_t>( _scale );
   FC_ASSERT( result <= KEYMARKET_MAX_SHARE_SUPPLY, "overflow when converting ${usd} USD to tokens",
              ("usd",usd)("scale",_scale) );
   return static_cast<int64_t>( result );
}

} } // keymarket::chain
