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
#include <keymarket/protocol/license.hpp>

namespace keymarket { namespace protocol {

static void validate_rates( uint16_t discount_rate, uint16_t royalty_rate )
{
   KEYMARKET_ASSERT( discount_rate <= KEYMARKET_100_PERCENT, invalid_discount_rate,
                     "Discount rate ${r} exceeds 100%", ("r",discount_rate) );
   KEYMARKET_ASSERT( royalty_rate <= KEYMARKET_100_PERCENT, invalid_royalty_rate,
                     "Royalty rate ${r} exceeds 100%", ("r",royalty_rate) );
}

static void validate_price( const share_type& price )
{
   FC_ASSERT( price >= 0, "Price can not be negative" );
   FC_ASSERT( price <= KEYMARKET_MAX_SHARE_SUPPLY, "Price is too large" );
}

void license_options::validate()const
{
   validate_price( publisher_price );
   validate_rates( discount_rate, royalty_rate );
   validate_localized_text( short_descriptions );
}

void license_create_operation::validate()const
{
   FC_ASSERT( !game_key.empty(), "Game key can not be empty" );
   options.validate();
}

void license_update_operation::validate()const
{
   FC_ASSERT( !game_key.empty(), "Game key can not be empty" );
   FC_ASSERT( new_name.valid() || new_thumbnail.valid() || new_short_descriptions.valid()
              || new_publisher_price.valid() || new_discount_rate.valid() || new_royalty_rate.valid()
              || new_permit_resale.valid() || new_limit_auth_count.valid(),
              "Nothing to update" );
   if( new_publisher_price.valid() )
      validate_price( *new_publisher_price );
   validate_rates( new_discount_rate.valid() ? *new_discount_rate : 0,
                   new_royalty_rate.valid() ? *new_royalty_rate : 0 );
   if( new_short_descriptions.valid() )
      validate_localized_text( *new_short_descriptions );
}

void license_purchase_operation::validate()const
{
   FC_ASSERT( !game_key.empty(), "Game key can not be empty" );
   FC_ASSERT( payment >= 0, "Payment can not be negative" );
   FC_ASSERT( !buyer.is_null(), "A license key can not be issued to the null address" );
}

} } // keymarket::protocol
