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
#include <keymarket/protocol/resale.hpp>
#include <keymarket/protocol/transfer.hpp>
#include <keymarket/protocol/withdraw.hpp>
#include <keymarket/protocol/capability.hpp>

namespace keymarket { namespace protocol {

void transfer_operation::validate()const
{
   FC_ASSERT( amount > 0, "Transfer amount must be positive" );
   FC_ASSERT( !to.is_null(), "Can not transfer to the null address" );
}

void resale_list_operation::validate()const
{
   FC_ASSERT( price >= 0, "Price can not be negative" );
   FC_ASSERT( price <= KEYMARKET_MAX_SHARE_SUPPLY, "Price is too large" );
}

void resale_buy_operation::validate()const
{
   FC_ASSERT( payment >= 0, "Payment can not be negative" );
   FC_ASSERT( !buyer.is_null(), "A license key can not be transferred to the null address" );
}

void platform_withdraw_operation::validate()const
{
   FC_ASSERT( pool == submission_fee_pool || pool == purchase_fee_pool, "Unknown platform pool", ("pool",pool) );
}

void game_proceeds_withdraw_operation::validate()const
{
   FC_ASSERT( !game_key.empty(), "Game key can not be empty" );
   FC_ASSERT( kind == sales_escrow || kind == royalty_escrow, "Unknown escrow kind", ("kind",kind) );
}

void capability_transfer_operation::validate()const
{
   FC_ASSERT( !new_holder.is_null(), "Can not transfer a capability to the null address" );
}

void marketplace_update_operation::validate()const
{
   FC_ASSERT( new_purchase_fee_rate.valid() || new_submission_fee_usd.valid(), "Nothing to update" );
   if( new_purchase_fee_rate.valid() )
      FC_ASSERT( *new_purchase_fee_rate <= KEYMARKET_100_PERCENT, "Purchase fee rate exceeds 100%",
                 ("rate",*new_purchase_fee_rate) );
   if( new_submission_fee_usd.valid() )
      FC_ASSERT( *new_submission_fee_usd >= 0, "Submission fee can not be negative" );
}

} } // keymarket::protocol
