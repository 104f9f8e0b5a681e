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
#include <keymarket/protocol/base.hpp>
#include <keymarket/protocol/capability.hpp>
#include <keymarket/protocol/game.hpp>
#include <keymarket/protocol/license.hpp>
#include <keymarket/protocol/resale.hpp>
#include <keymarket/protocol/transfer.hpp>
#include <keymarket/protocol/withdraw.hpp>

namespace keymarket { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   using operation = fc::static_variant<
            /*  0 */ transfer_operation,
            /*  1 */ game_register_operation,
            /*  2 */ game_update_operation,
            /*  3 */ license_create_operation,
            /*  4 */ license_update_operation,
            /*  5 */ license_purchase_operation,
            /*  6 */ license_authenticate_operation,
            /*  7 */ resale_list_operation,
            /*  8 */ resale_buy_operation,
            /*  9 */ resale_cancel_operation,
            /* 10 */ platform_withdraw_operation,
            /* 11 */ game_proceeds_withdraw_operation,
            /* 12 */ payout_withdraw_operation,
            /* 13 */ marketplace_update_operation,
            /* 14 */ capability_transfer_operation,
            /* 15 */ game_registered_operation,     // VIRTUAL
            /* 16 */ license_created_operation,     // VIRTUAL
            /* 17 */ license_purchased_operation,   // VIRTUAL
            /* 18 */ license_listed_operation,      // VIRTUAL
            /* 19 */ license_resold_operation,      // VIRTUAL
            /* 20 */ proceeds_withdrawn_operation   // VIRTUAL
         >;

   /// Calls validate() of the contained operation
   void operation_validate( const operation& op );

   /// @return true when @p op may only be produced by the database itself
   bool is_virtual_operation( const operation& op );

} } // keymarket::protocol

FC_REFLECT_TYPENAME( keymarket::protocol::operation )
