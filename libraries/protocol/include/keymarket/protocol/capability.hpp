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

namespace keymarket { namespace protocol {

   enum capability_kind
   {
      platform_capability  = 0, ///< authorizes the platform pools and the marketplace parameters
      publisher_capability = 1  ///< authorizes catalog changes and proceeds of one game
   };

   /**
    * @ingroup operations
    *
    * @brief Hands a capability to another address; only its current holder may do this
    */
   struct capability_transfer_operation : public base_operation
   {
      capability_id_type  capability;
      address             new_holder;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Changes the marketplace fee parameters. Requires the platform capability.
    */
   struct marketplace_update_operation : public base_operation
   {
      capability_id_type    capability;
      /// in KEYMARKET_100_PERCENT units
      optional<uint16_t>    new_purchase_fee_rate;
      /// in USD-equivalent units
      optional<share_type>  new_submission_fee_usd;

      void validate()const;
   };

} } // keymarket::protocol

FC_REFLECT_ENUM( keymarket::protocol::capability_kind, (platform_capability)(publisher_capability) )
FC_REFLECT( keymarket::protocol::capability_transfer_operation, (capability)(new_holder) )
FC_REFLECT( keymarket::protocol::marketplace_update_operation,
            (capability)(new_purchase_fee_rate)(new_submission_fee_usd) )
