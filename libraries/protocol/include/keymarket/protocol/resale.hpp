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

   /**
    * @ingroup operations
    *
    * @brief Puts a license key owned by the submitter up for resale
    *
    * The key leaves the key index and lives inside the listing until it is bought or the
    * listing is cancelled.
    *
    * @return the id of the listing
    */
   struct resale_list_operation : public base_operation
   {
      license_key_id_type  key;
      string               reseller_name;
      string               description;
      /// asking price in USD-equivalent units
      share_type           price;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Buys a listed key; the submitter pays, @ref buyer becomes the owner of the key
    *
    * @return the id of the key, unchanged from before the listing
    */
   struct resale_buy_operation : public base_operation
   {
      resale_listing_id_type  listing;
      share_type              payment;
      address                 buyer;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Withdraws a listing; only the seller may do this and gets the key back
    */
   struct resale_cancel_operation : public base_operation
   {
      resale_listing_id_type  listing;

      void validate()const {}
   };

   /**
    * @ingroup operations
    *
    * Virtual op emitted when a key has been listed for resale
    */
   struct license_listed_operation : public virtual_operation
   {
      resale_listing_id_type  listing;
      license_key_id_type     key;
      address                 seller;
      share_type              price;
   };

   /**
    * @ingroup operations
    *
    * Virtual op emitted when a listed key has been bought
    */
   struct license_resold_operation : public virtual_operation
   {
      resale_listing_id_type  listing;
      license_key_id_type     key;
      address                 seller;
      address                 buyer;
      share_type              price_paid;
      share_type              royalty;
   };

} } // keymarket::protocol

FC_REFLECT( keymarket::protocol::resale_list_operation, (key)(reseller_name)(description)(price) )
FC_REFLECT( keymarket::protocol::resale_buy_operation, (listing)(payment)(buyer) )
FC_REFLECT( keymarket::protocol::resale_cancel_operation, (listing) )
FC_REFLECT( keymarket::protocol::license_listed_operation, (listing)(key)(seller)(price) )
FC_REFLECT( keymarket::protocol::license_resold_operation, (listing)(key)(seller)(buyer)(price_paid)(royalty) )
