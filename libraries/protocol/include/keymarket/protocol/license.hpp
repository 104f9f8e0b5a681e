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
    * @brief The publisher controlled terms of a license
    */
   struct license_options
   {
      string          name;
      string          thumbnail;
      localized_text  short_descriptions;
      /// list price in USD-equivalent units
      share_type      publisher_price;
      /// in KEYMARKET_100_PERCENT units, subtracted from the list price at purchase
      uint16_t        discount_rate = 0;
      /// in KEYMARKET_100_PERCENT units, paid to the publisher on every resale
      uint16_t        royalty_rate = 0;
      bool            permit_resale = false;
      /// number of distinct users a key may be authenticated by
      uint32_t        limit_auth_count = 0;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Adds a license to a game. Requires the publisher capability of the game.
    *
    * @return the id of the new license
    */
   struct license_create_operation : public base_operation
   {
      string              game_key;
      capability_id_type  capability;
      license_options     options;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Changes the terms of a license. Requires the publisher capability of the game.
    *
    * Keys that were already issued keep their display snapshot, every rule checked later
    * (discount, royalty, resale permission, authentication cap) uses the new values.
    */
   struct license_update_operation : public base_operation
   {
      string                    game_key;
      license_id_type           license;
      capability_id_type        capability;

      optional<string>          new_name;
      optional<string>          new_thumbnail;
      optional<localized_text>  new_short_descriptions;
      optional<share_type>      new_publisher_price;
      optional<uint16_t>        new_discount_rate;
      optional<uint16_t>        new_royalty_rate;
      optional<bool>            new_permit_resale;
      optional<uint32_t>        new_limit_auth_count;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Buys a license key
    *
    * The submitter pays @ref payment from its wallet, the key is issued to @ref buyer.
    * @ref payment must be exactly the discounted price converted to ledger units.
    *
    * @return the id of the new license key
    */
   struct license_purchase_operation : public base_operation
   {
      string           game_key;
      license_id_type  license;
      share_type       payment;
      address          buyer;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Binds the submitter as the current user of a key it owns
    *
    * Each switch to a new user consumes one authentication of the license limit,
    * authenticating again as the current user changes nothing.
    */
   struct license_authenticate_operation : public base_operation
   {
      license_key_id_type  key;

      void validate()const {}
   };

   /**
    * @ingroup operations
    *
    * Virtual op emitted when a license has been added to a game
    */
   struct license_created_operation : public virtual_operation
   {
      license_created_operation() = default;
      license_created_operation( const string& key, license_id_type l )
         : game_key(key), license(l) {}

      string           game_key;
      license_id_type  license;
   };

   /**
    * @ingroup operations
    *
    * Virtual op emitted when a license key has been sold by the marketplace
    */
   struct license_purchased_operation : public virtual_operation
   {
      string               game_key;
      license_id_type      license;
      license_key_id_type  key;
      address              buyer;
      /// converted amount taken from the payer
      share_type           price_paid;
      /// part of @ref price_paid kept by the platform
      share_type           platform_fee;
   };

} } // keymarket::protocol

FC_REFLECT( keymarket::protocol::license_options,
            (name)(thumbnail)(short_descriptions)(publisher_price)(discount_rate)(royalty_rate)
            (permit_resale)(limit_auth_count) )
FC_REFLECT( keymarket::protocol::license_create_operation, (game_key)(capability)(options) )
FC_REFLECT( keymarket::protocol::license_update_operation,
            (game_key)(license)(capability)(new_name)(new_thumbnail)(new_short_descriptions)
            (new_publisher_price)(new_discount_rate)(new_royalty_rate)(new_permit_resale)(new_limit_auth_count) )
FC_REFLECT( keymarket::protocol::license_purchase_operation, (game_key)(license)(payment)(buyer) )
FC_REFLECT( keymarket::protocol::license_authenticate_operation, (key) )
FC_REFLECT( keymarket::protocol::license_created_operation, (game_key)(license) )
FC_REFLECT( keymarket::protocol::license_purchased_operation,
            (game_key)(license)(key)(buyer)(price_paid)(platform_fee) )
