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
#include <keymarket/chain/stored_value.hpp>
#include <keymarket/db/object.hpp>

namespace keymarket { namespace chain {

   class marketplace_object;

   /**
    * @brief The fee parameters of the marketplace
    * @ingroup object
    * @ingroup implementation
    */
   class marketplace_master
      : public abstract_object< marketplace_master, implementation_ids, impl_marketplace_object_type,
                                marketplace_object >
   {
      public:
         /// in KEYMARKET_100_PERCENT units, charged on every license purchase
         uint16_t    purchase_fee_rate = KEYMARKET_DEFAULT_PURCHASE_FEE_RATE;
         /// in USD-equivalent units, charged on every game registration
         share_type  submission_fee_usd = KEYMARKET_DEFAULT_SUBMISSION_FEE_USD;
   };

   /**
    * @brief Root of the primary market
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one marketplace_object, 2.0.0. It holds the platform pools, which only
    * the holder of the platform capability can drain.
    */
   class marketplace_object : public marketplace_master
   {
      public:
         stored_value submission_fees;
         stored_value purchase_fees;

      protected:
         virtual unique_ptr<object> backup()const override;
         virtual void restore( object& obj ) override;
         virtual void clear() override;
   };

   /**
    * @brief Root of the resale market
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one resale_market_object, 2.1.0. Royalty escrows and reseller payout
    * escrows belong to it.
    */
   class resale_market_object : public abstract_object< resale_market_object, implementation_ids,
                                                        impl_resale_market_object_type >
   {
      public:
         uint32_t  active_listings = 0;
         uint64_t  completed_resales = 0;
   };

   class token_supply_object;

   class token_supply_master
      : public abstract_object< token_supply_master, implementation_ids, impl_token_supply_object_type,
                                token_supply_object >
   {
   };

   /**
    * @brief Tracks the debt that backs every token in existence
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one token_supply_object, 2.2.0. Its current_supply equals the sum of all
    * balances held anywhere in the database.
    */
   class token_supply_object : public token_supply_master
   {
      public:
         stored_debt current_supply;

      protected:
         virtual unique_ptr<object> backup()const override;
         virtual void restore( object& obj ) override;
         virtual void clear() override;
   };

} } // keymarket::chain

MAP_OBJECT_ID_TO_TYPE(keymarket::chain::marketplace_object)
MAP_OBJECT_ID_TO_TYPE(keymarket::chain::resale_market_object)
MAP_OBJECT_ID_TO_TYPE(keymarket::chain::token_supply_object)

FC_REFLECT_DERIVED( keymarket::chain::marketplace_master, (keymarket::db::object),
                    (purchase_fee_rate)(submission_fee_usd) )
FC_REFLECT_DERIVED( keymarket::chain::marketplace_object, (keymarket::chain::marketplace_master),
                    (submission_fees)(purchase_fees) )
FC_REFLECT_DERIVED( keymarket::chain::resale_market_object, (keymarket::db::object),
                    (active_listings)(completed_resales) )
FC_REFLECT_DERIVED( keymarket::chain::token_supply_master, (keymarket::db::object), )
FC_REFLECT_DERIVED( keymarket::chain::token_supply_object, (keymarket::chain::token_supply_master),
                    (current_supply) )
