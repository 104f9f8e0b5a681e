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

   /// The two pools the platform accrues
   enum platform_pool
   {
      submission_fee_pool = 0,
      purchase_fee_pool   = 1
   };

   /// The two pools every game accrues for its publisher
   enum game_escrow_kind
   {
      sales_escrow   = 0,
      royalty_escrow = 1
   };

   /**
    * @ingroup operations
    *
    * @brief Drains one platform pool into the wallet of the submitter. Requires the platform capability.
    */
   struct platform_withdraw_operation : public base_operation
   {
      capability_id_type  capability;
      platform_pool       pool = submission_fee_pool;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Drains one escrow of a game into the wallet of the submitter. Requires the publisher
    * capability of the game.
    */
   struct game_proceeds_withdraw_operation : public base_operation
   {
      string              game_key;
      capability_id_type  capability;
      game_escrow_kind    kind = sales_escrow;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Drains the reseller payout escrow of the submitter into its wallet
    */
   struct payout_withdraw_operation : public base_operation
   {
      void validate()const {}
   };

   /**
    * @ingroup operations
    *
    * Virtual op emitted whenever a pool has been drained
    */
   struct proceeds_withdrawn_operation : public virtual_operation
   {
      proceeds_withdrawn_operation() = default;
      proceeds_withdrawn_operation( object_id_type p, const address& o, share_type a )
         : pool(p), owner(o), amount(a) {}

      /// the object that held the drained pool
      object_id_type  pool;
      address         owner;
      share_type      amount;
   };

} } // keymarket::protocol

FC_REFLECT_ENUM( keymarket::protocol::platform_pool, (submission_fee_pool)(purchase_fee_pool) )
FC_REFLECT_ENUM( keymarket::protocol::game_escrow_kind, (sales_escrow)(royalty_escrow) )
FC_REFLECT( keymarket::protocol::platform_withdraw_operation, (capability)(pool) )
FC_REFLECT( keymarket::protocol::game_proceeds_withdraw_operation, (game_key)(capability)(kind) )
FC_REFLECT( keymarket::protocol::payout_withdraw_operation, )
FC_REFLECT( keymarket::protocol::proceeds_withdrawn_operation, (pool)(owner)(amount) )
