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
#include <keymarket/protocol/withdraw.hpp>
#include <keymarket/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace keymarket { namespace chain {

   class account_balance_object;

   class account_balance_master
      : public abstract_object< account_balance_master, implementation_ids, impl_account_balance_object_type,
                                account_balance_object >
   {
      public:
         address owner;
   };

   /**
    * @brief The wallet of one address
    * @ingroup object
    * @ingroup implementation
    *
    * Payments are taken from the wallet of the submitter, withdrawals and transfers end up here.
    * Wallets are created on first deposit and never removed.
    */
   class account_balance_object : public account_balance_master
   {
      public:
         stored_value balance;

         share_type get_amount()const { return balance.get_amount(); }
         void  add_balance( stored_value&& delta );
         stored_value reduce_balance( share_type delta );

      protected:
         virtual unique_ptr<object> backup()const override;
         virtual void restore( object& obj ) override;
         virtual void clear() override;
   };

   class game_escrow_object;

   class game_escrow_master
      : public abstract_object< game_escrow_master, implementation_ids, impl_game_escrow_object_type,
                                game_escrow_object >
   {
      public:
         game_id_type      game;
         game_escrow_kind  kind = sales_escrow;
   };

   /**
    * @brief Publisher proceeds of one game
    * @ingroup object
    * @ingroup implementation
    *
    * Each game has at most one escrow per kind: sales proceeds of the primary market and
    * royalties of the resale market. Escrows are created on the first nonzero deposit.
    */
   class game_escrow_object : public game_escrow_master
   {
      public:
         stored_value balance;

      protected:
         virtual unique_ptr<object> backup()const override;
         virtual void restore( object& obj ) override;
         virtual void clear() override;
   };

   class payout_escrow_object;

   class payout_escrow_master
      : public abstract_object< payout_escrow_master, implementation_ids, impl_payout_escrow_object_type,
                                payout_escrow_object >
   {
      public:
         address owner;
   };

   /**
    * @brief Resale proceeds of one reseller, waiting to be withdrawn
    * @ingroup object
    * @ingroup implementation
    */
   class payout_escrow_object : public payout_escrow_master
   {
      public:
         stored_value balance;

      protected:
         virtual unique_ptr<object> backup()const override;
         virtual void restore( object& obj ) override;
         virtual void clear() override;
   };

   struct by_owner;
   struct by_game_kind;

   /**
    * @ingroup object_index
    */
   using account_balance_multi_index_type = multi_index_container<
      account_balance_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< account_balance_master, address, &account_balance_master::owner > >
      >
   >;

   /**
    * @ingroup object_index
    */
   using account_balance_index = generic_index<account_balance_object, account_balance_multi_index_type>;

   using game_escrow_multi_index_type = multi_index_container<
      game_escrow_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_game_kind>,
            composite_key< game_escrow_object,
               member< game_escrow_master, game_id_type, &game_escrow_master::game >,
               member< game_escrow_master, game_escrow_kind, &game_escrow_master::kind >
            >
         >
      >
   >;

   using game_escrow_index = generic_index<game_escrow_object, game_escrow_multi_index_type>;

   using payout_escrow_multi_index_type = multi_index_container<
      payout_escrow_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>, member< payout_escrow_master, address, &payout_escrow_master::owner > >
      >
   >;

   using payout_escrow_index = generic_index<payout_escrow_object, payout_escrow_multi_index_type>;

} } // keymarket::chain

MAP_OBJECT_ID_TO_TYPE(keymarket::chain::account_balance_object)
MAP_OBJECT_ID_TO_TYPE(keymarket::chain::game_escrow_object)
MAP_OBJECT_ID_TO_TYPE(keymarket::chain::payout_escrow_object)

FC_REFLECT_DERIVED( keymarket::chain::account_balance_master, (keymarket::db::object), (owner) )
FC_REFLECT_DERIVED( keymarket::chain::account_balance_object, (keymarket::chain::account_balance_master), (balance) )
FC_REFLECT_DERIVED( keymarket::chain::game_escrow_master, (keymarket::db::object), (game)(kind) )
FC_REFLECT_DERIVED( keymarket::chain::game_escrow_object, (keymarket::chain::game_escrow_master), (balance) )
FC_REFLECT_DERIVED( keymarket::chain::payout_escrow_master, (keymarket::db::object), (owner) )
FC_REFLECT_DERIVED( keymarket::chain::payout_escrow_object, (keymarket::chain::payout_escrow_master), (balance) )
