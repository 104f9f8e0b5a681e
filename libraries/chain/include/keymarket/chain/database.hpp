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

#include <keymarket/chain/balance_object.hpp>
#include <keymarket/chain/capability_object.hpp>
#include <keymarket/chain/evaluator.hpp>
#include <keymarket/chain/game_object.hpp>
#include <keymarket/chain/genesis_state.hpp>
#include <keymarket/chain/license_object.hpp>
#include <keymarket/chain/marketplace_object.hpp>
#include <keymarket/chain/operation_history_object.hpp>
#include <keymarket/chain/price_oracle.hpp>
#include <keymarket/chain/resale_listing_object.hpp>

#include <keymarket/protocol/transaction.hpp>

#include <keymarket/db/object_database.hpp>
#include <keymarket/db/object.hpp>
#include <keymarket/db/simple_index.hpp>
#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

#include <memory>

namespace keymarket { namespace chain {
   using keymarket::db::abstract_object;
   using keymarket::db::object;
   class op_evaluator;
   class transaction_evaluation_state;

   namespace detail {
      /// floor( value * percent / KEYMARKET_100_PERCENT ), computed without intermediate overflow
      share_type calculate_percent( const share_type& value, uint16_t percent );
   }

   /**
    *   @class database
    *   @brief tracks the marketplace state in an extensible manner
    *
    *   Every change is made by pushing a transaction on behalf of a submitter. A transaction
    *   either applies completely or not at all.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Creates the marketplace roots, the platform capability and the initial balances
          *
          * Must be called exactly once, on an empty database. Installs a fixed_ratio_price_oracle
          * with the token decimal scale of the genesis state unless an oracle was set before.
          */
         void init_genesis( const genesis_state_type& genesis_state );

         /// Replaces the price oracle used to convert USD-equivalent prices into tokens
         void set_price_oracle( std::shared_ptr<price_oracle> oracle );
         const price_oracle& get_price_oracle()const;
         share_type usd_to_token( share_type usd )const;

         //////////////////// db_transaction.cpp ////////////////////

         /**
          * @brief Applies all operations of @p trx as if called by @p submitter
          *
          * On failure every change made by the transaction is undone and the exception is rethrown.
          * On success the applied operations are published through applied_operation.
          */
         processed_transaction push_transaction( const transaction& trx, const address& submitter );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         /**
          *  This signal is emitted for every operation (submitted or virtual) of a transaction
          *  after the transaction has been committed
          */
         fc::signal<void(const operation_history_object&)>  applied_operation;

         /**
          *  This method is used to track applied operations during the evaluation of a transaction, these
          *  are the operations of the last transaction pushed.
          */
         uint32_t push_applied_operation( const operation& op );
         void     set_applied_operation_result( uint32_t op_id, const operation_result& r );
         const vector<optional< operation_history_object > >& get_applied_operations()const;

         //////////////////// db_getter.cpp ////////////////////

         const marketplace_object&     get_marketplace()const;
         const resale_market_object&   get_resale_market()const;
         const token_supply_object&    get_token_supply()const;

         /// @throw game_not_found
         const game_object&            get_game( const string& game_key )const;
         const game_object*            find_game( const string& game_key )const;
         /// Games in registration order; @throw index_out_of_range
         const game_object&            get_game_by_index( uint64_t n )const;
         uint64_t                      game_count()const;

         /// @throw license_not_found unless @p license exists and belongs to @p game
         const license_object&         get_license( const game_object& game, license_id_type license )const;
         /// Licenses of @p game in creation order; @throw index_out_of_range
         const license_object&         get_license_by_index( const game_object& game, uint64_t n )const;
         uint64_t                      license_count( const game_object& game )const;

         /// @throw license_key_not_found, also while the key is listed for resale
         const license_key_object&     get_license_key( license_key_id_type id )const;
         vector<license_key_id_type>   get_license_keys_by_owner( const address& owner )const;

         /// @throw listing_not_found
         const resale_listing_object&  get_listing( resale_listing_id_type id )const;

         const capability_object&      get_capability( capability_id_type id )const;
         vector<capability_id_type>    get_capabilities_by_holder( const address& holder )const;

         const game_escrow_object*     find_game_escrow( game_id_type game, game_escrow_kind kind )const;
         const payout_escrow_object*   find_payout_escrow( const address& owner )const;

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve the wallet balance of an address
          * @return 0 if the address never received anything
          */
         share_type get_balance( const address& owner )const;
         share_type get_game_escrow_balance( game_id_type game, game_escrow_kind kind )const;
         share_type get_payout_escrow_balance( const address& owner )const;

         /**
          * @brief Moves @p what into the wallet of @p owner, creating the wallet if needed
          */
         void add_balance( const address& owner, stored_value&& what );
         /**
          * @brief Takes exactly @p how_much out of the wallet of @p owner
          * @throw insufficient_balance if the wallet holds less
          */
         stored_value reduce_balance( const address& owner, share_type how_much );

         /// Merges @p what into the escrow of @p game, creating the escrow on the first nonzero deposit
         void deposit_game_escrow( game_id_type game, game_escrow_kind kind, stored_value&& what );
         /// Merges @p what into the payout escrow of @p owner, creating the escrow on the first nonzero deposit
         void deposit_payout_escrow( const address& owner, stored_value&& what );

         /// Sum of every balance, pool and escrow; always equals get_token_supply().current_supply
         share_type get_total_value()const;

         //////////////////// db_capability.cpp ////////////////////

         const capability_object& issue_capability( capability_kind kind, object_id_type bound_id,
                                                    const address& holder );

         //////////////////// db_init.cpp ////////////////////

         void initialize_evaluators();
         /// Reset the object graph in-memory
         void initialize_indexes();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

      private:
         processed_transaction _apply_transaction( const transaction& trx, const address& submitter );

         vector< std::unique_ptr<op_evaluator> >     _operation_evaluators;

         /**
          * Contains the set of ops that are in the process of being applied from
          * the current transaction.
          */
         vector<optional<operation_history_object> > _applied_ops;

         address                                     _current_submitter;
         uint32_t                                    _current_trx_num = 0;
         uint16_t                                    _current_op_in_trx = 0;
         uint16_t                                    _current_virtual_op = 0;

         std::shared_ptr<price_oracle>               _price_oracle;
         bool                                        _genesis_done = false;
   };

} }
