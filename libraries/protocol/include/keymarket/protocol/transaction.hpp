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
#include <keymarket/protocol/operations.hpp>

namespace keymarket { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * All transactions are sets of operations that must be applied atomically. Transactions must refer to a recent
    * state of the marketplace only through the ids of the objects they name.
    *
    * The submitter of a transaction is the caller of all of its operations. It is supplied by the host
    * alongside the transaction, a transaction therefore carries no signatures.
    */

   /**
    *  @brief groups operations that should be applied atomically
    */
   struct transaction
   {
      vector<operation>  operations;

      /// Runs the stateless checks of every operation, rejects virtual operations
      void validate()const;

      /// visit all operations
      template<typename Visitor>
      void visit( Visitor&& visitor )const
      {
         for( auto& op : operations )
            op.visit( std::forward<Visitor>( visitor ) );
      }
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    *
    *  When processing a transaction some operations generate
    *  new object IDs and these IDs cannot be known until the
    *  transaction is actually included.
    */
   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      vector<operation_result> operation_results;
   };

   /// @} transactions group

} } // keymarket::protocol

FC_REFLECT( keymarket::protocol::transaction, (operations) )
FC_REFLECT_DERIVED( keymarket::protocol::processed_transaction, (keymarket::protocol::transaction), (operation_results) )
