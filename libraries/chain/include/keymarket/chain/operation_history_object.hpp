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
#include <keymarket/protocol/operations.hpp>

namespace keymarket { namespace chain {

   /**
    * @brief tracks the history of all logical operations on the marketplace state
    * @ingroup implementation
    *
    *  Every submitted operation and every virtual operation it implies results in an
    *  operation_history_object. The database keeps the ones of the last transaction and
    *  publishes them through database::applied_operation once the transaction is committed.
    *
    *  @note  this object is READ ONLY it can never be modified
    */
   class operation_history_object
   {
      public:
         operation_history_object( const operation& o ):op(o){}
         operation_history_object(){}

         operation         op;
         operation_result  result;
         /** the address that submitted the transaction */
         address           submitter;
         /** sequence number of the transaction since the database was opened */
         uint32_t          trx_num = 0;
         /** the operation within the transaction */
         uint16_t          op_in_trx = 0;
         /** any virtual operations implied by operation in the transaction */
         uint16_t          virtual_op = 0;
   };

} } // keymarket::chain

FC_REFLECT( keymarket::chain::operation_history_object,
            (op)(result)(submitter)(trx_num)(op_in_trx)(virtual_op) )
