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
#include <keymarket/chain/database.hpp>
#include <keymarket/chain/evaluator.hpp>
#include <keymarket/chain/exceptions.hpp>
#include <keymarket/chain/transaction_evaluation_state.hpp>

namespace keymarket { namespace chain {
database& generic_evaluator::db()const { return trx_state->db(); }

const address& generic_evaluator::submitter()const { return trx_state->submitter(); }

   operation_result generic_evaluator::start_evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply )
   { try {
      trx_state   = &eval_state;
      auto result = evaluate( op );

      if( apply ) result = this->apply( op );
      return result;
   } FC_CAPTURE_AND_RETHROW() }

   const capability_object& generic_evaluator::presented_capability( capability_id_type id )const
   {
      const capability_object* cap = db().find( id );
      KEYMARKET_ASSERT( cap != nullptr, not_authorized, "Capability ${c} does not exist", ("c",id) );
      KEYMARKET_ASSERT( cap->holder == submitter(), not_authorized,
                        "Capability ${c} is held by ${h}, not by ${s}",
                        ("c",id)("h",cap->holder)("s",submitter()) );
      return *cap;
   }
} }
