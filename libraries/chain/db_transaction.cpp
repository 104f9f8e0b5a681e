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
#include <keymarket/chain/operation_history_object.hpp>
#include <keymarket/chain/transaction_evaluation_state.hpp>

namespace keymarket { namespace chain {

processed_transaction database::push_transaction( const transaction& trx, const address& submitter )
{ try {
   FC_ASSERT( _genesis_done, "Genesis state has not been applied" );

   _applied_ops.clear();
   _current_submitter = submitter;
   _current_virtual_op = 0;

   processed_transaction result;
   try {
      auto session = _undo_db.start_undo_session();
      result = _apply_transaction( trx, submitter );
      session.commit();
   }
   catch( const fc::exception& e )
   {
      wlog( "Rolled back transaction submitted by ${s}: ${e}", ("s",submitter)("e",e.to_string()) );
      _applied_ops.clear();
      ++_current_trx_num;
      throw;
   }
   ++_current_trx_num;

   for( const auto& op : _applied_ops )
   {
      if( op.valid() )
         applied_operation( *op );
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (trx)(submitter) ) }

processed_transaction database::_apply_transaction( const transaction& trx, const address& submitter )
{ try {
   trx.validate();

   transaction_evaluation_state eval_state( this, submitter );
   eval_state._trx = &trx;
   eval_state.operation_results.reserve( trx.operations.size() );

   //Finally process the operations
   processed_transaction ptrx(trx);
   _current_op_in_trx = 0;
   for( const auto& op : ptrx.operations )
   {
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );
      ++_current_op_in_trx;
   }
   ptrx.operation_results = std::move( eval_state.operation_results );

   FC_ASSERT( get_total_value() == get_token_supply().current_supply.get_amount(),
              "Transaction does not preserve value", ("total",get_total_value())
              ("supply",get_token_supply().current_supply.get_amount()) );

   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( i_which >= 0, "Negative operation tag" );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for this operation" );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for this operation" );
   auto op_id = push_applied_operation( op );
   auto result = eval->evaluate( eval_state, op, true );
   set_applied_operation_result( op_id, result );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint32_t database::push_applied_operation( const operation& op )
{
   _applied_ops.emplace_back(op);
   operation_history_object& oh = *(_applied_ops.back());
   oh.submitter  = _current_submitter;
   oh.trx_num    = _current_trx_num;
   oh.op_in_trx  = _current_op_in_trx;
   oh.virtual_op = _current_virtual_op++;
   return _applied_ops.size() - 1;
}

void database::set_applied_operation_result( uint32_t op_id, const operation_result& result )
{
   FC_ASSERT( op_id < _applied_ops.size() );
   if( _applied_ops[op_id] )
      _applied_ops[op_id]->result = result;
   else
   {
      elog( "Could not set operation result (trx_num=${t})", ("t", _current_trx_num) );
   }
}

const vector<optional< operation_history_object > >& database::get_applied_operations() const
{
   return _applied_ops;
}

} }
