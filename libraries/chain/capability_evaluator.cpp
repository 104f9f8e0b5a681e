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
#include <keymarket/chain/capability_evaluator.hpp>
#include <keymarket/chain/database.hpp>
#include <keymarket/chain/exceptions.hpp>
#include <keymarket/chain/marketplace_object.hpp>

namespace keymarket { namespace chain {

void_result capability_transfer_evaluator::do_evaluate( const capability_transfer_operation& op )
{ try {
   capability = &presented_capability( op.capability );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result capability_transfer_evaluator::do_apply( const capability_transfer_operation& op )
{ try {
   ilog( "Capability ${c} moves from ${f} to ${t}", ("c",op.capability)("f",capability->holder)("t",op.new_holder) );
   db().modify( *capability, [&op]( capability_object& c ) {
      c.holder = op.new_holder;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result marketplace_update_evaluator::do_evaluate( const marketplace_update_operation& op )
{ try {
   const capability_object& cap = presented_capability( op.capability );
   KEYMARKET_ASSERT( cap.bound_id == marketplace_id_type(), not_authorized,
                     "Capability ${c} is not the platform capability", ("c",op.capability) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result marketplace_update_evaluator::do_apply( const marketplace_update_operation& op )
{ try {
   database& d = db();
   d.modify( d.get_marketplace(), [&op]( marketplace_object& m ) {
      if( op.new_purchase_fee_rate.valid() )
         m.purchase_fee_rate = *op.new_purchase_fee_rate;
      if( op.new_submission_fee_usd.valid() )
         m.submission_fee_usd = *op.new_submission_fee_usd;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // keymarket::chain
