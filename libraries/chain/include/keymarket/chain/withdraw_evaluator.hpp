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
#include <keymarket/chain/evaluator.hpp>
#include <keymarket/chain/balance_object.hpp>

namespace keymarket { namespace chain {

   class platform_withdraw_evaluator : public evaluator<platform_withdraw_evaluator>
   {
      public:
         typedef platform_withdraw_operation operation_type;

         void_result do_evaluate( const platform_withdraw_operation& o );
         void_result do_apply( const platform_withdraw_operation& o );
   };

   class game_proceeds_withdraw_evaluator : public evaluator<game_proceeds_withdraw_evaluator>
   {
      public:
         typedef game_proceeds_withdraw_operation operation_type;

         void_result do_evaluate( const game_proceeds_withdraw_operation& o );
         void_result do_apply( const game_proceeds_withdraw_operation& o );

         const game_escrow_object* escrow = nullptr;
   };

   class payout_withdraw_evaluator : public evaluator<payout_withdraw_evaluator>
   {
      public:
         typedef payout_withdraw_operation operation_type;

         void_result do_evaluate( const payout_withdraw_operation& o );
         void_result do_apply( const payout_withdraw_operation& o );

         const payout_escrow_object* escrow = nullptr;
   };

} } // keymarket::chain
