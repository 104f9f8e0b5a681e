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
#include <keymarket/chain/capability_object.hpp>

namespace keymarket { namespace chain {

   class capability_transfer_evaluator : public evaluator<capability_transfer_evaluator>
   {
      public:
         typedef capability_transfer_operation operation_type;

         void_result do_evaluate( const capability_transfer_operation& o );
         void_result do_apply( const capability_transfer_operation& o );

         const capability_object* capability = nullptr;
   };

   class marketplace_update_evaluator : public evaluator<marketplace_update_evaluator>
   {
      public:
         typedef marketplace_update_operation operation_type;

         void_result do_evaluate( const marketplace_update_operation& o );
         void_result do_apply( const marketplace_update_operation& o );
   };

} } // keymarket::chain
