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
#include <keymarket/chain/game_object.hpp>
#include <keymarket/chain/license_object.hpp>

namespace keymarket { namespace chain {

   /**
    *  Sells a new key of a license. The payment is split into the platform purchase fee and
    *  the sales proceeds of the game.
    */
   class license_purchase_evaluator : public evaluator<license_purchase_evaluator>
   {
      public:
         typedef license_purchase_operation operation_type;

         void_result do_evaluate( const license_purchase_operation& o );
         object_id_type do_apply( const license_purchase_operation& o );

         const game_object*    game = nullptr;
         const license_object* license = nullptr;
   };

   class license_authenticate_evaluator : public evaluator<license_authenticate_evaluator>
   {
      public:
         typedef license_authenticate_operation operation_type;

         void_result do_evaluate( const license_authenticate_operation& o );
         void_result do_apply( const license_authenticate_operation& o );

         const license_key_object* key = nullptr;
   };

} } // keymarket::chain
