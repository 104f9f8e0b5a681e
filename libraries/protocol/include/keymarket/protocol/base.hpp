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

#include <keymarket/protocol/types.hpp>
#include <keymarket/protocol/address.hpp>
#include <keymarket/protocol/exceptions.hpp>

namespace keymarket { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @brief A set of valid commands for mutating the marketplace state.
    *
    *  An operation can be thought of like a function that will modify the shared
    *  marketplace state.  The members of each struct are like function arguments and each
    *  operation can potentially generate a return value.
    *
    *  Operations can be grouped into transactions (@ref transaction) to ensure that they occur
    *  in a particular order and that all operations apply successfully or
    *  no operations apply.
    *
    *  The identity that submits a transaction is not part of its operations. The host passes it
    *  to the database together with the transaction, and every evaluator treats it as the
    *  caller of the operation.
    *
    *  Virtual operations are never submitted. They are produced by the database while applying
    *  a submitted operation and are the events observers see.
    *
    *  @{
    */

   struct void_result{};
   using operation_result = fc::static_variant<void_result,object_id_type>;

   struct base_operation
   {
      void validate()const{}
      bool is_virtual()const { return false; }
   };

   struct virtual_operation : public base_operation
   {
      void validate()const { FC_ASSERT( !"virtual operation" ); }
      bool is_virtual()const { return true; }
   };

   /// Throws malformed_language_pair unless every key of @p text is a language code
   void validate_localized_text( const localized_text& text );

   ///@}

} } // keymarket::protocol

FC_REFLECT( keymarket::protocol::void_result, )
FC_REFLECT_TYPENAME( keymarket::protocol::operation_result )
