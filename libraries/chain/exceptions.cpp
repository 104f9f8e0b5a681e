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
#include <keymarket/chain/exceptions.hpp>

namespace keymarket { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "marketplace exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( identity_exception,      chain_exception, 3010000, "object identity exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( authorization_exception, chain_exception, 3020000, "authorization exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( funds_exception,         chain_exception, 3030000, "funds exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( policy_exception,        chain_exception, 3040000, "policy exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( duplicate_game_id,     identity_exception, 3010001, "game key already registered" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( game_not_found,        identity_exception, 3010002, "game not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( license_not_found,     identity_exception, 3010003, "license not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( listing_not_found,     identity_exception, 3010004, "resale listing not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( index_out_of_range,    identity_exception, 3010005, "index out of range" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( license_key_not_found, identity_exception, 3010006, "license key not found" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( not_publisher,         authorization_exception, 3020001, "not the publisher of this game" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_owner,             authorization_exception, 3020002, "not the owner" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_authorized,        authorization_exception, 3020003, "not authorized" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_fee,      funds_exception, 3030001, "insufficient fee" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_funds,    funds_exception, 3030002, "payment does not match the price" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_balance,  funds_exception, 3030003, "insufficient balance" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( no_funds_available,    funds_exception, 3030004, "no funds available" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( empty_pool,            funds_exception, 3030005, "pool is empty" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( sale_locked,           policy_exception, 3040001, "game sales are locked" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( resale_not_permitted,  policy_exception, 3040002, "resale is not permitted" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( auth_limit_exceeded,   policy_exception, 3040003, "authentication limit exceeded" )

} } // keymarket::chain
