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

#include <fc/exception/exception.hpp>
#include <keymarket/protocol/exceptions.hpp>
#include <keymarket/chain/types.hpp>

namespace keymarket { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( identity_exception,      keymarket::chain::chain_exception, 3010000 )
   FC_DECLARE_DERIVED_EXCEPTION( authorization_exception, keymarket::chain::chain_exception, 3020000 )
   FC_DECLARE_DERIVED_EXCEPTION( funds_exception,         keymarket::chain::chain_exception, 3030000 )
   FC_DECLARE_DERIVED_EXCEPTION( policy_exception,        keymarket::chain::chain_exception, 3040000 )

   FC_DECLARE_DERIVED_EXCEPTION( duplicate_game_id,       keymarket::chain::identity_exception, 3010001 )
   FC_DECLARE_DERIVED_EXCEPTION( game_not_found,          keymarket::chain::identity_exception, 3010002 )
   FC_DECLARE_DERIVED_EXCEPTION( license_not_found,       keymarket::chain::identity_exception, 3010003 )
   FC_DECLARE_DERIVED_EXCEPTION( listing_not_found,       keymarket::chain::identity_exception, 3010004 )
   FC_DECLARE_DERIVED_EXCEPTION( index_out_of_range,      keymarket::chain::identity_exception, 3010005 )
   FC_DECLARE_DERIVED_EXCEPTION( license_key_not_found,   keymarket::chain::identity_exception, 3010006 )

   FC_DECLARE_DERIVED_EXCEPTION( not_publisher,           keymarket::chain::authorization_exception, 3020001 )
   FC_DECLARE_DERIVED_EXCEPTION( not_owner,               keymarket::chain::authorization_exception, 3020002 )
   FC_DECLARE_DERIVED_EXCEPTION( not_authorized,          keymarket::chain::authorization_exception, 3020003 )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_fee,        keymarket::chain::funds_exception, 3030001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds,      keymarket::chain::funds_exception, 3030002 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,    keymarket::chain::funds_exception, 3030003 )
   FC_DECLARE_DERIVED_EXCEPTION( no_funds_available,      keymarket::chain::funds_exception, 3030004 )
   FC_DECLARE_DERIVED_EXCEPTION( empty_pool,              keymarket::chain::funds_exception, 3030005 )

   FC_DECLARE_DERIVED_EXCEPTION( sale_locked,             keymarket::chain::policy_exception, 3040001 )
   FC_DECLARE_DERIVED_EXCEPTION( resale_not_permitted,    keymarket::chain::policy_exception, 3040002 )
   FC_DECLARE_DERIVED_EXCEPTION( auth_limit_exceeded,     keymarket::chain::policy_exception, 3040003 )

} } // keymarket::chain
