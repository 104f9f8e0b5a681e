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
#include <keymarket/chain/capability_object.hpp>

namespace keymarket { namespace chain {

const capability_object& database::issue_capability( capability_kind kind, object_id_type bound_id,
                                                     const address& holder )
{ try {
   FC_ASSERT( !holder.is_null(), "Capabilities can not be issued to the null address" );
   const auto& cap = create<capability_object>( [kind,&bound_id,&holder]( capability_object& c ) {
      c.kind     = kind;
      c.bound_id = bound_id;
      c.holder   = holder;
   });
   ilog( "Issued ${k} capability ${c} bound to ${b} to ${h}",
         ("k",kind)("c",cap.id)("b",bound_id)("h",holder) );
   return cap;
} FC_CAPTURE_AND_RETHROW( (kind)(bound_id)(holder) ) }

} }
