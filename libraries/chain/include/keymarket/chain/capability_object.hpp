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

#include <keymarket/chain/types.hpp>
#include <keymarket/protocol/capability.hpp>
#include <keymarket/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace keymarket { namespace chain {

   /**
    *  @brief a bearer token that authorizes privileged operations on exactly one object
    *  @ingroup object
    *  @ingroup protocol
    *
    *  An operation presents a capability by id. The database accepts it when the submitter is the
    *  holder and the bound id equals the id of the object the operation targets. Capabilities are
    *  never removed, they only change hands.
    */
   class capability_object : public abstract_object<capability_object, protocol_ids, capability_object_type>
   {
      public:
         capability_kind  kind = publisher_capability;
         /// the marketplace root for the platform capability, a game for publisher capabilities
         object_id_type   bound_id;
         address          holder;
   };

   struct by_holder;

   /**
    * @ingroup object_index
    */
   using capability_multi_index_type = multi_index_container<
      capability_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_holder>,
            composite_key< capability_object,
               member< capability_object, address, &capability_object::holder >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using capability_index = generic_index<capability_object, capability_multi_index_type>;

} } // keymarket::chain

MAP_OBJECT_ID_TO_TYPE(keymarket::chain::capability_object)

FC_REFLECT_DERIVED( keymarket::chain::capability_object, (keymarket::db::object), (kind)(bound_id)(holder) )
