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
#include <keymarket/protocol/license.hpp>
#include <keymarket/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace keymarket { namespace chain {

   /**
    *  @brief a purchasable license of a game
    *  @ingroup object
    *  @ingroup protocol
    *
    *  The terms of a license are read live by every purchase, authentication and resale of its
    *  keys, so an update of the terms applies to keys that were issued before it.
    */
   class license_object : public abstract_object<license_object, protocol_ids, license_object_type>
   {
      public:
         game_id_type     game;
         license_options  options;

         /// list price minus the discount, in USD-equivalent units
         share_type discounted_price()const;
   };

   /**
    *  @brief a purchased license, a.k.a. license key
    *  @ingroup object
    *  @ingroup protocol
    *
    *  The display fields are a snapshot of the license at purchase time.
    */
   class license_key_object : public abstract_object<license_key_object, protocol_ids, license_key_object_type>
   {
      public:
         game_id_type     game;
         license_id_type  license;
         /// number of distinct users that have been bound to this key
         uint32_t         auth_count = 0;
         string           license_name;
         string           license_thumbnail;
         address          owner;
         /// the address currently bound, null until the first authentication
         address          user;
   };

   struct by_game;
   struct by_owner;

   /**
    * @ingroup object_index
    */
   using license_multi_index_type = multi_index_container<
      license_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_game>,
            composite_key< license_object,
               member< license_object, game_id_type, &license_object::game >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using license_index = generic_index<license_object, license_multi_index_type>;

   /**
    * @ingroup object_index
    */
   using license_key_multi_index_type = multi_index_container<
      license_key_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_owner>,
            composite_key< license_key_object,
               member< license_key_object, address, &license_key_object::owner >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using license_key_index = generic_index<license_key_object, license_key_multi_index_type>;

} } // keymarket::chain

MAP_OBJECT_ID_TO_TYPE(keymarket::chain::license_object)
MAP_OBJECT_ID_TO_TYPE(keymarket::chain::license_key_object)

FC_REFLECT_DERIVED( keymarket::chain::license_object, (keymarket::db::object), (game)(options) )
FC_REFLECT_DERIVED( keymarket::chain::license_key_object, (keymarket::db::object),
                    (game)(license)(auth_count)(license_name)(license_thumbnail)(owner)(user) )
