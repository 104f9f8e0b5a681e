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

#include <keymarket/chain/license_object.hpp>

namespace keymarket { namespace chain {

   /**
    *  @brief a license key offered for resale
    *  @ingroup object
    *  @ingroup protocol
    *
    *  While listed, the key does not exist in the license key index. The listing carries the
    *  complete key, including its id, and puts it back under that id when the listing is bought
    *  or cancelled.
    */
   class resale_listing_object : public abstract_object<resale_listing_object, protocol_ids, resale_listing_object_type>
   {
      public:
         license_key_object  key;
         string              reseller_name;
         string              description;
         /// asking price in USD-equivalent units
         share_type          price;
         /// owner of the key when it was listed
         address             seller;

         license_key_id_type get_key_id()const { return key.get_id(); }
   };

   struct by_seller;
   struct by_key;

   /**
    * @ingroup object_index
    */
   using resale_listing_multi_index_type = multi_index_container<
      resale_listing_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_key>,
            const_mem_fun< resale_listing_object, license_key_id_type, &resale_listing_object::get_key_id >
         >,
         ordered_unique< tag<by_seller>,
            composite_key< resale_listing_object,
               member< resale_listing_object, address, &resale_listing_object::seller >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   /**
    * @ingroup object_index
    */
   using resale_listing_index = generic_index<resale_listing_object, resale_listing_multi_index_type>;

} } // keymarket::chain

MAP_OBJECT_ID_TO_TYPE(keymarket::chain::resale_listing_object)

FC_REFLECT_DERIVED( keymarket::chain::resale_listing_object, (keymarket::db::object),
                    (key)(reseller_name)(description)(price)(seller) )
