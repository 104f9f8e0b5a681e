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
#include <keymarket/protocol/game.hpp>
#include <keymarket/db/generic_index.hpp>

namespace keymarket { namespace chain {

   /**
    *  @brief an entry of the game catalog
    *  @ingroup object
    *  @ingroup protocol
    *
    *  Games are identified by their human assigned game_key, which is unique across the catalog.
    *  Games are never removed. The licenses of a game live in the license index and refer back to
    *  the game by its id.
    */
   class game_object : public abstract_object<game_object, protocol_ids, game_object_type>
   {
      public:
         string         game_key;
         game_metadata  metadata;
         /// while set, no license of this game can be purchased
         bool           sale_locked = false;
         /// submitter of the game_register_operation
         address        creator;
   };

   struct by_game_key;

   /**
    * @ingroup object_index
    */
   using game_multi_index_type = multi_index_container<
      game_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_game_key>, member< game_object, string, &game_object::game_key > >
      >
   >;

   /**
    * @ingroup object_index
    */
   using game_index = generic_index<game_object, game_multi_index_type>;

} } // keymarket::chain

MAP_OBJECT_ID_TO_TYPE(keymarket::chain::game_object)

FC_REFLECT_DERIVED( keymarket::chain::game_object, (keymarket::db::object),
                    (game_key)(metadata)(sale_locked)(creator) )
