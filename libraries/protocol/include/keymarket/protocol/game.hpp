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
#include <keymarket/protocol/base.hpp>

namespace keymarket { namespace protocol {

   /**
    * @brief The descriptive part of a game catalog entry
    *
    * Description maps are keyed by two character language codes.
    */
   struct game_metadata
   {
      string          name;
      string          thumbnail;
      vector<string>  image_urls;
      vector<string>  video_urls;
      localized_text  short_descriptions;
      localized_text  long_descriptions;
      string          genre;
      string          developer;
      string          publisher;
      vector<string>  languages;
      vector<string>  platforms;
      string          system_requirements;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Adds a game to the catalog
    *
    * The submitter pays @ref submission_fee, which must match the current submission fee
    * converted to ledger units, and receives the publisher capability of the new game.
    *
    * @return the id of the publisher capability
    */
   struct game_register_operation : public base_operation
   {
      string         game_key;
      game_metadata  metadata;
      bool           sale_locked = false;
      share_type     submission_fee;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * @brief Replaces the metadata of a game and/or toggles its sale lock. Requires the
    * publisher capability of the game.
    */
   struct game_update_operation : public base_operation
   {
      string                   game_key;
      capability_id_type       capability;
      optional<game_metadata>  new_metadata;
      optional<bool>           sale_locked;

      void validate()const;
   };

   /**
    * @ingroup operations
    *
    * Virtual op emitted when a game has been added to the catalog
    */
   struct game_registered_operation : public virtual_operation
   {
      game_registered_operation() = default;
      game_registered_operation( const string& key, game_id_type g, const address& p, capability_id_type c )
         : game_key(key), game(g), publisher(p), capability(c) {}

      string              game_key;
      game_id_type        game;
      address             publisher;
      capability_id_type  capability;
   };

} } // keymarket::protocol

FC_REFLECT( keymarket::protocol::game_metadata,
            (name)(thumbnail)(image_urls)(video_urls)(short_descriptions)(long_descriptions)
            (genre)(developer)(publisher)(languages)(platforms)(system_requirements) )
FC_REFLECT( keymarket::protocol::game_register_operation, (game_key)(metadata)(sale_locked)(submission_fee) )
FC_REFLECT( keymarket::protocol::game_update_operation, (game_key)(capability)(new_metadata)(sale_locked) )
FC_REFLECT( keymarket::protocol::game_registered_operation, (game_key)(game)(publisher)(capability) )
