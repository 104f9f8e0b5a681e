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
#include <keymarket/protocol/game.hpp>

namespace keymarket { namespace protocol {

void game_metadata::validate()const
{
   validate_localized_text( short_descriptions );
   validate_localized_text( long_descriptions );
}

static void validate_game_key( const string& game_key )
{
   FC_ASSERT( !game_key.empty(), "Game key can not be empty" );
   FC_ASSERT( game_key.size() <= KEYMARKET_MAX_GAME_KEY_LENGTH, "Game key is too long",
              ("key",game_key)("max",KEYMARKET_MAX_GAME_KEY_LENGTH) );
}

void game_register_operation::validate()const
{
   validate_game_key( game_key );
   FC_ASSERT( submission_fee >= 0, "Submission fee can not be negative" );
   metadata.validate();
}

void game_update_operation::validate()const
{
   validate_game_key( game_key );
   FC_ASSERT( new_metadata.valid() || sale_locked.valid(), "Nothing to update" );
   if( new_metadata.valid() )
      new_metadata->validate();
}

} } // keymarket::protocol
