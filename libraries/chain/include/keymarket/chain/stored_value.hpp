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

#include <fc/variant.hpp>

namespace keymarket { namespace chain {
   class stored_value;

   /**
    *  The debt side of the ledger: every token in existence was issued by the single stored_debt
    *  held in the token_supply_object, so its amount always equals the sum of all stored_value
    *  amounts. Tokens only come back into it by being burned.
    */
   class stored_debt
   {
   public:
      stored_debt();
      ~stored_debt();

      stored_debt( const stored_debt& copy ) = delete;
      stored_debt( stored_debt& copy ) = delete;
      stored_debt( stored_debt&& move );

      stored_debt& operator=( const stored_debt& copy ) = delete;
      stored_debt& operator=( stored_debt& copy ) = delete;
      stored_debt& operator=( stored_debt&& move );

      share_type get_amount()const { return _amount; }

      stored_value issue( const share_type amount );
      void burn( stored_value&& amount );

   protected:
      share_type _amount;

      void restore( const share_type backup );
      void clear() { _amount = 0; }
      friend class token_supply_object;
   };

   /**
    *  A balance of tokens. A stored_value can not be copied, only moved, split and merged, so
    *  value is never created or destroyed outside of stored_debt::issue and stored_debt::burn.
    *  Every pool of the marketplace is a stored_value member of a database object.
    */
   class stored_value : public stored_debt
   {
   public:
      stored_value() = default;
      stored_value( stored_value&& move ) : stored_debt( std::move(move) ) {}

      stored_value& operator=( stored_value&& move ) {
         this->stored_debt::operator=( std::move(move) );
         return *this;
      }

      /// Takes exactly @p amount out of this balance; throws insufficient_balance if it holds less
      stored_value split( const share_type amount );
      /// Takes everything out of this balance; throws empty_pool if it holds nothing
      stored_value withdraw_all();
      stored_value& operator+=( stored_value&& other );

   protected:
      static stored_value issue( const share_type amount );
      void burn();
      friend class stored_debt;
      friend class account_balance_object;
      friend class marketplace_object;
      friend class game_escrow_object;
      friend class payout_escrow_object;
   };

} } // keymarket::chain

namespace fc {

inline void to_variant( const keymarket::chain::stored_debt& value, fc::variant& var, uint32_t max_depth )
{
   to_variant( value.get_amount(), var, max_depth );
}

inline void to_variant( const keymarket::chain::stored_value& value, fc::variant& var, uint32_t max_depth )
{
   to_variant( value.get_amount(), var, max_depth );
}

inline void from_variant( const fc::variant& var, keymarket::chain::stored_debt& value, uint32_t max_depth )
{
   FC_THROW_EXCEPTION( fc::assert_exception, "Unsupported!" );
}

inline void from_variant( const fc::variant& var, keymarket::chain::stored_value& value, uint32_t max_depth )
{
   FC_THROW_EXCEPTION( fc::assert_exception, "Unsupported!" );
}

template<>
struct get_typename< keymarket::chain::stored_debt >
{
   static const char* name()
   {
      return "keymarket::chain::stored_debt";
   }
};

template<>
struct get_typename< keymarket::chain::stored_value >
{
   static const char* name()
   {
      return "keymarket::chain::stored_value";
   }
};

} // fc
