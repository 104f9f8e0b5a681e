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
#include <keymarket/chain/stored_value.hpp>
#include <keymarket/chain/exceptions.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

namespace keymarket { namespace chain {
   stored_debt::stored_debt() : _amount(0) {}

   stored_debt::~stored_debt()
   {
      if( _amount != 0 )
         elog( "Value leak detected: ${n}!", ("n",_amount.value) );
   }

   stored_debt::stored_debt( stored_debt&& move )
      : _amount(move._amount)
   {
      move._amount = 0;
   }

   stored_debt& stored_debt::operator=( stored_debt&& other )
   {
      if( &other == this ) return *this;
      FC_ASSERT( _amount.value == 0, "Can't overwrite ${n} with ${on}!",
                 ("on",other._amount.value)("n",_amount.value) );
      _amount = other._amount;
      other._amount = 0;
      return *this;
   }

   stored_value stored_debt::issue( const share_type amount )
   {
      FC_ASSERT( amount >= 0, "Cannot issue a negative amount" );
      FC_ASSERT( _amount + amount <= KEYMARKET_MAX_SHARE_SUPPLY, "Cannot issue more than the maximum supply",
                 ("supply",_amount)("amount",amount) );
      _amount += amount;
      return stored_value::issue( amount );
   }

   void stored_debt::burn( stored_value&& amount )
   {
      FC_ASSERT( amount.get_amount() >= 0, "Cannot burn a negative amount" );
      FC_ASSERT( amount.get_amount() <= _amount, "Cannot burn ${n}, only ${d} was issued",
                 ("n",amount.get_amount())("d",_amount) );
      _amount -= amount.get_amount();
      amount.burn();
   }

   void stored_debt::restore( const share_type backup )
   {
      _amount = backup;
   }


   stored_value stored_value::split( const share_type amount )
   {
      KEYMARKET_ASSERT( amount >= 0 && amount <= _amount, insufficient_balance,
                        "Invalid split: want ${w} but have only ${n}",
                        ("w",amount)("n",_amount) );
      stored_value result;
      result._amount = amount;
      _amount -= amount;
      return result;
   }

   stored_value stored_value::withdraw_all()
   {
      KEYMARKET_ASSERT( _amount > 0, empty_pool, "Nothing to withdraw", ("n",_amount) );
      return split( _amount );
   }

   stored_value& stored_value::operator+=( stored_value&& other )
   {
      FC_ASSERT( &other != this, "Can't merge ${n} with itself!", ("n",_amount.value) );
      _amount += other._amount;
      other._amount = 0;
      return *this;
   }

   stored_value stored_value::issue( const share_type amount )
   {
      stored_value result;
      result._amount = amount;
      return result;
   }

   void stored_value::burn()
   {
      _amount = 0;
   }

} } // keymarket::chain
