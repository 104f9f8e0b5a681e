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
#include <keymarket/chain/balance_object.hpp>

namespace keymarket { namespace chain {

void account_balance_object::add_balance( stored_value&& delta )
{
   balance += std::move( delta );
}

stored_value account_balance_object::reduce_balance( share_type delta )
{
   return balance.split( delta );
}

class account_balance_backup : public account_balance_master, public backup_object<account_balance_object>
{
      share_type balance;
      friend class account_balance_object;

   public:
      account_balance_backup( const account_balance_object& original )
         : account_balance_master( original )
      {
         balance = original.balance.get_amount();
      }

      virtual unique_ptr<object> recreate() override { return recreate_from( *this ); }
};

unique_ptr<object> account_balance_object::backup()const
{
   return std::make_unique<account_balance_backup>( *this );
}

void account_balance_object::restore( object& obj )
{
   const auto& backup = static_cast<account_balance_backup&>(obj);
   balance.restore( backup.balance );
   static_cast<account_balance_master&>(*this) = backup;
}

void account_balance_object::clear()
{
   balance.clear();
}

class game_escrow_backup : public game_escrow_master, public backup_object<game_escrow_object>
{
      share_type balance;
      friend class game_escrow_object;

   public:
      game_escrow_backup( const game_escrow_object& original )
         : game_escrow_master( original )
      {
         balance = original.balance.get_amount();
      }

      virtual unique_ptr<object> recreate() override { return recreate_from( *this ); }
};

unique_ptr<object> game_escrow_object::backup()const
{
   return std::make_unique<game_escrow_backup>( *this );
}

void game_escrow_object::restore( object& obj )
{
   const auto& backup = static_cast<game_escrow_backup&>(obj);
   balance.restore( backup.balance );
   static_cast<game_escrow_master&>(*this) = backup;
}

void game_escrow_object::clear()
{
   balance.clear();
}

class payout_escrow_backup : public payout_escrow_master, public backup_object<payout_escrow_object>
{
      share_type balance;
      friend class payout_escrow_object;

   public:
      payout_escrow_backup( const payout_escrow_object& original )
         : payout_escrow_master( original )
      {
         balance = original.balance.get_amount();
      }

      virtual unique_ptr<object> recreate() override { return recreate_from( *this ); }
};

unique_ptr<object> payout_escrow_object::backup()const
{
   return std::make_unique<payout_escrow_backup>( *this );
}

void payout_escrow_object::restore( object& obj )
{
   const auto& backup = static_cast<payout_escrow_backup&>(obj);
   balance.restore( backup.balance );
   static_cast<payout_escrow_master&>(*this) = backup;
}

void payout_escrow_object::clear()
{
   balance.clear();
}

} } // keymarket::chain
