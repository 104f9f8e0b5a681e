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
#include <keymarket/chain/marketplace_object.hpp>

namespace keymarket { namespace chain {

class marketplace_backup : public marketplace_master, public backup_object<marketplace_object>
{
      share_type submission_fees;
      share_type purchase_fees;
      friend class marketplace_object;

   public:
      marketplace_backup( const marketplace_object& original )
         : marketplace_master( original )
      {
         submission_fees = original.submission_fees.get_amount();
         purchase_fees = original.purchase_fees.get_amount();
      }

      virtual unique_ptr<object> recreate() override { return recreate_from( *this ); }
};

unique_ptr<object> marketplace_object::backup()const
{
   return std::make_unique<marketplace_backup>( *this );
}

void marketplace_object::restore( object& obj )
{
   const auto& backup = static_cast<marketplace_backup&>(obj);
   submission_fees.restore( backup.submission_fees );
   purchase_fees.restore( backup.purchase_fees );
   static_cast<marketplace_master&>(*this) = backup;
}

void marketplace_object::clear()
{
   submission_fees.clear();
   purchase_fees.clear();
}

class token_supply_backup : public token_supply_master, public backup_object<token_supply_object>
{
      share_type current_supply;
      friend class token_supply_object;

   public:
      token_supply_backup( const token_supply_object& original )
         : token_supply_master( original )
      {
         current_supply = original.current_supply.get_amount();
      }

      virtual unique_ptr<object> recreate() override { return recreate_from( *this ); }
};

unique_ptr<object> token_supply_object::backup()const
{
   return std::make_unique<token_supply_backup>( *this );
}

void token_supply_object::restore( object& obj )
{
   const auto& backup = static_cast<token_supply_backup&>(obj);
   current_supply.restore( backup.current_supply );
   static_cast<token_supply_master&>(*this) = backup;
}

void token_supply_object::clear()
{
   current_supply.clear();
}

} } // keymarket::chain
