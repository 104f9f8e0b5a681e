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
#include <keymarket/chain/database.hpp>

#include <keymarket/chain/balance_object.hpp>
#include <keymarket/chain/capability_object.hpp>
#include <keymarket/chain/game_object.hpp>
#include <keymarket/chain/license_object.hpp>
#include <keymarket/chain/marketplace_object.hpp>
#include <keymarket/chain/resale_listing_object.hpp>

#include <keymarket/chain/capability_evaluator.hpp>
#include <keymarket/chain/game_evaluator.hpp>
#include <keymarket/chain/license_evaluator.hpp>
#include <keymarket/chain/purchase_evaluator.hpp>
#include <keymarket/chain/resale_evaluator.hpp>
#include <keymarket/chain/transfer_evaluator.hpp>
#include <keymarket/chain/withdraw_evaluator.hpp>

namespace keymarket { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<transfer_evaluator>();
   register_evaluator<game_register_evaluator>();
   register_evaluator<game_update_evaluator>();
   register_evaluator<license_create_evaluator>();
   register_evaluator<license_update_evaluator>();
   register_evaluator<license_purchase_evaluator>();
   register_evaluator<license_authenticate_evaluator>();
   register_evaluator<resale_list_evaluator>();
   register_evaluator<resale_buy_evaluator>();
   register_evaluator<resale_cancel_evaluator>();
   register_evaluator<platform_withdraw_evaluator>();
   register_evaluator<game_proceeds_withdraw_evaluator>();
   register_evaluator<payout_withdraw_evaluator>();
   register_evaluator<marketplace_update_evaluator>();
   register_evaluator<capability_transfer_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();
   _undo_db.set_max_size( KEYMARKET_MAX_UNDO_HISTORY );

   //Protocol object indexes
   add_index< primary_index<game_index> >();
   add_index< primary_index<license_index> >();
   add_index< primary_index<license_key_index> >();
   add_index< primary_index<resale_listing_index> >();
   add_index< primary_index<capability_index> >();

   //Implementation object indexes
   add_index< primary_index<simple_index<marketplace_object   >> >();
   add_index< primary_index<simple_index<resale_market_object >> >();
   add_index< primary_index<simple_index<token_supply_object  >> >();
   add_index< primary_index<account_balance_index             > >();
   add_index< primary_index<game_escrow_index                 > >();
   add_index< primary_index<payout_escrow_index               > >();
}

} }
