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
#include <keymarket/chain/exceptions.hpp>
#include <keymarket/chain/genesis_state.hpp>
#include <keymarket/chain/operation_history_object.hpp>

#include <fc/io/json.hpp>
#include <fc/filesystem.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace bpo = boost::program_options;

namespace keymarket { namespace node {

   /// One entry of the --transactions-json file
   struct submitted_transaction
   {
      chain::address      submitter;
      chain::transaction  trx;
   };

} } // keymarket::node

FC_REFLECT( keymarket::node::submitted_transaction, (submitter)(trx) )

namespace {

const uint32_t max_json_depth = 20;

fc::log_level string_to_level( const std::string& level )
{
   if( level == "info" )
      return fc::log_level::info;
   if( level == "debug" )
      return fc::log_level::debug;
   if( level == "warn" )
      return fc::log_level::warn;
   if( level == "error" )
      return fc::log_level::error;
   if( level == "all" )
      return fc::log_level::all;
   if( level == "off" )
      return fc::log_level::off;
   FC_THROW( "Log level not allowed. Allowed levels are info, debug, warn, error, all and off." );
}

void setup_logging( const std::string& console_level )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.stream = fc::console_appender::stream::std_error;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::debug,
         fc::console_appender::color::green ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::warn,
         fc::console_appender::color::brown ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::error,
         fc::console_appender::color::red ) );
   cfg.appenders.push_back( fc::appender_config( "stderr", "console", fc::variant( console_appender_config, 20 ) ) );
   cfg.loggers = { fc::logger_config( "default" ) };
   cfg.loggers.front().level = string_to_level( console_level );
   cfg.loggers.front().appenders = { "stderr" };

   fc::configure_logging( cfg );
}

void print_state( const keymarket::chain::database& db )
{
   using namespace keymarket::chain;

   fc::mutable_variant_object state;
   state( "marketplace", fc::variant( db.get_marketplace(), max_json_depth ) )
        ( "resale_market", fc::variant( db.get_resale_market(), max_json_depth ) )
        ( "token_supply", db.get_token_supply().current_supply.get_amount().value );

   fc::variants games;
   for( uint64_t i = 0; i < db.game_count(); ++i )
   {
      const game_object& game = db.get_game_by_index( i );
      fc::mutable_variant_object entry;
      entry( "game_key", game.game_key )
           ( "id", fc::variant( game.id, max_json_depth ) )
           ( "sale_locked", game.sale_locked )
           ( "licenses", db.license_count( game ) )
           ( "sales_escrow", db.get_game_escrow_balance( game.get_id(), sales_escrow ).value )
           ( "royalty_escrow", db.get_game_escrow_balance( game.get_id(), royalty_escrow ).value );
      games.emplace_back( fc::variant( entry ) );
   }
   state( "games", fc::variant( games ) );

   fc::variants balances;
   for( const auto& balance : db.get_index_type<account_balance_index>().indices() )
      balances.emplace_back( fc::mutable_variant_object( "owner", fc::variant( balance.owner, max_json_depth ) )
                                                       ( "amount", balance.get_amount().value ) );
   state( "balances", fc::variant( balances ) );

   fc::variants payouts;
   for( const auto& escrow : db.get_index_type<payout_escrow_index>().indices() )
      payouts.emplace_back( fc::mutable_variant_object( "owner", fc::variant( escrow.owner, max_json_depth ) )
                                                      ( "amount", escrow.balance.get_amount().value ) );
   state( "payout_escrows", fc::variant( payouts ) );

   std::cout << fc::json::to_pretty_string( state ) << "\n";
}

}

/// The main program
int main( int argc, char** argv )
{
   try {
      bpo::options_description opts( "Keymarket Node" );
      opts.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json,g", bpo::value<std::string>(), "File to read the genesis state from")
            ("transactions-json,t", bpo::value<std::string>(),
                    "File with a JSON array of {\"submitter\":...,\"trx\":{\"operations\":[...]}} to apply in order")
            ("print-state", "Print the marketplace state after all transactions have been applied")
            ("log-level,l", bpo::value<std::string>()->default_value("info"),
                    "Console log level: info, debug, warn, error, all or off");

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line( argc, argv, opts ), options );
         bpo::notify( options );
      }
      catch( const bpo::error& e )
      {
         std::cerr << "Error parsing command line: " << e.what() << "\n";
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         std::cout << opts << "\n";
         return EXIT_SUCCESS;
      }

      if( options.count("genesis-json") == 0 )
      {
         std::cerr << "Missing --genesis-json\n" << opts << "\n";
         return EXIT_FAILURE;
      }

      setup_logging( options.at("log-level").as<std::string>() );

      const fc::path genesis_path( options.at("genesis-json").as<std::string>() );
      ilog( "Reading genesis state from ${p}", ("p",genesis_path) );
      const auto genesis = fc::json::from_file( genesis_path ).as<keymarket::chain::genesis_state_type>( max_json_depth );

      keymarket::chain::database db;
      db.init_genesis( genesis );

      db.applied_operation.connect( []( const keymarket::chain::operation_history_object& o ) {
         std::cout << fc::json::to_string( fc::variant( o, max_json_depth ) ) << "\n";
      });

      uint32_t accepted = 0;
      uint32_t rejected = 0;
      if( options.count("transactions-json") > 0 )
      {
         const fc::path trx_path( options.at("transactions-json").as<std::string>() );
         const auto submitted = fc::json::from_file( trx_path )
                                   .as<std::vector<keymarket::node::submitted_transaction>>( max_json_depth );
         ilog( "Applying ${n} transactions from ${p}", ("n",submitted.size())("p",trx_path) );

         for( const auto& entry : submitted )
         {
            try
            {
               db.push_transaction( entry.trx, entry.submitter );
               ++accepted;
            }
            catch( const fc::exception& e )
            {
               ++rejected;
               std::cerr << "Rejected transaction " << ( accepted + rejected - 1 ) << " of "
                         << std::string( entry.submitter ) << ": " << e.to_string() << "\n";
            }
         }
         ilog( "Accepted ${a} transactions, rejected ${r}", ("a",accepted)("r",rejected) );
      }

      if( options.count("print-state") > 0 )
         print_state( db );

      return rejected == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
   }
   catch( const fc::exception& e )
   {
      std::cerr << e.to_detail_string() << "\n";
      return EXIT_FAILURE;
   }
}
