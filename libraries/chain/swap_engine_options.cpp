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
#include <atomicswap/chain/swap_engine_options.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

namespace atomicswap { namespace chain {

void swap_engine_options::set_program_options(
   boost::program_options::options_description& cli,
   boost::program_options::options_description& cfg
   )
{
   cli.add_options()
         ("swap-escrow-account", boost::program_options::value<uint64_t>()->default_value(
                                    ATOMICSWAP_ESCROW_ACCOUNT.instance ),
          "Ledger account that holds deposits of open swaps")
         ("swap-first-id", boost::program_options::value<uint32_t>()->default_value( ATOMICSWAP_FIRST_SWAP_ID ),
          "First swap id handed out by the registry")
         ("swap-api-limit", boost::program_options::value<uint32_t>()->default_value( ATOMICSWAP_DEFAULT_API_LIMIT ),
          "Maximum number of swaps returned by a single list query")
         ("swap-history-size", boost::program_options::value<uint32_t>()->default_value( ATOMICSWAP_DEFAULT_HISTORY_SIZE ),
          "Number of lifecycle events kept in memory, 0 keeps all of them")
         ("swap-log-events", boost::program_options::value<bool>()->default_value( false ),
          "Log every applied swap event")
         ;
   cfg.add(cli);
}

void swap_engine_options::initialize( const boost::program_options::variables_map& options )
{ try {
   if( options.count( "swap-escrow-account" ) )
      escrow_account = account_id_type( options["swap-escrow-account"].as<uint64_t>() );
   if( options.count( "swap-first-id" ) )
      first_swap_id = options["swap-first-id"].as<uint32_t>();
   if( options.count( "swap-api-limit" ) )
      api_limit = options["swap-api-limit"].as<uint32_t>();
   if( options.count( "swap-history-size" ) )
      history_size = options["swap-history-size"].as<uint32_t>();
   if( options.count( "swap-log-events" ) )
      log_events = options["swap-log-events"].as<bool>();

   FC_ASSERT( api_limit > 0, "swap-api-limit must be greater than zero" );
   FC_ASSERT( first_swap_id <= ATOMICSWAP_MAX_SWAP_ID, "swap-first-id leaves no id to allocate" );

   ilog( "Swap engine options: ${o}", ("o", *this) );
} FC_CAPTURE_AND_RETHROW() }

} } // atomicswap::chain
