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

#include <atomicswap/protocol/types.hpp>

#include <boost/program_options.hpp>

namespace atomicswap { namespace chain {
   using namespace protocol;

   /**
    * @brief tunables of a swap_engine
    *
    * Defaults match an engine constructed without options.
    */
   struct swap_engine_options
   {
      account_id_type escrow_account    = ATOMICSWAP_ESCROW_ACCOUNT;
      swap_id_type    first_swap_id     = ATOMICSWAP_FIRST_SWAP_ID;
      uint32_t        api_limit         = ATOMICSWAP_DEFAULT_API_LIMIT;
      uint32_t        history_size      = ATOMICSWAP_DEFAULT_HISTORY_SIZE;
      bool            log_events        = false;

      static void set_program_options( boost::program_options::options_description& cli,
                                       boost::program_options::options_description& cfg );

      /// Reads the options registered by set_program_options; rejects invalid values
      void initialize( const boost::program_options::variables_map& options );
   };

} } // atomicswap::chain

FC_REFLECT( atomicswap::chain::swap_engine_options,
            (escrow_account)(first_swap_id)(api_limit)(history_size)(log_events) )
