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
#include <atomicswap/protocol/swap.hpp>
#include <atomicswap/protocol/exceptions.hpp>

namespace atomicswap { namespace protocol {

   void swap_initiate_operation::validate()const
   {
      ATOMICSWAP_ASSERT( initiator_asset > 0, swap_invalid_amount,
                         "Initiator deposit must be greater than zero, got ${a}", ("a", initiator_asset) );
      ATOMICSWAP_ASSERT( counterparty_asset > 0, swap_invalid_amount,
                         "Counterparty amount must be greater than zero, got ${a}", ("a", counterparty_asset) );
      ATOMICSWAP_ASSERT( initiator != counterparty, swap_self_swap_not_allowed,
                         "Account ${a} cannot swap with itself", ("a", initiator) );
   }

   namespace {
      struct event_swap_id_visitor
      {
         typedef swap_id_type result_type;

         template<typename T>
         swap_id_type operator()( const T& ev )const { return ev.swap_id; }
      };
   }

   swap_id_type get_event_swap_id( const swap_event& e )
   {
      return e.visit( event_swap_id_visitor() );
   }

} } // atomicswap::protocol
