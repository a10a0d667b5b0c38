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
#include <atomicswap/chain/ledger.hpp>
#include <atomicswap/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace atomicswap { namespace chain {

void memory_ledger::transfer( account_id_type from, account_id_type to, share_type amount )
{ try {
   move_balance( from, to, amount );
} FC_CAPTURE_AND_RETHROW( (from)(to)(amount) ) }

void memory_ledger::move_balance( account_id_type from, account_id_type to, share_type amount )
{
   ATOMICSWAP_ASSERT( amount > 0, ledger_invalid_transfer,
                      "Cannot transfer a non-positive amount ${a}", ("a", amount) );
   ATOMICSWAP_ASSERT( from != to, ledger_invalid_transfer,
                      "Cannot transfer from ${a} to itself", ("a", from) );

   const share_type available = get_balance( from );
   ATOMICSWAP_ASSERT( available >= amount, ledger_insufficient_balance,
                      "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                      ("a", from)("b", available)("r", amount) );

   const share_type credited = get_balance( to ) + amount;
   _balances[from] = available - amount;
   _balances[to] = credited;
   dlog( "Moved ${r} from ${a} to ${b}", ("r", amount)("a", from)("b", to) );
}

void memory_ledger::set_call_context( account_id_type caller, share_type value )
{
   FC_ASSERT( value >= 0, "Attached value cannot be negative" );
   _caller = caller;
   _transferred = value;
}

void memory_ledger::set_balance( account_id_type account, share_type amount )
{
   FC_ASSERT( amount >= 0, "Balance cannot be negative" );
   FC_ASSERT( amount <= ATOMICSWAP_MAX_SHARE_SUPPLY, "Balance exceeds the maximum supply" );
   _balances[account] = amount;
}

share_type memory_ledger::get_balance( account_id_type account )const
{
   auto itr = _balances.find( account );
   if( itr == _balances.end() )
      return 0;
   return itr->second;
}

share_type memory_ledger::total_supply()const
{
   share_type total = 0;
   for( const auto& entry : _balances )
      total += entry.second;
   return total;
}

} } // atomicswap::chain
