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
#include <atomicswap/chain/swap_engine.hpp>
#include <atomicswap/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace atomicswap { namespace chain {

swap_engine::swap_engine( ledger_interface& ledger, const swap_engine_options& options )
   : _ledger( ledger ), _options( options ), _registry( options.first_swap_id )
{
}

template<typename Exception>
void swap_engine::transfer_or_throw( account_id_type from, account_id_type to, share_type amount, const char* leg )
{
   try
   {
      _ledger.transfer( from, to, amount );
   }
   catch( const fc::exception& e )
   {
      FC_THROW_EXCEPTION( Exception, "${leg} of ${r} from ${a} to ${b} failed: ${e}",
                          ("leg", leg)("r", amount)("a", from)("b", to)("e", e.to_string()) );
   }
   catch( const std::exception& e )
   {
      FC_THROW_EXCEPTION( Exception, "${leg} of ${r} from ${a} to ${b} failed: ${e}",
                          ("leg", leg)("r", amount)("a", from)("b", to)("e", e.what()) );
   }
}

swap_id_type swap_engine::initiate_swap( account_id_type counterparty, share_type counterparty_asset )
{
   swap_initiated_operation ev;
   {
      reentrancy_guard::scoped_acquire guard( _guard );

      swap_initiate_operation op( _ledger.caller_identity(), counterparty,
                                  _ledger.transferred_value(), counterparty_asset );
      op.validate();

      // checked before the deposit is taken, the counter cannot move while the guard is held
      if( !_registry.can_allocate() )
      {
         elog( "Swap id space exhausted, refusing swap from ${a}", ("a", op.initiator) );
         FC_THROW_EXCEPTION( swap_id_overflow, "No swap id left to allocate after ${n}",
                             ("n", _registry.next_id()) );
      }

      transfer_or_throw<swap_deposit_failed>( op.initiator, escrow_account(), op.initiator_asset, "Deposit" );

      swap_object swap;
      swap.initiator          = op.initiator;
      swap.counterparty       = op.counterparty;
      swap.initiator_asset    = op.initiator_asset;
      swap.counterparty_asset = op.counterparty_asset;
      const swap_id_type id = _registry.insert( std::move(swap) );

      ev = swap_initiated_operation( id, op.initiator, op.counterparty, op.initiator_asset, op.counterparty_asset );
      dlog( "Swap ${id} initiated by ${a} for ${b}", ("id", id)("a", op.initiator)("b", op.counterparty) );
   }
   notify_applied_event( ev );
   return ev.swap_id;
}

void swap_engine::accept_swap( swap_id_type swap_id )
{
   swap_accepted_operation ev;
   {
      reentrancy_guard::scoped_acquire guard( _guard );

      const swap_object* found = _registry.find( swap_id );
      ATOMICSWAP_ASSERT( found != nullptr, swap_not_found, "Swap ${id} does not exist", ("id", swap_id) );
      const swap_object swap = *found;
      ATOMICSWAP_ASSERT( !swap.unbalanced, swap_unbalanced,
                         "Swap ${id} is frozen after a failed rollback", ("id", swap_id) );

      const account_id_type caller = _ledger.caller_identity();
      ATOMICSWAP_ASSERT( caller == swap.counterparty, swap_unauthorized,
                         "Only ${c} may accept swap ${id}, not ${a}",
                         ("c", swap.counterparty)("id", swap_id)("a", caller) );

      const share_type attached = _ledger.transferred_value();
      ATOMICSWAP_ASSERT( attached == swap.counterparty_asset, swap_invalid_amount,
                         "Swap ${id} requires ${r}, ${a} was attached",
                         ("id", swap_id)("r", swap.counterparty_asset)("a", attached) );

      transfer_or_throw<swap_transfer_failed>( swap.counterparty, swap.initiator, swap.counterparty_asset,
                                               "Counterparty payment" );
      try
      {
         transfer_or_throw<swap_transfer_failed>( escrow_account(), swap.counterparty, swap.initiator_asset,
                                                  "Escrow release" );
      }
      catch( const swap_transfer_failed& e )
      {
         wlog( "Aborting swap ${id}, returning the counterparty payment: ${e}",
               ("id", swap_id)("e", e.to_string()) );
         try
         {
            transfer_or_throw<swap_rollback_failed>( swap.initiator, swap.counterparty, swap.counterparty_asset,
                                                     "Rollback" );
         }
         catch( const swap_rollback_failed& re )
         {
            elog( "Swap ${id} left unbalanced: ${e}", ("id", swap_id)("e", re.to_detail_string()) );
            _registry.mark_unbalanced( swap_id );
            throw;
         }
         throw;
      }

      _registry.remove( swap_id );

      ev = swap_accepted_operation( swap_id, swap.initiator, swap.counterparty );
      dlog( "Swap ${id} accepted by ${b}", ("id", swap_id)("b", swap.counterparty) );
   }
   notify_applied_event( ev );
}

void swap_engine::cancel_swap( swap_id_type swap_id )
{
   swap_cancelled_operation ev;
   {
      reentrancy_guard::scoped_acquire guard( _guard );

      const swap_object* found = _registry.find( swap_id );
      ATOMICSWAP_ASSERT( found != nullptr, swap_not_found, "Swap ${id} does not exist", ("id", swap_id) );
      const swap_object swap = *found;
      ATOMICSWAP_ASSERT( !swap.unbalanced, swap_unbalanced,
                         "Swap ${id} is frozen after a failed rollback", ("id", swap_id) );

      const account_id_type caller = _ledger.caller_identity();
      ATOMICSWAP_ASSERT( caller == swap.initiator, swap_unauthorized,
                         "Only ${i} may cancel swap ${id}, not ${a}",
                         ("i", swap.initiator)("id", swap_id)("a", caller) );

      transfer_or_throw<swap_refund_failed>( escrow_account(), swap.initiator, swap.initiator_asset, "Refund" );

      _registry.remove( swap_id );

      ev = swap_cancelled_operation( swap_id, swap.initiator );
      dlog( "Swap ${id} cancelled by ${a}", ("id", swap_id)("a", swap.initiator) );
   }
   notify_applied_event( ev );
}

optional<swap_object> swap_engine::get_swap( swap_id_type swap_id )const
{
   return _registry.get( swap_id );
}

vector<swap_object> swap_engine::get_swaps_by_initiator( account_id_type account, swap_id_type start, uint32_t limit )const
{
   FC_ASSERT( limit <= _options.api_limit, "Limit ${l} exceeds ${m}", ("l", limit)("m", _options.api_limit) );
   return _registry.find_by_initiator( account, start, limit );
}

vector<swap_object> swap_engine::get_swaps_by_counterparty( account_id_type account, swap_id_type start, uint32_t limit )const
{
   FC_ASSERT( limit <= _options.api_limit, "Limit ${l} exceeds ${m}", ("l", limit)("m", _options.api_limit) );
   return _registry.find_by_counterparty( account, start, limit );
}

void swap_engine::notify_applied_event( const swap_event& ev )
{
   if( _options.log_events )
      ilog( "Applied swap event ${e}", ("e", ev) );
   try
   {
      applied_event( ev );
   }
   catch( const fc::exception& e )
   {
      elog( "Caught exception in swap event listener: ${e}", ("e", e.to_detail_string()) );
   }
   catch( const std::exception& e )
   {
      elog( "Caught exception in swap event listener: ${e}", ("e", e.what()) );
   }
}

} } // atomicswap::chain
