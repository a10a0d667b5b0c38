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

#include <atomicswap/chain/ledger.hpp>
#include <atomicswap/chain/reentrancy_guard.hpp>
#include <atomicswap/chain/swap_engine_options.hpp>
#include <atomicswap/chain/swap_registry.hpp>

#include <fc/signals.hpp>

namespace atomicswap { namespace chain {

   /**
    * @class swap_engine
    * @brief runs the lifecycle of two-party swaps
    *
    * An initiator escrows a deposit and names a counterparty and the amount it must bring.
    * The counterparty accepts by attaching exactly that amount, which exchanges both deposits,
    * or the initiator cancels and gets the deposit back. Only open swaps are stored.
    *
    * Every mutating call holds the reentrancy guard while it runs and publishes its event
    * through applied_event after the guard has been released.
    */
   class swap_engine
   {
      public:
         swap_engine( ledger_interface& ledger, const swap_engine_options& options = swap_engine_options() );

         /**
          * Escrows the value attached to the call and opens a swap with the caller as initiator.
          * @param counterparty the only account that may accept
          * @param counterparty_asset amount the counterparty must attach to accept
          * @return id of the new swap
          */
         swap_id_type initiate_swap( account_id_type counterparty, share_type counterparty_asset );

         /**
          * Exchanges both deposits and removes the swap. The caller must be the counterparty and
          * attach exactly the requested amount. If any leg fails the swap stays open and no
          * funds have moved.
          *
          * If the counterparty payment cannot be returned after a failed escrow release,
          * swap_rollback_failed is thrown and the swap is marked unbalanced. An unbalanced swap
          * keeps its escrowed deposit and refuses every further accept and cancel with
          * swap_unbalanced, so the host has to reconcile it.
          */
         void accept_swap( swap_id_type swap_id );

         /// Refunds the initiator and removes the swap; only the initiator may cancel
         void cancel_swap( swap_id_type swap_id );

         /**
          * @name Queries
          */
         ///@{
         optional<swap_object> get_swap( swap_id_type swap_id )const;
         vector<swap_object>   get_swaps_by_initiator( account_id_type account, swap_id_type start, uint32_t limit )const;
         vector<swap_object>   get_swaps_by_counterparty( account_id_type account, swap_id_type start, uint32_t limit )const;
         size_t                get_swap_count()const { return _registry.size(); }
         bool                  is_guard_active()const { return _guard.active(); }
         ///@}

         const swap_engine_options& get_options()const { return _options; }
         const account_id_type&     escrow_account()const { return _options.escrow_account; }

         /**
          *  This signal is emitted after a swap operation completed and the guard was released.
          *  Listener failures are logged and do not undo the operation.
          */
         fc::signal<void(const swap_event&)> applied_event;

      private:
         void notify_applied_event( const swap_event& ev );

         /// Runs a ledger transfer, turning any failure into Exception
         template<typename Exception>
         void transfer_or_throw( account_id_type from, account_id_type to, share_type amount, const char* leg );

         ledger_interface&   _ledger;
         swap_engine_options _options;
         swap_registry       _registry;
         reentrancy_guard    _guard;
   };

} } // atomicswap::chain
