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

namespace atomicswap { namespace protocol {

   /**
    * @brief Proposes a swap and escrows the caller's deposit
    *
    * The caller becomes the initiator. The deposit is the value attached to the call,
    * it is not part of the operation.
    */
   struct swap_initiate_operation
   {
      swap_initiate_operation() {}
      swap_initiate_operation( account_id_type initiator, account_id_type counterparty,
                               share_type initiator_asset, share_type counterparty_asset )
         : initiator(initiator), counterparty(counterparty),
           initiator_asset(initiator_asset), counterparty_asset(counterparty_asset) {}

      account_id_type initiator;          ///< the caller
      account_id_type counterparty;       ///< the only account allowed to accept
      share_type      initiator_asset;    ///< attached deposit
      share_type      counterparty_asset; ///< what the counterparty must attach to accept

      void validate()const;
   };

   /**
    * virtual op emitted once a swap is stored
    */
   struct swap_initiated_operation
   {
      swap_initiated_operation() {}
      swap_initiated_operation( swap_id_type swap_id, account_id_type initiator, account_id_type counterparty,
                                share_type initiator_asset, share_type counterparty_asset )
         : swap_id(swap_id), initiator(initiator), counterparty(counterparty),
           initiator_asset(initiator_asset), counterparty_asset(counterparty_asset) {}

      swap_id_type    swap_id = 0;
      account_id_type initiator;
      account_id_type counterparty;
      share_type      initiator_asset;
      share_type      counterparty_asset;
   };

   /**
    * virtual op emitted once both deposits have changed hands
    */
   struct swap_accepted_operation
   {
      swap_accepted_operation() {}
      swap_accepted_operation( swap_id_type swap_id, account_id_type initiator, account_id_type counterparty )
         : swap_id(swap_id), initiator(initiator), counterparty(counterparty) {}

      swap_id_type    swap_id = 0;
      account_id_type initiator;
      account_id_type counterparty;
   };

   /**
    * virtual op emitted once the initiator has been refunded
    */
   struct swap_cancelled_operation
   {
      swap_cancelled_operation() {}
      swap_cancelled_operation( swap_id_type swap_id, account_id_type initiator )
         : swap_id(swap_id), initiator(initiator) {}

      swap_id_type    swap_id = 0;
      account_id_type initiator;
   };

   typedef fc::static_variant<
            swap_initiated_operation,
            swap_accepted_operation,
            swap_cancelled_operation
         > swap_event;

   /// id of the swap an event refers to
   swap_id_type get_event_swap_id( const swap_event& e );

} } // atomicswap::protocol

FC_REFLECT( atomicswap::protocol::swap_initiate_operation,
            (initiator)(counterparty)(initiator_asset)(counterparty_asset) )

FC_REFLECT( atomicswap::protocol::swap_initiated_operation,
            (swap_id)(initiator)(counterparty)(initiator_asset)(counterparty_asset) )
FC_REFLECT( atomicswap::protocol::swap_accepted_operation, (swap_id)(initiator)(counterparty) )
FC_REFLECT( atomicswap::protocol::swap_cancelled_operation, (swap_id)(initiator) )

FC_REFLECT_TYPENAME( atomicswap::protocol::swap_event )
