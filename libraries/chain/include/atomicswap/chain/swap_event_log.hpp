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

#include <atomicswap/chain/swap_engine.hpp>

#include <deque>

namespace atomicswap { namespace chain {

   /**
    * @brief one entry of the event log
    */
   struct applied_swap_event
   {
      uint64_t     sequence = 0;
      swap_id_type swap_id  = 0;
      swap_event   event;
   };

   /**
    * @class swap_event_log
    * @brief keeps the most recent lifecycle events published by a swap_engine
    *
    * Sequence numbers start at 1 and keep increasing when old entries are dropped.
    * The subscription ends when the log is destroyed.
    */
   class swap_event_log
   {
      public:
         /// @param max_size number of retained events, 0 retains all of them
         explicit swap_event_log( uint32_t max_size = ATOMICSWAP_DEFAULT_HISTORY_SIZE );

         swap_event_log( const swap_event_log& ) = delete;
         swap_event_log& operator = ( const swap_event_log& ) = delete;

         /// Subscribes to @p engine, dropping any previous subscription
         void attach( swap_engine& engine );
         void detach();

         void record( const swap_event& ev );

         vector<applied_swap_event> get_events( uint64_t start_sequence, uint32_t limit )const;
         vector<applied_swap_event> get_events_for_swap( swap_id_type swap_id )const;

         size_t   size()const { return _events.size(); }
         uint64_t last_sequence()const { return _last_sequence; }

      private:
         std::deque<applied_swap_event>     _events;
         uint32_t                           _max_size;
         uint64_t                           _last_sequence = 0;
         boost::signals2::scoped_connection _connection;
   };

} } // atomicswap::chain

FC_REFLECT( atomicswap::chain::applied_swap_event, (sequence)(swap_id)(event) )
