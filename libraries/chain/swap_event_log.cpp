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
#include <atomicswap/chain/swap_event_log.hpp>

#include <algorithm>

namespace atomicswap { namespace chain {

swap_event_log::swap_event_log( uint32_t max_size )
   : _max_size( max_size )
{
}

void swap_event_log::attach( swap_engine& engine )
{
   detach();
   _connection = engine.applied_event.connect( [this]( const swap_event& ev ) {
      record( ev );
   });
}

void swap_event_log::detach()
{
   _connection.disconnect();
}

void swap_event_log::record( const swap_event& ev )
{
   applied_swap_event entry;
   entry.sequence = ++_last_sequence;
   entry.swap_id  = get_event_swap_id( ev );
   entry.event    = ev;
   _events.push_back( std::move(entry) );

   while( _max_size > 0 && _events.size() > _max_size )
      _events.pop_front();
}

vector<applied_swap_event> swap_event_log::get_events( uint64_t start_sequence, uint32_t limit )const
{
   vector<applied_swap_event> result;
   auto itr = std::lower_bound( _events.begin(), _events.end(), start_sequence,
                                []( const applied_swap_event& e, uint64_t seq ) { return e.sequence < seq; } );
   for( ; itr != _events.end() && result.size() < limit; ++itr )
      result.push_back( *itr );
   return result;
}

vector<applied_swap_event> swap_event_log::get_events_for_swap( swap_id_type swap_id )const
{
   vector<applied_swap_event> result;
   for( const auto& e : _events )
   {
      if( e.swap_id == swap_id )
         result.push_back( e );
   }
   return result;
}

} } // atomicswap::chain
