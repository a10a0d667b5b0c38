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
#include <atomicswap/chain/swap_registry.hpp>
#include <atomicswap/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace atomicswap { namespace chain {

swap_registry::swap_registry( swap_id_type first_id )
   : _next_id( first_id )
{
}

swap_id_type swap_registry::insert( swap_object swap )
{
   if( !can_allocate() )
   {
      elog( "Swap id space exhausted, next id would be ${n}", ("n", _next_id) );
      FC_THROW_EXCEPTION( swap_id_overflow, "No swap id left to allocate after ${n}", ("n", _next_id) );
   }

   const swap_id_type id = _next_id;
   swap.id = id;
   const auto result = _swaps.insert( std::move(swap) );
   FC_ASSERT( result.second, "Swap id ${id} is already in use", ("id", id) );
   ++_next_id;
   return id;
}

const swap_object* swap_registry::find( swap_id_type id )const
{
   const auto& idx = _swaps.get<by_id>();
   auto itr = idx.find( id );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

optional<swap_object> swap_registry::get( swap_id_type id )const
{
   const swap_object* obj = find( id );
   if( obj == nullptr )
      return optional<swap_object>();
   return *obj;
}

void swap_registry::remove( swap_id_type id )
{
   auto& idx = _swaps.get<by_id>();
   auto itr = idx.find( id );
   FC_ASSERT( itr != idx.end(), "Removing unknown swap ${id}", ("id", id) );
   idx.erase( itr );
}

void swap_registry::mark_unbalanced( swap_id_type id )
{
   auto& idx = _swaps.get<by_id>();
   auto itr = idx.find( id );
   FC_ASSERT( itr != idx.end(), "Marking unknown swap ${id}", ("id", id) );
   idx.modify( itr, []( swap_object& s ) { s.unbalanced = true; } );
}

template<typename Tag>
vector<swap_object> swap_registry::find_by_account( account_id_type account, swap_id_type start, uint32_t limit )const
{
   vector<swap_object> result;
   const auto& idx = _swaps.get<Tag>();
   auto itr = idx.lower_bound( boost::make_tuple( account, start ) );
   auto end = idx.upper_bound( boost::make_tuple( account ) );
   while( itr != end && result.size() < limit )
   {
      result.push_back( *itr );
      ++itr;
   }
   return result;
}

vector<swap_object> swap_registry::find_by_initiator( account_id_type account, swap_id_type start, uint32_t limit )const
{
   return find_by_account<by_initiator>( account, start, limit );
}

vector<swap_object> swap_registry::find_by_counterparty( account_id_type account, swap_id_type start, uint32_t limit )const
{
   return find_by_account<by_counterparty>( account, start, limit );
}

} } // atomicswap::chain
