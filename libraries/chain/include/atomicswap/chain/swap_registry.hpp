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

#include <atomicswap/chain/swap_object.hpp>

namespace atomicswap { namespace chain {

   /**
    * @class swap_registry
    * @brief owns every open swap and the identifier counter
    *
    * Identifiers only move forward. An identifier is issued only when the counter can
    * advance past it, so the counter never wraps and an id is never reused.
    */
   class swap_registry
   {
      public:
         explicit swap_registry( swap_id_type first_id = ATOMICSWAP_FIRST_SWAP_ID );

         /**
          * Stores the record under the next identifier and returns that identifier.
          * Throws swap_id_overflow if the identifier space is exhausted; nothing is stored then.
          */
         swap_id_type insert( swap_object swap );

         /// Returns nullptr for never created, already resolved and invalid ids alike
         const swap_object* find( swap_id_type id )const;
         optional<swap_object> get( swap_id_type id )const;

         /// The caller must have checked that the record exists
         void remove( swap_id_type id );
         void mark_unbalanced( swap_id_type id );

         /// true while at least one identifier can still be issued
         bool can_allocate()const { return _next_id <= ATOMICSWAP_MAX_SWAP_ID; }
         swap_id_type next_id()const { return _next_id; }
         size_t size()const { return _swaps.size(); }

         vector<swap_object> find_by_initiator( account_id_type account, swap_id_type start, uint32_t limit )const;
         vector<swap_object> find_by_counterparty( account_id_type account, swap_id_type start, uint32_t limit )const;

      private:
         template<typename Tag>
         vector<swap_object> find_by_account( account_id_type account, swap_id_type start, uint32_t limit )const;

         swap_object_multi_index_type _swaps;
         swap_id_type                 _next_id;
   };

} } // atomicswap::chain
