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

#include <atomicswap/protocol/swap.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace atomicswap { namespace chain {
   using namespace protocol;
   using namespace boost::multi_index;

   /**
    * @brief registry record of an open swap
    *
    * A swap_object exists only while the swap is open. Accepting or cancelling the swap
    * removes it, so a resolved swap looks the same as one that never existed.
    */
   class swap_object
   {
   public:
      swap_id_type    id = 0;
      account_id_type initiator;
      account_id_type counterparty;
      share_type      initiator_asset;    ///< held by the escrow account
      share_type      counterparty_asset; ///< required from the counterparty on accept
      /// set when an accept could not return the counterparty payment; the swap is frozen
      bool            unbalanced = false;

      /*****
       * Index helper for initiator
       */
      struct initiator_extractor {
         using result_type = account_id_type;
         const result_type& operator()(const swap_object& o)const { return o.initiator; }
      };

      /*****
       * Index helper for counterparty
       */
      struct counterparty_extractor {
         using result_type = account_id_type;
         const result_type& operator()(const swap_object& o)const { return o.counterparty; }
      };
   };

   struct by_id;
   struct by_initiator;
   struct by_counterparty;
   using swap_object_multi_index_type = multi_index_container<
         swap_object,
         indexed_by<
            ordered_unique< tag< by_id >, member< swap_object, swap_id_type, &swap_object::id > >,
            ordered_unique< tag< by_initiator >,
               composite_key< swap_object,
                  swap_object::initiator_extractor,
                  member< swap_object, swap_id_type, &swap_object::id > > >,
            ordered_unique< tag< by_counterparty >,
               composite_key< swap_object,
                  swap_object::counterparty_extractor,
                  member< swap_object, swap_id_type, &swap_object::id > > >
         >
   >;

} } // atomicswap::chain

FC_REFLECT( atomicswap::chain::swap_object,
            (id)(initiator)(counterparty)(initiator_asset)(counterparty_asset)(unbalanced) )
