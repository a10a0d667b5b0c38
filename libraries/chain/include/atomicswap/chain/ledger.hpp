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

namespace atomicswap { namespace chain {
   using namespace protocol;

   /**
    * @brief account system the swap engine moves funds through
    *
    * The ledger owns balances and knows who is calling and how much value the call
    * carries. A transfer either completes or throws; it may call back into the engine.
    */
   class ledger_interface
   {
      public:
         virtual ~ledger_interface() {}

         /**
          * Moves @p amount from @p from to @p to.
          * Throws a ledger_exception (or any fc::exception) if the transfer did not happen.
          */
         virtual void transfer( account_id_type from, account_id_type to, share_type amount ) = 0;

         /// account on whose behalf the current call runs
         virtual account_id_type caller_identity()const = 0;
         /// value attached to the current call
         virtual share_type      transferred_value()const = 0;
   };

   /**
    * @brief in-process ledger keeping balances in a table
    *
    * Serves as the reference ledger for hosts without an account system of their own.
    * transfer() is virtual so hosts can observe or veto movements.
    */
   class memory_ledger : public ledger_interface
   {
      public:
         void transfer( account_id_type from, account_id_type to, share_type amount ) override;

         account_id_type caller_identity()const override { return _caller; }
         share_type      transferred_value()const override { return _transferred; }

         void set_call_context( account_id_type caller, share_type value = 0 );

         void       set_balance( account_id_type account, share_type amount );
         share_type get_balance( account_id_type account )const;
         /// sum of every balance in the table
         share_type total_supply()const;

      protected:
         void move_balance( account_id_type from, account_id_type to, share_type amount );

      private:
         flat_map<account_id_type, share_type> _balances;
         account_id_type                       _caller;
         share_type                            _transferred;
   };

} } // atomicswap::chain
