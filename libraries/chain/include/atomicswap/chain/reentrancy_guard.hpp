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

namespace atomicswap { namespace chain {

   /**
    * @class reentrancy_guard
    * @brief flag held for the duration of a state-changing call
    *
    * A ledger transfer may call back into the engine. While the flag is held every
    * mutating entry point is refused with swap_already_active.
    */
   class reentrancy_guard
   {
      public:
         /**
          * Holds the guard until destruction, whichever way the guarded block is left.
          */
         class scoped_acquire
         {
            public:
               explicit scoped_acquire( reentrancy_guard& g ) : _guard(g) { _guard.acquire(); }
               ~scoped_acquire() { _guard.release(); }

               scoped_acquire( const scoped_acquire& ) = delete;
               scoped_acquire& operator = ( const scoped_acquire& ) = delete;

            private:
               reentrancy_guard& _guard;
         };

         /// Throws swap_already_active if the guard is already held
         void acquire();
         void release() { _active = false; }

         bool active()const { return _active; }

      private:
         bool _active = false;
   };

} } // atomicswap::chain
