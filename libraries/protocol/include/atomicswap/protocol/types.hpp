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

#include <cstdint>
#include <string>
#include <vector>

#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/optional.hpp>
#include <fc/safe.hpp>
#include <fc/container/flat.hpp>
#include <fc/static_variant.hpp>
#include <fc/variant.hpp>

#include <atomicswap/protocol/config.hpp>

namespace atomicswap { namespace protocol {

using std::string;
using std::vector;

using fc::variant;
using fc::optional;
using fc::safe;
using fc::flat_map;

typedef safe<int64_t> share_type;
typedef uint32_t      swap_id_type;

/**
 * @brief identity of an account on the underlying ledger
 *
 * The ledger decides what an account is; the swap engine only compares and stores them.
 */
struct account_id_type
{
   account_id_type() {}
   explicit account_id_type( uint64_t i ) : instance(i) {}

   uint64_t instance = 0;

   string to_string()const;

   friend bool operator == ( const account_id_type& a, const account_id_type& b ) { return a.instance == b.instance; }
   friend bool operator != ( const account_id_type& a, const account_id_type& b ) { return a.instance != b.instance; }
   friend bool operator <  ( const account_id_type& a, const account_id_type& b ) { return a.instance <  b.instance; }
   friend bool operator >  ( const account_id_type& a, const account_id_type& b ) { return a.instance >  b.instance; }
};

} } // atomicswap::protocol

namespace fc {
   void to_variant( const atomicswap::protocol::account_id_type& var, fc::variant& vo, uint32_t max_depth = 1 );
   void from_variant( const fc::variant& var, atomicswap::protocol::account_id_type& vo, uint32_t max_depth = 1 );
}

FC_REFLECT_TYPENAME( atomicswap::protocol::account_id_type )
