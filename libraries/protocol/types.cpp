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
#include <atomicswap/protocol/types.hpp>

#include <fc/exception/exception.hpp>

#include <algorithm>
#include <cctype>

namespace atomicswap { namespace protocol {

   string account_id_type::to_string()const
   {
      return "1.2." + std::to_string( instance );
   }

} } // atomicswap::protocol

namespace fc {

   void to_variant( const atomicswap::protocol::account_id_type& var, fc::variant& vo, uint32_t max_depth )
   {
      vo = var.to_string();
   }

   void from_variant( const fc::variant& var, atomicswap::protocol::account_id_type& vo, uint32_t max_depth )
   {
      if( var.is_numeric() )
      {
         FC_ASSERT( var.is_uint64() || ( var.is_int64() && var.as_int64() >= 0 ),
                    "Invalid account id ${v}", ("v", var) );
         vo.instance = var.as_uint64();
         return;
      }
      const string s = var.as_string();
      const bool digits_only = s.size() > 4 && std::all_of( s.begin() + 4, s.end(), []( char c ) {
         return std::isdigit( static_cast<unsigned char>( c ) ) != 0;
      });
      FC_ASSERT( s.compare( 0, 4, "1.2." ) == 0 && digits_only, "Invalid account id ${s}", ("s", s) );
      try {
         vo.instance = std::stoull( s.substr( 4 ) );
      } FC_RETHROW_EXCEPTIONS( error, "Invalid account id ${s}", ("s", s) )
   }

} // fc
