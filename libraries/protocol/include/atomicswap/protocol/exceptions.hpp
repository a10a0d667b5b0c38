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

#include <fc/exception/exception.hpp>

#define ATOMICSWAP_ASSERT( expr, exc_type, FORMAT, ... )              \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace atomicswap { namespace protocol {

   FC_DECLARE_EXCEPTION( swap_exception, 5000000, "swap exception" )

   /// local, non-retryable; state is unchanged when one of these is thrown
   FC_DECLARE_DERIVED_EXCEPTION( swap_validation_exception,   atomicswap::protocol::swap_exception, 5010000, "swap validation exception" )

   FC_DECLARE_DERIVED_EXCEPTION( swap_invalid_amount,         atomicswap::protocol::swap_validation_exception, 5010001, "invalid amount" )
   FC_DECLARE_DERIVED_EXCEPTION( swap_self_swap_not_allowed,  atomicswap::protocol::swap_validation_exception, 5010002, "self swap not allowed" )
   FC_DECLARE_DERIVED_EXCEPTION( swap_not_found,              atomicswap::protocol::swap_validation_exception, 5010003, "swap not found" )
   FC_DECLARE_DERIVED_EXCEPTION( swap_unauthorized,           atomicswap::protocol::swap_validation_exception, 5010004, "caller is not authorized" )

   /// the ledger refused a transfer; no partial state is left behind
   FC_DECLARE_DERIVED_EXCEPTION( swap_resource_exception,     atomicswap::protocol::swap_exception, 5020000, "swap resource exception" )

   FC_DECLARE_DERIVED_EXCEPTION( swap_deposit_failed,         atomicswap::protocol::swap_resource_exception, 5020001, "deposit failed" )
   FC_DECLARE_DERIVED_EXCEPTION( swap_transfer_failed,        atomicswap::protocol::swap_resource_exception, 5020002, "transfer failed" )
   FC_DECLARE_DERIVED_EXCEPTION( swap_refund_failed,          atomicswap::protocol::swap_resource_exception, 5020003, "refund failed" )

   FC_DECLARE_DERIVED_EXCEPTION( swap_concurrency_exception,  atomicswap::protocol::swap_exception, 5030000, "swap concurrency exception" )

   FC_DECLARE_DERIVED_EXCEPTION( swap_already_active,         atomicswap::protocol::swap_concurrency_exception, 5030001, "reentrant call rejected" )

   /// irrecoverable; reported apart from business errors
   FC_DECLARE_DERIVED_EXCEPTION( swap_fatal_exception,        atomicswap::protocol::swap_exception, 5040000, "swap fatal exception" )

   FC_DECLARE_DERIVED_EXCEPTION( swap_id_overflow,            atomicswap::protocol::swap_fatal_exception, 5040001, "swap id space exhausted" )
   FC_DECLARE_DERIVED_EXCEPTION( swap_rollback_failed,        atomicswap::protocol::swap_fatal_exception, 5040002, "compensating transfer failed" )
   FC_DECLARE_DERIVED_EXCEPTION( swap_unbalanced,             atomicswap::protocol::swap_fatal_exception, 5040003, "swap awaits reconciliation" )

   FC_DECLARE_EXCEPTION( ledger_exception, 5100000, "ledger exception" )

   FC_DECLARE_DERIVED_EXCEPTION( ledger_insufficient_balance, atomicswap::protocol::ledger_exception, 5100001, "insufficient balance" )
   FC_DECLARE_DERIVED_EXCEPTION( ledger_invalid_transfer,     atomicswap::protocol::ledger_exception, 5100002, "invalid transfer" )

} } // atomicswap::protocol
