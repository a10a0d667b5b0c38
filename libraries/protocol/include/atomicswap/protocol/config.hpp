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

/** account that holds deposits while a swap is open */
#define ATOMICSWAP_ESCROW_ACCOUNT  (atomicswap::protocol::account_id_type(0))

#define ATOMICSWAP_FIRST_SWAP_ID      uint32_t(0)
/** the counter must be able to advance past an id before it is issued */
#define ATOMICSWAP_MAX_SWAP_ID        uint32_t(0xFFFFFFFE)

#define ATOMICSWAP_DEFAULT_API_LIMIT     101
#define ATOMICSWAP_DEFAULT_HISTORY_SIZE  1000

#define ATOMICSWAP_MAX_SHARE_SUPPLY int64_t(1000000000000000ll)
