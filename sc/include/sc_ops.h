// Copyright (c) 2025-2026, Brandon Lehmann
//
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

/**
 * @file sc_ops.h
 * @brief Scalar add, sub, neg, copy, zero, one (mod L).
 *
 * Inputs must already be reduced. The final conditional add of L in sc_sub is
 * mask-selected, so timing does not depend on the operands.
 */

#ifndef EDWARDS25519_SC_OPS_H
#define EDWARDS25519_SC_OPS_H

#include "ct_barrier.h"
#include "sc.h"
#include "sc_constants.h"

#include <cstring>

/* h = f - g mod L, for f, g in [0, L) (also used to subtract L from a sum < 2L) */
static inline void sc_sub(sc_fe h, const sc_fe f, const sc_fe g)
{
    uint64_t d[5];
    uint64_t borrow = 0;
    for (int i = 0; i < 5; i++)
    {
        borrow = f[i] - (g[i] + (borrow >> 63));
        d[i] = borrow & SC52_MASK;
    }

    /* add L back if the subtraction underflowed */
    const uint64_t underflow_mask = ct_barrier_u64(((borrow >> 63) ^ 1) - 1);
    uint64_t carry = 0;
    for (int i = 0; i < 5; i++)
    {
        carry = (carry >> 52) + d[i] + (SC_L[i] & underflow_mask);
        h[i] = carry & SC52_MASK;
    }
}

static inline void sc_add(sc_fe h, const sc_fe f, const sc_fe g)
{
    sc_fe sum;
    uint64_t carry = 0;
    for (int i = 0; i < 5; i++)
    {
        carry = f[i] + g[i] + (carry >> 52);
        sum[i] = carry & SC52_MASK;
    }
    sc_sub(h, sum, SC_L);
}

static inline void sc_0(sc_fe h)
{
    std::memset(h, 0, sizeof(sc_fe));
}

static inline void sc_1(sc_fe h)
{
    h[0] = 1;
    h[1] = 0;
    h[2] = 0;
    h[3] = 0;
    h[4] = 0;
}

static inline void sc_copy(sc_fe h, const sc_fe f)
{
    std::memmove(h, f, sizeof(sc_fe));
}

static inline void sc_neg(sc_fe h, const sc_fe f)
{
    sc_fe zero;
    sc_0(zero);
    sc_sub(h, zero, f);
}

#endif // EDWARDS25519_SC_OPS_H
