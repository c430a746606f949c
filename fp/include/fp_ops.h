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
 * @file fp_ops.h
 * @brief Basic F_p arithmetic: add, sub, neg, copy, zero, one.
 *
 * fp_add does not carry; its output limbs may reach 2^53 when both inputs are
 * themselves unreduced sums, which fp_mul, fp_sq and fp_sub all accept.
 * fp_sub and fp_neg add a multiple of p before subtracting and carry the result.
 */

#ifndef EDWARDS25519_FP_OPS_H
#define EDWARDS25519_FP_OPS_H

#include "fp.h"
#include "x64/fp51.h"

#include <cstring>

static inline void fp_add(fp_fe h, const fp_fe f, const fp_fe g)
{
    h[0] = f[0] + g[0];
    h[1] = f[1] + g[1];
    h[2] = f[2] + g[2];
    h[3] = f[3] + g[3];
    h[4] = f[4] + g[4];
}

/* h = f - g + 4p, carried */
static inline void fp_sub(fp_fe h, const fp_fe f, const fp_fe g)
{
    uint64_t c;
    uint64_t h0 = f[0] + 0x1FFFFFFFFFFFB4ULL - g[0];
    c = h0 >> 51;
    h0 &= FP51_MASK;
    uint64_t h1 = f[1] + 0x1FFFFFFFFFFFFCULL - g[1] + c;
    c = h1 >> 51;
    h1 &= FP51_MASK;
    uint64_t h2 = f[2] + 0x1FFFFFFFFFFFFCULL - g[2] + c;
    c = h2 >> 51;
    h2 &= FP51_MASK;
    uint64_t h3 = f[3] + 0x1FFFFFFFFFFFFCULL - g[3] + c;
    c = h3 >> 51;
    h3 &= FP51_MASK;
    uint64_t h4 = f[4] + 0x1FFFFFFFFFFFFCULL - g[4] + c;
    c = h4 >> 51;
    h4 &= FP51_MASK;
    h0 += c * 19;
    h[0] = h0;
    h[1] = h1;
    h[2] = h2;
    h[3] = h3;
    h[4] = h4;
}

/* h = 4p - f, carried */
static inline void fp_neg(fp_fe h, const fp_fe f)
{
    uint64_t c;
    uint64_t h0 = 0x1FFFFFFFFFFFB4ULL - f[0];
    c = h0 >> 51;
    h0 &= FP51_MASK;
    uint64_t h1 = 0x1FFFFFFFFFFFFCULL - f[1] + c;
    c = h1 >> 51;
    h1 &= FP51_MASK;
    uint64_t h2 = 0x1FFFFFFFFFFFFCULL - f[2] + c;
    c = h2 >> 51;
    h2 &= FP51_MASK;
    uint64_t h3 = 0x1FFFFFFFFFFFFCULL - f[3] + c;
    c = h3 >> 51;
    h3 &= FP51_MASK;
    uint64_t h4 = 0x1FFFFFFFFFFFFCULL - f[4] + c;
    c = h4 >> 51;
    h4 &= FP51_MASK;
    h0 += c * 19;
    h[0] = h0;
    h[1] = h1;
    h[2] = h2;
    h[3] = h3;
    h[4] = h4;
}

static inline void fp_copy(fp_fe h, const fp_fe f)
{
    std::memmove(h, f, sizeof(fp_fe));
}

static inline void fp_0(fp_fe h)
{
    std::memset(h, 0, sizeof(fp_fe));
}

static inline void fp_1(fp_fe h)
{
    h[0] = 1;
    h[1] = 0;
    h[2] = 0;
    h[3] = 0;
    h[4] = 0;
}

#endif // EDWARDS25519_FP_OPS_H
