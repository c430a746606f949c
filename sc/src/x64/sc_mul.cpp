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

#include "sc_mul.h"

#include "edwards25519_secure_erase.h"
#include "sc_constants.h"
#include "sc_ops.h"
#include "x64/mul128.h"

/*
 * Schoolbook 5x5 limb product into nine 128-bit column sums.
 * Each column holds at most five 104-bit products, so nothing overflows.
 */
static void sc52_mul_internal(edwards25519_u128 z[9], const sc_fe a, const sc_fe b)
{
    z[0] = mul64(a[0], b[0]);
    z[1] = mul64(a[0], b[1]) + mul64(a[1], b[0]);
    z[2] = mul64(a[0], b[2]) + mul64(a[1], b[1]) + mul64(a[2], b[0]);
    z[3] = mul64(a[0], b[3]) + mul64(a[1], b[2]) + mul64(a[2], b[1]) + mul64(a[3], b[0]);
    z[4] = mul64(a[0], b[4]) + mul64(a[1], b[3]) + mul64(a[2], b[2]) + mul64(a[3], b[1]) + mul64(a[4], b[0]);
    z[5] = mul64(a[1], b[4]) + mul64(a[2], b[3]) + mul64(a[3], b[2]) + mul64(a[4], b[1]);
    z[6] = mul64(a[2], b[4]) + mul64(a[3], b[3]) + mul64(a[4], b[2]);
    z[7] = mul64(a[3], b[4]) + mul64(a[4], b[3]);
    z[8] = mul64(a[4], b[4]);
}

/* Montgomery step for the low limbs: pick n so that sum + n*L0 is divisible by 2^52 */
static inline uint64_t sc52_part1(edwards25519_u128 sum, uint64_t *n)
{
    const uint64_t p = (lo128(sum) * SC_LFACTOR) & SC52_MASK;
    *n = p;
    return shr128(sum + mul64(p, SC_L[0]), 52);
}

static inline uint64_t sc52_part2(edwards25519_u128 sum, uint64_t *w)
{
    *w = lo128(sum) & SC52_MASK;
    return shr128(sum, 52);
}

/*
 * h = z / R mod L for a 9-limb product z < L * 2^260.
 *
 * Adds the multiple n*L that clears the low five limbs, keeps the high five and
 * performs one conditional subtraction of L. SC_L[3] is zero, so its products
 * are left out.
 */
static void sc52_montgomery_reduce(sc_fe h, const edwards25519_u128 z[9])
{
    uint64_t n0, n1, n2, n3, n4;
    uint64_t r0, r1, r2, r3;
    uint64_t carry;

    const uint64_t l1 = SC_L[1], l2 = SC_L[2], l4 = SC_L[4];

    carry = sc52_part1(z[0], &n0);
    carry = sc52_part1(z[1] + carry + mul64(n0, l1), &n1);
    carry = sc52_part1(z[2] + carry + mul64(n0, l2) + mul64(n1, l1), &n2);
    carry = sc52_part1(z[3] + carry + mul64(n1, l2) + mul64(n2, l1), &n3);
    carry = sc52_part1(z[4] + carry + mul64(n0, l4) + mul64(n2, l2) + mul64(n3, l1), &n4);

    carry = sc52_part2(z[5] + carry + mul64(n1, l4) + mul64(n3, l2) + mul64(n4, l1), &r0);
    carry = sc52_part2(z[6] + carry + mul64(n2, l4) + mul64(n4, l2), &r1);
    carry = sc52_part2(z[7] + carry + mul64(n3, l4), &r2);
    carry = sc52_part2(z[8] + carry + mul64(n4, l4), &r3);

    const sc_fe r = {r0, r1, r2, r3, carry};
    sc_sub(h, r, SC_L);
}

void sc_montgomery_mul_x64(sc_fe h, const sc_fe f, const sc_fe g)
{
    edwards25519_u128 z[9];
    sc52_mul_internal(z, f, g);
    sc52_montgomery_reduce(h, z);
    edwards25519_secure_erase(z, sizeof(z));
}

void sc_mul_x64(sc_fe h, const sc_fe f, const sc_fe g)
{
    /* (f*g/R) * R^2 / R = f*g */
    sc_fe t;
    sc_montgomery_mul_x64(t, f, g);
    sc_montgomery_mul_x64(h, t, SC_RR);
    edwards25519_secure_erase(t, sizeof(t));
}
