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

#include "fp_sqrt_ratio.h"

#include "edwards25519_secure_erase.h"
#include "fp_cmov.h"
#include "fp_cneg.h"
#include "fp_ops.h"
#include "fp_pow22523.h"
#include "fp_utils.h"
#include "x64/fp51_chain.h"

/*
 * sqrt(-1) mod p, where p = 2^255 - 19.
 * = 2^((p-1)/4) mod p
 * = 19681161376707505956807079304988542015446066515923890162744021073123829784752
 */
const fp_fe FP_SQRT_M1 =
    {0x61b274a0ea0b0ULL, 0xd5a5fc8f189dULL, 0x7ef5e9cbd0c60ULL, 0x78595a6804c9eULL, 0x2b8324804fc1dULL};

/*
 * Constant-time square root of u/v for p = 5 (mod 8).
 *
 * Algorithm:
 *   r = (u * v^3) * (u * v^7)^((p-5)/8)
 *   check = v * r^2
 *
 *   correct   = (check ==  u)          r is the root
 *   flipped   = (check == -u)          r * sqrt(-1) is the root
 *   flipped_i = (check == -u*sqrt(-1)) u/v is not a square
 *
 *   r = r * sqrt(-1) if flipped or flipped_i, then r = |r|
 *   success = (correct | flipped) & (v != 0)
 *
 * Every candidate is computed and compared on every call.
 */
int fp_sqrt_ratio_x64(fp_fe x, const fp_fe u, const fp_fe v)
{
    fp_fe v3, v7, uv3, uv7, r, r_prime, check, neg_u, neg_u_i;

    fp51_chain_sq(v3, v);
    fp51_chain_mul(v3, v3, v); /* v^3 */
    fp51_chain_sq(v7, v3);
    fp51_chain_mul(v7, v7, v); /* v^7 */

    fp51_chain_mul(uv3, u, v3);
    fp51_chain_mul(uv7, u, v7);

    fp_pow22523(r, uv7);
    fp51_chain_mul(r, r, uv3);

    fp51_chain_sq(check, r);
    fp51_chain_mul(check, check, v);

    fp_neg(neg_u, u);
    fp51_chain_mul(neg_u_i, neg_u, FP_SQRT_M1);

    unsigned int correct = (unsigned int)fp_equal(check, u);
    unsigned int flipped = (unsigned int)fp_equal(check, neg_u);
    unsigned int flipped_i = (unsigned int)fp_equal(check, neg_u_i);
    unsigned int v_nonzero = (unsigned int)fp_isnonzero(v);

    fp51_chain_mul(r_prime, r, FP_SQRT_M1);
    fp_cmov(r, r_prime, flipped | flipped_i);

    /* choose the non-negative root */
    fp_cneg(x, r, (unsigned int)fp_isnegative(r));

    unsigned int ok = (correct | flipped) & v_nonzero;

    edwards25519_secure_erase(v3, sizeof(fp_fe));
    edwards25519_secure_erase(v7, sizeof(fp_fe));
    edwards25519_secure_erase(uv3, sizeof(fp_fe));
    edwards25519_secure_erase(uv7, sizeof(fp_fe));
    edwards25519_secure_erase(r, sizeof(fp_fe));
    edwards25519_secure_erase(r_prime, sizeof(fp_fe));
    edwards25519_secure_erase(check, sizeof(fp_fe));
    edwards25519_secure_erase(neg_u, sizeof(fp_fe));
    edwards25519_secure_erase(neg_u_i, sizeof(fp_fe));

    return -(int)(1u - ok);
}
