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

#include "edwards_frombytes.h"

#include "edwards_constants.h"
#include "fp_cneg.h"
#include "fp_frombytes.h"
#include "fp_mul.h"
#include "fp_ops.h"
#include "fp_sq.h"
#include "fp_sqrt_ratio.h"
#include "fp_tobytes.h"
#include "fp_utils.h"

/*
 * Decompression:
 *   y = bits 0..254, rejected unless y < p
 *   u = y^2 - 1, v = d*y^2 + 1
 *   x = sqrt(u/v), non-negative; no root means the bytes are not a curve point
 *   x = 0 with the sign bit set has no canonical meaning and is rejected
 *   x = -x if the sign bit is set
 *   result = (x : y : 1 : x*y)
 */
int edwards_frombytes(edwards_extended *r, const unsigned char s[32])
{
    fp_fe x, y, yy, u, v, one;

    fp_frombytes(y, s);

    /* canonical check: y must re-encode to the input with bit 255 cleared */
    unsigned char check[32];
    fp_tobytes(check, y);
    unsigned char diff = (unsigned char)(check[31] ^ (s[31] & 0x7f));
    for (int i = 0; i < 31; i++)
        diff |= (unsigned char)(check[i] ^ s[i]);
    if (diff != 0)
        return EDWARDS25519_ERR_INVALID_ENCODING;

    fp_1(one);
    fp_sq(yy, y);
    fp_sub(u, yy, one);
    fp_mul(v, yy, EDWARDS_D);
    fp_add(v, v, one);

    if (fp_sqrt_ratio(x, u, v) != 0)
        return EDWARDS25519_ERR_NOT_ON_CURVE;

    const unsigned int sign = (unsigned int)(s[31] >> 7);
    if (sign && !fp_isnonzero(x))
        return EDWARDS25519_ERR_INVALID_ENCODING;

    /* sqrt_ratio returns the non-negative root */
    fp_cneg(r->X, x, sign);
    fp_copy(r->Y, y);
    fp_1(r->Z);
    fp_mul(r->T, r->X, y);

    return EDWARDS25519_OK;
}
