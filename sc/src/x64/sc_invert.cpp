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

#include "sc_invert.h"

#include "edwards25519_secure_erase.h"
#include "sc_constants.h"
#include "sc_mul.h"
#include "sc_ops.h"

/* L - 2, little-endian */
static const unsigned char SC_L_MINUS_2[32] = {0xeb, 0xd3, 0xf5, 0x5c, 0x1a, 0x63, 0x12, 0x58, 0xd6, 0x9c, 0xf7,
    0xa2, 0xde, 0xf9, 0xde, 0x14, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
    0x00, 0x10};

/*
 * Left-to-right square-and-multiply in the Montgomery domain. The branch is on
 * bits of the public exponent only.
 */
void sc_invert(sc_fe out, const sc_fe z)
{
    sc_fe zm, acc;
    sc_montgomery_mul(zm, z, SC_RR); /* z * R */
    sc_copy(acc, SC_R); /* 1 * R */

    for (int i = 252; i >= 0; i--)
    {
        sc_montgomery_mul(acc, acc, acc);
        if ((SC_L_MINUS_2[i >> 3] >> (i & 7)) & 1)
            sc_montgomery_mul(acc, acc, zm);
    }

    /* leave the Montgomery domain: acc * 1 / R */
    sc_fe one;
    sc_1(one);
    sc_montgomery_mul(out, acc, one);

    edwards25519_secure_erase(zm, sizeof(zm));
    edwards25519_secure_erase(acc, sizeof(acc));
}
