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

#include "sc_frombytes.h"

#include "edwards25519_secure_erase.h"
#include "le_bytes.h"
#include "sc_constants.h"
#include "sc_mul.h"
#include "sc_ops.h"
#include "sc_tobytes.h"

/* Split 256 bits into 52-bit limbs without reducing; the top limb gets 48 bits */
static void sc52_unpack(sc_fe h, const unsigned char s[32])
{
    const uint64_t w0 = le_load_u64(s);
    const uint64_t w1 = le_load_u64(s + 8);
    const uint64_t w2 = le_load_u64(s + 16);
    const uint64_t w3 = le_load_u64(s + 24);

    h[0] = w0 & SC52_MASK;
    h[1] = ((w0 >> 52) | (w1 << 12)) & SC52_MASK;
    h[2] = ((w1 >> 40) | (w2 << 24)) & SC52_MASK;
    h[3] = ((w2 >> 28) | (w3 << 36)) & SC52_MASK;
    h[4] = w3 >> 16;
}

void sc_frombytes_mod_order(sc_fe h, const unsigned char s[32])
{
    /* x * R / R = x mod L */
    sc_fe x;
    sc52_unpack(x, s);
    sc_montgomery_mul(h, x, SC_R);
    edwards25519_secure_erase(x, sizeof(x));
}

/*
 * The 512-bit input is split as lo + hi * 2^260. lo * R / R reduces lo, and
 * hi * RR / R = hi * 2^260 mod L.
 */
void sc_reduce_wide(sc_fe h, const unsigned char s[64])
{
    uint64_t w[8];
    for (int i = 0; i < 8; i++)
        w[i] = le_load_u64(s + 8 * i);

    sc_fe lo, hi;
    lo[0] = w[0] & SC52_MASK;
    lo[1] = ((w[0] >> 52) | (w[1] << 12)) & SC52_MASK;
    lo[2] = ((w[1] >> 40) | (w[2] << 24)) & SC52_MASK;
    lo[3] = ((w[2] >> 28) | (w[3] << 36)) & SC52_MASK;
    lo[4] = ((w[3] >> 16) | (w[4] << 48)) & SC52_MASK;
    hi[0] = (w[4] >> 4) & SC52_MASK;
    hi[1] = ((w[4] >> 56) | (w[5] << 8)) & SC52_MASK;
    hi[2] = ((w[5] >> 44) | (w[6] << 20)) & SC52_MASK;
    hi[3] = ((w[6] >> 32) | (w[7] << 32)) & SC52_MASK;
    hi[4] = w[7] >> 20;

    sc_montgomery_mul(lo, lo, SC_R);
    sc_montgomery_mul(hi, hi, SC_RR);
    sc_add(h, hi, lo);

    edwards25519_secure_erase(w, sizeof(w));
    edwards25519_secure_erase(lo, sizeof(lo));
    edwards25519_secure_erase(hi, sizeof(hi));
}

int sc_frombytes_canonical(sc_fe h, const unsigned char s[32])
{
    sc_frombytes_mod_order(h, s);

    /* canonical iff the reduced value re-encodes to the same bytes */
    unsigned char check[32];
    sc_tobytes(check, h);

    unsigned char diff = 0;
    for (int i = 0; i < 32; i++)
        diff |= (unsigned char)(check[i] ^ s[i]);

    edwards25519_secure_erase(check, sizeof(check));

    return diff == 0 ? 0 : -1;
}
