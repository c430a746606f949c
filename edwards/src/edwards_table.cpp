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

#include "edwards_table.h"

#include "ct_barrier.h"
#include "edwards_add.h"
#include "edwards_dbl.h"
#include "edwards_ops.h"
#include "edwards25519_secure_erase.h"

void edwards_table_radix16_init(edwards_table_radix16 *t, const edwards_extended *p)
{
    edwards_extended multiples[8];
    edwards_copy(&multiples[0], p); /* 1P */
    edwards_dbl(&multiples[1], p); /* 2P */
    edwards_add(&multiples[2], &multiples[1], p); /* 3P */
    edwards_dbl(&multiples[3], &multiples[1]); /* 4P */
    edwards_add(&multiples[4], &multiples[3], p); /* 5P */
    edwards_dbl(&multiples[5], &multiples[2]); /* 6P */
    edwards_add(&multiples[6], &multiples[5], p); /* 7P */
    edwards_dbl(&multiples[7], &multiples[3]); /* 8P */

    for (int i = 0; i < 8; i++)
        edwards_to_cached(&t->entries[i], &multiples[i]);

    edwards25519_secure_erase(multiples, sizeof(multiples));
}

void edwards_table_radix16_select(edwards_cached *r, const edwards_table_radix16 *t, int8_t digit)
{
    /* branchless abs + sign extraction */
    const int32_t d = (int32_t)digit;
    const int32_t sign_mask = d >> 31;
    const unsigned int abs_d = ct_barrier_u32((uint32_t)((d ^ sign_mask) - sign_mask));
    const unsigned int neg = (unsigned int)(sign_mask & 1);

    /* digit 0 selects nothing and leaves the identity */
    edwards_cached_identity(r);
    for (unsigned int j = 0; j < 8; j++)
    {
        /* eq = 1 if abs_d == j+1, 0 otherwise */
        const unsigned int eq = ((abs_d ^ (j + 1)) - 1u) >> 31;
        edwards_cached_cmov(r, &t->entries[j], eq);
    }

    edwards_cached_cneg(r, neg);
}

void edwards_table_naf_init(edwards_table_naf *t, const edwards_extended *p)
{
    edwards_extended p2, acc;
    edwards_cached p2_cached;
    edwards_completed c;

    edwards_dbl(&p2, p);
    edwards_to_cached(&p2_cached, &p2);

    edwards_copy(&acc, p);
    edwards_to_cached(&t->entries[0], &acc);
    for (int i = 1; i < 8; i++)
    {
        /* (2i+1)P = (2i-1)P + 2P */
        edwards_add_cached(&c, &acc, &p2_cached);
        edwards_completed_to_extended(&acc, &c);
        edwards_to_cached(&t->entries[i], &acc);
    }
}
