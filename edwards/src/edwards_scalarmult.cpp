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

#include "edwards_scalarmult.h"

#include "edwards25519_secure_erase.h"
#include "edwards_add.h"
#include "edwards_dbl.h"
#include "edwards_msm.h"
#include "edwards_ops.h"
#include "edwards_table.h"
#include "sc_recode.h"

/* The single-point case of the constant-time multi-scalar path */
void edwards_scalarmult(edwards_extended *r, const unsigned char scalar[32], const edwards_extended *p)
{
    edwards_msm(r, scalar, p, 1);
}

/*
 * Variable-time scalar multiplication using wNAF with window width 5.
 *
 * Algorithm:
 *   1. Precompute odd multiples: [P, 3P, 5P, 7P, 9P, 11P, 13P, 15P]
 *   2. wNAF-encode scalar with w=5 -> digits in [-15, 15], non-adjacent
 *   3. Scan from the highest nonzero digit down:
 *      - Double
 *      - If digit != 0: add/sub precomputed point
 */
void edwards_scalarmult_vartime(edwards_extended *r, const unsigned char scalar[32], const edwards_extended *p)
{
    int8_t naf[256];
    sc_non_adjacent_form(naf, scalar, EDWARDS_NAF_WIDTH);

    int start = 255;
    while (start >= 0 && naf[start] == 0)
        start--;

    if (start < 0)
    {
        edwards_identity(r);
        return;
    }

    edwards_table_naf table;
    edwards_table_naf_init(&table, p);

    edwards_extended acc;
    edwards_completed c;
    edwards_identity(&acc);

    for (int i = start; i >= 0; i--)
    {
        edwards_dbl_completed(&c, &acc);
        edwards_completed_to_extended(&acc, &c);

        const int8_t d = naf[i];
        if (d > 0)
        {
            edwards_add_cached(&c, &acc, &table.entries[d / 2]);
            edwards_completed_to_extended(&acc, &c);
        }
        else if (d < 0)
        {
            edwards_sub_cached(&c, &acc, &table.entries[(-d) / 2]);
            edwards_completed_to_extended(&acc, &c);
        }
    }

    edwards_copy(r, &acc);

    edwards25519_secure_erase(naf, sizeof(naf));
    edwards25519_secure_erase(&table, sizeof(table));
}
