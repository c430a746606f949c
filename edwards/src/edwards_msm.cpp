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
 * @file edwards_msm.cpp
 * @brief Constant-time Straus multi-scalar multiplication and the variable-time dispatcher.
 */

#include "edwards_msm.h"

#include "edwards25519_secure_erase.h"
#include "edwards_add.h"
#include "edwards_dbl.h"
#include "edwards_ops.h"
#include "edwards_table.h"
#include "sc_recode.h"

#include <vector>

edwards_msm_algorithm edwards_msm_select(size_t n)
{
    return n < EDWARDS_MSM_PIPPENGER_THRESHOLD ? EDWARDS_MSM_STRAUS : EDWARDS_MSM_PIPPENGER;
}

/*
 * Constant-time Straus (interleaved radix-16 windows).
 *
 * Algorithm:
 *   1. Recode every scalar to 64 signed digits in [-7, 8]
 *   2. Per point, precompute [P, 2P, ..., 8P] in cached form
 *   3. For digit position 63 down to 0:
 *      - 4 doublings (skipped at the top position, the accumulator is the identity)
 *      - for every term: CT table scan + CT conditional negate + unconditional add
 *   4. Secure erase digits and tables
 *
 * A zero digit selects the cached identity and still performs the addition, so
 * the sequence of operations depends only on n.
 */
void edwards_msm(edwards_extended *result, const unsigned char *scalars, const edwards_extended *points, size_t n)
{
    edwards_identity(result);
    if (n == 0)
        return;

    std::vector<int8_t> digits(n * 64);
    std::vector<edwards_table_radix16> tables(n);
    for (size_t i = 0; i < n; i++)
    {
        sc_as_radix_16(digits.data() + i * 64, scalars + i * 32);
        edwards_table_radix16_init(&tables[i], &points[i]);
    }

    edwards_extended acc;
    edwards_completed c;
    edwards_cached selected;
    edwards_identity(&acc);

    for (int pos = 63; pos >= 0; pos--)
    {
        if (pos != 63)
        {
            for (int k = 0; k < 4; k++)
            {
                edwards_dbl_completed(&c, &acc);
                edwards_completed_to_extended(&acc, &c);
            }
        }

        for (size_t i = 0; i < n; i++)
        {
            edwards_table_radix16_select(&selected, &tables[i], digits[i * 64 + (size_t)pos]);
            edwards_add_cached(&c, &acc, &selected);
            edwards_completed_to_extended(&acc, &c);
        }
    }

    edwards_copy(result, &acc);

    edwards25519_secure_erase(digits.data(), digits.size() * sizeof(digits[0]));
    edwards25519_secure_erase(tables.data(), tables.size() * sizeof(tables[0]));
    edwards25519_secure_erase(&acc, sizeof(acc));
    edwards25519_secure_erase(&c, sizeof(c));
    edwards25519_secure_erase(&selected, sizeof(selected));
}

void edwards_msm_vartime(
    edwards_extended *result,
    const unsigned char *scalars,
    const edwards_extended *points,
    size_t n)
{
    if (n == 0)
    {
        edwards_identity(result);
        return;
    }

    if (edwards_msm_select(n) == EDWARDS_MSM_STRAUS)
        edwards_msm_straus_vartime(result, scalars, points, n);
    else
        edwards_msm_pippenger_vartime(result, scalars, points, n);
}

int edwards_msm_vartime_optional(
    edwards_extended *result,
    const unsigned char *scalars,
    const edwards_extended *const *points,
    size_t n)
{
    /* all-or-nothing: any absent point aborts before any arithmetic */
    for (size_t i = 0; i < n; i++)
    {
        if (points[i] == nullptr)
        {
            edwards_identity(result);
            return -1;
        }
    }

    std::vector<edwards_extended> present(n);
    for (size_t i = 0; i < n; i++)
        edwards_copy(&present[i], points[i]);

    edwards_msm_vartime(result, scalars, present.data(), n);
    return 0;
}
