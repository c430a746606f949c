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
 * @file edwards_msm_vartime.cpp
 * @brief Variable-time multi-scalar multiplication: Straus (wNAF) and Pippenger (buckets).
 */

#include "edwards25519_secure_erase.h"
#include "edwards_add.h"
#include "edwards_dbl.h"
#include "edwards_msm.h"
#include "edwards_ops.h"
#include "edwards_table.h"
#include "sc_recode.h"

#include <cstdint>
#include <vector>

// ============================================================================
// Straus (interleaved wNAF) -- used for n < 190
// ============================================================================

void edwards_msm_straus_vartime(
    edwards_extended *result,
    const unsigned char *scalars,
    const edwards_extended *points,
    size_t n)
{
    edwards_identity(result);
    if (n == 0)
        return;

    std::vector<int8_t> nafs(n * 256);
    std::vector<edwards_table_naf> tables(n);

    int top = -1;
    for (size_t i = 0; i < n; i++)
    {
        int8_t *naf = nafs.data() + i * 256;
        sc_non_adjacent_form(naf, scalars + i * 32, EDWARDS_NAF_WIDTH);
        edwards_table_naf_init(&tables[i], &points[i]);

        for (int j = 255; j > top; j--)
        {
            if (naf[j] != 0)
            {
                top = j;
                break;
            }
        }
    }

    edwards_extended acc;
    edwards_completed c;
    edwards_identity(&acc);

    // Main loop: one doubling per bit position, then every nonzero digit
    for (int pos = top; pos >= 0; pos--)
    {
        edwards_dbl_completed(&c, &acc);
        edwards_completed_to_extended(&acc, &c);

        for (size_t i = 0; i < n; i++)
        {
            const int8_t d = nafs[i * 256 + (size_t)pos];
            if (d > 0)
            {
                edwards_add_cached(&c, &acc, &tables[i].entries[d / 2]);
                edwards_completed_to_extended(&acc, &c);
            }
            else if (d < 0)
            {
                edwards_sub_cached(&c, &acc, &tables[i].entries[(-d) / 2]);
                edwards_completed_to_extended(&acc, &c);
            }
        }
    }

    edwards_copy(result, &acc);
}

// ============================================================================
// Pippenger (bucket method) -- used for n >= 190
// ============================================================================

int edwards_pippenger_window_size(size_t n)
{
    if (n < 500)
        return 6;
    if (n < 800)
        return 7;
    if (n < 2592)
        return 8;
    if (n < 7776)
        return 9;
    if (n < 23328)
        return 10;
    return 11;
}

void edwards_msm_pippenger_vartime(
    edwards_extended *result,
    const unsigned char *scalars,
    const edwards_extended *points,
    size_t n)
{
    edwards_identity(result);
    if (n == 0)
        return;

    const int w = edwards_pippenger_window_size(n);
    const size_t num_buckets = (size_t)1 << (w - 1);
    const size_t num_windows = (size_t)((256 + w - 1) / w);

    std::vector<int16_t> all_digits(n * num_windows);
    std::vector<edwards_cached> cached_points(n);
    for (size_t i = 0; i < n; i++)
    {
        sc_as_radix_2w(all_digits.data() + i * num_windows, scalars + i * 32, w);
        edwards_to_cached(&cached_points[i], &points[i]);
    }

    std::vector<edwards_extended> buckets(num_buckets);
    std::vector<bool> bucket_used(num_buckets);

    edwards_extended total;
    edwards_completed c;
    edwards_cached cached;
    edwards_identity(&total);

    for (size_t win = num_windows; win-- > 0;)
    {
        // Horner step: multiply accumulated result by 2^w
        if (win != num_windows - 1)
        {
            for (int d = 0; d < w; d++)
            {
                edwards_dbl_completed(&c, &total);
                edwards_completed_to_extended(&total, &c);
            }
        }

        for (size_t j = 0; j < num_buckets; j++)
        {
            edwards_identity(&buckets[j]);
            bucket_used[j] = false;
        }

        // Distribute points into buckets by digit magnitude, subtracting for negative digits
        for (size_t i = 0; i < n; i++)
        {
            const int16_t digit = all_digits[i * num_windows + win];
            if (digit > 0)
            {
                const size_t b = (size_t)(digit - 1);
                edwards_add_cached(&c, &buckets[b], &cached_points[i]);
                edwards_completed_to_extended(&buckets[b], &c);
                bucket_used[b] = true;
            }
            else if (digit < 0)
            {
                const size_t b = (size_t)((-digit) - 1);
                edwards_sub_cached(&c, &buckets[b], &cached_points[i]);
                edwards_completed_to_extended(&buckets[b], &c);
                bucket_used[b] = true;
            }
        }

        // Running-sum combination: partial = sum((j+1) * bucket[j])
        edwards_extended running, partial;
        edwards_identity(&running);
        edwards_identity(&partial);
        bool running_used = false;

        for (size_t j = num_buckets; j-- > 0;)
        {
            if (bucket_used[j])
            {
                edwards_to_cached(&cached, &buckets[j]);
                edwards_add_cached(&c, &running, &cached);
                edwards_completed_to_extended(&running, &c);
                running_used = true;
            }

            if (running_used)
            {
                edwards_to_cached(&cached, &running);
                edwards_add_cached(&c, &partial, &cached);
                edwards_completed_to_extended(&partial, &c);
            }
        }

        // Add this window's result to total
        if (running_used)
        {
            edwards_to_cached(&cached, &partial);
            edwards_add_cached(&c, &total, &cached);
            edwards_completed_to_extended(&total, &c);
        }
    }

    edwards_copy(result, &total);
}
