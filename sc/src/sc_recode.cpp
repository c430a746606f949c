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

#include "sc_recode.h"

#include "edwards25519_secure_erase.h"
#include "le_bytes.h"

/*
 * Recode scalar into signed 4-bit digits.
 *
 * Nibbles are extracted low to high, then a single pass recenters them: a value
 * above 8 becomes value - 16 and carries +1 into the next nibble. The carry is
 * computed arithmetically so the pass is branch-free.
 */
void sc_as_radix_16(int8_t digits[64], const unsigned char scalar[32])
{
    for (int i = 0; i < 32; i++)
    {
        digits[2 * i] = (int8_t)(scalar[i] & 0x0f);
        digits[2 * i + 1] = (int8_t)((scalar[i] >> 4) & 0x0f);
    }

    int32_t carry = 0;
    for (int i = 0; i < 63; i++)
    {
        const int32_t val = (int32_t)digits[i] + carry;
        /* 1 if val > 8 */
        carry = (int32_t)(((uint32_t)(8 - val) >> 31) & 1);
        digits[i] = (int8_t)(val - (carry << 4));
    }
    digits[63] = (int8_t)(digits[63] + carry);
}

void sc_non_adjacent_form(int8_t naf[256], const unsigned char scalar[32], int w)
{
    for (int i = 0; i < 256; i++)
        naf[i] = 0;

    /* one zero word past the end so a window may straddle the top */
    uint64_t x[5];
    for (int i = 0; i < 4; i++)
        x[i] = le_load_u64(scalar + 8 * i);
    x[4] = 0;

    const uint64_t width = 1ULL << w;
    const uint64_t window_mask = width - 1;

    int pos = 0;
    uint64_t carry = 0;
    while (pos < 256)
    {
        const int idx = pos / 64;
        const int bit_idx = pos % 64;
        uint64_t bit_buf;
        if (bit_idx < 64 - w)
            bit_buf = x[idx] >> bit_idx;
        else
            bit_buf = (x[idx] >> bit_idx) | (x[idx + 1] << (64 - bit_idx));

        const uint64_t window = carry + (bit_buf & window_mask);

        if ((window & 1) == 0)
        {
            /* even window: emit 0 here, the carry stays pending */
            pos += 1;
            continue;
        }

        if (window < width / 2)
        {
            carry = 0;
            naf[pos] = (int8_t)window;
        }
        else
        {
            carry = 1;
            naf[pos] = (int8_t)((int64_t)window - (int64_t)width);
        }

        pos += w;
    }

    edwards25519_secure_erase(x, sizeof(x));
}

int sc_as_radix_2w(int16_t *digits, const unsigned char scalar[32], int w)
{
    const int half = 1 << (w - 1);
    const uint64_t mask = (1ULL << w) - 1;
    const int num_digits = (256 + w - 1) / w;

    uint64_t x[5];
    for (int i = 0; i < 4; i++)
        x[i] = le_load_u64(scalar + 8 * i);
    x[4] = 0;

    int carry = 0;
    for (int i = 0; i < num_digits; i++)
    {
        const int bit_pos = i * w;
        const int idx = bit_pos / 64;
        const int bit_off = bit_pos % 64;

        uint64_t raw = x[idx] >> bit_off;
        if (bit_off + w > 64)
            raw |= x[idx + 1] << (64 - bit_off);

        int val = (int)(raw & mask) + carry;
        carry = 0;

        if (val >= half)
        {
            val -= (1 << w);
            carry = 1;
        }

        digits[i] = static_cast<int16_t>(val);
    }

    edwards25519_secure_erase(x, sizeof(x));
    return num_digits;
}
