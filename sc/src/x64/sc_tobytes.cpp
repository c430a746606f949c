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

#include "sc_tobytes.h"

#include "ct_barrier.h"
#include "le_bytes.h"

void sc_tobytes(unsigned char s[32], const sc_fe h)
{
    le_store_u64(s, h[0] | (h[1] << 52));
    le_store_u64(s + 8, (h[1] >> 12) | (h[2] << 40));
    le_store_u64(s + 16, (h[2] >> 24) | (h[3] << 28));
    le_store_u64(s + 24, (h[3] >> 36) | (h[4] << 16));
}

int sc_equal(const sc_fe f, const sc_fe g)
{
    uint64_t d = 0;
    for (int i = 0; i < 5; i++)
        d |= f[i] ^ g[i];
    d = ct_barrier_u64(d);
    return (int)(((d | (0 - d)) >> 63) ^ 1);
}

int sc_isnonzero(const sc_fe h)
{
    uint64_t d = 0;
    for (int i = 0; i < 5; i++)
        d |= h[i];
    d = ct_barrier_u64(d);
    return (int)((d | (0 - d)) >> 63);
}
