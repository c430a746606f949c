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
 * @file le_bytes.h
 * @brief Fixed-width little-endian integer <-> byte conversion.
 *
 * Total, branch-free and independent of host byte order. The 128-bit variants are
 * only available where the compiler provides unsigned __int128.
 */

#ifndef EDWARDS25519_LE_BYTES_H
#define EDWARDS25519_LE_BYTES_H

#include "edwards25519_platform.h"

#include <cstdint>

static inline void le_store_u16(unsigned char out[2], uint16_t v)
{
    out[0] = (unsigned char)v;
    out[1] = (unsigned char)(v >> 8);
}

static inline void le_store_u32(unsigned char out[4], uint32_t v)
{
    for (int i = 0; i < 4; i++)
        out[i] = (unsigned char)(v >> (8 * i));
}

static inline void le_store_u64(unsigned char out[8], uint64_t v)
{
    for (int i = 0; i < 8; i++)
        out[i] = (unsigned char)(v >> (8 * i));
}

static inline uint16_t le_load_u16(const unsigned char in[2])
{
    return (uint16_t)(in[0] | ((uint16_t)in[1] << 8));
}

static inline uint32_t le_load_u32(const unsigned char in[4])
{
    uint32_t v = 0;
    for (int i = 0; i < 4; i++)
        v |= (uint32_t)in[i] << (8 * i);
    return v;
}

static inline uint64_t le_load_u64(const unsigned char in[8])
{
    uint64_t v = 0;
    for (int i = 0; i < 8; i++)
        v |= (uint64_t)in[i] << (8 * i);
    return v;
}

#if EDWARDS25519_HAVE_INT128
static inline void le_store_u128(unsigned char out[16], edwards25519_uint128 v)
{
    le_store_u64(out, (uint64_t)v);
    le_store_u64(out + 8, (uint64_t)(v >> 64));
}

static inline edwards25519_uint128 le_load_u128(const unsigned char in[16])
{
    return (edwards25519_uint128)le_load_u64(in) | ((edwards25519_uint128)le_load_u64(in + 8) << 64);
}
#endif

#endif // EDWARDS25519_LE_BYTES_H
