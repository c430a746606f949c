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
 * @file mul128.h
 * @brief 64x64->128 multiply with native __int128 or an MSVC _umul128 emulation.
 *
 * Callers that must build on both toolchains use mul64(), operator+, shr128() and
 * lo128() only; the field inner loops additionally use native __int128 arithmetic
 * where it is available.
 */

#ifndef EDWARDS25519_X64_MUL128_H
#define EDWARDS25519_X64_MUL128_H

#include "edwards25519_platform.h"

#include <cstdint>

#if EDWARDS25519_HAVE_INT128

typedef edwards25519_uint128 edwards25519_u128;

static inline edwards25519_uint128 mul64(uint64_t a, uint64_t b)
{
    return (edwards25519_uint128)a * b;
}

static inline uint64_t shr128(edwards25519_uint128 v, int shift)
{
    return (uint64_t)(v >> shift);
}

static inline uint64_t lo128(edwards25519_uint128 v)
{
    return (uint64_t)v;
}

#elif EDWARDS25519_HAVE_UMUL128

struct edwards25519_uint128_emu
{
    uint64_t lo;
    uint64_t hi;
};

typedef edwards25519_uint128_emu edwards25519_u128;

static inline edwards25519_uint128_emu mul64(uint64_t a, uint64_t b)
{
    edwards25519_uint128_emu r;
    r.lo = _umul128(a, b, &r.hi);
    return r;
}

static inline edwards25519_uint128_emu operator+(edwards25519_uint128_emu a, edwards25519_uint128_emu b)
{
    edwards25519_uint128_emu r;
    r.lo = a.lo + b.lo;
    r.hi = a.hi + b.hi + (r.lo < a.lo ? 1 : 0);
    return r;
}

static inline edwards25519_uint128_emu operator+(edwards25519_uint128_emu a, uint64_t b)
{
    edwards25519_uint128_emu r;
    r.lo = a.lo + b;
    r.hi = a.hi + (r.lo < a.lo ? 1 : 0);
    return r;
}

static inline edwards25519_uint128_emu &operator+=(edwards25519_uint128_emu &a, edwards25519_uint128_emu b)
{
    a = a + b;
    return a;
}

static inline edwards25519_uint128_emu &operator+=(edwards25519_uint128_emu &a, uint64_t b)
{
    a = a + b;
    return a;
}

static inline uint64_t shr128(edwards25519_uint128_emu v, int shift)
{
    if (shift == 0)
        return v.lo;
    if (shift < 64)
        return (v.lo >> shift) | (v.hi << (64 - shift));
    return v.hi >> (shift - 64);
}

static inline uint64_t lo128(edwards25519_uint128_emu v)
{
    return v.lo;
}

#endif

#endif // EDWARDS25519_X64_MUL128_H
