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
 * @file edwards25519_platform.h
 * @brief Compile-time platform detection and 128-bit multiplication support.
 *
 * Detects x86-64 and ARM64, and selects between __int128 (GCC/Clang) or the
 * _umul128 intrinsic (MSVC) for 64x64->128 multiplication. Both the radix-2^51
 * field backend and the radix-2^52 scalar backend need one of the two.
 */

#ifndef EDWARDS25519_PLATFORM_H
#define EDWARDS25519_PLATFORM_H

#if defined(__x86_64__) || defined(_M_X64)
#define EDWARDS25519_PLATFORM_X64 1
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
#define EDWARDS25519_PLATFORM_ARM64 1
#endif

#if defined(__SIZEOF_INT128__)
#define EDWARDS25519_HAVE_INT128 1
typedef unsigned __int128 edwards25519_uint128;
#elif defined(_M_X64)
#define EDWARDS25519_HAVE_UMUL128 1
#include <intrin.h>
#endif

#if EDWARDS25519_HAVE_INT128 || EDWARDS25519_HAVE_UMUL128
#define EDWARDS25519_PLATFORM_64BIT 1
#else
#error "edwards25519 requires a 64x64->128 bit multiply (unsigned __int128 or _umul128)"
#endif

#if defined(_MSC_VER)
#define EDWARDS25519_FORCE_INLINE __forceinline
#else
#define EDWARDS25519_FORCE_INLINE inline __attribute__((always_inline))
#endif

#endif // EDWARDS25519_PLATFORM_H
