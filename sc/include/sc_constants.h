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
 * @file sc_constants.h
 * @brief Radix-2^52 constants for Montgomery arithmetic mod L (R = 2^260).
 */

#ifndef EDWARDS25519_SC_CONSTANTS_H
#define EDWARDS25519_SC_CONSTANTS_H

#include "sc.h"

static const uint64_t SC52_MASK = (1ULL << 52) - 1;

/* L = 2^252 + 27742317777372353535851937790883648493 */
static const sc_fe SC_L = {0x2631a5cf5d3edULL, 0xdea2f79cd6581ULL, 0x14def9ULL, 0x0ULL, 0x100000000000ULL};

/* R = 2^260 mod L */
static const sc_fe SC_R = {0xf48bd6721e6edULL, 0x3bab5ac67e45aULL, 0xfffffeb35e51bULL, 0xfffffffffffffULL, 0xfffffffffffULL};

/* RR = R^2 mod L */
static const sc_fe SC_RR = {0x9d265e952d13bULL, 0xd63c715bea69fULL, 0x5be65cb687604ULL, 0x3dceec73d217fULL, 0x9411b7c309aULL};

/* -L^-1 mod 2^52 */
static const uint64_t SC_LFACTOR = 0x51da312547e1bULL;

#endif // EDWARDS25519_SC_CONSTANTS_H
