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
 * @file sc_frombytes.h
 * @brief Scalar decoding: reduce 32 or 64 little-endian bytes mod L, or accept only
 *        canonical encodings.
 */

#ifndef EDWARDS25519_SC_FROMBYTES_H
#define EDWARDS25519_SC_FROMBYTES_H

#include "sc.h"

/* Any 256-bit integer, reduced mod L */
void sc_frombytes_mod_order(sc_fe h, const unsigned char s[32]);

/* Any 512-bit integer, reduced mod L */
void sc_reduce_wide(sc_fe h, const unsigned char s[64]);

/**
 * Decode a canonical scalar. Returns 0 if s encodes a value < L, -1 otherwise
 * (h then holds s mod L).
 */
int sc_frombytes_canonical(sc_fe h, const unsigned char s[32]);

#endif // EDWARDS25519_SC_FROMBYTES_H
