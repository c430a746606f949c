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
 * @file sc_recode.h
 * @brief Signed-digit expansions of a scalar for double-and-add evaluation.
 *
 * All three take the 32-byte little-endian encoding of a reduced scalar (< 2^253)
 * and produce digits d[i] with scalar = sum(d[i] * base^i).
 */

#ifndef EDWARDS25519_SC_RECODE_H
#define EDWARDS25519_SC_RECODE_H

#include <cstdint>

/* Largest digit count produced by sc_as_radix_2w (w = 2) */
#define SC_RADIX_2W_MAX_DIGITS 128

/**
 * Radix-16 recoding: 64 signed digits in [-7, 8], scalar = sum(d[i] * 16^i).
 *
 * Control flow and memory access are independent of the scalar. Used by the
 * constant-time scalar multiplication and Straus paths.
 */
void sc_as_radix_16(int8_t digits[64], const unsigned char scalar[32]);

/**
 * Width-w non-adjacent form, 2 <= w <= 8.
 *
 * naf[i] is 0 or odd with |naf[i]| < 2^(w-1); any two nonzero digits are at least w
 * positions apart; scalar = sum(naf[i] * 2^i). Variable time.
 */
void sc_non_adjacent_form(int8_t naf[256], const unsigned char scalar[32], int w);

/**
 * Signed radix-2^w windows, 2 <= w <= 16, for bucket methods.
 *
 * Writes ceil(256 / w) digits in [-2^(w-1), 2^(w-1) - 1], least significant first,
 * and returns the digit count. Variable time.
 */
int sc_as_radix_2w(int16_t *digits, const unsigned char scalar[32], int w);

#endif // EDWARDS25519_SC_RECODE_H
