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
 * @file edwards_table.h
 * @brief Per-point lookup tables in cached form.
 *
 * - radix-16 table: [1P, 2P, ..., 8P], read with a constant-time scan that touches
 *   every entry regardless of the digit.
 * - NAF table: odd multiples [1P, 3P, ..., 15P] for width-5 NAF digits, indexed
 *   directly by |digit| / 2 (variable time).
 */

#ifndef EDWARDS25519_EDWARDS_TABLE_H
#define EDWARDS25519_EDWARDS_TABLE_H

#include "edwards.h"

#include <cstdint>

#define EDWARDS_NAF_WIDTH 5

struct edwards_table_radix16
{
    edwards_cached entries[8];
};

struct edwards_table_naf
{
    edwards_cached entries[8];
};

void edwards_table_radix16_init(edwards_table_radix16 *t, const edwards_extended *p);

/* r = digit * P for digit in [-8, 8], constant time in digit */
void edwards_table_radix16_select(edwards_cached *r, const edwards_table_radix16 *t, int8_t digit);

void edwards_table_naf_init(edwards_table_naf *t, const edwards_extended *p);

#endif // EDWARDS25519_EDWARDS_TABLE_H
