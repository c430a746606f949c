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
 * @file sc_mul.h
 * @brief Scalar multiplication mod L via Montgomery reduction (R = 2^260).
 */

#ifndef EDWARDS25519_SC_MUL_H
#define EDWARDS25519_SC_MUL_H

#include "sc.h"

/* h = f * g mod L */
void sc_mul_x64(sc_fe h, const sc_fe f, const sc_fe g);

/* h = f * g / R mod L (both operands in Montgomery form, or one of them a plain value) */
void sc_montgomery_mul_x64(sc_fe h, const sc_fe f, const sc_fe g);

static inline void sc_mul(sc_fe h, const sc_fe f, const sc_fe g)
{
    sc_mul_x64(h, f, g);
}

static inline void sc_sq(sc_fe h, const sc_fe f)
{
    sc_mul_x64(h, f, f);
}

static inline void sc_montgomery_mul(sc_fe h, const sc_fe f, const sc_fe g)
{
    sc_montgomery_mul_x64(h, f, g);
}

#endif // EDWARDS25519_SC_MUL_H
