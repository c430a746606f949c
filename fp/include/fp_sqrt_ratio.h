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
 * @file fp_sqrt_ratio.h
 * @brief Constant-time square root of a ratio: find x with x^2 = u/v (mod p).
 */

#ifndef EDWARDS25519_FP_SQRT_RATIO_H
#define EDWARDS25519_FP_SQRT_RATIO_H

#include "fp.h"

/* sqrt(-1) mod p = 2^((p-1)/4) mod p */
extern const fp_fe FP_SQRT_M1;

int fp_sqrt_ratio_x64(fp_fe x, const fp_fe u, const fp_fe v);

/**
 * Compute the non-negative x with v * x^2 = u (mod p).
 *
 * Returns 0 on success. Returns -1 when u/v is not a square or when v == 0
 * (including u == v == 0); x is then set to a value that must not be used as a root.
 */
static inline int fp_sqrt_ratio(fp_fe x, const fp_fe u, const fp_fe v)
{
    return fp_sqrt_ratio_x64(x, u, v);
}

#endif // EDWARDS25519_FP_SQRT_RATIO_H
