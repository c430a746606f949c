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
 * @file edwards_msm.h
 * @brief Multi-scalar multiplication: result = sum(scalars[i] * points[i]).
 *
 * scalars is n * 32 bytes (each a reduced scalar, little-endian). n = 0 yields the
 * identity. The _vartime entry points pick Straus for n < EDWARDS_MSM_PIPPENGER_THRESHOLD
 * and Pippenger otherwise; the constant-time entry point always uses the radix-16
 * Straus method since bucket accumulation cannot hide which bucket a digit selects.
 */

#ifndef EDWARDS25519_EDWARDS_MSM_H
#define EDWARDS25519_EDWARDS_MSM_H

#include "edwards.h"

#include <cstddef>

#define EDWARDS_MSM_PIPPENGER_THRESHOLD 190

enum edwards_msm_algorithm
{
    EDWARDS_MSM_STRAUS = 0,
    EDWARDS_MSM_PIPPENGER = 1
};

/* Algorithm used by edwards_msm_vartime for a batch of n terms */
edwards_msm_algorithm edwards_msm_select(size_t n);

/* Pippenger window width c for a batch of n terms */
int edwards_pippenger_window_size(size_t n);

/* Constant time in the scalars and points */
void edwards_msm(edwards_extended *result, const unsigned char *scalars, const edwards_extended *points, size_t n);

void edwards_msm_vartime(
    edwards_extended *result,
    const unsigned char *scalars,
    const edwards_extended *points,
    size_t n);

/*
 * points[i] may be nullptr. Returns -1 and sets result to the identity, without
 * computing anything, if any point is absent; otherwise returns 0.
 */
int edwards_msm_vartime_optional(
    edwards_extended *result,
    const unsigned char *scalars,
    const edwards_extended *const *points,
    size_t n);

/* The two variable-time strategies, callable directly for any n */
void edwards_msm_straus_vartime(
    edwards_extended *result,
    const unsigned char *scalars,
    const edwards_extended *points,
    size_t n);

void edwards_msm_pippenger_vartime(
    edwards_extended *result,
    const unsigned char *scalars,
    const edwards_extended *points,
    size_t n);

#endif // EDWARDS25519_EDWARDS_MSM_H
