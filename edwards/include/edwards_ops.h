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
 * @file edwards_ops.h
 * @brief Inline point helpers: identity, basepoint, copy, negation, representation
 *        changes and constant-time selection.
 */

#ifndef EDWARDS25519_EDWARDS_OPS_H
#define EDWARDS25519_EDWARDS_OPS_H

#include "edwards.h"
#include "edwards_constants.h"
#include "fp_cmov.h"
#include "fp_mul.h"
#include "fp_ops.h"

/* Identity: (0:1:1:0) */
static inline void edwards_identity(edwards_extended *r)
{
    fp_0(r->X);
    fp_1(r->Y);
    fp_1(r->Z);
    fp_0(r->T);
}

static inline void edwards_basepoint(edwards_extended *r)
{
    fp_copy(r->X, EDWARDS_BX);
    fp_copy(r->Y, EDWARDS_BY);
    fp_1(r->Z);
    fp_copy(r->T, EDWARDS_BT);
}

static inline void edwards_copy(edwards_extended *r, const edwards_extended *p)
{
    fp_copy(r->X, p->X);
    fp_copy(r->Y, p->Y);
    fp_copy(r->Z, p->Z);
    fp_copy(r->T, p->T);
}

/* Negate: (X:Y:Z:T) -> (-X:Y:Z:-T) */
static inline void edwards_neg(edwards_extended *r, const edwards_extended *p)
{
    fp_neg(r->X, p->X);
    fp_copy(r->Y, p->Y);
    fp_copy(r->Z, p->Z);
    fp_neg(r->T, p->T);
}

/* Constant-time conditional move: r = b ? p : r */
static inline void edwards_cmov(edwards_extended *r, const edwards_extended *p, unsigned int b)
{
    fp_cmov(r->X, p->X, b);
    fp_cmov(r->Y, p->Y, b);
    fp_cmov(r->Z, p->Z, b);
    fp_cmov(r->T, p->T, b);
}

/* Completed -> extended: (X*T : Y*Z : Z*T : X*Y) */
static inline void edwards_completed_to_extended(edwards_extended *r, const edwards_completed *c)
{
    fp_mul(r->X, c->X, c->T);
    fp_mul(r->Y, c->Y, c->Z);
    fp_mul(r->Z, c->Z, c->T);
    fp_mul(r->T, c->X, c->Y);
}

static inline void edwards_to_cached(edwards_cached *r, const edwards_extended *p)
{
    fp_add(r->YplusX, p->Y, p->X);
    fp_sub(r->YminusX, p->Y, p->X);
    fp_copy(r->Z, p->Z);
    fp_mul(r->T2d, p->T, EDWARDS_D2);
}

/* Cached identity: (1, 1, 1, 0) */
static inline void edwards_cached_identity(edwards_cached *r)
{
    fp_1(r->YplusX);
    fp_1(r->YminusX);
    fp_1(r->Z);
    fp_0(r->T2d);
}

/* Negate a cached point: swap Y+X and Y-X, negate 2dT */
static inline void edwards_cached_neg(edwards_cached *r, const edwards_cached *p)
{
    fp_fe t;
    fp_copy(t, p->YplusX);
    fp_copy(r->YplusX, p->YminusX);
    fp_copy(r->YminusX, t);
    fp_copy(r->Z, p->Z);
    fp_neg(r->T2d, p->T2d);
}

/* Constant-time conditional move for cached points */
static inline void edwards_cached_cmov(edwards_cached *r, const edwards_cached *p, unsigned int b)
{
    fp_cmov(r->YplusX, p->YplusX, b);
    fp_cmov(r->YminusX, p->YminusX, b);
    fp_cmov(r->Z, p->Z, b);
    fp_cmov(r->T2d, p->T2d, b);
}

/* Constant-time conditional negate: if b, negate r in place */
static inline void edwards_cached_cneg(edwards_cached *r, unsigned int b)
{
    edwards_cached neg;
    edwards_cached_neg(&neg, r);
    edwards_cached_cmov(r, &neg, b);
}

#endif // EDWARDS25519_EDWARDS_OPS_H
