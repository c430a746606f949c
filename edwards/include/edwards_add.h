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
 * @file edwards_add.h
 * @brief Unified point addition and subtraction (Hisil-Wong-Carter-Dawson, a = -1).
 *
 * Complete on edwards25519: valid for every pair of inputs, including P + P, P + (-P)
 * and the identity, with no data-dependent branches.
 */

#ifndef EDWARDS25519_EDWARDS_ADD_H
#define EDWARDS25519_EDWARDS_ADD_H

#include "edwards.h"

/* r = p + q */
void edwards_add_cached(edwards_completed *r, const edwards_extended *p, const edwards_cached *q);

/* r = p - q */
void edwards_sub_cached(edwards_completed *r, const edwards_extended *p, const edwards_cached *q);

/* r = p + q, all extended; r may alias p or q */
void edwards_add(edwards_extended *r, const edwards_extended *p, const edwards_extended *q);

/* r = p - q, all extended; r may alias p or q */
void edwards_sub(edwards_extended *r, const edwards_extended *p, const edwards_extended *q);

#endif // EDWARDS25519_EDWARDS_ADD_H
