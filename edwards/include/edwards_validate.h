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
 * @file edwards_validate.h
 * @brief Point predicates: projective equality, identity test, curve membership.
 */

#ifndef EDWARDS25519_EDWARDS_VALIDATE_H
#define EDWARDS25519_EDWARDS_VALIDATE_H

#include "edwards.h"

/* 1 if p and q represent the same affine point. Constant time. */
int edwards_equal(const edwards_extended *p, const edwards_extended *q);

/* 1 if p is the identity (X = 0, Y = Z). Constant time. */
int edwards_is_identity(const edwards_extended *p);

/*
 * 1 if Z != 0, X*Y = Z*T and (Y^2 - X^2)*Z^2 = Z^4 + d*X^2*Y^2,
 * i.e. both extended-coordinate invariants hold.
 */
int edwards_is_on_curve(const edwards_extended *p);

#endif // EDWARDS25519_EDWARDS_VALIDATE_H
