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
 * @file edwards_frombytes.h
 * @brief Decompress a 32-byte encoding (canonical y, bit 255 = sign of x) into an
 *        extended point.
 */

#ifndef EDWARDS25519_EDWARDS_FROMBYTES_H
#define EDWARDS25519_EDWARDS_FROMBYTES_H

#include "edwards.h"

#define EDWARDS25519_OK 0
/* y >= p, or x = 0 with the sign bit set */
#define EDWARDS25519_ERR_INVALID_ENCODING (-1)
/* (y^2 - 1) / (d*y^2 + 1) has no square root */
#define EDWARDS25519_ERR_NOT_ON_CURVE (-2)

/**
 * Returns EDWARDS25519_OK and sets r on success. On failure returns one of the
 * error codes above and r is left untouched.
 *
 * Variable time in the (public) encoding.
 */
int edwards_frombytes(edwards_extended *r, const unsigned char s[32]);

#endif // EDWARDS25519_EDWARDS_FROMBYTES_H
