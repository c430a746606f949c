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
 * @file fp51_chain.h
 * @brief Multiply/square primitives used inside the fixed exponentiation chains
 *        (invert, pow22523). Everything resolves to the force-inlined kernels.
 */

#ifndef EDWARDS25519_X64_FP51_CHAIN_H
#define EDWARDS25519_X64_FP51_CHAIN_H

#include "x64/fp51_inline.h"

#define fp51_chain_mul fp51_mul_inline
#define fp51_chain_sq fp51_sq_inline

/* h = f^(2^n), n >= 1 */
static EDWARDS25519_FORCE_INLINE void fp51_sqn_inline(fp_fe h, const fp_fe f, int n)
{
    fp51_sq_inline(h, f);
    for (int i = 1; i < n; i++)
        fp51_sq_inline(h, h);
}

#define fp51_chain_sqn fp51_sqn_inline

#endif // EDWARDS25519_X64_FP51_CHAIN_H
