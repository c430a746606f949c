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
 * @file edwards25519.h
 * @brief Master include header for the edwards25519 library.
 *
 * edwards25519 implements the prime-order group of the twisted Edwards curve
 * -x^2 + y^2 = 1 + d*x^2*y^2 over F_p, p = 2^255 - 19, with group order
 * L = 2^252 + 27742317777372353535851937790883648493 (cofactor 8).
 *
 * The library is organized in layers:
 *
 * - **Field elements (fp_*)**: arithmetic modulo p, including sqrt_ratio.
 * - **Scalars (sc_*)**: arithmetic modulo L and the radix-16 / NAF / radix-2^w
 *   digit expansions.
 * - **Curve points (edwards_*)**: extended-coordinate addition, doubling, the
 *   32-byte codec, scalar multiplication and MSM (Straus and Pippenger).
 * - **C++ API (edwards25519::)**: Scalar, EdwardsPoint and the multiplication
 *   entry points.
 *
 * Including this header pulls in everything. You can also include individual
 * headers (e.g. fp_mul.h, edwards_msm.h) if you only need specific ops.
 *
 * @note **This is a low-level cryptographic primitive library.** Callers must:
 *
 * 1. Decode all externally-received points via from_bytes / decompress.
 * 2. Use constant-time multiplication for secret scalars, and _vartime
 *    functions only for public data.
 * 3. Zero sensitive data after use via edwards25519_secure_erase().
 */

#ifndef EDWARDS25519_H
#define EDWARDS25519_H

/* Platform detection and secure erase */
#include "ct_barrier.h"
#include "edwards25519_platform.h"
#include "edwards25519_secure_erase.h"
#include "le_bytes.h"

/* F_p field arithmetic (p = 2^255 - 19) */
#include "fp.h"
#include "fp_cmov.h"
#include "fp_cneg.h"
#include "fp_frombytes.h"
#include "fp_invert.h"
#include "fp_mul.h"
#include "fp_ops.h"
#include "fp_pow22523.h"
#include "fp_sq.h"
#include "fp_sqrt_ratio.h"
#include "fp_tobytes.h"
#include "fp_utils.h"

/* Scalars mod L */
#include "sc.h"
#include "sc_constants.h"
#include "sc_frombytes.h"
#include "sc_invert.h"
#include "sc_mul.h"
#include "sc_ops.h"
#include "sc_recode.h"
#include "sc_tobytes.h"

/* Curve operations */
#include "edwards.h"
#include "edwards_add.h"
#include "edwards_constants.h"
#include "edwards_dbl.h"
#include "edwards_frombytes.h"
#include "edwards_msm.h"
#include "edwards_ops.h"
#include "edwards_scalarmult.h"
#include "edwards_table.h"
#include "edwards_tobytes.h"
#include "edwards_validate.h"

/* C++ API */
#include "edwards25519_error.h"
#include "edwards25519_msm.h"
#include "edwards25519_point.h"
#include "edwards25519_scalar.h"

#endif /* EDWARDS25519_H */
