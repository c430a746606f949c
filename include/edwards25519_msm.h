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
 * @file edwards25519_msm.h
 * @brief Scalar and multi-scalar multiplication entry points.
 *
 * - multiscalar_mul: constant time in scalars and points (radix-16 Straus).
 * - vartime_multiscalar_mul: Straus with width-5 NAF for n < 190, Pippenger otherwise.
 * - optional_multiscalar_mul: as vartime_multiscalar_mul, but returns nullopt without
 *   computing anything if any point is absent.
 *
 * The vector overloads throw std::invalid_argument when the scalar and point counts
 * differ; nothing is computed in that case.
 */

#ifndef EDWARDS25519_API_MSM_H
#define EDWARDS25519_API_MSM_H

#include "edwards25519_point.h"
#include "edwards25519_scalar.h"

#include <cstddef>
#include <optional>
#include <vector>

namespace edwards25519
{

    enum class MsmAlgorithm
    {
        Straus,
        Pippenger
    };

    /// Strategy vartime_multiscalar_mul uses for a batch of n terms.
    MsmAlgorithm msm_algorithm(size_t n);

    /// s * P, constant time. Same result as multiscalar_mul with a single term.
    EdwardsPoint scalar_mul(const Scalar &s, const EdwardsPoint &p);

    EdwardsPoint multiscalar_mul(const Scalar *scalars, const EdwardsPoint *points, size_t n);

    EdwardsPoint multiscalar_mul(const std::vector<Scalar> &scalars, const std::vector<EdwardsPoint> &points);

    EdwardsPoint vartime_multiscalar_mul(const Scalar *scalars, const EdwardsPoint *points, size_t n);

    EdwardsPoint
        vartime_multiscalar_mul(const std::vector<Scalar> &scalars, const std::vector<EdwardsPoint> &points);

    std::optional<EdwardsPoint> optional_multiscalar_mul(
        const std::vector<Scalar> &scalars,
        const std::vector<std::optional<EdwardsPoint>> &points);

    /// Force a particular variable-time strategy regardless of n (cross-checking, benchmarking).
    EdwardsPoint vartime_multiscalar_mul(
        MsmAlgorithm algorithm,
        const std::vector<Scalar> &scalars,
        const std::vector<EdwardsPoint> &points);

} // namespace edwards25519

#endif // EDWARDS25519_API_MSM_H
