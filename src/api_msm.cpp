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

// api_msm.cpp: Scalar and multi-scalar multiplication entry points of the C++ API.

#include "edwards25519_msm.h"
#include "edwards25519_secure_erase.h"
#include "edwards_msm.h"

#include <climits>
#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace edwards25519
{

    namespace
    {
        void check_lengths(size_t scalars, size_t points)
        {
            if (scalars != points)
                throw std::invalid_argument("multiscalar multiplication: scalar and point counts differ");
        }

        /* Flatten the batch into the layout the core routines take: n * 32 scalar bytes, n points */
        void flatten(
            std::vector<unsigned char> &scalar_bytes,
            std::vector<edwards_extended> &ext_points,
            const Scalar *scalars,
            const EdwardsPoint *points,
            size_t n)
        {
            if (n > SIZE_MAX / 32)
                throw std::length_error("multiscalar multiplication: batch too large");

            scalar_bytes.resize(32 * n);
            ext_points.resize(n);

            for (size_t i = 0; i < n; i++)
            {
                auto sb = scalars[i].to_bytes();
                std::memcpy(scalar_bytes.data() + 32 * i, sb.data(), 32);
                edwards25519_secure_erase(sb.data(), sb.size());
                edwards_copy(&ext_points[i], &points[i].raw());
            }
        }
    } // namespace

    MsmAlgorithm msm_algorithm(size_t n)
    {
        return edwards_msm_select(n) == EDWARDS_MSM_STRAUS ? MsmAlgorithm::Straus : MsmAlgorithm::Pippenger;
    }

    EdwardsPoint scalar_mul(const Scalar &s, const EdwardsPoint &p)
    {
        return multiscalar_mul(&s, &p, 1);
    }

    EdwardsPoint multiscalar_mul(const Scalar *scalars, const EdwardsPoint *points, size_t n)
    {
        if (n == 0 || !scalars || !points)
            return EdwardsPoint();

        std::vector<unsigned char> scalar_bytes;
        std::vector<edwards_extended> ext_points;
        flatten(scalar_bytes, ext_points, scalars, points, n);

        EdwardsPoint r;
        edwards_msm(&r.raw(), scalar_bytes.data(), ext_points.data(), n);

        edwards25519_secure_erase(scalar_bytes.data(), scalar_bytes.size());
        return r;
    }

    EdwardsPoint multiscalar_mul(const std::vector<Scalar> &scalars, const std::vector<EdwardsPoint> &points)
    {
        check_lengths(scalars.size(), points.size());
        return multiscalar_mul(scalars.data(), points.data(), scalars.size());
    }

    EdwardsPoint vartime_multiscalar_mul(const Scalar *scalars, const EdwardsPoint *points, size_t n)
    {
        if (n == 0 || !scalars || !points)
            return EdwardsPoint();

        std::vector<unsigned char> scalar_bytes;
        std::vector<edwards_extended> ext_points;
        flatten(scalar_bytes, ext_points, scalars, points, n);

        EdwardsPoint r;
        edwards_msm_vartime(&r.raw(), scalar_bytes.data(), ext_points.data(), n);
        return r;
    }

    EdwardsPoint
        vartime_multiscalar_mul(const std::vector<Scalar> &scalars, const std::vector<EdwardsPoint> &points)
    {
        check_lengths(scalars.size(), points.size());
        return vartime_multiscalar_mul(scalars.data(), points.data(), scalars.size());
    }

    std::optional<EdwardsPoint> optional_multiscalar_mul(
        const std::vector<Scalar> &scalars,
        const std::vector<std::optional<EdwardsPoint>> &points)
    {
        check_lengths(scalars.size(), points.size());

        const size_t n = scalars.size();
        if (n > SIZE_MAX / 32)
            throw std::length_error("multiscalar multiplication: batch too large");

        std::vector<unsigned char> scalar_bytes(32 * n);
        std::vector<const edwards_extended *> point_ptrs(n);

        for (size_t i = 0; i < n; i++)
        {
            const auto sb = scalars[i].to_bytes();
            std::memcpy(scalar_bytes.data() + 32 * i, sb.data(), 32);
            point_ptrs[i] = points[i].has_value() ? &points[i]->raw() : nullptr;
        }

        EdwardsPoint r;
        if (edwards_msm_vartime_optional(&r.raw(), scalar_bytes.data(), point_ptrs.data(), n) != 0)
            return std::nullopt;
        return r;
    }

    EdwardsPoint vartime_multiscalar_mul(
        MsmAlgorithm algorithm,
        const std::vector<Scalar> &scalars,
        const std::vector<EdwardsPoint> &points)
    {
        check_lengths(scalars.size(), points.size());

        const size_t n = scalars.size();
        std::vector<unsigned char> scalar_bytes;
        std::vector<edwards_extended> ext_points;
        flatten(scalar_bytes, ext_points, scalars.data(), points.data(), n);

        EdwardsPoint r;
        if (algorithm == MsmAlgorithm::Straus)
            edwards_msm_straus_vartime(&r.raw(), scalar_bytes.data(), ext_points.data(), n);
        else
            edwards_msm_pippenger_vartime(&r.raw(), scalar_bytes.data(), ext_points.data(), n);
        return r;
    }

} // namespace edwards25519
